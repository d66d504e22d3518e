#pragma once

#include <starfall/Buffer.hpp>
#include <starfall/Descriptors.hpp>
#include <starfall/Events.hpp>
#include <starfall/GpuTypes.hpp>
#include <starfall/Handle.hpp>
#include <starfall/Mesh.hpp>
#include <starfall/Pipeline.hpp>
#include <starfall/SlotAllocator.hpp>
#include <expected>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace starfall {

/**
 * @brief GPU side of a pool: shared geometry, the instance buffer and its Set 2
 *
 * The instance buffer holds one region of `capacity` records per frame slot,
 * so the CPU never writes a region the GPU may still read.
 */
struct PoolBuffers {
    Buffer vertex_buffer;
    Buffer index_buffer;
    Buffer instance_buffer;
    uint32_t index_count;
    vk::DescriptorSet object_set;

    static std::expected<PoolBuffers, Error> create(
        const VulkanContext& context,
        const OneTimeCommands& commands,
        DescriptorAllocator& descriptors,
        const Mesh& mesh,
        uint32_t capacity,
        uint32_t frames_in_flight
    );
};

/**
 * @brief One mesh type: its slots per frame slot and, when uploaded, its buffers
 *
 * Instances pushed during a frame take a slot from that frame slot's
 * allocator and are staged densely in push order, so one draw of
 * instance_count records starting at the region covers them all. Slots are
 * released at the end of the frame and come back once its fence signals.
 */
class MeshPool
{
public:
    MeshPool(PoolKind kind, std::optional<MaterialId> material, uint32_t capacity, uint32_t frames_in_flight);

    void attach_buffers(PoolBuffers buffers) { m_buffers.emplace(std::move(buffers)); }

    /**
     * @brief Reclaim slots the GPU is done with and clear the staged instances
     */
    void begin_frame(uint32_t frame_slot, uint64_t completed_frame);

    /**
     * @brief Stage one instance; nullopt when the frame slot is out of slots
     */
    std::optional<uint32_t> push_instance(uint32_t frame_slot, const InstanceData& instance);

    /**
     * @brief Copy staged instances into the mapped instance buffer region
     */
    std::expected<void, Error> upload(uint32_t frame_slot);

    /**
     * @brief Release every slot used this frame, tagged with frame_number
     *
     * @return Number of slots released
     */
    uint32_t end_frame(uint32_t frame_slot, uint64_t frame_number);

    [[nodiscard]] PoolKind kind() const { return m_kind; }
    [[nodiscard]] const std::optional<MaterialId>& material() const { return m_material; }
    void set_material(std::optional<MaterialId> material) { m_material = material; }
    [[nodiscard]] uint32_t capacity() const { return m_capacity; }
    [[nodiscard]] uint32_t instance_count(uint32_t frame_slot) const { return static_cast<uint32_t>(m_staged[frame_slot].size()); }
    [[nodiscard]] std::span<const InstanceData> staged(uint32_t frame_slot) const { return m_staged[frame_slot]; }
    [[nodiscard]] uint32_t dropped(uint32_t frame_slot) const { return m_dropped[frame_slot]; }
    [[nodiscard]] const SlotAllocator& allocator(uint32_t frame_slot) const { return m_allocators[frame_slot]; }
    [[nodiscard]] vk::DeviceSize region_offset(uint32_t frame_slot) const {
        return static_cast<vk::DeviceSize>(frame_slot) * m_capacity * sizeof(InstanceData);
    }
    [[nodiscard]] const std::optional<PoolBuffers>& buffers() const { return m_buffers; }

private:
    PoolKind m_kind;
    std::optional<MaterialId> m_material;
    uint32_t m_capacity;
    std::vector<SlotAllocator> m_allocators;
    std::vector<std::vector<InstanceData>> m_staged;
    std::vector<std::vector<uint32_t>> m_used_slots;
    std::vector<uint32_t> m_dropped;
    std::optional<PoolBuffers> m_buffers;
};

struct PoolStats {
    uint32_t active_pools = 0;
    uint32_t total_active_objects = 0; ///< Instances staged in the current frame
    uint64_t total_spawned = 0;
    uint64_t total_despawned = 0;
    uint32_t render_batches_per_frame = 0;
    uint32_t dropped_this_frame = 0;
};

/**
 * @brief Registry of mesh pools with per-frame accounting
 */
class MeshPoolManager
{
public:
    explicit MeshPoolManager(uint32_t frames_in_flight);

    MeshTypeId add_pool(MeshPool pool, std::optional<uint64_t> content_hash = std::nullopt);

    /**
     * @brief Pool previously registered for identical mesh content
     */
    [[nodiscard]] std::optional<MeshTypeId> find_by_hash(uint64_t content_hash) const;

    [[nodiscard]] MeshPool* get(MeshTypeId id) { return m_pools.get(id); }
    [[nodiscard]] const MeshPool* get(MeshTypeId id) const { return m_pools.get(id); }
    [[nodiscard]] std::size_t size() const { return m_pools.size(); }

    void begin_frame(uint32_t frame_slot, uint64_t completed_frame);

    /**
     * @brief Stage an instance; counts a drop when the pool is exhausted
     *
     * @return false when the id is stale or the instance was dropped
     */
    bool submit(MeshTypeId id, const InstanceData& instance);

    /**
     * @brief Upload staged instances of every pool that owns buffers
     */
    std::expected<void, Error> upload();

    /**
     * @brief Release this frame's slots and publish InstancesDropped events
     */
    void end_frame(uint64_t frame_number, uint32_t batches, EventQueue& events);

    void for_each(const std::function<void(MeshTypeId, MeshPool&)>& fn) { m_pools.for_each(fn); }

    [[nodiscard]] const PoolStats& stats() const { return m_stats; }
    [[nodiscard]] uint32_t current_frame_slot() const { return m_frame_slot; }

private:
    uint32_t m_frames_in_flight;
    uint32_t m_frame_slot = 0;
    SlotMap<MeshPool, MeshTypeTag> m_pools;
    std::unordered_map<uint64_t, MeshTypeId> m_by_hash;
    PoolStats m_stats;
};

} // namespace starfall
