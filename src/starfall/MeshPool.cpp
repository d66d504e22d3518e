#include <starfall/MeshPool.hpp>
#include <starfall/Logger.hpp>
#include <cstring>

namespace starfall {

std::expected<PoolBuffers, Error> PoolBuffers::create(
    const VulkanContext& context,
    const OneTimeCommands& commands,
    DescriptorAllocator& descriptors,
    const Mesh& mesh,
    uint32_t capacity,
    uint32_t frames_in_flight
) {
    auto vertex_buffer = Buffer::create_with_data(context, commands,
        std::as_bytes(std::span{mesh.vertices}), vk::BufferUsageFlagBits::eVertexBuffer);
    if (!vertex_buffer) {
        return std::unexpected(vertex_buffer.error());
    }

    auto index_buffer = Buffer::create_with_data(context, commands,
        std::as_bytes(std::span{mesh.indices}), vk::BufferUsageFlagBits::eIndexBuffer);
    if (!index_buffer) {
        return std::unexpected(index_buffer.error());
    }

    vk::DeviceSize instance_size = static_cast<vk::DeviceSize>(capacity) * frames_in_flight * sizeof(InstanceData);
    auto instance_buffer = Buffer::create(context, instance_size,
        vk::BufferUsageFlagBits::eVertexBuffer | vk::BufferUsageFlagBits::eStorageBuffer,
        MemoryUsage::HostVisible);
    if (!instance_buffer) {
        return std::unexpected(instance_buffer.error());
    }

    auto object_set = descriptors.allocate(SetKind::Object);
    if (!object_set) {
        return std::unexpected(object_set.error());
    }
    write_object_set(context.device(), *object_set, instance_buffer->descriptor_info());

    return PoolBuffers{
        .vertex_buffer = std::move(*vertex_buffer),
        .index_buffer = std::move(*index_buffer),
        .instance_buffer = std::move(*instance_buffer),
        .index_count = mesh.index_count(),
        .object_set = *object_set,
    };
}

MeshPool::MeshPool(PoolKind kind, std::optional<MaterialId> material, uint32_t capacity, uint32_t frames_in_flight)
    : m_kind(kind)
    , m_material(material)
    , m_capacity(capacity)
    , m_allocators(frames_in_flight, SlotAllocator(capacity))
    , m_staged(frames_in_flight)
    , m_used_slots(frames_in_flight)
    , m_dropped(frames_in_flight, 0)
{
    for (auto& staged : m_staged) {
        staged.reserve(capacity);
    }
}

void MeshPool::begin_frame(uint32_t frame_slot, uint64_t completed_frame)
{
    m_allocators[frame_slot].reclaim(completed_frame);
    m_staged[frame_slot].clear();
    m_dropped[frame_slot] = 0;
}

std::optional<uint32_t> MeshPool::push_instance(uint32_t frame_slot, const InstanceData& instance)
{
    auto slot = m_allocators[frame_slot].allocate();
    if (!slot) {
        ++m_dropped[frame_slot];
        return std::nullopt;
    }
    m_used_slots[frame_slot].push_back(*slot);
    m_staged[frame_slot].push_back(instance);
    return slot;
}

std::expected<void, Error> MeshPool::upload(uint32_t frame_slot)
{
    if (!m_buffers || m_staged[frame_slot].empty()) {
        return {};
    }
    return m_buffers->instance_buffer.write(std::as_bytes(std::span{m_staged[frame_slot]}), region_offset(frame_slot));
}

uint32_t MeshPool::end_frame(uint32_t frame_slot, uint64_t frame_number)
{
    auto& used = m_used_slots[frame_slot];
    for (uint32_t slot : used) {
        m_allocators[frame_slot].release(slot, frame_number);
    }
    auto released = static_cast<uint32_t>(used.size());
    used.clear();
    return released;
}

MeshPoolManager::MeshPoolManager(uint32_t frames_in_flight)
    : m_frames_in_flight(frames_in_flight)
{}

MeshTypeId MeshPoolManager::add_pool(MeshPool pool, std::optional<uint64_t> content_hash)
{
    auto id = m_pools.insert(std::move(pool));
    if (content_hash) {
        m_by_hash[*content_hash] = id;
    }
    m_stats.active_pools = static_cast<uint32_t>(m_pools.size());
    return id;
}

std::optional<MeshTypeId> MeshPoolManager::find_by_hash(uint64_t content_hash) const
{
    auto it = m_by_hash.find(content_hash);
    if (it == m_by_hash.end() || !m_pools.contains(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

void MeshPoolManager::begin_frame(uint32_t frame_slot, uint64_t completed_frame)
{
    m_frame_slot = frame_slot % m_frames_in_flight;
    m_stats.total_active_objects = 0;
    m_stats.dropped_this_frame = 0;
    m_pools.for_each([&](MeshTypeId, MeshPool& pool) { pool.begin_frame(m_frame_slot, completed_frame); });
}

bool MeshPoolManager::submit(MeshTypeId id, const InstanceData& instance)
{
    auto* pool = m_pools.get(id);
    if (!pool) {
        Logger::instance().warn("Instance submitted for unknown mesh type {}:{}", id.index, id.generation);
        return false;
    }
    if (!pool->push_instance(m_frame_slot, instance)) {
        ++m_stats.dropped_this_frame;
        return false;
    }
    ++m_stats.total_active_objects;
    ++m_stats.total_spawned;
    return true;
}

std::expected<void, Error> MeshPoolManager::upload()
{
    std::expected<void, Error> result;
    m_pools.for_each([&](MeshTypeId, MeshPool& pool) {
        if (!result) {
            return;
        }
        result = pool.upload(m_frame_slot);
    });
    return result;
}

void MeshPoolManager::end_frame(uint64_t frame_number, uint32_t batches, EventQueue& events)
{
    m_stats.render_batches_per_frame = batches;
    m_pools.for_each([&](MeshTypeId id, MeshPool& pool) {
        if (uint32_t dropped = pool.dropped(m_frame_slot); dropped > 0) {
            Logger::instance().warn("[{}] pool {}:{} exhausted, dropped {} instances in frame {}",
                to_string(ErrorKind::ResourceExhaustion), id.index, id.generation, dropped, frame_number);
            events.push(InstancesDropped{id, dropped, frame_number});
        }
        m_stats.total_despawned += pool.end_frame(m_frame_slot, frame_number);
    });
}

} // namespace starfall
