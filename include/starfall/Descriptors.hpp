#pragma once

#include <starfall/Common.hpp>
#include <starfall/Config.hpp>
#include <array>
#include <cstddef>
#include <expected>

namespace starfall {

/**
 * @brief The three descriptor set slots every pipeline shares
 */
enum class SetKind : uint8_t {
    Frame = 0,    ///< camera + lighting, one per frame slot
    Material = 1, ///< material UBO + 4 textures, one per material
    Object = 2    ///< instance array, one per mesh pool
};

constexpr uint32_t MATERIAL_TEXTURE_SLOTS = 4;

/**
 * @brief One binding of the shared pipeline layout
 */
struct DescriptorSlot {
    SetKind set;
    uint32_t binding;
    vk::DescriptorType type;
    vk::ShaderStageFlags stages;
};

namespace detail {
constexpr vk::ShaderStageFlags VERTEX = vk::ShaderStageFlagBits::eVertex;
constexpr vk::ShaderStageFlags FRAGMENT = vk::ShaderStageFlagBits::eFragment;
constexpr vk::ShaderStageFlags BOTH = VERTEX | FRAGMENT;
} // namespace detail

/// Every binding shaders may declare; the set layouts are built from this
inline constexpr std::array<DescriptorSlot, 8> DESCRIPTOR_SLOTS{
    DescriptorSlot{SetKind::Frame, 0, vk::DescriptorType::eUniformBuffer, detail::BOTH},     // camera
    DescriptorSlot{SetKind::Frame, 1, vk::DescriptorType::eUniformBuffer, detail::FRAGMENT}, // lighting
    DescriptorSlot{SetKind::Material, 0, vk::DescriptorType::eUniformBuffer, detail::BOTH},
    DescriptorSlot{SetKind::Material, 1, vk::DescriptorType::eCombinedImageSampler, detail::FRAGMENT},
    DescriptorSlot{SetKind::Material, 2, vk::DescriptorType::eCombinedImageSampler, detail::FRAGMENT},
    DescriptorSlot{SetKind::Material, 3, vk::DescriptorType::eCombinedImageSampler, detail::FRAGMENT},
    DescriptorSlot{SetKind::Material, 4, vk::DescriptorType::eCombinedImageSampler, detail::FRAGMENT},
    DescriptorSlot{SetKind::Object, 0, vk::DescriptorType::eStorageBuffer, detail::VERTEX},  // instances
};

[[nodiscard]] const DescriptorSlot* find_descriptor_slot(uint32_t set, uint32_t binding);

struct DescriptorPoolSizes {
    uint32_t max_sets;
    uint32_t uniform_buffers;
    uint32_t combined_image_samplers;
    uint32_t storage_buffers;
};

/**
 * @brief Fixed descriptor budget derived from the configured maxima
 *
 * Tracks how many sets of each kind are live. The pool is never grown, so a
 * reservation past the budget fails with DescriptorPoolExhausted.
 */
class DescriptorBudget
{
public:
    DescriptorBudget(uint32_t frames_in_flight, uint32_t max_materials, uint32_t max_mesh_types);

    static DescriptorBudget from_config(const RendererConfig& config)
    {
        return {config.frames_in_flight, config.max_materials, config.max_mesh_types};
    }

    [[nodiscard]] DescriptorPoolSizes pool_sizes() const;

    [[nodiscard]] std::expected<void, Error> reserve(SetKind kind);
    void release(SetKind kind);

    [[nodiscard]] uint32_t capacity(SetKind kind) const { return m_capacity[index(kind)]; }
    [[nodiscard]] uint32_t in_use(SetKind kind) const { return m_in_use[index(kind)]; }
    [[nodiscard]] uint32_t remaining(SetKind kind) const { return capacity(kind) - in_use(kind); }

private:
    static constexpr std::size_t index(SetKind kind) { return static_cast<std::size_t>(kind); }

    std::array<uint32_t, 3> m_capacity;
    std::array<uint32_t, 3> m_in_use{};
};

/**
 * @brief Set layouts for Set 0, Set 1 and Set 2
 *
 * Set 0: 0 camera UBO (V|F), 1 lighting UBO (F)
 * Set 1: 0 material UBO (V|F), 1..4 combined image samplers (F)
 * Set 2: 0 instance storage buffer (V)
 */
class DescriptorLayouts
{
public:
    static std::expected<DescriptorLayouts, Error> create(vk::Device device);

    ~DescriptorLayouts();

    DescriptorLayouts(const DescriptorLayouts&) = delete;
    DescriptorLayouts& operator=(const DescriptorLayouts&) = delete;
    DescriptorLayouts(DescriptorLayouts&& other) noexcept;
    DescriptorLayouts& operator=(DescriptorLayouts&& other) noexcept;

    [[nodiscard]] vk::DescriptorSetLayout get(SetKind kind) const { return m_layouts[static_cast<std::size_t>(kind)]; }

    /// Ordered by set index, ready for vk::PipelineLayoutCreateInfo
    [[nodiscard]] const std::array<vk::DescriptorSetLayout, 3>& all() const { return m_layouts; }

private:
    explicit DescriptorLayouts(vk::Device device);
    void destroy();

    vk::Device m_device;
    std::array<vk::DescriptorSetLayout, 3> m_layouts{};
};

/**
 * @brief Owns the single descriptor pool and hands out sets within the budget
 */
class DescriptorAllocator
{
public:
    static std::expected<DescriptorAllocator, Error> create(
        vk::Device device,
        const DescriptorLayouts& layouts,
        DescriptorBudget budget
    );

    ~DescriptorAllocator();

    DescriptorAllocator(const DescriptorAllocator&) = delete;
    DescriptorAllocator& operator=(const DescriptorAllocator&) = delete;
    DescriptorAllocator(DescriptorAllocator&& other) noexcept;
    DescriptorAllocator& operator=(DescriptorAllocator&& other) noexcept;

    [[nodiscard]] std::expected<vk::DescriptorSet, Error> allocate(SetKind kind);

    /**
     * @brief Return a set to the pool; the caller guarantees no frame in flight uses it
     */
    void free(SetKind kind, vk::DescriptorSet set);

    [[nodiscard]] const DescriptorBudget& budget() const { return m_budget; }

private:
    DescriptorAllocator(vk::Device device, vk::DescriptorPool pool, std::array<vk::DescriptorSetLayout, 3> layouts, DescriptorBudget budget);
    void destroy();

    vk::Device m_device;
    vk::DescriptorPool m_pool;
    std::array<vk::DescriptorSetLayout, 3> m_layouts;
    DescriptorBudget m_budget;
};

void write_frame_set(
    vk::Device device,
    vk::DescriptorSet set,
    const vk::DescriptorBufferInfo& camera,
    const vk::DescriptorBufferInfo& lighting
);

void write_material_set(
    vk::Device device,
    vk::DescriptorSet set,
    const vk::DescriptorBufferInfo& material,
    const std::array<vk::DescriptorImageInfo, MATERIAL_TEXTURE_SLOTS>& textures
);

void write_object_set(vk::Device device, vk::DescriptorSet set, const vk::DescriptorBufferInfo& instances);

} // namespace starfall
