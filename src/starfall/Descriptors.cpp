#include <starfall/Descriptors.hpp>
#include <starfall/Logger.hpp>
#include <span>
#include <vector>

namespace starfall {

namespace {

std::string_view set_name(SetKind kind)
{
    switch (kind) {
        case SetKind::Frame: return "frame";
        case SetKind::Material: return "material";
        case SetKind::Object: return "object";
    }
    return "unknown";
}

} // anonymous namespace

const DescriptorSlot* find_descriptor_slot(uint32_t set, uint32_t binding)
{
    for (const auto& slot : DESCRIPTOR_SLOTS) {
        if (static_cast<uint32_t>(slot.set) == set && slot.binding == binding) {
            return &slot;
        }
    }
    return nullptr;
}

// --- DescriptorBudget ---

DescriptorBudget::DescriptorBudget(uint32_t frames_in_flight, uint32_t max_materials, uint32_t max_mesh_types)
    : m_capacity{frames_in_flight, max_materials, max_mesh_types}
{}

DescriptorPoolSizes DescriptorBudget::pool_sizes() const
{
    auto frames = m_capacity[index(SetKind::Frame)];
    auto materials = m_capacity[index(SetKind::Material)];
    auto meshes = m_capacity[index(SetKind::Object)];
    return DescriptorPoolSizes{
        .max_sets = frames + materials + meshes,
        .uniform_buffers = 2 * frames + materials,
        .combined_image_samplers = MATERIAL_TEXTURE_SLOTS * materials,
        .storage_buffers = meshes,
    };
}

std::expected<void, Error> DescriptorBudget::reserve(SetKind kind)
{
    auto i = index(kind);
    if (m_in_use[i] >= m_capacity[i]) {
        return std::unexpected(Error::make(ErrorCode::DescriptorPoolExhausted,
            std::format("No {} descriptor sets left ({} of {} in use)", set_name(kind), m_in_use[i], m_capacity[i])));
    }
    m_in_use[i]++;
    return {};
}

void DescriptorBudget::release(SetKind kind)
{
    auto i = index(kind);
    if (m_in_use[i] == 0) {
        Logger::instance().warn("Released more {} descriptor sets than were reserved", set_name(kind));
        return;
    }
    m_in_use[i]--;
}

// --- DescriptorLayouts ---

DescriptorLayouts::DescriptorLayouts(vk::Device device)
    : m_device(device)
{}

std::expected<DescriptorLayouts, Error> DescriptorLayouts::create(vk::Device device)
{
    DescriptorLayouts layouts(device);

    for (auto kind : {SetKind::Frame, SetKind::Material, SetKind::Object}) {
        std::vector<vk::DescriptorSetLayoutBinding> bindings;
        for (const auto& slot : DESCRIPTOR_SLOTS) {
            if (slot.set == kind) {
                bindings.push_back(vk::DescriptorSetLayoutBinding()
                    .setBinding(slot.binding)
                    .setDescriptorType(slot.type)
                    .setDescriptorCount(1)
                    .setStageFlags(slot.stages));
            }
        }

        auto layout_res = device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo().setBindings(bindings));
        STARFALL_CHECK_VK_RESULT(layout_res, VulkanCallFailed, "Failed to create descriptor set layout {}");
        layouts.m_layouts[static_cast<std::size_t>(kind)] = layout_res.value;
    }

    Logger::instance().debug("Created descriptor set layouts");
    return layouts;
}

void DescriptorLayouts::destroy()
{
    for (auto& layout : m_layouts) {
        if (layout) {
            m_device.destroyDescriptorSetLayout(layout);
            layout = nullptr;
        }
    }
}

DescriptorLayouts::~DescriptorLayouts()
{
    destroy();
}

DescriptorLayouts::DescriptorLayouts(DescriptorLayouts&& other) noexcept
    : m_device(other.m_device)
    , m_layouts(std::exchange(other.m_layouts, {}))
{}

DescriptorLayouts& DescriptorLayouts::operator=(DescriptorLayouts&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = other.m_device;
        m_layouts = std::exchange(other.m_layouts, {});
    }
    return *this;
}

// --- DescriptorAllocator ---

DescriptorAllocator::DescriptorAllocator(
    vk::Device device,
    vk::DescriptorPool pool,
    std::array<vk::DescriptorSetLayout, 3> layouts,
    DescriptorBudget budget
)
    : m_device(device)
    , m_pool(pool)
    , m_layouts(layouts)
    , m_budget(budget)
{}

std::expected<DescriptorAllocator, Error> DescriptorAllocator::create(
    vk::Device device,
    const DescriptorLayouts& layouts,
    DescriptorBudget budget
) {
    auto sizes = budget.pool_sizes();
    std::array pool_sizes = {
        vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, sizes.uniform_buffers),
        vk::DescriptorPoolSize(vk::DescriptorType::eCombinedImageSampler, sizes.combined_image_samplers),
        vk::DescriptorPoolSize(vk::DescriptorType::eStorageBuffer, sizes.storage_buffers),
    };

    auto pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(sizes.max_sets)
        .setPoolSizes(pool_sizes);

    auto pool_res = device.createDescriptorPool(pool_info);
    STARFALL_CHECK_VK_RESULT(pool_res, DescriptorPoolExhausted, "Failed to create descriptor pool {}");

    Logger::instance().debug("Descriptor pool: {} sets, {} UBOs, {} samplers, {} storage buffers",
        sizes.max_sets, sizes.uniform_buffers, sizes.combined_image_samplers, sizes.storage_buffers);

    return DescriptorAllocator(device, pool_res.value, layouts.all(), budget);
}

std::expected<vk::DescriptorSet, Error> DescriptorAllocator::allocate(SetKind kind)
{
    if (auto reserved = m_budget.reserve(kind); !reserved) {
        Logger::instance().error("{}", reserved.error().describe());
        return std::unexpected(reserved.error());
    }

    auto layout = m_layouts[static_cast<std::size_t>(kind)];
    auto alloc_info = vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_pool)
        .setSetLayouts(layout);

    auto set_res = m_device.allocateDescriptorSets(alloc_info);
    if (set_res.result != vk::Result::eSuccess) {
        m_budget.release(kind);
        auto error = error_from_vk_result(set_res.result, ErrorCode::DescriptorPoolExhausted,
            std::format("Failed to allocate {} descriptor set {}", set_name(kind), vk::to_string(set_res.result)));
        Logger::instance().error("{}", error.describe());
        return std::unexpected(error);
    }
    return set_res.value[0];
}

void DescriptorAllocator::free(SetKind kind, vk::DescriptorSet set)
{
    if (!set) {
        return;
    }
    auto result = m_device.freeDescriptorSets(m_pool, set);
    if (result != vk::Result::eSuccess) {
        Logger::instance().warn("Failed to free {} descriptor set {}", set_name(kind), vk::to_string(result));
        return;
    }
    m_budget.release(kind);
}

void DescriptorAllocator::destroy()
{
    if (m_pool) {
        m_device.destroyDescriptorPool(m_pool);
        m_pool = nullptr;
    }
}

DescriptorAllocator::~DescriptorAllocator()
{
    destroy();
}

DescriptorAllocator::DescriptorAllocator(DescriptorAllocator&& other) noexcept
    : m_device(other.m_device)
    , m_pool(std::exchange(other.m_pool, nullptr))
    , m_layouts(other.m_layouts)
    , m_budget(other.m_budget)
{}

DescriptorAllocator& DescriptorAllocator::operator=(DescriptorAllocator&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = other.m_device;
        m_pool = std::exchange(other.m_pool, nullptr);
        m_layouts = other.m_layouts;
        m_budget = other.m_budget;
    }
    return *this;
}

// --- Writes ---

void write_frame_set(
    vk::Device device,
    vk::DescriptorSet set,
    const vk::DescriptorBufferInfo& camera,
    const vk::DescriptorBufferInfo& lighting
) {
    std::array writes = {
        vk::WriteDescriptorSet()
            .setDstSet(set)
            .setDstBinding(0)
            .setDstArrayElement(0)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setBufferInfo(camera),
        vk::WriteDescriptorSet()
            .setDstSet(set)
            .setDstBinding(1)
            .setDstArrayElement(0)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setBufferInfo(lighting),
    };
    device.updateDescriptorSets(writes, nullptr);
}

void write_material_set(
    vk::Device device,
    vk::DescriptorSet set,
    const vk::DescriptorBufferInfo& material,
    const std::array<vk::DescriptorImageInfo, MATERIAL_TEXTURE_SLOTS>& textures
) {
    std::array<vk::WriteDescriptorSet, 1 + MATERIAL_TEXTURE_SLOTS> writes;
    writes[0] = vk::WriteDescriptorSet()
        .setDstSet(set)
        .setDstBinding(0)
        .setDstArrayElement(0)
        .setDescriptorType(vk::DescriptorType::eUniformBuffer)
        .setBufferInfo(material);
    for (uint32_t i = 0; i < MATERIAL_TEXTURE_SLOTS; i++) {
        writes[i + 1] = vk::WriteDescriptorSet()
            .setDstSet(set)
            .setDstBinding(i + 1)
            .setDstArrayElement(0)
            .setDescriptorType(vk::DescriptorType::eCombinedImageSampler)
            .setImageInfo(textures[i]);
    }
    device.updateDescriptorSets(writes, nullptr);
}

void write_object_set(vk::Device device, vk::DescriptorSet set, const vk::DescriptorBufferInfo& instances)
{
    auto write = vk::WriteDescriptorSet()
        .setDstSet(set)
        .setDstBinding(0)
        .setDstArrayElement(0)
        .setDescriptorType(vk::DescriptorType::eStorageBuffer)
        .setBufferInfo(instances);
    device.updateDescriptorSets(write, nullptr);
}

} // namespace starfall
