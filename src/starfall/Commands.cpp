#include <starfall/Commands.hpp>
#include <starfall/Logger.hpp>

namespace starfall {

OneTimeCommands::OneTimeCommands(vk::Device device, vk::Queue queue, vk::CommandPool pool, vk::Fence fence)
    : m_device(device)
    , m_queue(queue)
    , m_pool(pool)
    , m_fence(fence)
{}

std::expected<OneTimeCommands, Error> OneTimeCommands::create(const VulkanContext& context)
{
    auto device = context.device();

    auto pool_info = vk::CommandPoolCreateInfo()
        .setFlags(vk::CommandPoolCreateFlagBits::eTransient | vk::CommandPoolCreateFlagBits::eResetCommandBuffer)
        .setQueueFamilyIndex(context.queue_indices().graphics);
    auto pool_res = device.createCommandPool(pool_info);
    STARFALL_CHECK_VK_RESULT(pool_res, VulkanCallFailed, "Failed to create upload command pool {}");

    auto fence_res = device.createFence(vk::FenceCreateInfo());
    if (fence_res.result != vk::Result::eSuccess) {
        device.destroyCommandPool(pool_res.value);
        return std::unexpected(error_from_vk_result(fence_res.result, ErrorCode::VulkanCallFailed,
            std::format("Failed to create upload fence {}", vk::to_string(fence_res.result))));
    }

    return OneTimeCommands(device, context.graphics_queue(), pool_res.value, fence_res.value);
}

std::expected<void, Error> OneTimeCommands::submit(const std::function<void(vk::CommandBuffer)>& record) const
{
    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(1);
    auto cmd_res = m_device.allocateCommandBuffers(alloc_info);
    STARFALL_CHECK_VK_RESULT(cmd_res, VulkanCallFailed, "Failed to allocate upload command buffer {}");
    auto cmd = cmd_res.value[0];

    auto release = [&] { m_device.freeCommandBuffers(m_pool, cmd); };

    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    if (begin_res != vk::Result::eSuccess) {
        release();
        STARFALL_CHECK_VK_RESULT_VOID(begin_res, VulkanCallFailed, "Failed to begin upload command buffer {}");
    }

    record(cmd);

    auto end_res = cmd.end();
    if (end_res != vk::Result::eSuccess) {
        release();
        STARFALL_CHECK_VK_RESULT_VOID(end_res, VulkanCallFailed, "Failed to record upload command buffer {}");
    }

    auto submit_info = vk::SubmitInfo().setCommandBuffers(cmd);
    auto submit_res = m_queue.submit(submit_info, m_fence);
    if (submit_res != vk::Result::eSuccess) {
        release();
        STARFALL_CHECK_VK_RESULT_VOID(submit_res, VulkanCallFailed, "Failed to submit upload {}");
    }

    auto wait_res = m_device.waitForFences(m_fence, vk::True, UINT64_MAX);
    auto reset_res = m_device.resetFences(m_fence);
    release();
    STARFALL_CHECK_VK_RESULT_VOID(wait_res, VulkanCallFailed, "Failed to wait for upload {}");
    STARFALL_CHECK_VK_RESULT_VOID(reset_res, VulkanCallFailed, "Failed to reset upload fence {}");

    Logger::instance().trace("One-time command buffer completed");
    return {};
}

void OneTimeCommands::destroy()
{
    if (m_fence) {
        m_device.destroyFence(m_fence);
        m_fence = nullptr;
    }
    if (m_pool) {
        m_device.destroyCommandPool(m_pool);
        m_pool = nullptr;
    }
}

OneTimeCommands::~OneTimeCommands()
{
    destroy();
}

OneTimeCommands::OneTimeCommands(OneTimeCommands&& other) noexcept
    : m_device(other.m_device)
    , m_queue(other.m_queue)
    , m_pool(std::exchange(other.m_pool, nullptr))
    , m_fence(std::exchange(other.m_fence, nullptr))
{}

OneTimeCommands& OneTimeCommands::operator=(OneTimeCommands&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = other.m_device;
        m_queue = other.m_queue;
        m_pool = std::exchange(other.m_pool, nullptr);
        m_fence = std::exchange(other.m_fence, nullptr);
    }
    return *this;
}

} // namespace starfall
