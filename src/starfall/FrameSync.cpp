#include <starfall/FrameSync.hpp>
#include <starfall/Logger.hpp>
#include <algorithm>
#include <utility>

namespace starfall {

std::expected<void, Error> wait_with_retries(
    const std::function<vk::Result(uint64_t)>& wait,
    uint64_t timeout_ns,
    uint32_t max_retries
) {
    for (uint32_t attempt = 1; attempt <= max_retries; ++attempt) {
        auto result = wait(timeout_ns);
        if (result == vk::Result::eSuccess) {
            return {};
        }
        if (result != vk::Result::eTimeout) {
            return std::unexpected(error_from_vk_result(result, ErrorCode::VulkanCallFailed,
                std::format("Fence wait failed: {}", vk::to_string(result))));
        }
        Logger::instance().warn("Fence wait timed out after {} ms (attempt {}/{})", timeout_ns / 1'000'000, attempt, max_retries);
    }
    return std::unexpected(Error::make(ErrorCode::FenceTimeout,
        std::format("Fence not signaled after {} waits of {} ms", max_retries, timeout_ns / 1'000'000)));
}

FrameSync::FrameSync(vk::Device device, uint32_t graphics_family)
    : m_device(device)
    , m_graphics_family(graphics_family)
{}

std::expected<FrameSync, Error> FrameSync::create(const VulkanContext& context, uint32_t frames_in_flight, uint32_t image_count)
{
    FrameSync sync(context.device(), context.queue_indices().graphics);
    auto device = context.device();

    for (uint32_t i = 0; i < frames_in_flight; i++) {
        // Push first so a failure half way still gets cleaned up
        auto& slot = sync.m_slots.emplace_back();

        auto semaphore_res = device.createSemaphore({});
        STARFALL_CHECK_VK_RESULT(semaphore_res, VulkanCallFailed, "Failed to create image-available semaphore: {}");
        slot.image_available = semaphore_res.value;

        auto fence_info = vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled);
        auto fence_res = device.createFence(fence_info);
        STARFALL_CHECK_VK_RESULT(fence_res, VulkanCallFailed, "Failed to create in-flight fence: {}");
        slot.in_flight = fence_res.value;

        auto pool_info = vk::CommandPoolCreateInfo()
            .setFlags(vk::CommandPoolCreateFlagBits::eTransient)
            .setQueueFamilyIndex(sync.m_graphics_family);
        auto pool_res = device.createCommandPool(pool_info);
        STARFALL_CHECK_VK_RESULT(pool_res, VulkanCallFailed, "Failed to create frame command pool: {}");
        slot.command_pool = pool_res.value;
    }

    if (auto result = sync.resize_images(image_count); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Frame sync: {} slots, {} images", frames_in_flight, image_count);
    return sync;
}

std::expected<void, Error> FrameSync::resize_images(uint32_t image_count)
{
    if (m_render_finished.size() == image_count) {
        return {};
    }
    destroy_render_finished();

    for (uint32_t i = 0; i < image_count; i++) {
        auto semaphore_res = m_device.createSemaphore({});
        STARFALL_CHECK_VK_RESULT(semaphore_res, VulkanCallFailed, "Failed to create render-finished semaphore: {}");
        m_render_finished.push_back(semaphore_res.value);
    }
    return {};
}

std::expected<std::optional<uint64_t>, Error> FrameSync::wait_for_slot(uint32_t slot, uint64_t timeout_ns, uint32_t max_retries)
{
    auto& frame = m_slots[slot];
    if (!frame.submitted_frame) {
        return std::optional<uint64_t>{};
    }

    auto waited = wait_with_retries(
        [&](uint64_t timeout) { return m_device.waitForFences(frame.in_flight, true, timeout); },
        timeout_ns,
        max_retries);
    if (!waited) {
        return std::unexpected(waited.error());
    }
    return frame.submitted_frame;
}

std::expected<uint64_t, Error> FrameSync::completed_frame() const
{
    uint64_t newest = 0;
    std::optional<uint64_t> oldest_pending;
    for (const auto& frame : m_slots) {
        if (!frame.submitted_frame) {
            continue;
        }
        newest = std::max(newest, *frame.submitted_frame);
        auto status = m_device.getFenceStatus(frame.in_flight);
        if (status == vk::Result::eNotReady) {
            oldest_pending = std::min(oldest_pending.value_or(UINT64_MAX), *frame.submitted_frame);
        } else if (status != vk::Result::eSuccess) {
            return std::unexpected(error_from_vk_result(status, ErrorCode::VulkanCallFailed,
                std::format("Fence status query failed: {}", vk::to_string(status))));
        }
    }
    if (oldest_pending) {
        return *oldest_pending - 1;
    }
    return newest;
}

std::expected<vk::CommandBuffer, Error> FrameSync::begin_recording(uint32_t slot)
{
    auto& frame = m_slots[slot];

    if (frame.command_buffer) {
        m_device.freeCommandBuffers(frame.command_pool, frame.command_buffer);
        frame.command_buffer = nullptr;
    }
    auto reset_res = m_device.resetCommandPool(frame.command_pool);
    STARFALL_CHECK_VK_RESULT_VOID(reset_res, VulkanCallFailed, "Failed to reset frame command pool: {}");

    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(frame.command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(1);
    auto command_buffer_res = m_device.allocateCommandBuffers(alloc_info);
    STARFALL_CHECK_VK_RESULT(command_buffer_res, VulkanCallFailed, "Failed to allocate frame command buffer: {}");
    frame.command_buffer = command_buffer_res.value.front();

    auto begin_info = vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit);
    auto begin_res = frame.command_buffer.begin(begin_info);
    STARFALL_CHECK_VK_RESULT_VOID(begin_res, VulkanCallFailed, "Failed to begin frame command buffer: {}");
    return frame.command_buffer;
}

std::expected<void, Error> FrameSync::submit(uint32_t slot, vk::Queue queue, uint32_t image_index, uint64_t frame_number)
{
    return submit_batch(slot, queue, image_index, frame_number, m_slots[slot].command_buffer);
}

std::expected<void, Error> FrameSync::release_image(uint32_t slot, vk::Queue queue, uint32_t image_index, uint64_t frame_number)
{
    Logger::instance().warn("Releasing image {} of abandoned frame {}", image_index, frame_number);
    return submit_batch(slot, queue, image_index, frame_number, nullptr);
}

std::expected<void, Error> FrameSync::submit_batch(uint32_t slot, vk::Queue queue, uint32_t image_index, uint64_t frame_number, vk::CommandBuffer command_buffer)
{
    auto& frame = m_slots[slot];

    // Resetting an unsignaled fence is allowed, so this also covers a retry after a failed submit
    auto reset_res = m_device.resetFences(frame.in_flight);
    STARFALL_CHECK_VK_RESULT_VOID(reset_res, VulkanCallFailed, "Failed to reset in-flight fence: {}");

    // From here until a successful submit the fence never signals, so the slot must not be waited on
    frame.submitted_frame.reset();

    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(frame.image_available)
        .setWaitDstStageMask(wait_stage);
    // Without commands nothing will present the image, so render_finished stays unsignaled
    if (command_buffer) {
        submit_info.setCommandBuffers(command_buffer)
            .setSignalSemaphores(m_render_finished[image_index]);
    }

    auto submit_res = queue.submit(submit_info, frame.in_flight);
    STARFALL_CHECK_VK_RESULT_VOID(submit_res, VulkanCallFailed, "Failed to submit frame: {}");
    frame.submitted_frame = frame_number;
    return {};
}

void FrameSync::destroy_render_finished()
{
    for (auto semaphore : m_render_finished) {
        m_device.destroySemaphore(semaphore);
    }
    m_render_finished.clear();
}

void FrameSync::destroy()
{
    if (!m_device) {
        return;
    }
    destroy_render_finished();
    for (auto& slot : m_slots) {
        // Destroying the pool frees its command buffer
        if (slot.command_pool) m_device.destroyCommandPool(slot.command_pool);
        if (slot.in_flight) m_device.destroyFence(slot.in_flight);
        if (slot.image_available) m_device.destroySemaphore(slot.image_available);
    }
    m_slots.clear();
}

FrameSync::~FrameSync()
{
    destroy();
}

FrameSync::FrameSync(FrameSync&& other) noexcept
    : m_device(std::exchange(other.m_device, nullptr))
    , m_graphics_family(other.m_graphics_family)
    , m_slots(std::move(other.m_slots))
    , m_render_finished(std::move(other.m_render_finished))
{}

FrameSync& FrameSync::operator=(FrameSync&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = std::exchange(other.m_device, nullptr);
        m_graphics_family = other.m_graphics_family;
        m_slots = std::move(other.m_slots);
        m_render_finished = std::move(other.m_render_finished);
    }
    return *this;
}

} // namespace starfall
