#pragma once

#include <starfall/VulkanContext.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <vector>

namespace starfall {

/**
 * @brief Wait in timeout-sized steps, retrying on TIMEOUT
 *
 * @param wait Performs one wait with the given timeout and returns its result
 * @return FenceTimeout after max_retries timeouts, DeviceLost on DEVICE_LOST
 */
[[nodiscard]] std::expected<void, Error> wait_with_retries(
    const std::function<vk::Result(uint64_t)>& wait,
    uint64_t timeout_ns,
    uint32_t max_retries
);

/**
 * @brief Per frame-in-flight resources
 */
struct FrameSlot {
    vk::Semaphore image_available;
    vk::Fence in_flight; ///< Created signaled
    vk::CommandPool command_pool;
    vk::CommandBuffer command_buffer;
    std::optional<uint64_t> submitted_frame;
};

/**
 * @brief Semaphores, fences and command buffers of the frame loop
 *
 * Image-available semaphores and fences belong to frame slots. Render-finished
 * semaphores belong to swapchain images because acquisition order need not
 * follow slot order.
 */
class FrameSync
{
public:
    static std::expected<FrameSync, Error> create(const VulkanContext& context, uint32_t frames_in_flight, uint32_t image_count);

    ~FrameSync();

    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;
    FrameSync(FrameSync&& other) noexcept;
    FrameSync& operator=(FrameSync&& other) noexcept;

    /**
     * @brief Rebuild the per-image semaphores; the device must be idle
     */
    std::expected<void, Error> resize_images(uint32_t image_count);

    /**
     * @brief Wait for the slot's previous submission, leaving the fence signaled
     *
     * @return Frame number the slot last submitted, or nullopt if it never did
     */
    std::expected<std::optional<uint64_t>, Error> wait_for_slot(uint32_t slot, uint64_t timeout_ns, uint32_t max_retries);

    /**
     * @brief Newest frame number known to have finished on the GPU
     *
     * Polls every slot's fence; a frame counts as finished only when every
     * earlier submission has finished too.
     */
    [[nodiscard]] std::expected<uint64_t, Error> completed_frame() const;

    /**
     * @brief Free the slot's previous command buffer, allocate a fresh one and begin it
     */
    std::expected<vk::CommandBuffer, Error> begin_recording(uint32_t slot);

    /**
     * @brief Reset the slot's fence and submit its command buffer
     *
     * Waits on image_available at COLOR_ATTACHMENT_OUTPUT and signals the
     * render-finished semaphore of image_index.
     */
    std::expected<void, Error> submit(uint32_t slot, vk::Queue queue, uint32_t image_index, uint64_t frame_number);

    /**
     * @brief Consume an acquire whose frame failed before submission
     *
     * Submits an empty batch that waits on image_available and signals the
     * fence, so the slot can be waited on and acquired into again. The image
     * itself is not presented and render_finished is left untouched.
     */
    std::expected<void, Error> release_image(uint32_t slot, vk::Queue queue, uint32_t image_index, uint64_t frame_number);

    [[nodiscard]] const FrameSlot& slot(uint32_t index) const { return m_slots[index]; }
    [[nodiscard]] vk::Semaphore image_available(uint32_t slot) const { return m_slots[slot].image_available; }
    [[nodiscard]] vk::Semaphore render_finished(uint32_t image_index) const { return m_render_finished[image_index]; }
    [[nodiscard]] uint32_t frames_in_flight() const { return static_cast<uint32_t>(m_slots.size()); }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_render_finished.size()); }

private:
    FrameSync(vk::Device device, uint32_t graphics_family);
    std::expected<void, Error> submit_batch(uint32_t slot, vk::Queue queue, uint32_t image_index, uint64_t frame_number, vk::CommandBuffer command_buffer);
    void destroy_render_finished();
    void destroy();

    vk::Device m_device;
    uint32_t m_graphics_family;
    std::vector<FrameSlot> m_slots;
    std::vector<vk::Semaphore> m_render_finished;
};

} // namespace starfall
