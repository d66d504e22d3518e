#pragma once

#include <starfall/VulkanContext.hpp>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace starfall {

// Pure selection helpers, shared by creation and recreation

[[nodiscard]] std::optional<vk::SurfaceFormatKHR> choose_surface_format(std::span<const vk::SurfaceFormatKHR> available);
[[nodiscard]] std::optional<vk::PresentModeKHR> choose_present_mode(std::span<const vk::PresentModeKHR> available);
[[nodiscard]] vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities, vk::Extent2D requested);
[[nodiscard]] uint32_t choose_image_count(const vk::SurfaceCapabilitiesKHR& capabilities);

constexpr std::array DEPTH_FORMAT_CANDIDATES = {
    vk::Format::eD32Sfloat, vk::Format::eD32SfloatS8Uint, vk::Format::eD24UnormS8Uint
};

/**
 * @brief First depth format from DEPTH_FORMAT_CANDIDATES the device can attach with optimal tiling
 */
[[nodiscard]] std::expected<vk::Format, Error> find_depth_format(vk::PhysicalDevice physical_device);

enum class RecreateOutcome : uint8_t { Recreated, Skipped };

enum class AcquireStatus : uint8_t {
    Acquired,
    Suboptimal, ///< Image usable, recreate afterwards
    OutOfDate,  ///< No image, recreate before the next frame
    NotReady    ///< Timed out, skip the frame
};

struct AcquireResult {
    AcquireStatus status;
    uint32_t image_index;
};

enum class PresentStatus : uint8_t { Presented, Suboptimal, OutOfDate };

/**
 * @brief Swapchain images with per-image colour views, depth attachments and framebuffers
 */
class Swapchain
{
public:
    /**
     * @brief Create the chain; framebuffers follow once the render pass exists
     *
     * @param context Presenting context (headless contexts fail)
     * @param requested Extent used when the surface lets us choose
     */
    static std::expected<Swapchain, Error> create(const VulkanContext& context, vk::Extent2D requested);

    ~Swapchain();

    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;
    Swapchain(Swapchain&& other) noexcept;
    Swapchain& operator=(Swapchain&& other) noexcept;

    std::expected<void, Error> create_framebuffers(vk::RenderPass render_pass);

    /**
     * @brief Rebuild everything at a new extent
     *
     * A zero width or height leaves the chain untouched and reports Skipped.
     * Otherwise waits for the device, recreates with oldSwapchain set and
     * rebuilds views, depth and framebuffers.
     */
    std::expected<RecreateOutcome, Error> recreate(vk::Extent2D new_extent, vk::RenderPass render_pass);

    [[nodiscard]] std::expected<AcquireResult, Error> acquire_next_image(vk::Semaphore signal_semaphore, uint64_t timeout) const;

    [[nodiscard]] std::expected<PresentStatus, Error> present(vk::Queue present_queue, vk::Semaphore wait_semaphore, uint32_t image_index) const;

    [[nodiscard]] vk::SwapchainKHR get() const { return m_swapchain; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_targets.size()); }
    [[nodiscard]] vk::Format color_format() const { return m_surface_format.format; }
    [[nodiscard]] vk::Format depth_format() const { return m_depth_format; }
    [[nodiscard]] vk::Framebuffer framebuffer(uint32_t image_index) const { return m_targets[image_index].framebuffer; }

private:
    /// Everything rendered into for one presentable image
    struct ImageTarget {
        vk::Image color;
        vk::ImageView color_view;
        vk::Image depth;
        vk::DeviceMemory depth_memory;
        vk::ImageView depth_view;
        vk::Framebuffer framebuffer;
    };

    explicit Swapchain(const VulkanContext& context);

    std::expected<void, Error> create_swapchain(vk::Extent2D requested, vk::SwapchainKHR old_swapchain);
    std::expected<void, Error> create_depth_resources();
    std::expected<vk::ImageView, Error> create_view(vk::Image image, vk::Format format, vk::ImageAspectFlags aspect) const;
    void destroy_targets();
    void cleanup();

    const VulkanContext* m_context;
    vk::Device m_device;

    vk::SwapchainKHR m_swapchain;
    vk::SurfaceFormatKHR m_surface_format;
    vk::PresentModeKHR m_present_mode = vk::PresentModeKHR::eFifo;
    vk::Extent2D m_extent;
    vk::Format m_depth_format = vk::Format::eUndefined;

    std::vector<ImageTarget> m_targets;
};

} // namespace starfall
