#include <starfall/Swapchain.hpp>
#include <starfall/Logger.hpp>
#include <starfall/Memory.hpp>
#include <algorithm>

namespace starfall {

std::optional<vk::SurfaceFormatKHR> choose_surface_format(std::span<const vk::SurfaceFormatKHR> available)
{
    if (available.empty()) {
        return std::nullopt;
    }
    // Prefer SRGB if available
    for (const auto& format : available) {
        if (format.format == vk::Format::eB8G8R8A8Srgb &&
            format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) {
            return format;
        }
    }
    return available[0];
}

std::optional<vk::PresentModeKHR> choose_present_mode(std::span<const vk::PresentModeKHR> available)
{
    if (available.empty()) {
        return std::nullopt;
    }
    if (std::ranges::contains(available, vk::PresentModeKHR::eMailbox)) {
        return vk::PresentModeKHR::eMailbox;
    }
    return vk::PresentModeKHR::eFifo;  // Always available
}

vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities, vk::Extent2D requested)
{
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return capabilities.currentExtent;
    }

    // Window manager allows us to choose - clamp to valid range
    return vk::Extent2D{
        std::clamp(requested.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(requested.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height)
    };
}

uint32_t choose_image_count(const vk::SurfaceCapabilitiesKHR& capabilities)
{
    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0 && image_count > capabilities.maxImageCount) {
        image_count = capabilities.maxImageCount;
    }
    return image_count;
}

std::expected<vk::Format, Error> find_depth_format(vk::PhysicalDevice physical_device)
{
    for (vk::Format format : DEPTH_FORMAT_CANDIDATES) {
        auto props = physical_device.getFormatProperties(format);
        if (props.optimalTilingFeatures & vk::FormatFeatureFlagBits::eDepthStencilAttachment) {
            return format;
        }
    }
    return std::unexpected(Error::make(ErrorCode::SwapchainCreationFailed, "No supported depth format"));
}

Swapchain::Swapchain(const VulkanContext& context)
    : m_context(&context)
    , m_device(context.device())
{}

std::expected<Swapchain, Error> Swapchain::create(const VulkanContext& context, vk::Extent2D requested)
{
    if (context.headless()) {
        return std::unexpected(Error::make(ErrorCode::SwapchainCreationFailed, "Headless context has no surface"));
    }

    Swapchain swapchain(context);

    auto depth_format = find_depth_format(context.physical_device());
    if (!depth_format) {
        return std::unexpected(depth_format.error());
    }
    swapchain.m_depth_format = *depth_format;

    if (auto result = swapchain.create_swapchain(requested, nullptr); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = swapchain.create_depth_resources(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Swapchain created: {}x{}, {} images, {}, {}",
        swapchain.m_extent.width, swapchain.m_extent.height, swapchain.m_targets.size(),
        vk::to_string(swapchain.m_surface_format.format), vk::to_string(swapchain.m_present_mode));
    return swapchain;
}

std::expected<void, Error> Swapchain::create_swapchain(vk::Extent2D requested, vk::SwapchainKHR old_swapchain)
{
    auto physical_device = m_context->physical_device();
    auto surface = m_context->surface();

    auto surface_capabilities_res = physical_device.getSurfaceCapabilitiesKHR(surface);
    STARFALL_CHECK_VK_RESULT(surface_capabilities_res, SwapchainCreationFailed, "Could not query surface capabilities {}");
    auto surface_formats_res = physical_device.getSurfaceFormatsKHR(surface);
    STARFALL_CHECK_VK_RESULT(surface_formats_res, SwapchainCreationFailed, "Could not query surface formats {}");
    auto present_modes_res = physical_device.getSurfacePresentModesKHR(surface);
    STARFALL_CHECK_VK_RESULT(present_modes_res, SwapchainCreationFailed, "Could not query present modes {}");

    auto surface_format = choose_surface_format(surface_formats_res.value);
    auto present_mode = choose_present_mode(present_modes_res.value);
    if (!surface_format || !present_mode) {
        return std::unexpected(Error::make(ErrorCode::SwapchainCreationFailed,
            "Surface offers no compatible format or present mode"));
    }

    const auto& surface_capabilities = surface_capabilities_res.value;
    m_surface_format = *surface_format;
    m_present_mode = *present_mode;
    m_extent = choose_extent(surface_capabilities, requested);

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(surface)
        .setMinImageCount(choose_image_count(surface_capabilities))
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment | vk::ImageUsageFlagBits::eTransferSrc)
        .setPreTransform(surface_capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(m_present_mode)
        .setClipped(true)
        .setOldSwapchain(old_swapchain);

    const auto& queues = m_context->queue_indices();
    std::array family_indices = {queues.graphics, queues.present};
    if (queues.shared()) {
        swapchain_info.setImageSharingMode(vk::SharingMode::eExclusive);
    } else {
        swapchain_info.setImageSharingMode(vk::SharingMode::eConcurrent)
            .setQueueFamilyIndices(family_indices);
    }

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    STARFALL_CHECK_VK_RESULT(swapchain_res, SwapchainCreationFailed, "Could not create swapchain {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    STARFALL_CHECK_VK_RESULT(images_res, SwapchainCreationFailed, "Could not get swapchain images {}");

    m_targets.clear();
    for (vk::Image image : images_res.value) {
        // Pushed first so a failed view is still cleaned up with the rest
        m_targets.push_back(ImageTarget{.color = image});
        auto view = create_view(image, m_surface_format.format, vk::ImageAspectFlagBits::eColor);
        if (!view) {
            return std::unexpected(view.error());
        }
        m_targets.back().color_view = *view;
    }
    return {};
}

std::expected<vk::ImageView, Error> Swapchain::create_view(vk::Image image, vk::Format format, vk::ImageAspectFlags aspect) const
{
    auto view_res = m_device.createImageView(vk::ImageViewCreateInfo()
        .setImage(image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(format)
        .setSubresourceRange(vk::ImageSubresourceRange(aspect, 0, 1, 0, 1)));
    STARFALL_CHECK_VK_RESULT(view_res, SwapchainCreationFailed, "Could not create swapchain image view {}");
    return view_res.value;
}

std::expected<void, Error> Swapchain::create_depth_resources()
{
    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setExtent(vk::Extent3D(m_extent.width, m_extent.height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setFormat(m_depth_format)
        .setTiling(vk::ImageTiling::eOptimal)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setUsage(vk::ImageUsageFlagBits::eDepthStencilAttachment)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setSamples(vk::SampleCountFlagBits::e1);

    // Frames in flight may render to different images at once, so depth is per image
    for (auto& target : m_targets) {
        auto image_res = m_device.createImage(image_info);
        STARFALL_CHECK_VK_RESULT(image_res, SwapchainCreationFailed, "Could not create depth image {}");
        target.depth = image_res.value;

        auto requirements = m_device.getImageMemoryRequirements(target.depth);
        auto memory_type = find_memory_type(m_context->limits().memory_properties,
            requirements.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
        if (!memory_type) {
            return std::unexpected(memory_type.error());
        }

        auto memory_res = m_device.allocateMemory(vk::MemoryAllocateInfo(requirements.size, *memory_type));
        STARFALL_CHECK_VK_RESULT(memory_res, OutOfDeviceMemory, "Could not allocate depth memory {}");
        target.depth_memory = memory_res.value;

        auto bind_res = m_device.bindImageMemory(target.depth, target.depth_memory, 0);
        STARFALL_CHECK_VK_RESULT_VOID(bind_res, SwapchainCreationFailed, "Could not bind depth image memory {}");

        auto view = create_view(target.depth, m_depth_format, vk::ImageAspectFlagBits::eDepth);
        if (!view) {
            return std::unexpected(view.error());
        }
        target.depth_view = *view;
    }
    return {};
}

std::expected<void, Error> Swapchain::create_framebuffers(vk::RenderPass render_pass)
{
    for (auto& target : m_targets) {
        if (target.framebuffer) {
            m_device.destroyFramebuffer(target.framebuffer);
            target.framebuffer = nullptr;
        }

        std::array attachments{target.color_view, target.depth_view};
        auto framebuffer_res = m_device.createFramebuffer(vk::FramebufferCreateInfo()
            .setRenderPass(render_pass)
            .setAttachments(attachments)
            .setWidth(m_extent.width)
            .setHeight(m_extent.height)
            .setLayers(1));
        STARFALL_CHECK_VK_RESULT(framebuffer_res, SwapchainCreationFailed, "Could not create framebuffer {}");
        target.framebuffer = framebuffer_res.value;
    }
    return {};
}

std::expected<RecreateOutcome, Error> Swapchain::recreate(vk::Extent2D new_extent, vk::RenderPass render_pass)
{
    if (new_extent.width == 0 || new_extent.height == 0) {
        Logger::instance().debug("Skipping swapchain recreation for zero extent {}x{}", new_extent.width, new_extent.height);
        return RecreateOutcome::Skipped;
    }

    if (auto idle = m_context->wait_idle(); !idle) {
        return std::unexpected(idle.error());
    }

    auto old_format = m_surface_format.format;
    destroy_targets();

    auto old_swapchain = std::exchange(m_swapchain, nullptr);
    auto created = create_swapchain(new_extent, old_swapchain);
    m_device.destroySwapchainKHR(old_swapchain);
    if (!created) {
        return std::unexpected(created.error());
    }

    if (m_surface_format.format != old_format) {
        return std::unexpected(Error::make(ErrorCode::SwapchainCreationFailed,
            std::format("Surface format changed from {} to {}", vk::to_string(old_format), vk::to_string(m_surface_format.format))));
    }

    if (auto result = create_depth_resources(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = create_framebuffers(render_pass); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Swapchain recreated: {}x{}", m_extent.width, m_extent.height);
    return RecreateOutcome::Recreated;
}

std::expected<AcquireResult, Error> Swapchain::acquire_next_image(vk::Semaphore signal_semaphore, uint64_t timeout) const
{
    // Raw call: vk::Result::eErrorOutOfDateKHR is an expected outcome here
    uint32_t image_index = 0;
    auto result = static_cast<vk::Result>(vkAcquireNextImageKHR(
        m_device, m_swapchain, timeout, signal_semaphore, VK_NULL_HANDLE, &image_index));

    switch (result) {
        case vk::Result::eSuccess: return AcquireResult{AcquireStatus::Acquired, image_index};
        case vk::Result::eSuboptimalKHR: return AcquireResult{AcquireStatus::Suboptimal, image_index};
        case vk::Result::eErrorOutOfDateKHR: return AcquireResult{AcquireStatus::OutOfDate, 0};
        case vk::Result::eTimeout:
        case vk::Result::eNotReady: return AcquireResult{AcquireStatus::NotReady, 0};
        default:
            return std::unexpected(error_from_vk_result(result, ErrorCode::VulkanCallFailed,
                std::format("acquireNextImageKHR error: {}", vk::to_string(result))));
    }
}

std::expected<PresentStatus, Error> Swapchain::present(vk::Queue present_queue, vk::Semaphore wait_semaphore, uint32_t image_index) const
{
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(image_index);

    // vk-hpp treats OUT_OF_DATE as fatal, so present through the C entry point
    auto result = static_cast<vk::Result>(VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(present_queue),
        &static_cast<const VkPresentInfoKHR&>(present_info)));

    switch (result) {
        case vk::Result::eSuccess: return PresentStatus::Presented;
        case vk::Result::eSuboptimalKHR: return PresentStatus::Suboptimal;
        case vk::Result::eErrorOutOfDateKHR: return PresentStatus::OutOfDate;
        default:
            return std::unexpected(error_from_vk_result(result, ErrorCode::VulkanCallFailed,
                std::format("presentKHR error: {}", vk::to_string(result))));
    }
}

void Swapchain::destroy_targets()
{
    // Null handles are ignored by the destroy calls
    for (const auto& target : m_targets) {
        m_device.destroyFramebuffer(target.framebuffer);
        m_device.destroyImageView(target.depth_view);
        m_device.destroyImage(target.depth);
        m_device.freeMemory(target.depth_memory);
        m_device.destroyImageView(target.color_view);
    }
    m_targets.clear();
}

void Swapchain::cleanup()
{
    if (!m_device) {
        return;
    }
    destroy_targets();
    if (m_swapchain) {
        m_device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
    }
}

Swapchain::~Swapchain()
{
    cleanup();
}

Swapchain::Swapchain(Swapchain&& other) noexcept
    : m_context(other.m_context)
    , m_device(std::exchange(other.m_device, nullptr))
    , m_swapchain(std::exchange(other.m_swapchain, nullptr))
    , m_surface_format(other.m_surface_format)
    , m_present_mode(other.m_present_mode)
    , m_extent(other.m_extent)
    , m_depth_format(other.m_depth_format)
    , m_targets(std::move(other.m_targets))
{}

Swapchain& Swapchain::operator=(Swapchain&& other) noexcept
{
    if (this != &other) {
        cleanup();
        m_context = other.m_context;
        m_device = std::exchange(other.m_device, nullptr);
        m_swapchain = std::exchange(other.m_swapchain, nullptr);
        m_surface_format = other.m_surface_format;
        m_present_mode = other.m_present_mode;
        m_extent = other.m_extent;
        m_depth_format = other.m_depth_format;
        m_targets = std::move(other.m_targets);
    }
    return *this;
}

} // namespace starfall
