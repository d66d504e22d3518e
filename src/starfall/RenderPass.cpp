#include <starfall/RenderPass.hpp>
#include <starfall/Logger.hpp>
#include <utility>

namespace starfall {

RenderPass::RenderPass(vk::Device device, vk::RenderPass render_pass, vk::Format color_format, vk::Format depth_format)
    : m_device(device)
    , m_render_pass(render_pass)
    , m_color_format(color_format)
    , m_depth_format(depth_format)
{}

namespace {

// Both attachments are cleared on load and carry no stencil
vk::AttachmentDescription cleared_attachment(vk::Format format, vk::AttachmentStoreOp store, vk::ImageLayout final_layout)
{
    return vk::AttachmentDescription()
        .setFormat(format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(store)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(final_layout);
}

} // anonymous namespace

std::expected<RenderPass, Error> RenderPass::create(vk::Device device, vk::Format color_format, vk::Format depth_format)
{
    std::array attachments{
        cleared_attachment(color_format, vk::AttachmentStoreOp::eStore, vk::ImageLayout::ePresentSrcKHR),
        cleared_attachment(depth_format, vk::AttachmentStoreOp::eDontCare, vk::ImageLayout::eDepthStencilAttachmentOptimal),
    };

    vk::AttachmentReference color_ref(0, vk::ImageLayout::eColorAttachmentOptimal);
    vk::AttachmentReference depth_ref(1, vk::ImageLayout::eDepthStencilAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref)
        .setPDepthStencilAttachment(&depth_ref);

    // Wait for the previous frame's colour and depth writes before clearing
    constexpr auto attachment_stages = vk::PipelineStageFlagBits::eColorAttachmentOutput | vk::PipelineStageFlagBits::eEarlyFragmentTests;
    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(attachment_stages)
        .setDstStageMask(attachment_stages)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite | vk::AccessFlagBits::eDepthStencilAttachmentWrite);

    auto render_pass_info = vk::RenderPassCreateInfo()
        .setAttachments(attachments)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto render_pass_res = device.createRenderPass(render_pass_info);
    STARFALL_CHECK_VK_RESULT(render_pass_res, VulkanCallFailed, "Could not create render pass {}");

    Logger::instance().debug("Created render pass (color {}, depth {})",
        vk::to_string(color_format), vk::to_string(depth_format));
    return RenderPass(device, render_pass_res.value, color_format, depth_format);
}

RenderPass::~RenderPass()
{
    if (m_render_pass) {
        m_device.destroyRenderPass(m_render_pass);
    }
}

RenderPass::RenderPass(RenderPass&& other) noexcept
    : m_device(other.m_device)
    , m_render_pass(std::exchange(other.m_render_pass, nullptr))
    , m_color_format(other.m_color_format)
    , m_depth_format(other.m_depth_format)
{}

RenderPass& RenderPass::operator=(RenderPass&& other) noexcept
{
    if (this != &other) {
        if (m_render_pass) {
            m_device.destroyRenderPass(m_render_pass);
        }
        m_device = other.m_device;
        m_render_pass = std::exchange(other.m_render_pass, nullptr);
        m_color_format = other.m_color_format;
        m_depth_format = other.m_depth_format;
    }
    return *this;
}

std::array<vk::ClearValue, 2> make_clear_values(const glm::vec4& clear_color)
{
    return {
        vk::ClearValue(vk::ClearColorValue(clear_color.r, clear_color.g, clear_color.b, clear_color.a)),
        vk::ClearValue(vk::ClearDepthStencilValue(1.0f, 0)),
    };
}

} // namespace starfall
