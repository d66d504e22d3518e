#include <starfall/DebugOverlay.hpp>
#include <starfall/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>

namespace starfall {

DebugOverlay::DebugOverlay(RendererCore& renderer)
    : m_renderer(&renderer)
    , m_descriptor_pool(nullptr)
{}

DebugOverlay::~DebugOverlay()
{
    cleanup();
}

std::expected<std::unique_ptr<DebugOverlay>, Error> DebugOverlay::create(RendererCore& renderer, const GlfwWindow& window)
{
    auto overlay = std::unique_ptr<DebugOverlay>(new DebugOverlay(renderer));
    if (auto result = overlay->setup_imgui(window); !result) {
        return std::unexpected(result.error());
    }

    renderer.set_overlay_recorder([overlay = overlay.get()](vk::CommandBuffer command_buffer) {
        overlay->record(command_buffer);
    });
    return overlay;
}

std::expected<void, Error> DebugOverlay::setup_imgui(const GlfwWindow& window)
{
    const auto& context = m_renderer->context();

    // ImGui descriptor pool
    std::vector<vk::DescriptorPoolSize> pool_sizes = {
        {vk::DescriptorType::eCombinedImageSampler, 64},
        {vk::DescriptorType::eUniformBuffer, 64}
    };

    auto imgui_pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(64)
        .setPoolSizes(pool_sizes);

    auto pool_res = context.device().createDescriptorPool(imgui_pool_info);
    STARFALL_CHECK_VK_RESULT(pool_res, DescriptorPoolExhausted, "Failed to create ImGui descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO();
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForVulkan(window.get_window_handle(), true);

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = static_cast<VkInstance>(context.instance());
    init_info.PhysicalDevice = static_cast<VkPhysicalDevice>(context.physical_device());
    init_info.Device = static_cast<VkDevice>(context.device());
    init_info.QueueFamily = context.queue_indices().graphics;
    init_info.Queue = static_cast<VkQueue>(context.graphics_queue());
    init_info.DescriptorPool = static_cast<VkDescriptorPool>(m_descriptor_pool);
    init_info.MinImageCount = 2;
    init_info.ImageCount = m_renderer->swapchain_image_count();
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.RenderPass = static_cast<VkRenderPass>(m_renderer->render_pass());
    init_info.Allocator = nullptr;
    init_info.CheckVkResultFn = nullptr;

    ImGui_ImplVulkan_Init(&init_info);
    ImGui_ImplVulkan_CreateFontsTexture();

    Logger::instance().info("Debug overlay ready");
    return {};
}

void DebugOverlay::build(const FrameReport& last_frame, float frame_time_ms)
{
    m_total_dropped += last_frame.dropped_instances;

    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const auto& stats = m_renderer->stats();
    ImGui::Begin("Starfall");
    ImGui::Text("Frame %llu", static_cast<unsigned long long>(last_frame.frame_number));
    ImGui::Text("Frame time: %.2f ms", frame_time_ms);
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);
    if (last_frame.skipped) {
        ImGui::TextDisabled("Last frame skipped: %s", to_string(*last_frame.skipped).data());
    }

    ImGui::Separator();
    ImGui::Text("Pools: %u", stats.active_pools);
    ImGui::Text("Batches: %u", stats.render_batches_per_frame);
    ImGui::Text("Drawn instances: %u", last_frame.drawn_instances);
    ImGui::Text("Active objects: %u", stats.total_active_objects);
    ImGui::Text("Spawned / despawned: %llu / %llu",
        static_cast<unsigned long long>(stats.total_spawned), static_cast<unsigned long long>(stats.total_despawned));

    ImGui::Separator();
    if (last_frame.dropped_instances > 0) {
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.3f, 1.0f), "Dropped this frame: %u", last_frame.dropped_instances);
    } else {
        ImGui::Text("Dropped this frame: 0");
    }
    ImGui::Text("Dropped total: %llu", static_cast<unsigned long long>(m_total_dropped));
    ImGui::End();

    ImGui::Render();
    m_frame_built = true;
}

void DebugOverlay::record(vk::CommandBuffer command_buffer) const
{
    if (!m_frame_built) {
        return;
    }
    if (auto* draw_data = ImGui::GetDrawData()) {
        ImGui_ImplVulkan_RenderDrawData(draw_data, static_cast<VkCommandBuffer>(command_buffer));
    }
}

void DebugOverlay::cleanup()
{
    if (!m_descriptor_pool) {
        return;
    }
    m_renderer->set_overlay_recorder(nullptr);
    if (auto idle = m_renderer->context().wait_idle(); !idle) {
        Logger::instance().error("{}", idle.error().describe());
    }

    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    m_renderer->context().device().destroyDescriptorPool(m_descriptor_pool);
    m_descriptor_pool = nullptr;
}

} // namespace starfall
