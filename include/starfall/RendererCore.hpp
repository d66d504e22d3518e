#pragma once

#include <starfall/Billboard.hpp>
#include <starfall/Buffer.hpp>
#include <starfall/Camera.hpp>
#include <starfall/Commands.hpp>
#include <starfall/Config.hpp>
#include <starfall/DeletionQueue.hpp>
#include <starfall/Descriptors.hpp>
#include <starfall/Events.hpp>
#include <starfall/FrameSync.hpp>
#include <starfall/Lighting.hpp>
#include <starfall/Material.hpp>
#include <starfall/MeshPool.hpp>
#include <starfall/Pipeline.hpp>
#include <starfall/RenderPass.hpp>
#include <starfall/SceneBridge.hpp>
#include <starfall/Swapchain.hpp>
#include <starfall/Text.hpp>
#include <starfall/Texture.hpp>
#include <starfall/Ui.hpp>
#include <starfall/VulkanContext.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace starfall {

enum class SkipReason : uint8_t {
    NotInFrame,      ///< end_frame without begin_frame
    ZeroExtent,      ///< Window minimized
    RecreateFailed,  ///< Swapchain recreation failed once; retried next frame
    OutOfDate,       ///< Acquire reported OUT_OF_DATE
    AcquireTimeout
};

[[nodiscard]] std::string_view to_string(SkipReason reason);

struct FrameReport {
    uint64_t frame_number = 0;
    uint32_t drawn_instances = 0;
    uint32_t dropped_instances = 0;
    uint32_t batches = 0;
    std::optional<SkipReason> skipped;
};

/**
 * @brief The renderer: owns every GPU object and runs the frame loop
 *
 * Single-threaded. Between begin_frame() and end_frame() the caller submits
 * renderables, billboards and UI; end_frame() sorts them into batches,
 * records one command buffer, submits and presents.
 */
class RendererCore
{
public:
    using OverlayRecorder = std::function<void(vk::CommandBuffer)>;

    /**
     * @brief Bring up device, swapchain, pipelines and the built-in pools
     *
     * @param config Renderer settings, validated first
     * @param surface_provider Window to present to; must outlive the renderer
     * @return Renderer, or an InitializationFailure with nothing left alive
     */
    static std::expected<std::unique_ptr<RendererCore>, Error> create(
        const RendererConfig& config,
        const SurfaceProvider& surface_provider
    );

    ~RendererCore();

    RendererCore(const RendererCore&) = delete;
    RendererCore& operator=(const RendererCore&) = delete;
    RendererCore(RendererCore&&) = delete;
    RendererCore& operator=(RendererCore&&) = delete;

    /**
     * @brief Register a mesh type
     *
     * Identical mesh content with the same kind and material returns the
     * existing pool. Invalid meshes are replaced by a cube.
     *
     * @param material Pool material; the default material when unset
     * @param capacity Instances per frame; defaults to the configured capacity for the kind
     */
    std::expected<MeshTypeId, Error> load_mesh(
        const Mesh& mesh,
        std::optional<MaterialId> material = std::nullopt,
        PoolKind kind = PoolKind::Mesh,
        std::optional<uint32_t> capacity = std::nullopt
    );

    std::expected<void, Error> set_pool_material(MeshTypeId mesh_type, std::optional<MaterialId> material);

    /**
     * @brief Upload a material UBO and bind its textures
     *
     * Invalid parameters are replaced by the default material and reported as
     * AssetFallbackUsed. Missing textures bind the white texture.
     */
    std::expected<MaterialId, Error> create_material(const Material& material);

    /**
     * @brief Release a material once no frame in flight can use it
     *
     * Pools still pointing at it fall back to the default material.
     */
    std::expected<void, Error> release_material(MaterialId material);

    std::expected<TextureId, Error> upload_texture(uint32_t width, uint32_t height, std::span<const uint8_t> rgba);

    /**
     * @brief Release a texture once no frame in flight can use it
     *
     * Fails while a live material still samples it.
     */
    std::expected<void, Error> release_texture(TextureId texture);

    /**
     * @brief Wait for this frame slot's fence and start collecting draws
     *
     * Pending swapchain recreation happens here, so UI submitted afterwards
     * sees the new extent.
     */
    std::expected<void, Error> begin_frame(const CameraState& camera, const LightingEnvironment& lighting);

    /**
     * @return false when outside a frame or the mesh type is unknown
     */
    bool submit_renderable(const Renderable& renderable);
    bool submit_billboard(const Billboard& billboard);

    /**
     * @return Number of billboards the trail was split into
     */
    uint32_t submit_trail(std::span<const glm::vec3> points, const TrailStyle& style);
    bool submit_ui_panel(const UiPanel& panel);
    bool submit_ui_text(const TextMesh& text, float x, float y, float pixel_scale = 1.0f, glm::vec4 color = glm::vec4(1.0f));

    /**
     * @brief Acquire, record, submit and present the frame
     *
     * Skipped frames are reported in FrameReport::skipped. Errors are fatal:
     * DEVICE_LOST, fence timeouts and repeated swapchain recreation failures.
     */
    std::expected<FrameReport, Error> end_frame();

    /**
     * @brief Recreate the swapchain at the next frame boundary
     */
    void handle_resize(vk::Extent2D new_extent);

    void request_shutdown() { m_shutdown_requested = true; }
    [[nodiscard]] bool shutdown_requested() const { return m_shutdown_requested; }

    [[nodiscard]] std::vector<RendererEvent> drain_events() { return m_events.drain(); }
    [[nodiscard]] const PoolStats& stats() const { return m_pools.stats(); }

    /**
     * @brief Wait for the device and destroy everything in reverse creation order
     */
    void shutdown();

    /**
     * @brief Record extra draws (the debug overlay) after the UI pass
     */
    void set_overlay_recorder(OverlayRecorder recorder) { m_overlay_recorder = std::move(recorder); }

    [[nodiscard]] const RendererConfig& config() const { return m_config; }
    [[nodiscard]] const VulkanContext& context() const { return *m_context; }
    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass->get(); }
    [[nodiscard]] uint32_t swapchain_image_count() const { return m_swapchain->image_count(); }
    [[nodiscard]] vk::Extent2D extent() const { return m_swapchain->extent(); }
    [[nodiscard]] uint64_t frame_number() const { return m_frame_number; }
    [[nodiscard]] MaterialId default_material_id() const { return m_default_material; }

private:
    struct FrameResources {
        Buffer camera_ubo;
        Buffer lighting_ubo;
        vk::DescriptorSet frame_set;
    };

    struct MaterialResources {
        Material material;
        Buffer ubo;
        vk::DescriptorSet set;
        PipelineVariant variant;
        BlendMode blend;
        InstanceAppearance appearance;
        uint32_t texture_flags;
        std::array<std::optional<TextureId>, MATERIAL_TEXTURE_SLOTS> textures;
    };

    RendererCore(const RendererConfig& config, const SurfaceProvider& surface_provider);

    std::expected<void, Error> initialize();
    std::expected<void, Error> create_frame_resources();
    std::expected<void, Error> create_builtin_resources();

    [[nodiscard]] uint32_t default_capacity(PoolKind kind) const;

    /// Material resources for id, or the default material when the id is stale
    [[nodiscard]] const MaterialResources& material_or_default(std::optional<MaterialId> id) const;
    [[nodiscard]] const Texture& texture_or_white(std::optional<TextureId> id) const;

    bool push_item(MeshTypeId mesh_type, const glm::mat4& transform, std::optional<MaterialId> instance_material,
        std::optional<glm::vec4> tint);

    std::expected<void, Error> recreate_swapchain();
    std::expected<void, Error> write_frame_uniforms(uint32_t slot);
    std::expected<FramePlan, Error> stage_instances();
    void record_draws(vk::CommandBuffer command_buffer, const FramePlan& plan, FrameReport& report);
    FrameReport finish_frame(FrameReport report);
    std::expected<void, Error> release_acquired_image(uint32_t image_index);

    RendererConfig m_config;
    const SurfaceProvider* m_surface_provider;

    // Declaration order is creation order; members are destroyed in reverse
    std::unique_ptr<VulkanContext> m_context;
    std::optional<OneTimeCommands> m_commands;
    std::optional<Swapchain> m_swapchain;
    std::optional<RenderPass> m_render_pass;
    std::optional<DescriptorLayouts> m_layouts;
    std::optional<DescriptorAllocator> m_descriptors;
    std::optional<PipelineManager> m_pipelines;
    std::optional<FrameSync> m_frame_sync;
    std::vector<FrameResources> m_frames;
    SlotMap<Texture, TextureTag> m_textures;
    SlotMap<MaterialResources, MaterialTag> m_materials;
    MeshPoolManager m_pools;
    DeletionQueue m_deletion_queue;
    EventQueue m_events;

    TextureId m_white_texture;
    TextureId m_fallback_texture;
    MaterialId m_default_material;
    MaterialId m_billboard_alpha_material;
    MaterialId m_billboard_additive_material;
    MaterialId m_ui_panel_material;
    MeshTypeId m_billboard_alpha_pool;
    MeshTypeId m_billboard_additive_pool;
    MeshTypeId m_ui_quad_pool;

    // Frame state
    bool m_in_frame = false;
    uint64_t m_frame_number = 0;
    uint64_t m_completed_frame = 0;
    uint32_t m_frame_slot = 0;
    std::optional<SkipReason> m_frame_skip;
    CameraState m_camera;
    LightingEnvironment m_lighting;
    std::vector<DrawItem> m_items;

    bool m_presented_once = false;
    bool m_recreate_requested = false;
    std::optional<vk::Extent2D> m_pending_extent;
    uint32_t m_failed_recreations = 0;
    bool m_shutdown_requested = false;
    bool m_shut_down = false;

    OverlayRecorder m_overlay_recorder;
};

} // namespace starfall
