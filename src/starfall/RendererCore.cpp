#include <starfall/RendererCore.hpp>
#include <starfall/Assets.hpp>
#include <starfall/Logger.hpp>
#include <limits>

namespace starfall {

std::string_view to_string(SkipReason reason)
{
    switch (reason) {
        case SkipReason::NotInFrame: return "NotInFrame";
        case SkipReason::ZeroExtent: return "ZeroExtent";
        case SkipReason::RecreateFailed: return "RecreateFailed";
        case SkipReason::OutOfDate: return "OutOfDate";
        case SkipReason::AcquireTimeout: return "AcquireTimeout";
    }
    return "Unknown";
}

namespace {

/// Pools are shared only between identical mesh content with the same kind and material
uint64_t pool_key(uint64_t mesh_hash, PoolKind kind, std::optional<MaterialId> material)
{
    uint64_t key = mesh_hash;
    auto mix = [&](uint64_t value) { key ^= value + 0x9e3779b97f4a7c15ull + (key << 6) + (key >> 2); };
    mix(static_cast<uint64_t>(kind));
    mix(material ? std::hash<MaterialId>{}(*material) : UINT64_MAX);
    return key;
}

/// Drop texture references for which pred is false
void strip_textures(Material& material, const std::function<bool(TextureId)>& keep)
{
    auto strip = [&](std::optional<TextureId>& texture) {
        if (texture && !keep(*texture)) {
            Logger::instance().warn("Material references unknown texture {}:{}, binding white instead",
                texture->index, texture->generation);
            texture.reset();
        }
    };
    auto strip_pbr = [&](StandardPbr& pbr) {
        strip(pbr.textures.base_color);
        strip(pbr.textures.normal);
        strip(pbr.textures.metallic_roughness);
        strip(pbr.textures.emission_ao);
    };
    auto strip_unlit = [&](Unlit& unlit) { strip(unlit.texture); };
    std::visit(overloaded{
        strip_pbr,
        strip_unlit,
        [&](Transparent& transparent) { std::visit(overloaded{strip_pbr, strip_unlit}, transparent.base); }
    }, material);
}

} // anonymous namespace

RendererCore::RendererCore(const RendererConfig& config, const SurfaceProvider& surface_provider)
    : m_config(config)
    , m_surface_provider(&surface_provider)
    , m_pools(config.frames_in_flight)
{}

RendererCore::~RendererCore()
{
    shutdown();
}

std::expected<std::unique_ptr<RendererCore>, Error> RendererCore::create(
    const RendererConfig& config,
    const SurfaceProvider& surface_provider
) {
    if (auto valid = validate_config(config); !valid) {
        Logger::instance().error("{}", valid.error().describe());
        return std::unexpected(valid.error());
    }

    auto core = std::unique_ptr<RendererCore>(new RendererCore(config, surface_provider));
    if (auto result = core->initialize(); !result) {
        Logger::instance().error("Renderer startup failed: {}", result.error().describe());
        core->shutdown();
        return std::unexpected(result.error());
    }
    return core;
}

std::expected<void, Error> RendererCore::initialize()
{
    Logger::instance().info("Initializing renderer...");

    auto context = VulkanContext::create(m_config, m_surface_provider);
    if (!context) {
        return std::unexpected(context.error());
    }
    m_context = std::move(*context);

    auto commands = OneTimeCommands::create(*m_context);
    if (!commands) {
        return std::unexpected(commands.error());
    }
    m_commands.emplace(std::move(*commands));

    auto swapchain = Swapchain::create(*m_context, m_surface_provider->framebuffer_extent());
    if (!swapchain) {
        return std::unexpected(swapchain.error());
    }
    m_swapchain.emplace(std::move(*swapchain));

    auto render_pass = RenderPass::create(m_context->device(), m_swapchain->color_format(), m_swapchain->depth_format());
    if (!render_pass) {
        return std::unexpected(render_pass.error());
    }
    m_render_pass.emplace(std::move(*render_pass));

    if (auto result = m_swapchain->create_framebuffers(m_render_pass->get()); !result) {
        return std::unexpected(result.error());
    }

    auto layouts = DescriptorLayouts::create(m_context->device());
    if (!layouts) {
        return std::unexpected(layouts.error());
    }
    m_layouts.emplace(std::move(*layouts));

    auto descriptors = DescriptorAllocator::create(m_context->device(), *m_layouts, DescriptorBudget::from_config(m_config));
    if (!descriptors) {
        return std::unexpected(descriptors.error());
    }
    m_descriptors.emplace(std::move(*descriptors));

    auto pipelines = PipelineManager::create(*m_context, *m_layouts, m_render_pass->get());
    if (!pipelines) {
        return std::unexpected(pipelines.error());
    }
    m_pipelines.emplace(std::move(*pipelines));

    auto frame_sync = FrameSync::create(*m_context, m_config.frames_in_flight, m_swapchain->image_count());
    if (!frame_sync) {
        return std::unexpected(frame_sync.error());
    }
    m_frame_sync.emplace(std::move(*frame_sync));

    if (auto result = create_frame_resources(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = create_builtin_resources(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Renderer ready on '{}': {}x{}, {} images, {} frames in flight",
        m_context->limits().device_name, m_swapchain->extent().width, m_swapchain->extent().height,
        m_swapchain->image_count(), m_config.frames_in_flight);
    return {};
}

std::expected<void, Error> RendererCore::create_frame_resources()
{
    for (uint32_t i = 0; i < m_config.frames_in_flight; i++) {
        auto camera_ubo = Buffer::create(*m_context, sizeof(CameraUbo), vk::BufferUsageFlagBits::eUniformBuffer, MemoryUsage::HostVisible);
        if (!camera_ubo) {
            return std::unexpected(camera_ubo.error());
        }
        auto lighting_ubo = Buffer::create(*m_context, sizeof(LightingUbo), vk::BufferUsageFlagBits::eUniformBuffer, MemoryUsage::HostVisible);
        if (!lighting_ubo) {
            return std::unexpected(lighting_ubo.error());
        }
        auto frame_set = m_descriptors->allocate(SetKind::Frame);
        if (!frame_set) {
            return std::unexpected(frame_set.error());
        }
        write_frame_set(m_context->device(), *frame_set, camera_ubo->descriptor_info(), lighting_ubo->descriptor_info());
        m_frames.push_back(FrameResources{std::move(*camera_ubo), std::move(*lighting_ubo), *frame_set});
    }
    return {};
}

std::expected<void, Error> RendererCore::create_builtin_resources()
{
    // Bound wherever a material leaves a texture slot empty
    auto white = Texture::solid_color(*m_context, *m_commands, {255, 255, 255, 255});
    if (!white) {
        return std::unexpected(white.error());
    }
    m_white_texture = m_textures.insert(std::move(*white));

    auto fallback = fallback_image();
    auto magenta = Texture::from_rgba(*m_context, *m_commands, fallback.width, fallback.height, fallback.rgba);
    if (!magenta) {
        return std::unexpected(magenta.error());
    }
    m_fallback_texture = m_textures.insert(std::move(*magenta));

    auto default_id = create_material(default_material());
    if (!default_id) {
        return std::unexpected(default_id.error());
    }
    m_default_material = *default_id;

    auto billboard_alpha = create_material(Transparent{Unlit{}, AlphaBlend{}, BlendMode::Alpha});
    auto billboard_additive = create_material(Transparent{Unlit{}, AlphaBlend{}, BlendMode::Additive});
    auto ui_panel = create_material(Unlit{});
    if (!billboard_alpha || !billboard_additive || !ui_panel) {
        return std::unexpected(!billboard_alpha ? billboard_alpha.error()
            : !billboard_additive ? billboard_additive.error() : ui_panel.error());
    }
    m_billboard_alpha_material = *billboard_alpha;
    m_billboard_additive_material = *billboard_additive;
    m_ui_panel_material = *ui_panel;

    Mesh quad = make_quad();
    auto alpha_pool = load_mesh(quad, m_billboard_alpha_material, PoolKind::Billboard);
    if (!alpha_pool) {
        return std::unexpected(alpha_pool.error());
    }
    m_billboard_alpha_pool = *alpha_pool;

    auto additive_pool = load_mesh(quad, m_billboard_additive_material, PoolKind::Billboard);
    if (!additive_pool) {
        return std::unexpected(additive_pool.error());
    }
    m_billboard_additive_pool = *additive_pool;

    auto ui_pool = load_mesh(quad, m_ui_panel_material, PoolKind::UiPanel);
    if (!ui_pool) {
        return std::unexpected(ui_pool.error());
    }
    m_ui_quad_pool = *ui_pool;
    return {};
}

uint32_t RendererCore::default_capacity(PoolKind kind) const
{
    switch (kind) {
        case PoolKind::Mesh: return m_config.default_pool_capacity;
        case PoolKind::Billboard: return m_config.billboard_pool_capacity;
        case PoolKind::UiPanel: return m_config.ui_pool_capacity;
        case PoolKind::UiText: return m_config.text_pool_capacity;
    }
    return m_config.default_pool_capacity;
}

const RendererCore::MaterialResources& RendererCore::material_or_default(std::optional<MaterialId> id) const
{
    if (id) {
        if (const auto* material = m_materials.get(*id)) {
            return *material;
        }
    }
    return *m_materials.get(m_default_material);
}

const Texture& RendererCore::texture_or_white(std::optional<TextureId> id) const
{
    if (id) {
        if (const auto* texture = m_textures.get(*id)) {
            return *texture;
        }
    }
    return *m_textures.get(m_white_texture);
}

std::expected<MeshTypeId, Error> RendererCore::load_mesh(
    const Mesh& mesh,
    std::optional<MaterialId> material,
    PoolKind kind,
    std::optional<uint32_t> capacity
) {
    if (material && !m_materials.contains(*material)) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle,
            std::format("Pool material {}:{} does not exist", material->index, material->generation)));
    }

    Mesh usable = resolve_mesh_asset(mesh, &m_events);
    uint64_t key = pool_key(content_hash(usable), kind, material);
    if (auto existing = m_pools.find_by_hash(key)) {
        Logger::instance().debug("Mesh already loaded as pool {}:{}", existing->index, existing->generation);
        return *existing;
    }

    uint32_t pool_capacity = capacity.value_or(default_capacity(kind));
    if (pool_capacity == 0) {
        return std::unexpected(Error::make(ErrorCode::InvalidConfig, "Mesh pool capacity must be greater than zero"));
    }

    auto buffers = PoolBuffers::create(*m_context, *m_commands, *m_descriptors, usable, pool_capacity, m_config.frames_in_flight);
    if (!buffers) {
        Logger::instance().error("{}", buffers.error().describe());
        return std::unexpected(buffers.error());
    }

    MeshPool pool(kind, material, pool_capacity, m_config.frames_in_flight);
    pool.attach_buffers(std::move(*buffers));
    auto id = m_pools.add_pool(std::move(pool), key);
    Logger::instance().debug("Loaded {} pool {}:{} ({} vertices, {} indices, capacity {})",
        to_string(kind), id.index, id.generation, usable.vertices.size(), usable.indices.size(), pool_capacity);
    return id;
}

std::expected<void, Error> RendererCore::set_pool_material(MeshTypeId mesh_type, std::optional<MaterialId> material)
{
    auto* pool = m_pools.get(mesh_type);
    if (!pool) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle,
            std::format("Mesh type {}:{} does not exist", mesh_type.index, mesh_type.generation)));
    }
    if (material && !m_materials.contains(*material)) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle,
            std::format("Material {}:{} does not exist", material->index, material->generation)));
    }
    pool->set_material(material);
    return {};
}

std::expected<MaterialId, Error> RendererCore::create_material(const Material& requested)
{
    Material material = resolve_material_asset(requested, &m_events);
    strip_textures(material, [&](TextureId id) { return m_textures.contains(id); });

    auto ubo = Buffer::create(*m_context, MATERIAL_UBO_SIZE, vk::BufferUsageFlagBits::eUniformBuffer, MemoryUsage::HostVisible);
    if (!ubo) {
        return std::unexpected(ubo.error());
    }
    auto packed = pack_material_ubo(material);
    if (auto written = ubo->write(packed); !written) {
        return std::unexpected(written.error());
    }

    auto set = m_descriptors->allocate(SetKind::Material);
    if (!set) {
        Logger::instance().error("{}", set.error().describe());
        return std::unexpected(set.error());
    }

    auto textures = material_textures(material);
    std::array<vk::DescriptorImageInfo, MATERIAL_TEXTURE_SLOTS> image_infos;
    for (std::size_t i = 0; i < MATERIAL_TEXTURE_SLOTS; ++i) {
        image_infos[i] = texture_or_white(textures[i]).descriptor_info();
    }
    write_material_set(m_context->device(), *set, ubo->descriptor_info(0, MATERIAL_UBO_SIZE), image_infos);

    auto id = m_materials.insert(MaterialResources{
        .material = material,
        .ubo = std::move(*ubo),
        .set = *set,
        .variant = required_pipeline(material),
        .blend = material_blend(material),
        .appearance = instance_appearance(material),
        .texture_flags = material_texture_flags(material),
        .textures = textures,
    });
    Logger::instance().debug("Created material {}:{} ({})", id.index, id.generation, to_string(required_pipeline(material)));
    return id;
}

std::expected<void, Error> RendererCore::release_material(MaterialId material)
{
    if (material == m_default_material || material == m_billboard_alpha_material ||
        material == m_billboard_additive_material || material == m_ui_panel_material) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle, "Built-in materials cannot be released"));
    }
    auto removed = m_materials.erase(material);
    if (!removed) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle,
            std::format("Material {}:{} does not exist", material.index, material.generation)));
    }

    // The current frame may already reference the set
    m_deletion_queue.enqueue(m_frame_number, [this, resources = std::move(*removed)]() mutable {
        m_descriptors->free(SetKind::Material, resources.set);
        auto ubo = std::move(resources.ubo);
    });
    return {};
}

std::expected<TextureId, Error> RendererCore::upload_texture(uint32_t width, uint32_t height, std::span<const uint8_t> rgba)
{
    if (m_textures.size() >= m_config.max_textures) {
        return std::unexpected(Error::make(ErrorCode::DescriptorPoolExhausted,
            std::format("Texture limit of {} reached", m_config.max_textures)));
    }

    auto texture = Texture::from_rgba(*m_context, *m_commands, width, height, rgba);
    if (!texture) {
        if (texture.error().code == ErrorCode::InvalidImage) {
            auto defect = texture.error();
            defect.kind = ErrorKind::AssetDefect;
            Logger::instance().warn("{} - using magenta texture", defect.describe());
            m_events.push(AssetFallbackUsed{defect.code, defect.message});
            return m_fallback_texture;
        }
        return std::unexpected(texture.error());
    }
    return m_textures.insert(std::move(*texture));
}

std::expected<void, Error> RendererCore::release_texture(TextureId texture)
{
    if (texture == m_white_texture || texture == m_fallback_texture) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle, "Built-in textures cannot be released"));
    }
    if (!m_textures.contains(texture)) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle,
            std::format("Texture {}:{} does not exist", texture.index, texture.generation)));
    }

    bool referenced = false;
    m_materials.for_each([&](MaterialId, MaterialResources& material) {
        for (const auto& slot : material.textures) {
            referenced = referenced || slot == texture;
        }
    });
    if (referenced) {
        return std::unexpected(Error::make(ErrorCode::InvalidHandle,
            std::format("Texture {}:{} is still used by a material", texture.index, texture.generation)));
    }

    auto removed = m_textures.erase(texture);
    m_deletion_queue.enqueue(m_frame_number, [released = std::move(*removed)]() mutable {
        auto destroyed = std::move(released);
    });
    return {};
}

std::expected<void, Error> RendererCore::begin_frame(const CameraState& camera, const LightingEnvironment& lighting)
{
    if (m_in_frame) {
        Logger::instance().warn("begin_frame called twice; discarding {} submissions of frame {}", m_items.size(), m_frame_number);
        m_items.clear();
    } else {
        ++m_frame_number;
        m_frame_slot = static_cast<uint32_t>((m_frame_number - 1) % m_config.frames_in_flight);

        // 1. Wait for the slot's previous submission before touching its resources
        auto waited = m_frame_sync->wait_for_slot(m_frame_slot, m_config.fence_timeout_ns, m_config.max_fence_wait_retries);
        if (!waited) {
            Logger::instance().critical("{}", waited.error().describe());
            return std::unexpected(waited.error());
        }
        auto completed = m_frame_sync->completed_frame();
        if (!completed) {
            return std::unexpected(completed.error());
        }
        m_completed_frame = std::max(m_completed_frame, *completed);

        m_deletion_queue.collect(m_completed_frame);
        m_pools.begin_frame(m_frame_slot, m_completed_frame);
    }

    m_frame_skip.reset();
    if (m_recreate_requested) {
        if (auto result = recreate_swapchain(); !result) {
            return std::unexpected(result.error());
        }
    }

    m_camera = camera;
    m_lighting = lighting;
    m_in_frame = true;
    return {};
}

std::expected<void, Error> RendererCore::recreate_swapchain()
{
    vk::Extent2D extent = m_pending_extent.value_or(m_surface_provider->framebuffer_extent());
    auto outcome = m_swapchain->recreate(extent, m_render_pass->get());
    if (!outcome) {
        ++m_failed_recreations;
        Logger::instance().error("Swapchain recreation failed ({} in a row): {}", m_failed_recreations, outcome.error().describe());
        if (m_failed_recreations >= 2) {
            return std::unexpected(Error{ErrorKind::FatalDevice, outcome.error().code,
                std::format("Swapchain recreation failed twice in a row: {}", outcome.error().message)});
        }
        m_frame_skip = SkipReason::RecreateFailed;
        return {};
    }
    if (*outcome == RecreateOutcome::Skipped) {
        // A zero-sized resize is stale once the surface grows again
        m_pending_extent.reset();
        m_frame_skip = SkipReason::ZeroExtent;
        return {};
    }

    if (auto result = m_frame_sync->resize_images(m_swapchain->image_count()); !result) {
        return std::unexpected(result.error());
    }
    m_failed_recreations = 0;
    m_recreate_requested = false;
    m_pending_extent.reset();
    m_events.push(SwapchainRecreated{m_swapchain->extent()});
    Logger::instance().info("Swapchain recreated at {}x{}", m_swapchain->extent().width, m_swapchain->extent().height);
    return {};
}

void RendererCore::handle_resize(vk::Extent2D new_extent)
{
    m_pending_extent = new_extent;
    m_recreate_requested = true;
}

bool RendererCore::push_item(
    MeshTypeId mesh_type,
    const glm::mat4& transform,
    std::optional<MaterialId> instance_material,
    std::optional<glm::vec4> tint
) {
    if (!m_in_frame) {
        Logger::instance().warn("Submission outside begin_frame/end_frame ignored");
        return false;
    }
    const auto* pool = m_pools.get(mesh_type);
    if (!pool) {
        Logger::instance().warn("[{}] submission for unknown mesh type {}:{}",
            to_string(ErrorCode::InvalidHandle), mesh_type.index, mesh_type.generation);
        return false;
    }

    const auto& pool_material = material_or_default(pool->material());
    MaterialId pool_material_id = pool->material() && m_materials.contains(*pool->material()) ? *pool->material() : m_default_material;

    std::optional<MaterialId> source = instance_material && m_materials.contains(*instance_material)
        ? instance_material : std::optional<MaterialId>(pool_material_id);
    const auto& appearance_source = material_or_default(source);

    m_items.push_back(DrawItem{
        .pool = mesh_type,
        .pool_kind = pool->kind(),
        .material = pool_material_id,
        .material_variant = pool_material.variant,
        .blend = pool_material.blend,
        .instance = make_instance(transform, appearance_source.appearance, tint, pool_material.texture_flags, source->index),
    });
    return true;
}

bool RendererCore::submit_renderable(const Renderable& renderable)
{
    return push_item(renderable.mesh_type, renderable.transform, renderable.material, renderable.tint);
}

bool RendererCore::submit_billboard(const Billboard& billboard)
{
    auto pool = billboard.blend == BlendMode::Additive ? m_billboard_additive_pool : m_billboard_alpha_pool;
    return push_item(pool, billboard_transform(billboard, m_camera), std::nullopt, billboard.color);
}

uint32_t RendererCore::submit_trail(std::span<const glm::vec3> points, const TrailStyle& style)
{
    auto billboards = build_trail(points, style);
    for (const auto& billboard : billboards) {
        submit_billboard(billboard);
    }
    return static_cast<uint32_t>(billboards.size());
}

bool RendererCore::submit_ui_panel(const UiPanel& panel)
{
    return push_item(m_ui_quad_pool, ui_panel_transform(panel, m_swapchain->extent()), std::nullopt, panel.color);
}

bool RendererCore::submit_ui_text(const TextMesh& text, float x, float y, float pixel_scale, glm::vec4 color)
{
    return push_item(text.mesh_type, ui_text_transform(x, y, pixel_scale, m_swapchain->extent()), text.material, color);
}

std::expected<void, Error> RendererCore::write_frame_uniforms(uint32_t slot)
{
    auto& frame = m_frames[slot];
    if (auto result = frame.camera_ubo.write_object(pack_camera(m_camera)); !result) {
        return result;
    }
    return frame.lighting_ubo.write_object(pack_lighting(m_lighting));
}

std::expected<FramePlan, Error> RendererCore::stage_instances()
{
    FramePlan plan = plan_frame(m_items, m_camera.view);
    for (const auto& batch : plan.batches) {
        for (const auto& instance : batch.instances) {
            m_pools.submit(batch.pool, instance);
        }
    }
    if (auto uploaded = m_pools.upload(); !uploaded) {
        return std::unexpected(uploaded.error());
    }
    return plan;
}

void RendererCore::record_draws(vk::CommandBuffer command_buffer, const FramePlan& plan, FrameReport& report)
{
    auto layout = m_pipelines->layout();
    command_buffer.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, layout,
        static_cast<uint32_t>(SetKind::Frame), m_frames[m_frame_slot].frame_set, {});

    // A skipped batch invalidates the bind flags the plan computed
    bool force_bind = true;
    for (const auto& batch : plan.batches) {
        const auto* pool = m_pools.get(batch.pool);
        uint32_t count = pool ? pool->instance_count(m_frame_slot) : 0;
        if (!pool || !pool->buffers() || count == 0) {
            force_bind = true;
            continue;
        }
        const auto& buffers = *pool->buffers();

        if (batch.bind_pipeline || force_bind) {
            command_buffer.bindPipeline(vk::PipelineBindPoint::eGraphics, m_pipelines->get(batch.variant));
        }
        if (batch.bind_material || force_bind) {
            command_buffer.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, layout,
                static_cast<uint32_t>(SetKind::Material), material_or_default(batch.material).set, {});
        }
        force_bind = false;

        command_buffer.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, layout,
            static_cast<uint32_t>(SetKind::Object), buffers.object_set, {});

        std::array<vk::Buffer, 2> vertex_buffers = {buffers.vertex_buffer.buffer(), buffers.instance_buffer.buffer()};
        std::array<vk::DeviceSize, 2> offsets = {0, pool->region_offset(m_frame_slot)};
        command_buffer.bindVertexBuffers(VERTEX_BINDING, vertex_buffers, offsets);
        command_buffer.bindIndexBuffer(buffers.index_buffer.buffer(), 0, vk::IndexType::eUint32);

        // Single-instance variants take the transform from here
        auto push = make_push_constants(pool->staged(m_frame_slot).front().model);
        command_buffer.pushConstants(layout, vk::ShaderStageFlagBits::eVertex | vk::ShaderStageFlagBits::eFragment,
            0, PUSH_CONSTANT_SIZE, &push);

        command_buffer.drawIndexed(buffers.index_count, count, 0, 0, 0);
        report.drawn_instances += count;
        ++report.batches;
    }
}

FrameReport RendererCore::finish_frame(FrameReport report)
{
    m_pools.end_frame(m_frame_number, report.batches, m_events);
    report.dropped_instances = m_pools.stats().dropped_this_frame;
    m_items.clear();
    if (report.skipped) {
        Logger::instance().debug("Frame {} skipped: {}", report.frame_number, to_string(*report.skipped));
    }
    return report;
}

std::expected<FrameReport, Error> RendererCore::end_frame()
{
    FrameReport report;
    report.frame_number = m_frame_number;
    if (!m_in_frame) {
        Logger::instance().warn("end_frame called outside a frame");
        report.skipped = SkipReason::NotInFrame;
        return report;
    }
    m_in_frame = false;

    // Set between a successful acquire and a successful submit
    std::optional<uint32_t> unsubmitted_image;
    auto fail = [&](const Error& error) -> std::expected<FrameReport, Error> {
        Logger::instance().error("Frame {} failed: {}", m_frame_number, error.describe());
        finish_frame(report);
        if (unsubmitted_image) {
            if (auto released = release_acquired_image(*unsubmitted_image); !released) {
                return std::unexpected(Error{ErrorKind::FatalDevice, released.error().code,
                    std::format("{}; the acquired image could not be released: {}", error.message, released.error().message)});
            }
        }
        return std::unexpected(error);
    };

    if (m_frame_skip) {
        report.skipped = m_frame_skip;
        return finish_frame(report);
    }

    // 2. Acquire; a short timeout until the first present succeeded
    uint64_t timeout = m_presented_once ? std::numeric_limits<uint64_t>::max() : m_config.initial_acquire_timeout_ns;
    auto acquired = m_swapchain->acquire_next_image(m_frame_sync->image_available(m_frame_slot), timeout);
    if (!acquired) {
        return fail(acquired.error());
    }
    switch (acquired->status) {
        case AcquireStatus::OutOfDate:
            m_recreate_requested = true;
            report.skipped = SkipReason::OutOfDate;
            return finish_frame(report);
        case AcquireStatus::NotReady:
            report.skipped = SkipReason::AcquireTimeout;
            return finish_frame(report);
        case AcquireStatus::Suboptimal:
            m_recreate_requested = true;
            break;
        case AcquireStatus::Acquired:
            break;
    }
    uint32_t image_index = acquired->image_index;
    unsubmitted_image = image_index;

    // 3. Per-frame uniforms, then instances
    if (auto result = write_frame_uniforms(m_frame_slot); !result) {
        return fail(result.error());
    }
    auto plan = stage_instances();
    if (!plan) {
        return fail(plan.error());
    }

    // 4-5. Fresh command buffer
    auto command_buffer = m_frame_sync->begin_recording(m_frame_slot);
    if (!command_buffer) {
        return fail(command_buffer.error());
    }
    vk::CommandBuffer cmd = *command_buffer;

    // 6. Render pass
    auto extent = m_swapchain->extent();
    auto clear_values = make_clear_values(m_config.clear_color);
    auto render_pass_info = vk::RenderPassBeginInfo()
        .setRenderPass(m_render_pass->get())
        .setFramebuffer(m_swapchain->framebuffer(image_index))
        .setRenderArea(vk::Rect2D({0, 0}, extent))
        .setClearValues(clear_values);
    cmd.beginRenderPass(render_pass_info, vk::SubpassContents::eInline);

    // 7. Dynamic state; negative height flips Y to match glm
    auto viewport = vk::Viewport()
        .setX(0.0f)
        .setY(static_cast<float>(extent.height))
        .setWidth(static_cast<float>(extent.width))
        .setHeight(-static_cast<float>(extent.height))
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);
    cmd.setViewport(0, viewport);
    cmd.setScissor(0, vk::Rect2D({0, 0}, extent));

    // 8. Opaque, transparent and UI batches, then the overlay
    record_draws(cmd, *plan, report);
    if (m_overlay_recorder) {
        m_overlay_recorder(cmd);
    }

    // 9. Close the command buffer
    cmd.endRenderPass();
    auto end_res = cmd.end();
    if (end_res != vk::Result::eSuccess) {
        return fail(error_from_vk_result(end_res, ErrorCode::VulkanCallFailed,
            std::format("Failed to end frame command buffer: {}", vk::to_string(end_res))));
    }

    // 10-11. Reset the fence and submit
    if (auto submitted = m_frame_sync->submit(m_frame_slot, m_context->graphics_queue(), image_index, m_frame_number); !submitted) {
        return fail(submitted.error());
    }
    unsubmitted_image.reset();

    // 12. Present
    auto presented = m_swapchain->present(m_context->present_queue(), m_frame_sync->render_finished(image_index), image_index);
    if (!presented) {
        return fail(presented.error());
    }
    if (*presented != PresentStatus::Presented) {
        m_recreate_requested = true;
    }
    m_presented_once = true;

    return finish_frame(report);
}

std::expected<void, Error> RendererCore::release_acquired_image(uint32_t image_index)
{
    // A cleared pass leaves the image in PRESENT_SRC so it can go back to the presentation engine
    auto record_clear = [&]() -> std::expected<void, Error> {
        auto command_buffer = m_frame_sync->begin_recording(m_frame_slot);
        if (!command_buffer) {
            return std::unexpected(command_buffer.error());
        }
        auto clear_values = make_clear_values(m_config.clear_color);
        command_buffer->beginRenderPass(vk::RenderPassBeginInfo()
            .setRenderPass(m_render_pass->get())
            .setFramebuffer(m_swapchain->framebuffer(image_index))
            .setRenderArea(vk::Rect2D({0, 0}, m_swapchain->extent()))
            .setClearValues(clear_values), vk::SubpassContents::eInline);
        command_buffer->endRenderPass();
        auto end_res = command_buffer->end();
        STARFALL_CHECK_VK_RESULT_VOID(end_res, VulkanCallFailed, "Failed to end clear command buffer: {}");
        return m_frame_sync->submit(m_frame_slot, m_context->graphics_queue(), image_index, m_frame_number);
    };

    if (auto cleared = record_clear(); !cleared) {
        // Still consume the acquire semaphore and re-arm the fence; recreation reclaims the image
        Logger::instance().warn("Could not clear abandoned image {}: {}", image_index, cleared.error().describe());
        m_recreate_requested = true;
        return m_frame_sync->release_image(m_frame_slot, m_context->graphics_queue(), image_index, m_frame_number);
    }

    auto presented = m_swapchain->present(m_context->present_queue(), m_frame_sync->render_finished(image_index), image_index);
    if (!presented) {
        return std::unexpected(presented.error());
    }
    if (*presented != PresentStatus::Presented) {
        m_recreate_requested = true;
    }
    return {};
}

void RendererCore::shutdown()
{
    if (m_shut_down) {
        return;
    }
    m_shut_down = true;

    if (m_context) {
        if (auto idle = m_context->wait_idle(); !idle) {
            Logger::instance().error("Wait for idle at shutdown failed: {}", idle.error().describe());
        }
    }

    m_overlay_recorder = nullptr;
    m_items.clear();
    if (m_descriptors) {
        m_deletion_queue.flush();
    }

    // Reverse creation order; descriptor sets go with their pool
    m_pools = MeshPoolManager(m_config.frames_in_flight);
    m_materials.clear();
    m_textures.clear();
    m_frames.clear();
    m_frame_sync.reset();
    m_pipelines.reset();
    m_descriptors.reset();
    m_layouts.reset();
    m_render_pass.reset();
    m_swapchain.reset();
    m_commands.reset();
    m_context.reset();
    Logger::instance().info("Renderer shut down");
}

} // namespace starfall
