#include <starfall/Pipeline.hpp>
#include <starfall/GpuTypes.hpp>
#include <starfall/Logger.hpp>
#include <map>
#include <unordered_map>
#include <utility>

namespace starfall {

namespace {

constexpr std::string_view MESH_VERT = "starfall/mesh.vert.slang";
constexpr std::string_view INSTANCED_VERT = "starfall/instanced.vert.slang";
constexpr std::string_view BILLBOARD_VERT = "starfall/billboard.vert.slang";
constexpr std::string_view UI_VERT = "starfall/ui.vert.slang";
constexpr std::string_view PBR_FRAG = "starfall/pbr.frag.slang";
constexpr std::string_view UNLIT_FRAG = "starfall/unlit.frag.slang";
constexpr std::string_view BILLBOARD_FRAG = "starfall/billboard.frag.slang";
constexpr std::string_view UI_PANEL_FRAG = "starfall/ui_panel.frag.slang";
constexpr std::string_view UI_TEXT_FRAG = "starfall/ui_text.frag.slang";

VariantDescription world(std::string_view vert, std::string_view frag, bool transparent, bool instanced)
{
    return VariantDescription{
        .vertex_shader = vert,
        .fragment_shader = frag,
        .blend = transparent ? ColorBlend::Alpha : ColorBlend::Disabled,
        .depth_test = true,
        .depth_write = !transparent,
        .depth_compare = vk::CompareOp::eLess,
        .cull_mode = transparent ? vk::CullModeFlags(vk::CullModeFlagBits::eNone) : vk::CullModeFlags(vk::CullModeFlagBits::eBack),
        .instance_transform = instanced,
        .stage = transparent ? RenderStage::Transparent : RenderStage::Opaque,
    };
}

VariantDescription billboard(ColorBlend blend)
{
    return VariantDescription{
        .vertex_shader = BILLBOARD_VERT,
        .fragment_shader = BILLBOARD_FRAG,
        .blend = blend,
        .depth_test = true,
        .depth_write = false,
        .depth_compare = vk::CompareOp::eLess,
        .cull_mode = vk::CullModeFlagBits::eNone,
        .instance_transform = true,
        .stage = RenderStage::Transparent,
    };
}

VariantDescription ui(std::string_view frag)
{
    return VariantDescription{
        .vertex_shader = UI_VERT,
        .fragment_shader = frag,
        .blend = ColorBlend::Alpha,
        .depth_test = true,
        .depth_write = false,
        .depth_compare = vk::CompareOp::eLessOrEqual,
        .cull_mode = vk::CullModeFlagBits::eNone,
        .instance_transform = true,
        .stage = RenderStage::Ui,
    };
}

vk::PipelineColorBlendAttachmentState make_blend_attachment(ColorBlend blend)
{
    auto attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(
            vk::ColorComponentFlagBits::eR |
            vk::ColorComponentFlagBits::eG |
            vk::ColorComponentFlagBits::eB |
            vk::ColorComponentFlagBits::eA
        )
        .setBlendEnable(blend != ColorBlend::Disabled);

    if (blend == ColorBlend::Disabled) {
        return attachment;
    }

    return attachment
        .setSrcColorBlendFactor(vk::BlendFactor::eSrcAlpha)
        .setDstColorBlendFactor(blend == ColorBlend::Additive ? vk::BlendFactor::eOne : vk::BlendFactor::eOneMinusSrcAlpha)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setAlphaBlendOp(vk::BlendOp::eAdd);
}

} // anonymous namespace

std::string_view to_string(PipelineVariant variant)
{
    switch (variant) {
        using enum PipelineVariant;
        case OpaquePbr: return "OpaquePbr";
        case OpaqueUnlit: return "OpaqueUnlit";
        case TransparentPbr: return "TransparentPbr";
        case TransparentUnlit: return "TransparentUnlit";
        case InstancedOpaquePbr: return "InstancedOpaquePbr";
        case InstancedOpaqueUnlit: return "InstancedOpaqueUnlit";
        case InstancedTransparentPbr: return "InstancedTransparentPbr";
        case InstancedTransparentUnlit: return "InstancedTransparentUnlit";
        case BillboardAlpha: return "BillboardAlpha";
        case BillboardAdditive: return "BillboardAdditive";
        case UiPanel: return "UiPanel";
        case UiText: return "UiText";
    }
    return "Unknown";
}

std::string_view to_string(PoolKind kind)
{
    switch (kind) {
        case PoolKind::Mesh: return "Mesh";
        case PoolKind::Billboard: return "Billboard";
        case PoolKind::UiPanel: return "UiPanel";
        case PoolKind::UiText: return "UiText";
    }
    return "Unknown";
}

VariantDescription describe_variant(PipelineVariant variant)
{
    switch (variant) {
        using enum PipelineVariant;
        case OpaquePbr: return world(MESH_VERT, PBR_FRAG, false, false);
        case OpaqueUnlit: return world(MESH_VERT, UNLIT_FRAG, false, false);
        case TransparentPbr: return world(MESH_VERT, PBR_FRAG, true, false);
        case TransparentUnlit: return world(MESH_VERT, UNLIT_FRAG, true, false);
        case InstancedOpaquePbr: return world(INSTANCED_VERT, PBR_FRAG, false, true);
        case InstancedOpaqueUnlit: return world(INSTANCED_VERT, UNLIT_FRAG, false, true);
        case InstancedTransparentPbr: return world(INSTANCED_VERT, PBR_FRAG, true, true);
        case InstancedTransparentUnlit: return world(INSTANCED_VERT, UNLIT_FRAG, true, true);
        case BillboardAlpha: return billboard(ColorBlend::Alpha);
        case BillboardAdditive: return billboard(ColorBlend::Additive);
        case UiPanel: return ui(UI_PANEL_FRAG);
        case UiText: return ui(UI_TEXT_FRAG);
    }
    return world(MESH_VERT, PBR_FRAG, false, false);
}

PipelineVariant instanced_variant(PipelineVariant variant)
{
    switch (variant) {
        using enum PipelineVariant;
        case OpaquePbr: return InstancedOpaquePbr;
        case OpaqueUnlit: return InstancedOpaqueUnlit;
        case TransparentPbr: return InstancedTransparentPbr;
        case TransparentUnlit: return InstancedTransparentUnlit;
        default: return variant;
    }
}

PipelineVariant resolve_pipeline(PipelineVariant material_variant, PoolKind pool_kind, uint32_t instance_count, BlendMode blend)
{
    switch (pool_kind) {
        case PoolKind::Mesh:
            return instance_count > 1 ? instanced_variant(material_variant) : material_variant;
        case PoolKind::Billboard:
            return blend == BlendMode::Additive ? PipelineVariant::BillboardAdditive : PipelineVariant::BillboardAlpha;
        case PoolKind::UiPanel:
            return PipelineVariant::UiPanel;
        case PoolKind::UiText:
            return PipelineVariant::UiText;
    }
    return material_variant;
}

std::array<vk::VertexInputBindingDescription, 2> vertex_input_bindings()
{
    return {
        vk::VertexInputBindingDescription()
            .setBinding(VERTEX_BINDING)
            .setStride(sizeof(Vertex))
            .setInputRate(vk::VertexInputRate::eVertex),
        vk::VertexInputBindingDescription()
            .setBinding(INSTANCE_BINDING)
            .setStride(sizeof(InstanceData))
            .setInputRate(vk::VertexInputRate::eInstance),
    };
}

std::array<vk::VertexInputAttributeDescription, 16> vertex_input_attributes()
{
    using F = vk::Format;
    auto vertex = [](uint32_t location, F format, uint32_t offset) {
        return vk::VertexInputAttributeDescription(location, VERTEX_BINDING, format, offset);
    };
    auto instance = [](uint32_t location, F format, uint32_t offset) {
        return vk::VertexInputAttributeDescription(location, INSTANCE_BINDING, format, offset);
    };
    constexpr uint32_t vec4_size = sizeof(glm::vec4);

    return {
        vertex(0, F::eR32G32B32Sfloat, offsetof(Vertex, position)),
        vertex(1, F::eR32G32B32Sfloat, offsetof(Vertex, normal)),
        vertex(2, F::eR32G32Sfloat, offsetof(Vertex, uv)),
        vertex(3, F::eR32G32B32Sfloat, offsetof(Vertex, tangent)),
        // Model matrix columns
        instance(4, F::eR32G32B32A32Sfloat, offsetof(InstanceData, model) + 0 * vec4_size),
        instance(5, F::eR32G32B32A32Sfloat, offsetof(InstanceData, model) + 1 * vec4_size),
        instance(6, F::eR32G32B32A32Sfloat, offsetof(InstanceData, model) + 2 * vec4_size),
        instance(7, F::eR32G32B32A32Sfloat, offsetof(InstanceData, model) + 3 * vec4_size),
        // Normal matrix columns, the fourth is padding
        instance(8, F::eR32G32B32A32Sfloat, offsetof(InstanceData, normal_matrix) + 0 * vec4_size),
        instance(9, F::eR32G32B32A32Sfloat, offsetof(InstanceData, normal_matrix) + 1 * vec4_size),
        instance(10, F::eR32G32B32A32Sfloat, offsetof(InstanceData, normal_matrix) + 2 * vec4_size),
        instance(11, F::eR32G32B32A32Sfloat, offsetof(InstanceData, normal_matrix) + 3 * vec4_size),
        instance(12, F::eR32G32B32A32Sfloat, offsetof(InstanceData, material_color)),
        instance(13, F::eR32G32B32A32Sfloat, offsetof(InstanceData, emission_color)),
        instance(14, F::eR32G32B32A32Uint, offsetof(InstanceData, texture_flags)),
        instance(15, F::eR32Uint, offsetof(InstanceData, material_index)),
    };
}

std::expected<void, Error> check_push_constant_limit(uint32_t device_limit)
{
    if (device_limit < PUSH_CONSTANT_SIZE) {
        return std::unexpected(Error::make(ErrorCode::DeviceLimitTooLow,
            std::format("Device allows {} bytes of push constants, {} required", device_limit, PUSH_CONSTANT_SIZE)));
    }
    return {};
}

std::expected<void, Error> check_vertex_interface(std::span<const VertexAttribute> reflected, std::string_view shader_name)
{
    auto expected_attributes = vertex_input_attributes();

    std::map<uint32_t, std::vector<vk::Format>> expected_by_binding;
    for (const auto& attribute : expected_attributes) {
        expected_by_binding[attribute.binding].push_back(attribute.format);
    }

    std::map<uint32_t, std::vector<const VertexAttribute*>> reflected_by_binding;
    for (const auto& attribute : reflected) {
        reflected_by_binding[attribute.binding].push_back(&attribute);
    }

    for (const auto& [binding, attributes] : reflected_by_binding) {
        auto it = expected_by_binding.find(binding);
        if (it == expected_by_binding.end()) {
            return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                std::format("'{}' declares vertex binding {} which the renderer does not provide", shader_name, binding)));
        }
        if (attributes.size() != it->second.size()) {
            return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                std::format("'{}' binding {} has {} attributes, expected {}", shader_name, binding, attributes.size(), it->second.size())));
        }
        for (std::size_t i = 0; i < attributes.size(); ++i) {
            if (attributes[i]->format != it->second[i]) {
                return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                    std::format("'{}' attribute '{}' is {}, expected {}", shader_name, attributes[i]->name,
                        vk::to_string(attributes[i]->format), vk::to_string(it->second[i]))));
            }
        }
    }
    return {};
}

std::expected<void, Error> check_descriptor_interface(std::span<const ReflectedDescriptor> reflected, std::string_view shader_name)
{
    for (const auto& descriptor : reflected) {
        const auto* slot = find_descriptor_slot(descriptor.set, descriptor.binding);
        if (!slot) {
            return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                std::format("'{}' declares '{}' at set {} binding {}, which the pipeline layout does not have",
                    shader_name, descriptor.name, descriptor.set, descriptor.binding)));
        }
        if (slot->type != descriptor.type || descriptor.count != 1) {
            return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                std::format("'{}' declares '{}' as {} x{}, set {} binding {} holds one {}", shader_name, descriptor.name,
                    vk::to_string(descriptor.type), descriptor.count, descriptor.set, descriptor.binding, vk::to_string(slot->type))));
        }
    }
    return {};
}

PipelineManager::PipelineManager(vk::Device device)
    : m_device(device)
{}

std::expected<PipelineManager, Error> PipelineManager::create(
    const VulkanContext& context,
    const DescriptorLayouts& layouts,
    vk::RenderPass render_pass
) {
    if (auto limit = check_push_constant_limit(context.limits().max_push_constants_size); !limit) {
        Logger::instance().error("{}", limit.error().describe());
        return std::unexpected(limit.error());
    }

    PipelineManager manager(context.device());
    auto device = context.device();

    auto cache_res = device.createPipelineCache(vk::PipelineCacheCreateInfo());
    STARFALL_CHECK_VK_RESULT(cache_res, PipelineCreationFailed, "Failed to create pipeline cache: {}");
    manager.m_cache = cache_res.value;

    auto push_range = vk::PushConstantRange()
        .setStageFlags(vk::ShaderStageFlagBits::eVertex | vk::ShaderStageFlagBits::eFragment)
        .setOffset(0)
        .setSize(PUSH_CONSTANT_SIZE);

    auto pipeline_layout_info = vk::PipelineLayoutCreateInfo()
        .setSetLayouts(layouts.all())
        .setPushConstantRanges(push_range);

    auto pipeline_layout_res = device.createPipelineLayout(pipeline_layout_info);
    STARFALL_CHECK_VK_RESULT(pipeline_layout_res, PipelineCreationFailed, "Failed to create pipeline layout: {}");
    manager.m_layout = pipeline_layout_res.value;

    // Shader modules are only needed until the pipelines exist
    std::unordered_map<std::string_view, Shader> shaders;
    auto load = [&](std::string_view name) -> std::expected<const Shader*, Error> {
        if (auto it = shaders.find(name); it != shaders.end()) {
            return &it->second;
        }
        auto shader = Shader::compile(device, name, "main");
        if (!shader) {
            return std::unexpected(shader.error());
        }
        if (const auto* vertex = std::get_if<VertexDetails>(&shader->details())) {
            if (auto checked = check_vertex_interface(vertex->inputs, name); !checked) {
                return std::unexpected(checked.error());
            }
        }
        if (auto checked = check_descriptor_interface(shader->descriptors(), name); !checked) {
            return std::unexpected(checked.error());
        }
        if (const auto& push = shader->push_block(); push && push->end() > PUSH_CONSTANT_SIZE) {
            return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                std::format("'{}' push constants end at byte {}, limit is {}", name, push->end(), PUSH_CONSTANT_SIZE)));
        }
        return &shaders.emplace(name, std::move(*shader)).first->second;
    };

    for (auto variant : ALL_PIPELINE_VARIANTS) {
        auto description = describe_variant(variant);
        auto vertex_shader = load(description.vertex_shader);
        if (!vertex_shader) {
            return std::unexpected(vertex_shader.error());
        }
        auto fragment_shader = load(description.fragment_shader);
        if (!fragment_shader) {
            return std::unexpected(fragment_shader.error());
        }
        if (!(*vertex_shader)->details().matches((*fragment_shader)->details())) {
            return std::unexpected(Error::make(ErrorCode::PipelineCreationFailed,
                std::format("Stage interfaces of {} do not match", to_string(variant))));
        }

        auto pipeline = manager.create_pipeline(variant, render_pass, **vertex_shader, **fragment_shader);
        if (!pipeline) {
            return std::unexpected(pipeline.error());
        }
        manager.m_pipelines[static_cast<std::size_t>(variant)] = *pipeline;
        Logger::instance().debug("Created pipeline {}", to_string(variant));
    }

    Logger::instance().info("Created {} pipelines from {} shader modules", ALL_PIPELINE_VARIANTS.size(), shaders.size());
    return manager;
}

std::expected<vk::Pipeline, Error> PipelineManager::create_pipeline(
    PipelineVariant variant,
    vk::RenderPass render_pass,
    const Shader& vertex_shader,
    const Shader& fragment_shader
) const {
    auto description = describe_variant(variant);

    std::array shader_stages = {
        vertex_shader.stage_info(),
        fragment_shader.stage_info()
    };

    auto bindings = vertex_input_bindings();
    auto attributes = vertex_input_attributes();
    auto vertex_input = vk::PipelineVertexInputStateCreateInfo()
        .setVertexBindingDescriptions(bindings)
        .setVertexAttributeDescriptions(attributes);

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(vk::PrimitiveTopology::eTriangleList)
        .setPrimitiveRestartEnable(false);

    // Viewport and scissor (dynamic)
    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    // The viewport flips Y, so counter-clockwise stays front facing
    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setDepthClampEnable(false)
        .setRasterizerDiscardEnable(false)
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(description.cull_mode)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setDepthBiasEnable(false);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setSampleShadingEnable(false)
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    auto depth_stencil = vk::PipelineDepthStencilStateCreateInfo()
        .setDepthTestEnable(description.depth_test)
        .setDepthWriteEnable(description.depth_write)
        .setDepthCompareOp(description.depth_compare)
        .setDepthBoundsTestEnable(false)
        .setStencilTestEnable(false);

    auto color_blend_attachment = make_blend_attachment(description.blend);
    auto color_blending = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(false)
        .setAttachments(color_blend_attachment);

    std::array dynamic_states = {vk::DynamicState::eViewport, vk::DynamicState::eScissor};
    auto dynamic_state = vk::PipelineDynamicStateCreateInfo()
        .setDynamicStates(dynamic_states);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPDepthStencilState(&depth_stencil)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_layout)
        .setRenderPass(render_pass)
        .setSubpass(0);

    auto pipeline_res = m_device.createGraphicsPipeline(m_cache, pipeline_info);
    STARFALL_CHECK_VK_RESULT(pipeline_res, PipelineCreationFailed, "Failed to create graphics pipeline: {}");
    return pipeline_res.value;
}

void PipelineManager::destroy()
{
    if (!m_device) {
        return;
    }
    for (auto& pipeline : m_pipelines) {
        if (pipeline) {
            m_device.destroyPipeline(pipeline);
            pipeline = nullptr;
        }
    }
    if (m_layout) m_device.destroyPipelineLayout(m_layout);
    if (m_cache) m_device.destroyPipelineCache(m_cache);
    m_layout = nullptr;
    m_cache = nullptr;
}

PipelineManager::~PipelineManager()
{
    destroy();
}

PipelineManager::PipelineManager(PipelineManager&& other) noexcept
    : m_device(std::exchange(other.m_device, nullptr))
    , m_cache(std::exchange(other.m_cache, nullptr))
    , m_layout(std::exchange(other.m_layout, nullptr))
    , m_pipelines(std::exchange(other.m_pipelines, {}))
{}

PipelineManager& PipelineManager::operator=(PipelineManager&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_device = std::exchange(other.m_device, nullptr);
        m_cache = std::exchange(other.m_cache, nullptr);
        m_layout = std::exchange(other.m_layout, nullptr);
        m_pipelines = std::exchange(other.m_pipelines, {});
    }
    return *this;
}

} // namespace starfall
