#pragma once

#include <starfall/Descriptors.hpp>
#include <starfall/Shader.hpp>
#include <starfall/VulkanContext.hpp>
#include <array>
#include <expected>
#include <span>
#include <string_view>

namespace starfall {

/**
 * @brief Closed set of graphics pipelines
 *
 * The plain variants take the model transform from push constants and draw a
 * single instance. The Instanced ones read it from the instance buffer.
 */
enum class PipelineVariant : uint8_t {
    OpaquePbr,
    OpaqueUnlit,
    TransparentPbr,
    TransparentUnlit,
    InstancedOpaquePbr,
    InstancedOpaqueUnlit,
    InstancedTransparentPbr,
    InstancedTransparentUnlit,
    BillboardAlpha,
    BillboardAdditive,
    UiPanel,
    UiText
};

constexpr std::array ALL_PIPELINE_VARIANTS = {
    PipelineVariant::OpaquePbr,
    PipelineVariant::OpaqueUnlit,
    PipelineVariant::TransparentPbr,
    PipelineVariant::TransparentUnlit,
    PipelineVariant::InstancedOpaquePbr,
    PipelineVariant::InstancedOpaqueUnlit,
    PipelineVariant::InstancedTransparentPbr,
    PipelineVariant::InstancedTransparentUnlit,
    PipelineVariant::BillboardAlpha,
    PipelineVariant::BillboardAdditive,
    PipelineVariant::UiPanel,
    PipelineVariant::UiText,
};

[[nodiscard]] std::string_view to_string(PipelineVariant variant);

enum class BlendMode : uint8_t { Alpha, Additive };

enum class ColorBlend : uint8_t {
    Disabled,
    Alpha,   ///< src-alpha / one-minus-src-alpha
    Additive ///< src-alpha / one
};

/**
 * @brief Which part of the frame a variant draws in
 */
enum class RenderStage : uint8_t { Opaque, Transparent, Ui };

enum class PoolKind : uint8_t { Mesh, Billboard, UiPanel, UiText };

[[nodiscard]] std::string_view to_string(PoolKind kind);

/**
 * @brief Fixed-function state and shaders of one variant
 */
struct VariantDescription {
    std::string_view vertex_shader;
    std::string_view fragment_shader;
    ColorBlend blend;
    bool depth_test;
    bool depth_write;
    vk::CompareOp depth_compare;
    vk::CullModeFlags cull_mode;
    bool instance_transform; ///< model matrix from binding 1 instead of push constants
    RenderStage stage;
};

[[nodiscard]] VariantDescription describe_variant(PipelineVariant variant);

/**
 * @brief Instanced counterpart of a push-constant variant; other variants map to themselves
 */
[[nodiscard]] PipelineVariant instanced_variant(PipelineVariant variant);

/**
 * @brief Variant a pool batch is drawn with
 *
 * Mesh pools use the material's variant for a single instance and its
 * instanced counterpart otherwise. Billboard pools pick by blend mode, UI
 * pools use their UI variant.
 */
[[nodiscard]] PipelineVariant resolve_pipeline(
    PipelineVariant material_variant,
    PoolKind pool_kind,
    uint32_t instance_count,
    BlendMode blend = BlendMode::Alpha
);

constexpr uint32_t VERTEX_BINDING = 0;
constexpr uint32_t INSTANCE_BINDING = 1;

[[nodiscard]] std::array<vk::VertexInputBindingDescription, 2> vertex_input_bindings();

/**
 * @brief Locations 0..3 from Vertex, 4..15 from InstanceData
 */
[[nodiscard]] std::array<vk::VertexInputAttributeDescription, 16> vertex_input_attributes();

/**
 * @brief Fail with DeviceLimitTooLow when the device cannot hold the 128-byte push block
 */
[[nodiscard]] std::expected<void, Error> check_push_constant_limit(uint32_t device_limit);

/**
 * @brief Compare reflected vertex inputs with the fixed vertex layout
 *
 * Reflected attributes are matched per binding in declaration order, by format.
 */
[[nodiscard]] std::expected<void, Error> check_vertex_interface(std::span<const VertexAttribute> reflected, std::string_view shader_name);

/**
 * @brief Every reflected descriptor must land on a DESCRIPTOR_SLOTS entry of the same type
 *
 * Stage visibility is not compared; Slang reports module globals the entry point never touches.
 */
[[nodiscard]] std::expected<void, Error> check_descriptor_interface(std::span<const ReflectedDescriptor> reflected, std::string_view shader_name);

/**
 * @brief Shared pipeline layout, pipeline cache and one pipeline per variant
 *
 * Viewport and scissor are dynamic, so pipelines survive swapchain recreation
 * as long as the surface format stays the same.
 */
class PipelineManager
{
public:
    static std::expected<PipelineManager, Error> create(
        const VulkanContext& context,
        const DescriptorLayouts& layouts,
        vk::RenderPass render_pass
    );

    ~PipelineManager();

    PipelineManager(const PipelineManager&) = delete;
    PipelineManager& operator=(const PipelineManager&) = delete;
    PipelineManager(PipelineManager&& other) noexcept;
    PipelineManager& operator=(PipelineManager&& other) noexcept;

    [[nodiscard]] vk::Pipeline get(PipelineVariant variant) const { return m_pipelines[static_cast<std::size_t>(variant)]; }
    [[nodiscard]] vk::PipelineLayout layout() const { return m_layout; }

private:
    explicit PipelineManager(vk::Device device);

    std::expected<vk::Pipeline, Error> create_pipeline(
        PipelineVariant variant,
        vk::RenderPass render_pass,
        const Shader& vertex_shader,
        const Shader& fragment_shader
    ) const;
    void destroy();

    vk::Device m_device;
    vk::PipelineCache m_cache;
    vk::PipelineLayout m_layout;
    std::array<vk::Pipeline, ALL_PIPELINE_VARIANTS.size()> m_pipelines{};
};

} // namespace starfall
