#pragma once

#include <starfall/GpuTypes.hpp>
#include <starfall/Handle.hpp>
#include <starfall/Material.hpp>
#include <starfall/Pipeline.hpp>
#include <optional>
#include <span>
#include <vector>

namespace starfall {

/**
 * @brief One drawable handed over by the scene each frame
 *
 * The pool's material decides pipeline and textures. This material only
 * supplies per-instance colour, emission and material index.
 */
struct Renderable {
    MeshTypeId mesh_type;
    glm::mat4 transform{1.0f};
    MaterialId material;
    std::optional<glm::vec4> tint;
};

/**
 * @brief A renderable resolved against its pool, ready for sorting
 */
struct DrawItem {
    MeshTypeId pool;
    PoolKind pool_kind = PoolKind::Mesh;
    MaterialId material; ///< Pool material, bound as Set 1
    PipelineVariant material_variant = PipelineVariant::OpaquePbr;
    BlendMode blend = BlendMode::Alpha;
    InstanceData instance;
};

/**
 * @brief All instances of one pool within one pass, drawn with a single call
 */
struct DrawBatch {
    MeshTypeId pool;
    MaterialId material;
    PipelineVariant variant = PipelineVariant::OpaquePbr;
    RenderStage stage = RenderStage::Opaque;
    std::vector<InstanceData> instances;
    bool bind_pipeline = true; ///< Variant differs from the previous batch
    bool bind_material = true; ///< Material differs from the previous batch
};

struct FramePlan {
    std::vector<DrawBatch> batches; ///< Opaque, then transparent, then UI

    [[nodiscard]] uint32_t instance_count() const;
};

[[nodiscard]] InstanceData make_instance(
    const glm::mat4& transform,
    const InstanceAppearance& appearance,
    std::optional<glm::vec4> tint,
    uint32_t texture_flags,
    uint32_t material_index
);

[[nodiscard]] RenderStage classify(const DrawItem& item);

/**
 * @brief Distance in front of the camera along its view direction
 */
[[nodiscard]] float view_depth(const glm::mat4& view, const glm::mat4& model);

/**
 * @brief Sort and batch a frame's draw items
 *
 * Opaque items sort by (variant, pool, material) then front to back.
 * Transparent items sort back to front with (variant, pool, material) as the
 * tie-break. UI keeps submission order. Each pass is then grouped into one
 * batch per pool in order of first appearance, instances in sorted order.
 */
[[nodiscard]] FramePlan plan_frame(std::span<const DrawItem> items, const glm::mat4& view);

} // namespace starfall
