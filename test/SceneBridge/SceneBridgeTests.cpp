#include <catch2/catch_test_macros.hpp>
#include <starfall/SceneBridge.hpp>
#include <algorithm>
#include <cstddef>
#include <vector>

using namespace starfall;

namespace {

DrawItem item(uint32_t pool, PipelineVariant variant, float z, uint32_t material = 0,
    PoolKind kind = PoolKind::Mesh, BlendMode blend = BlendMode::Alpha)
{
    DrawItem draw;
    draw.pool = MeshTypeId{pool, 0};
    draw.pool_kind = kind;
    draw.material = MaterialId{material, 0};
    draw.material_variant = variant;
    draw.blend = blend;
    draw.instance.model = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, z));
    draw.instance.material_index = pool * 100 + static_cast<uint32_t>(-z);
    return draw;
}

} // namespace

TEST_CASE("make_instance combines appearance and tint", "[scene]")
{
    InstanceAppearance appearance{glm::vec4(0.5f, 1.0f, 1.0f, 1.0f), glm::vec4(0.1f)};
    auto transform = glm::scale(glm::mat4(1.0f), glm::vec3(2.0f));
    auto instance = make_instance(transform, appearance, glm::vec4(1.0f, 0.5f, 1.0f, 0.5f), texture_bits::NORMAL, 7);

    REQUIRE(instance.model == transform);
    REQUIRE(instance.material_color == glm::vec4(0.5f, 0.5f, 1.0f, 0.5f));
    REQUIRE(instance.emission_color == glm::vec4(0.1f));
    REQUIRE(instance.texture_flags.x == texture_bits::NORMAL);
    REQUIRE(instance.material_index == 7);
    REQUIRE(instance.normal_matrix[0].x == 0.5f);
    REQUIRE(instance.normal_matrix[3] == glm::vec4(0.0f));
}

TEST_CASE("View depth grows away from the camera", "[scene]")
{
    glm::mat4 view = glm::lookAt(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    auto near_model = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, 5.0f));
    auto far_model = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f));
    REQUIRE(view_depth(view, near_model) == 5.0f);
    REQUIRE(view_depth(view, far_model) == 15.0f);
}

TEST_CASE("Frame plan orders passes and batches per pool", "[scene]")
{
    glm::mat4 view(1.0f); // camera at the origin looking down -Z

    std::vector<DrawItem> items = {
        item(1, PipelineVariant::TransparentUnlit, -2.0f, 5),
        item(0, PipelineVariant::OpaquePbr, -8.0f),
        item(2, PipelineVariant::OpaqueUnlit, 0.0f, 0, PoolKind::UiPanel),
        item(1, PipelineVariant::TransparentUnlit, -9.0f, 5),
        item(0, PipelineVariant::OpaquePbr, -3.0f),
        item(3, PipelineVariant::TransparentUnlit, -5.0f, 6),
    };

    auto plan = plan_frame(items, view);

    REQUIRE(plan.instance_count() == 6);
    REQUIRE(plan.batches.size() == 4);

    SECTION("opaque first, one batch per pool, front to back")
    {
        const auto& opaque = plan.batches[0];
        REQUIRE(opaque.stage == RenderStage::Opaque);
        REQUIRE(opaque.pool == MeshTypeId{0, 0});
        REQUIRE(opaque.instances.size() == 2);
        REQUIRE(opaque.variant == PipelineVariant::InstancedOpaquePbr);
        REQUIRE(opaque.instances[0].model[3].z == -3.0f);
        REQUIRE(opaque.instances[1].model[3].z == -8.0f);
    }

    SECTION("transparent back to front, batches in order of first appearance")
    {
        REQUIRE(plan.batches[1].stage == RenderStage::Transparent);
        REQUIRE(plan.batches[1].pool == MeshTypeId{1, 0});
        REQUIRE(plan.batches[1].instances[0].model[3].z == -9.0f);
        REQUIRE(plan.batches[1].instances[1].model[3].z == -2.0f);
        REQUIRE(plan.batches[2].pool == MeshTypeId{3, 0});
        REQUIRE(plan.batches[2].variant == PipelineVariant::TransparentUnlit);
    }

    SECTION("UI last")
    {
        REQUIRE(plan.batches[3].stage == RenderStage::Ui);
        REQUIRE(plan.batches[3].variant == PipelineVariant::UiPanel);
    }

    SECTION("state changes are flagged only when they happen")
    {
        REQUIRE(plan.batches[0].bind_pipeline);
        REQUIRE(plan.batches[0].bind_material);
        REQUIRE(plan.batches[1].bind_pipeline);
        REQUIRE(plan.batches[2].bind_material);
        REQUIRE(plan.batches[3].bind_pipeline);
    }
}

TEST_CASE("Opaque batches group by variant before depth", "[scene]")
{
    std::vector<DrawItem> items = {
        item(4, PipelineVariant::OpaqueUnlit, -1.0f),
        item(5, PipelineVariant::OpaquePbr, -20.0f),
        item(6, PipelineVariant::OpaqueUnlit, -30.0f),
    };

    auto plan = plan_frame(items, glm::mat4(1.0f));
    REQUIRE(plan.batches.size() == 3);
    REQUIRE(plan.batches[0].variant == PipelineVariant::OpaquePbr);
    REQUIRE(plan.batches[1].variant == PipelineVariant::OpaqueUnlit);
    REQUIRE(plan.batches[2].variant == PipelineVariant::OpaqueUnlit);
    REQUIRE(plan.batches[1].pool == MeshTypeId{4, 0});
    REQUIRE_FALSE(plan.batches[2].bind_pipeline);
    REQUIRE_FALSE(plan.batches[2].bind_material);
}

TEST_CASE("Billboards are transparent and UI keeps submission order", "[scene]")
{
    std::vector<DrawItem> items = {
        item(7, PipelineVariant::OpaqueUnlit, 0.0f, 0, PoolKind::UiText),
        item(8, PipelineVariant::OpaqueUnlit, 0.0f, 0, PoolKind::UiPanel),
        item(9, PipelineVariant::OpaqueUnlit, -4.0f, 0, PoolKind::Billboard, BlendMode::Additive),
    };

    REQUIRE(classify(items[2]) == RenderStage::Transparent);

    auto plan = plan_frame(items, glm::mat4(1.0f));
    REQUIRE(plan.batches.size() == 3);
    REQUIRE(plan.batches[0].variant == PipelineVariant::BillboardAdditive);
    REQUIRE(plan.batches[1].variant == PipelineVariant::UiText);
    REQUIRE(plan.batches[2].variant == PipelineVariant::UiPanel);
}

TEST_CASE("Empty frame plans nothing", "[scene]")
{
    auto plan = plan_frame({}, glm::mat4(1.0f));
    REQUIRE(plan.batches.empty());
    REQUIRE(plan.instance_count() == 0);
}

TEST_CASE("Transparent order does not depend on submission order", "[scene]")
{
    glm::mat4 view = glm::lookAt(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));

    auto transparent = [](uint32_t pool, float z) {
        DrawItem draw = item(pool, PipelineVariant::TransparentUnlit, 0.0f, pool);
        draw.instance.model = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, z));
        draw.instance.material_index = static_cast<uint32_t>(z);
        return draw;
    };

    std::vector<DrawItem> items = {transparent(1, 1.0f), transparent(2, 2.0f), transparent(1, 3.0f)};
    std::vector<std::size_t> order = {0, 1, 2};

    do {
        std::vector<DrawItem> submitted;
        for (std::size_t index : order) {
            submitted.push_back(items[index]);
        }
        auto plan = plan_frame(submitted, view);

        // Farthest first: z=1 opens pool 1, which also takes z=3
        REQUIRE(plan.batches.size() == 2);
        REQUIRE(plan.batches[0].pool == MeshTypeId{1, 0});
        REQUIRE(plan.batches[0].instances.size() == 2);
        REQUIRE(plan.batches[0].instances[0].material_index == 1);
        REQUIRE(plan.batches[0].instances[1].material_index == 3);
        REQUIRE(plan.batches[1].pool == MeshTypeId{2, 0});
        REQUIRE(plan.batches[1].instances.size() == 1);
        REQUIRE(plan.batches[1].instances[0].material_index == 2);
    } while (std::next_permutation(order.begin(), order.end()));
}
