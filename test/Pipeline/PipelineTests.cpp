#include <catch2/catch_test_macros.hpp>
#include <starfall/Pipeline.hpp>
#include <starfall/GpuTypes.hpp>
#include <set>
#include <vector>

using namespace starfall;

TEST_CASE("Every variant has a description", "[pipeline]")
{
    for (auto variant : ALL_PIPELINE_VARIANTS) {
        auto description = describe_variant(variant);
        INFO(to_string(variant));
        REQUIRE_FALSE(description.vertex_shader.empty());
        REQUIRE_FALSE(description.fragment_shader.empty());
    }
}

TEST_CASE("Variant fixed-function state", "[pipeline]")
{
    SECTION("opaque writes depth without blending")
    {
        auto opaque = describe_variant(PipelineVariant::OpaquePbr);
        REQUIRE(opaque.depth_write);
        REQUIRE(opaque.blend == ColorBlend::Disabled);
        REQUIRE(opaque.stage == RenderStage::Opaque);
        REQUIRE_FALSE(opaque.instance_transform);
    }

    SECTION("transparent tests but does not write depth")
    {
        auto transparent = describe_variant(PipelineVariant::InstancedTransparentUnlit);
        REQUIRE(transparent.depth_test);
        REQUIRE_FALSE(transparent.depth_write);
        REQUIRE(transparent.blend == ColorBlend::Alpha);
        REQUIRE(transparent.stage == RenderStage::Transparent);
        REQUIRE(transparent.instance_transform);
    }

    SECTION("additive billboards")
    {
        auto additive = describe_variant(PipelineVariant::BillboardAdditive);
        REQUIRE(additive.blend == ColorBlend::Additive);
        REQUIRE_FALSE(additive.depth_write);
        REQUIRE(additive.stage == RenderStage::Transparent);
    }

    SECTION("UI draws last")
    {
        REQUIRE(describe_variant(PipelineVariant::UiPanel).stage == RenderStage::Ui);
        REQUIRE(describe_variant(PipelineVariant::UiText).stage == RenderStage::Ui);
    }
}

TEST_CASE("Pipeline resolution by pool kind and instance count", "[pipeline]")
{
    SECTION("single mesh instance keeps the material variant")
    {
        REQUIRE(resolve_pipeline(PipelineVariant::OpaquePbr, PoolKind::Mesh, 1) == PipelineVariant::OpaquePbr);
    }

    SECTION("several mesh instances use the instanced variant")
    {
        REQUIRE(resolve_pipeline(PipelineVariant::OpaquePbr, PoolKind::Mesh, 2) == PipelineVariant::InstancedOpaquePbr);
        REQUIRE(resolve_pipeline(PipelineVariant::TransparentUnlit, PoolKind::Mesh, 50) == PipelineVariant::InstancedTransparentUnlit);
    }

    SECTION("billboards pick by blend mode")
    {
        REQUIRE(resolve_pipeline(PipelineVariant::OpaqueUnlit, PoolKind::Billboard, 10, BlendMode::Additive) == PipelineVariant::BillboardAdditive);
        REQUIRE(resolve_pipeline(PipelineVariant::OpaqueUnlit, PoolKind::Billboard, 10, BlendMode::Alpha) == PipelineVariant::BillboardAlpha);
    }

    SECTION("UI pools")
    {
        REQUIRE(resolve_pipeline(PipelineVariant::OpaqueUnlit, PoolKind::UiPanel, 3) == PipelineVariant::UiPanel);
        REQUIRE(resolve_pipeline(PipelineVariant::OpaqueUnlit, PoolKind::UiText, 1) == PipelineVariant::UiText);
    }
}

TEST_CASE("Vertex input layout", "[pipeline]")
{
    auto bindings = vertex_input_bindings();
    REQUIRE(bindings[0].stride == sizeof(Vertex));
    REQUIRE(bindings[0].inputRate == vk::VertexInputRate::eVertex);
    REQUIRE(bindings[1].stride == sizeof(InstanceData));
    REQUIRE(bindings[1].inputRate == vk::VertexInputRate::eInstance);

    auto attributes = vertex_input_attributes();
    std::set<uint32_t> locations;
    for (const auto& attribute : attributes) {
        locations.insert(attribute.location);
        REQUIRE(attribute.binding == (attribute.location < 4 ? VERTEX_BINDING : INSTANCE_BINDING));
    }
    REQUIRE(locations.size() == 16);
    REQUIRE(*locations.rbegin() == 15);
    REQUIRE(attributes[15].offset == 176);
}

TEST_CASE("Push constant limit", "[pipeline]")
{
    REQUIRE(check_push_constant_limit(128).has_value());
    REQUIRE(check_push_constant_limit(256).has_value());

    auto too_small = check_push_constant_limit(96);
    REQUIRE_FALSE(too_small.has_value());
    REQUIRE(too_small.error().code == ErrorCode::DeviceLimitTooLow);
}

TEST_CASE("Reflected vertex interface is checked against the fixed layout", "[pipeline]")
{
    std::vector<VertexAttribute> reflected;
    for (const auto& attribute : vertex_input_attributes()) {
        reflected.push_back(VertexAttribute{"a", attribute.location, attribute.binding, attribute.offset, attribute.format});
    }

    SECTION("exact match")
    {
        REQUIRE(check_vertex_interface(reflected, "test").has_value());
    }

    SECTION("wrong format")
    {
        reflected[2].format = vk::Format::eR32G32B32Sfloat;
        auto result = check_vertex_interface(reflected, "test");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::PipelineCreationFailed);
    }

    SECTION("unknown binding")
    {
        reflected.push_back(VertexAttribute{"extra", 16, 2, 0, vk::Format::eR32Sfloat});
        REQUIRE_FALSE(check_vertex_interface(reflected, "test").has_value());
    }

    SECTION("missing attribute")
    {
        reflected.pop_back();
        REQUIRE_FALSE(check_vertex_interface(reflected, "test").has_value());
    }
}

TEST_CASE("Reflected descriptors are checked against the shared layout", "[pipeline]")
{
    std::vector<ReflectedDescriptor> reflected{
        {"camera", 0, 0, 1, vk::DescriptorType::eUniformBuffer, 208},
        {"material", 1, 0, 1, vk::DescriptorType::eUniformBuffer, 64},
        {"base_color_texture", 1, 1, 1, vk::DescriptorType::eCombinedImageSampler, 0},
    };

    SECTION("known slots")
    {
        REQUIRE(check_descriptor_interface(reflected, "test").has_value());
    }

    SECTION("no descriptors at all")
    {
        REQUIRE(check_descriptor_interface({}, "test").has_value());
    }

    SECTION("binding outside the layout")
    {
        reflected.push_back({"shadow_map", 1, 5, 1, vk::DescriptorType::eCombinedImageSampler, 0});
        auto result = check_descriptor_interface(reflected, "test");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::PipelineCreationFailed);
    }

    SECTION("wrong descriptor type")
    {
        reflected[0].type = vk::DescriptorType::eStorageBuffer;
        REQUIRE_FALSE(check_descriptor_interface(reflected, "test").has_value());
    }

    SECTION("arrayed binding")
    {
        reflected[2].count = 4;
        REQUIRE_FALSE(check_descriptor_interface(reflected, "test").has_value());
    }
}
