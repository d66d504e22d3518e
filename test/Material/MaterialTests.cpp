#include <catch2/catch_test_macros.hpp>
#include <starfall/Material.hpp>
#include <cstring>

using namespace starfall;

TEST_CASE("Materials select their pipeline", "[material]")
{
    REQUIRE(required_pipeline(StandardPbr{}) == PipelineVariant::OpaquePbr);
    REQUIRE(required_pipeline(Unlit{}) == PipelineVariant::OpaqueUnlit);
    REQUIRE(required_pipeline(Transparent{StandardPbr{}, AlphaBlend{}}) == PipelineVariant::TransparentPbr);
    REQUIRE(required_pipeline(Transparent{Unlit{}, AlphaBlend{}}) == PipelineVariant::TransparentUnlit);

    SECTION("alpha mask stays in the opaque pass")
    {
        REQUIRE(required_pipeline(Transparent{StandardPbr{}, AlphaMask{0.3f}}) == PipelineVariant::OpaquePbr);
    }
}

TEST_CASE("Material validation", "[material]")
{
    REQUIRE(validate_material(default_material()).has_value());

    SECTION("roughness out of range")
    {
        StandardPbr pbr;
        pbr.roughness = 1.5f;
        auto result = validate_material(pbr);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidMaterial);
    }

    SECTION("negative colour channel")
    {
        REQUIRE_FALSE(validate_material(Unlit{glm::vec4(-0.1f, 0.0f, 0.0f, 1.0f)}).has_value());
    }

    SECTION("HDR colours are allowed")
    {
        REQUIRE(validate_material(Unlit{glm::vec4(4.0f, 2.0f, 1.0f, 1.0f)}).has_value());
    }

    SECTION("mask cutoff out of range")
    {
        REQUIRE_FALSE(validate_material(Transparent{Unlit{}, AlphaMask{1.2f}}).has_value());
    }
}

TEST_CASE("Texture references and flags", "[material]")
{
    StandardPbr pbr;
    pbr.textures.base_color = TextureId{3, 0};
    pbr.textures.emission_ao = TextureId{4, 0};

    auto textures = material_textures(pbr);
    REQUIRE(textures[0] == TextureId{3, 0});
    REQUIRE_FALSE(textures[1].has_value());
    REQUIRE(textures[3] == TextureId{4, 0});

    REQUIRE(material_texture_flags(pbr) == (texture_bits::BASE_COLOR | texture_bits::EMISSION_AO));
    REQUIRE(material_texture_flags(Transparent{Unlit{glm::vec4(1.0f), TextureId{1, 0}}}) == texture_bits::BASE_COLOR);
}

TEST_CASE("Material UBO packing", "[material]")
{
    SECTION("standard")
    {
        StandardPbr pbr;
        pbr.metallic = 0.25f;
        pbr.roughness = 0.75f;
        auto bytes = pack_material_ubo(pbr);
        StandardMaterialUbo ubo;
        std::memcpy(&ubo, bytes.data(), sizeof(ubo));
        REQUIRE(ubo.params.x == 0.25f);
        REQUIRE(ubo.params.y == 0.75f);
        REQUIRE(ubo.alpha_params.x == 0.0f);
        REQUIRE(ubo.alpha_params.w == 0.0f);
    }

    SECTION("unlit masked")
    {
        auto bytes = pack_material_ubo(Transparent{Unlit{glm::vec4(1.0f, 0.0f, 0.0f, 0.5f)}, AlphaMask{0.4f}});
        UnlitMaterialUbo ubo;
        std::memcpy(&ubo, bytes.data(), sizeof(ubo));
        REQUIRE(ubo.color == glm::vec4(1.0f, 0.0f, 0.0f, 0.5f));
        REQUIRE(ubo.alpha_params.x == 1.0f);
        REQUIRE(ubo.alpha_params.y == 0.4f);
        REQUIRE(ubo.alpha_params.w == 1.0f);
    }
}

TEST_CASE("Instance appearance", "[material]")
{
    StandardPbr pbr;
    pbr.base_color = glm::vec4(0.5f, 0.5f, 0.5f, 1.0f);
    pbr.emission = glm::vec3(1.0f, 0.0f, 0.0f);
    pbr.emission_strength = 2.0f;

    auto appearance = instance_appearance(pbr);
    REQUIRE(appearance.color == pbr.base_color);
    REQUIRE(appearance.emission == glm::vec4(2.0f, 0.0f, 0.0f, 1.0f));

    REQUIRE(material_blend(Transparent{Unlit{}, AlphaBlend{}, BlendMode::Additive}) == BlendMode::Additive);
    REQUIRE(material_blend(StandardPbr{}) == BlendMode::Alpha);
}
