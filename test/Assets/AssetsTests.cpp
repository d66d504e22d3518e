#include <catch2/catch_test_macros.hpp>
#include <starfall/Assets.hpp>

using namespace starfall;

TEST_CASE("Image validation", "[assets]")
{
    REQUIRE(validate_image(ImageData{2, 2, std::vector<uint8_t>(16, 255)}).has_value());

    SECTION("zero extent")
    {
        auto result = validate_image(ImageData{0, 4, {}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidImage);
    }

    SECTION("wrong byte count")
    {
        REQUIRE_FALSE(validate_image(ImageData{2, 2, std::vector<uint8_t>(12, 255)}).has_value());
    }
}

TEST_CASE("Broken images fall back to magenta", "[assets]")
{
    EventQueue events;
    auto image = resolve_image_asset(ImageData{3, 3, {1, 2, 3}}, &events);

    REQUIRE(image.width == 1);
    REQUIRE(image.rgba == std::vector<uint8_t>{255, 0, 255, 255});

    auto drained = events.drain();
    REQUIRE(drained.size() == 1);
    const auto* fallback = std::get_if<AssetFallbackUsed>(&drained[0]);
    REQUIRE(fallback != nullptr);
    REQUIRE(fallback->code == ErrorCode::InvalidImage);
}

TEST_CASE("Loader errors fall back as asset defects", "[assets]")
{
    EventQueue events;
    auto mesh = resolve_mesh_asset(std::unexpected(Error::make(ErrorCode::VulkanCallFailed, "decoder crashed")), &events);

    REQUIRE(mesh.vertices.size() == make_cube().vertices.size());
    REQUIRE(events.size() == 1);
}

TEST_CASE("Invalid meshes become a cube", "[assets]")
{
    Mesh broken;
    broken.vertices.resize(2);
    broken.indices = {0, 1, 5};
    auto mesh = resolve_mesh_asset(broken);
    REQUIRE(content_hash(mesh) == content_hash(make_cube()));
}

TEST_CASE("Invalid materials become the default material", "[assets]")
{
    StandardPbr bad;
    bad.metallic = 3.0f;

    EventQueue events;
    auto material = resolve_material_asset(Material{bad}, &events);
    REQUIRE(std::holds_alternative<StandardPbr>(material));
    REQUIRE(std::get<StandardPbr>(material).metallic == 0.0f);
    REQUIRE(events.size() == 1);
}

TEST_CASE("Valid assets pass through untouched", "[assets]")
{
    EventQueue events;
    auto quad = resolve_mesh_asset(make_quad(), &events);
    auto material = resolve_material_asset(Material{Unlit{glm::vec4(0.2f)}}, &events);

    REQUIRE(quad.vertices.size() == 4);
    REQUIRE(std::holds_alternative<Unlit>(material));
    REQUIRE(events.size() == 0);
}
