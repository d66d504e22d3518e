#include <catch2/catch_test_macros.hpp>
#include <starfall/Config.hpp>

using namespace starfall;

TEST_CASE("Default config is valid", "[config]")
{
    RendererConfig config;
    REQUIRE(validate_config(config).has_value());
    REQUIRE(config.frames_in_flight == 2);
}

TEST_CASE("frames_in_flight must be within 1..4", "[config]")
{
    RendererConfig config;

    SECTION("zero is rejected")
    {
        config.frames_in_flight = 0;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidConfig);
        REQUIRE(result.error().kind == ErrorKind::InitializationFailure);
    }

    SECTION("above the limit is rejected")
    {
        config.frames_in_flight = MAX_FRAMES_IN_FLIGHT_LIMIT + 1;
        REQUIRE_FALSE(validate_config(config).has_value());
    }

    SECTION("the limit itself is accepted")
    {
        config.frames_in_flight = MAX_FRAMES_IN_FLIGHT_LIMIT;
        REQUIRE(validate_config(config).has_value());
    }
}

TEST_CASE("Capacities must be positive", "[config]")
{
    RendererConfig config;

    SECTION("pool capacity")
    {
        config.default_pool_capacity = 0;
        REQUIRE_FALSE(validate_config(config).has_value());
    }

    SECTION("material budget")
    {
        config.max_materials = 0;
        REQUIRE_FALSE(validate_config(config).has_value());
    }

    SECTION("texture budget must hold the built-in textures")
    {
        config.max_textures = 1;
        auto result = validate_config(config);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message.find("max_textures") != std::string::npos);
    }

    SECTION("font size")
    {
        config.font_pixel_size = 0.0f;
        REQUIRE_FALSE(validate_config(config).has_value());
    }
}

TEST_CASE("Validation layers follow the build type unless forced", "[config]")
{
    RendererConfig config;
    config.enable_validation = false;
    REQUIRE_FALSE(config.validation_enabled());
    config.enable_validation = true;
    REQUIRE(config.validation_enabled());
}
