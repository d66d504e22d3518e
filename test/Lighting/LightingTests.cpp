#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <starfall/Lighting.hpp>
#include <cmath>

using namespace starfall;
using Catch::Matchers::WithinAbs;

TEST_CASE("Default lighting has one directional light", "[lighting]")
{
    auto ubo = pack_lighting(default_lighting());
    REQUIRE(ubo.counts == glm::uvec4(1, 0, 0, 0));
    REQUIRE_THAT(glm::length(glm::vec3(ubo.directional[0].direction)), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(ubo.ambient.w, WithinAbs(0.2, 1e-6));
}

TEST_CASE("Lights past the per-type limits are dropped", "[lighting]")
{
    LightingEnvironment lighting;
    lighting.point_lights.resize(MAX_POINT_LIGHTS + 3);
    lighting.spot_lights.resize(1);

    auto ubo = pack_lighting(lighting);
    REQUIRE(ubo.counts.y == MAX_POINT_LIGHTS);
    REQUIRE(ubo.counts.z == 1);
}

TEST_CASE("Light parameters are packed", "[lighting]")
{
    LightingEnvironment lighting;
    lighting.point_lights.push_back(PointLight{.position = {1, 2, 3}, .color = {1, 0, 0}, .intensity = 4.0f, .range = 7.0f});
    lighting.spot_lights.push_back(SpotLight{.direction = {0, 0, -2}, .inner_angle = 0.6f, .outer_angle = 0.4f});
    lighting.directional_lights.push_back(DirectionalLight{.direction = glm::vec3(0.0f)});

    auto ubo = pack_lighting(lighting);
    REQUIRE(ubo.point[0].position_range == glm::vec4(1, 2, 3, 7));
    REQUIRE(ubo.point[0].color_intensity == glm::vec4(1, 0, 0, 4));

    SECTION("directions are normalised with a fallback")
    {
        REQUIRE(ubo.spot[0].direction == glm::vec4(0, 0, -1, 0));
        REQUIRE(ubo.directional[0].direction == glm::vec4(0, -1, 0, 0));
    }

    SECTION("inner cone never exceeds the outer cone")
    {
        REQUIRE_THAT(ubo.spot[0].cone.x, WithinAbs(std::cos(0.4f), 1e-6));
        REQUIRE_THAT(ubo.spot[0].cone.y, WithinAbs(std::cos(0.4f), 1e-6));
    }
}
