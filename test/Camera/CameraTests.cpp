#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <starfall/Camera.hpp>

using namespace starfall;
using Catch::Matchers::WithinAbs;

TEST_CASE("look_at builds a camera facing the target", "[camera]")
{
    auto camera = look_at(glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f), 60.0f, 16.0f / 9.0f);

    REQUIRE(camera.position == glm::vec3(0.0f, 0.0f, 5.0f));
    REQUIRE_THAT(camera.forward().z, WithinAbs(-1.0, 1e-5));
    REQUIRE_THAT(camera.right().x, WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(camera.up().y, WithinAbs(1.0, 1e-5));
}

TEST_CASE("Projected depth lies in [0, 1]", "[camera]")
{
    auto camera = look_at(glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f), 60.0f, 1.0f, 0.1f, 100.0f);
    auto ubo = pack_camera(camera);

    auto project = [&](const glm::vec3& p) {
        glm::vec4 clip = ubo.view_projection * glm::vec4(p, 1.0f);
        return clip.z / clip.w;
    };

    REQUIRE_THAT(project(glm::vec3(0.0f, 0.0f, 4.9f)), WithinAbs(0.0, 1e-4));
    REQUIRE_THAT(project(glm::vec3(0.0f, 0.0f, -95.0f)), WithinAbs(1.0, 1e-4));
    REQUIRE(ubo.position == glm::vec4(0.0f, 0.0f, 5.0f, 1.0f));
}

TEST_CASE("Orbit camera", "[camera]")
{
    OrbitCamera camera(800, 600);

    SECTION("elevation is clamped")
    {
        camera.set_rotation(0.0f, 120.0f);
        REQUIRE(camera.elevation() <= 89.0f);
    }

    SECTION("distance sets the eye distance")
    {
        camera.set_distance(10.0f);
        REQUIRE_THAT(glm::length(camera.position() - camera.target()), WithinAbs(10.0, 1e-4));
    }

    SECTION("state looks at the target")
    {
        camera.set_target(glm::vec3(1.0f, 2.0f, 3.0f));
        auto state = camera.state();
        glm::vec3 to_target = glm::normalize(camera.target() - state.position);
        REQUIRE_THAT(glm::dot(to_target, state.forward()), WithinAbs(1.0, 1e-4));
    }
}
