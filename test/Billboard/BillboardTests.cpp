#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <starfall/Billboard.hpp>
#include <cmath>
#include <cstddef>
#include <vector>

using namespace starfall;
using Catch::Matchers::WithinAbs;

namespace {

void require_orthonormal(const BillboardBasis& basis)
{
    REQUIRE_THAT(glm::length(basis.right), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(glm::length(basis.up), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(glm::length(basis.forward), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(glm::dot(basis.right, basis.up), WithinAbs(0.0, 1e-5));
    REQUIRE_THAT(glm::dot(basis.right, basis.forward), WithinAbs(0.0, 1e-5));
    glm::vec3 cross = glm::cross(basis.right, basis.up);
    REQUIRE_THAT(glm::dot(cross, basis.forward), WithinAbs(1.0, 1e-5));
}

bool finite(const glm::vec3& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

TEST_CASE("Screen-aligned billboards use the camera axes", "[billboard]")
{
    auto camera = look_at(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f), 60.0f, 1.0f);
    auto basis = billboard_basis(Billboard{}, camera);

    require_orthonormal(basis);
    REQUIRE_THAT(basis.right.x, WithinAbs(1.0, 1e-4));
    REQUIRE_THAT(basis.up.y, WithinAbs(1.0, 1e-4));
    REQUIRE_THAT(basis.forward.z, WithinAbs(1.0, 1e-4));
}

TEST_CASE("Velocity-aligned billboards stretch along the velocity", "[billboard]")
{
    auto camera = look_at(glm::vec3(0.0f, 5.0f, 10.0f), glm::vec3(0.0f), 60.0f, 1.0f);
    Billboard billboard;
    billboard.orientation = VelocityAligned{glm::vec3(3.0f, 0.0f, 0.0f)};

    auto basis = billboard_basis(billboard, camera);
    require_orthonormal(basis);
    REQUIRE_THAT(basis.right.x, WithinAbs(1.0, 1e-4));
    REQUIRE(glm::dot(basis.forward, camera.position - billboard.position) > 0.0f);

    SECTION("zero velocity stays finite")
    {
        billboard.orientation = VelocityAligned{glm::vec3(0.0f)};
        auto fallback = billboard_basis(billboard, camera);
        REQUIRE(finite(fallback.right));
        REQUIRE(finite(fallback.up));
        require_orthonormal(fallback);
    }

    SECTION("velocity pointing at the camera stays finite")
    {
        billboard.orientation = VelocityAligned{camera.position};
        auto fallback = billboard_basis(billboard, camera);
        REQUIRE(finite(fallback.right));
        require_orthonormal(fallback);
    }
}

TEST_CASE("World-axis billboards keep their axis", "[billboard]")
{
    auto camera = look_at(glm::vec3(4.0f, 2.0f, 4.0f), glm::vec3(0.0f), 60.0f, 1.0f);
    Billboard billboard;
    billboard.orientation = WorldAxisAligned{glm::vec3(0.0f, 1.0f, 0.0f)};

    auto basis = billboard_basis(billboard, camera);
    require_orthonormal(basis);
    REQUIRE_THAT(basis.up.y, WithinAbs(1.0, 1e-4));

    SECTION("camera directly above the axis")
    {
        auto above = look_at(glm::vec3(0.0f, 10.0f, 0.0f), glm::vec3(0.0f), 60.0f, 1.0f);
        auto degenerate = billboard_basis(billboard, above);
        REQUIRE(finite(degenerate.right));
        require_orthonormal(degenerate);
    }
}

TEST_CASE("Billboard transform scales the basis", "[billboard]")
{
    auto camera = look_at(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f), 60.0f, 1.0f);
    Billboard billboard;
    billboard.position = glm::vec3(1.0f, 2.0f, 3.0f);
    billboard.size = glm::vec3(2.0f, 0.5f, 1.0f);

    auto transform = billboard_transform(billboard, camera);
    REQUIRE_THAT(glm::length(glm::vec3(transform[0])), WithinAbs(2.0, 1e-4));
    REQUIRE_THAT(glm::length(glm::vec3(transform[1])), WithinAbs(0.5, 1e-4));
    REQUIRE(glm::vec3(transform[3]) == billboard.position);
}

TEST_CASE("Trails become one segment per pair of points", "[billboard][trail]")
{
    std::vector<glm::vec3> points = {{0, 0, 0}, {1, 0, 0}, {1, 0, 0}, {3, 0, 0}};
    TrailStyle style;
    style.width = 0.2f;
    style.head_color = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
    style.tail_color = glm::vec4(0.0f, 0.0f, 1.0f, 0.0f);

    auto segments = build_trail(points, style);

    SECTION("repeated points are skipped")
    {
        REQUIRE(segments.size() == 2);
    }

    SECTION("segments are centred and sized to their length")
    {
        REQUIRE(segments[0].position == glm::vec3(0.5f, 0.0f, 0.0f));
        REQUIRE_THAT(segments[0].size.x, WithinAbs(1.0, 1e-5));
        REQUIRE_THAT(segments[0].size.y, WithinAbs(0.2, 1e-5));
        REQUIRE(segments[1].position == glm::vec3(2.0f, 0.0f, 0.0f));
        REQUIRE_THAT(segments[1].size.x, WithinAbs(2.0, 1e-5));
    }

    SECTION("colour fades from head to tail")
    {
        REQUIRE(segments[0].color.r > segments[1].color.r);
        REQUIRE(segments[0].color.a > segments[1].color.a);
        REQUIRE(segments[0].blend == style.blend);
    }

    SECTION("fewer than two points give nothing")
    {
        std::vector<glm::vec3> single = {{0, 0, 0}};
        REQUIRE(build_trail(single, style).empty());
    }
}

TEST_CASE("Trail segments meet end to end", "[billboard][trail]")
{
    std::vector<glm::vec3> points;
    for (int i = 0; i < 10; ++i) {
        points.emplace_back(0.5f * static_cast<float>(i), 0.0f, 0.0f);
    }
    auto camera = look_at(glm::vec3(2.0f, 3.0f, 10.0f), glm::vec3(2.0f, 0.0f, 0.0f), 60.0f, 1.0f);

    auto segments = build_trail(points, TrailStyle{});
    REQUIRE(segments.size() == 9);

    for (std::size_t i = 0; i < segments.size(); ++i) {
        REQUIRE_THAT(segments[i].position.x, WithinAbs(points[i].x + 0.25, 1e-5));
        REQUIRE_THAT(segments[i].size.x, WithinAbs(0.5, 1e-5));
    }

    // The quad spans -0.5..0.5 along its local x axis
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        glm::vec3 end(billboard_transform(segments[i], camera) * glm::vec4(0.5f, 0.0f, 0.0f, 1.0f));
        glm::vec3 next_start(billboard_transform(segments[i + 1], camera) * glm::vec4(-0.5f, 0.0f, 0.0f, 1.0f));
        REQUIRE(glm::length(end - next_start) < 1e-4f);
        REQUIRE_THAT(end.x, WithinAbs(points[i + 1].x, 1e-4));
    }
}
