#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <starfall/Mesh.hpp>
#include <limits>

using namespace starfall;
using Catch::Matchers::WithinAbs;

TEST_CASE("Built-in meshes are valid", "[mesh]")
{
    REQUIRE(validate_mesh(make_cube()).has_value());
    REQUIRE(validate_mesh(make_quad()).has_value());
    REQUIRE(validate_mesh(make_icosphere(2)).has_value());
}

TEST_CASE("Cube layout", "[mesh]")
{
    auto cube = make_cube(1.0f);
    REQUIRE(cube.vertices.size() == 24);
    REQUIRE(cube.index_count() == 36);

    for (const auto& vertex : cube.vertices) {
        REQUIRE_THAT(glm::length(vertex.normal), WithinAbs(1.0, 1e-5));
        REQUIRE_THAT(glm::dot(vertex.normal, vertex.tangent), WithinAbs(0.0, 1e-5));
        REQUIRE_THAT(std::abs(glm::dot(vertex.position, vertex.normal)), WithinAbs(1.0, 1e-5));
    }
}

TEST_CASE("Cube faces wind counter-clockwise seen from outside", "[mesh]")
{
    auto cube = make_cube();
    for (std::size_t i = 0; i < cube.indices.size(); i += 3) {
        const auto& a = cube.vertices[cube.indices[i]];
        const auto& b = cube.vertices[cube.indices[i + 1]];
        const auto& c = cube.vertices[cube.indices[i + 2]];
        glm::vec3 face_normal = glm::cross(b.position - a.position, c.position - a.position);
        REQUIRE(glm::dot(face_normal, a.normal) > 0.0f);
    }
}

TEST_CASE("Icosphere vertices lie on the sphere", "[mesh]")
{
    auto sphere = make_icosphere(1, 2.0f);
    REQUIRE(sphere.vertices.size() == 42);
    REQUIRE(sphere.index_count() == 80 * 3);
    for (const auto& vertex : sphere.vertices) {
        REQUIRE_THAT(glm::length(vertex.position), WithinAbs(2.0, 1e-4));
        REQUIRE_THAT(glm::dot(vertex.normal, vertex.tangent), WithinAbs(0.0, 1e-4));
    }
}

TEST_CASE("Invalid meshes are rejected", "[mesh]")
{
    SECTION("empty")
    {
        auto result = validate_mesh(Mesh{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidMesh);
        REQUIRE(result.error().kind == ErrorKind::AssetDefect);
    }

    SECTION("partial triangle")
    {
        auto mesh = make_quad();
        mesh.indices.pop_back();
        REQUIRE_FALSE(validate_mesh(mesh).has_value());
    }

    SECTION("index out of range")
    {
        auto mesh = make_quad();
        mesh.indices[0] = 4;
        REQUIRE_FALSE(validate_mesh(mesh).has_value());
    }

    SECTION("non-finite position")
    {
        auto mesh = make_quad();
        mesh.vertices[1].position.x = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_FALSE(validate_mesh(mesh).has_value());
    }
}

TEST_CASE("Tangent generation", "[mesh]")
{
    SECTION("follows the U direction")
    {
        auto quad = make_quad();
        for (auto& vertex : quad.vertices) {
            vertex.tangent = glm::vec3(0.0f);
        }
        generate_tangents(quad);
        for (const auto& vertex : quad.vertices) {
            REQUIRE_THAT(vertex.tangent.x, WithinAbs(1.0, 1e-5));
        }
    }

    SECTION("degenerate UVs fall back to a perpendicular")
    {
        auto quad = make_quad();
        for (auto& vertex : quad.vertices) {
            vertex.uv = glm::vec2(0.5f);
        }
        generate_tangents(quad);
        for (const auto& vertex : quad.vertices) {
            REQUIRE_THAT(glm::length(vertex.tangent), WithinAbs(1.0, 1e-5));
            REQUIRE_THAT(glm::dot(vertex.tangent, vertex.normal), WithinAbs(0.0, 1e-5));
        }
    }
}

TEST_CASE("any_perpendicular", "[mesh]")
{
    for (glm::vec3 n : {glm::vec3(1, 0, 0), glm::vec3(0, 1, 0), glm::normalize(glm::vec3(1, 1, 1))}) {
        auto p = any_perpendicular(n);
        REQUIRE_THAT(glm::dot(p, n), WithinAbs(0.0, 1e-5));
        REQUIRE_THAT(glm::length(p), WithinAbs(1.0, 1e-5));
    }
}

TEST_CASE("Content hash identifies identical meshes", "[mesh]")
{
    REQUIRE(content_hash(make_cube()) == content_hash(make_cube()));
    REQUIRE(content_hash(make_cube()) != content_hash(make_cube(1.0f)));
    REQUIRE(content_hash(make_quad()) != content_hash(make_cube()));
}
