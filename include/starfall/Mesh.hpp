#pragma once

#include <starfall/GpuTypes.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace starfall {

/**
 * @brief Indexed triangle list as delivered by the asset layer
 */
struct Mesh {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;

    [[nodiscard]] uint32_t index_count() const { return static_cast<uint32_t>(indices.size()); }
};

/**
 * @brief Non-empty, whole triangles, indices in range and finite positions; else InvalidMesh
 */
[[nodiscard]] std::expected<void, Error> validate_mesh(const Mesh& mesh);

/**
 * @brief Per-vertex tangents from UV derivatives
 *
 * Accumulated per triangle, then orthogonalised against the normal. Vertices
 * with degenerate UVs get an arbitrary but deterministic perpendicular.
 */
void generate_tangents(Mesh& mesh);

/**
 * @brief Unit-length vector perpendicular to n, stable for a given n
 */
[[nodiscard]] glm::vec3 any_perpendicular(const glm::vec3& n);

/**
 * @brief 24-vertex cube centred at the origin, outward counter-clockwise faces
 */
[[nodiscard]] Mesh make_cube(float half_extent = 0.5f);

/**
 * @brief Subdivided icosahedron with spherical UVs
 */
[[nodiscard]] Mesh make_icosphere(uint32_t subdivisions, float radius = 1.0f);

/**
 * @brief Quad in the XY plane facing +Z, centred at the origin
 */
[[nodiscard]] Mesh make_quad(float width = 1.0f, float height = 1.0f);

/**
 * @brief FNV-1a over vertex and index bytes; identical meshes share a pool
 */
[[nodiscard]] uint64_t content_hash(const Mesh& mesh);

} // namespace starfall
