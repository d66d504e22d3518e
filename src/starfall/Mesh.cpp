#include <starfall/Mesh.hpp>
#include <starfall/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <span>
#include <unordered_map>

namespace starfall {

std::expected<void, Error> validate_mesh(const Mesh& mesh)
{
    auto invalid = [](std::string message) {
        return std::unexpected(Error::make(ErrorCode::InvalidMesh, std::move(message)));
    };

    if (mesh.vertices.empty() || mesh.indices.empty()) {
        return invalid("Mesh has no vertices or no indices");
    }
    if (mesh.indices.size() % 3 != 0) {
        return invalid(std::format("Index count {} is not a multiple of 3", mesh.indices.size()));
    }
    for (std::size_t i = 0; i < mesh.indices.size(); ++i) {
        if (mesh.indices[i] >= mesh.vertices.size()) {
            return invalid(std::format("Index {} at position {} is out of range ({} vertices)",
                mesh.indices[i], i, mesh.vertices.size()));
        }
    }
    for (std::size_t i = 0; i < mesh.vertices.size(); ++i) {
        const auto& p = mesh.vertices[i].position;
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            return invalid(std::format("Vertex {} has a non-finite position", i));
        }
    }
    return {};
}

glm::vec3 any_perpendicular(const glm::vec3& n)
{
    // Cross with the axis least aligned with n
    glm::vec3 a = std::abs(n.x) < 0.9f ? glm::vec3(1.0f, 0.0f, 0.0f) : glm::vec3(0.0f, 1.0f, 0.0f);
    return glm::normalize(glm::cross(n, a));
}

void generate_tangents(Mesh& mesh)
{
    std::vector<glm::vec3> accumulated(mesh.vertices.size(), glm::vec3(0.0f));

    for (std::size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
        uint32_t i0 = mesh.indices[i];
        uint32_t i1 = mesh.indices[i + 1];
        uint32_t i2 = mesh.indices[i + 2];
        const auto& v0 = mesh.vertices[i0];
        const auto& v1 = mesh.vertices[i1];
        const auto& v2 = mesh.vertices[i2];

        glm::vec3 e1 = v1.position - v0.position;
        glm::vec3 e2 = v2.position - v0.position;
        glm::vec2 d1 = v1.uv - v0.uv;
        glm::vec2 d2 = v2.uv - v0.uv;

        float det = d1.x * d2.y - d2.x * d1.y;
        if (std::abs(det) < 1e-12f) {
            continue;
        }
        glm::vec3 tangent = (e1 * d2.y - e2 * d1.y) / det;
        accumulated[i0] += tangent;
        accumulated[i1] += tangent;
        accumulated[i2] += tangent;
    }

    for (std::size_t v = 0; v < mesh.vertices.size(); ++v) {
        auto& vertex = mesh.vertices[v];
        glm::vec3 n = glm::length(vertex.normal) > 1e-6f ? glm::normalize(vertex.normal) : glm::vec3(0.0f, 0.0f, 1.0f);
        // Gram-Schmidt
        glm::vec3 t = accumulated[v] - n * glm::dot(n, accumulated[v]);
        if (glm::length(t) < 1e-6f) {
            vertex.tangent = any_perpendicular(n);
        } else {
            vertex.tangent = glm::normalize(t);
        }
    }
}

Mesh make_cube(float half_extent)
{
    struct Face {
        glm::vec3 normal;
        glm::vec3 u;
        glm::vec3 v;
    };
    // cross(u, v) == normal for every face
    constexpr std::array<Face, 6> faces = {{
        {{1, 0, 0}, {0, 0, -1}, {0, 1, 0}},
        {{-1, 0, 0}, {0, 0, 1}, {0, 1, 0}},
        {{0, 1, 0}, {1, 0, 0}, {0, 0, -1}},
        {{0, -1, 0}, {1, 0, 0}, {0, 0, 1}},
        {{0, 0, 1}, {1, 0, 0}, {0, 1, 0}},
        {{0, 0, -1}, {-1, 0, 0}, {0, 1, 0}},
    }};
    constexpr std::array<glm::vec2, 4> corners = {{{-1, -1}, {1, -1}, {1, 1}, {-1, 1}}};

    Mesh mesh;
    mesh.vertices.reserve(24);
    mesh.indices.reserve(36);
    for (const auto& face : faces) {
        auto base = static_cast<uint32_t>(mesh.vertices.size());
        for (const auto& c : corners) {
            Vertex vertex;
            vertex.position = (face.normal + face.u * c.x + face.v * c.y) * half_extent;
            vertex.normal = face.normal;
            vertex.uv = glm::vec2((c.x + 1.0f) * 0.5f, (1.0f - c.y) * 0.5f);
            vertex.tangent = face.u;
            mesh.vertices.push_back(vertex);
        }
        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    }
    return mesh;
}

Mesh make_icosphere(uint32_t subdivisions, float radius)
{
    const float t = (1.0f + std::sqrt(5.0f)) / 2.0f;

    std::vector<glm::vec3> positions = {
        glm::normalize(glm::vec3(-1,  t,  0)),
        glm::normalize(glm::vec3( 1,  t,  0)),
        glm::normalize(glm::vec3(-1, -t,  0)),
        glm::normalize(glm::vec3( 1, -t,  0)),
        glm::normalize(glm::vec3( 0, -1,  t)),
        glm::normalize(glm::vec3( 0,  1,  t)),
        glm::normalize(glm::vec3( 0, -1, -t)),
        glm::normalize(glm::vec3( 0,  1, -t)),
        glm::normalize(glm::vec3( t,  0, -1)),
        glm::normalize(glm::vec3( t,  0,  1)),
        glm::normalize(glm::vec3(-t,  0, -1)),
        glm::normalize(glm::vec3(-t,  0,  1))
    };

    std::vector<uint32_t> indices = {
        0, 11, 5,   0, 5, 1,    0, 1, 7,    0, 7, 10,   0, 10, 11,
        1, 5, 9,    5, 11, 4,   11, 10, 2,  10, 7, 6,   7, 1, 8,
        3, 9, 4,    3, 4, 2,    3, 2, 6,    3, 6, 8,    3, 8, 9,
        4, 9, 5,    2, 4, 11,   6, 2, 10,   8, 6, 7,    9, 8, 1
    };

    for (uint32_t i = 0; i < subdivisions; i++) {
        std::vector<uint32_t> new_indices;
        new_indices.reserve(indices.size() * 4);
        std::unordered_map<uint64_t, uint32_t> midpoint_cache;

        auto get_midpoint = [&](uint32_t i1, uint32_t i2) -> uint32_t {
            if (i1 > i2) std::swap(i1, i2);
            uint64_t key = (static_cast<uint64_t>(i1) << 32) | i2;

            auto it = midpoint_cache.find(key);
            if (it != midpoint_cache.end()) {
                return it->second;
            }

            glm::vec3 mid = glm::normalize(positions[i1] + positions[i2]);
            auto idx = static_cast<uint32_t>(positions.size());
            positions.push_back(mid);
            midpoint_cache[key] = idx;
            return idx;
        };

        for (size_t j = 0; j < indices.size(); j += 3) {
            uint32_t v1 = indices[j];
            uint32_t v2 = indices[j + 1];
            uint32_t v3 = indices[j + 2];

            uint32_t a = get_midpoint(v1, v2);
            uint32_t b = get_midpoint(v2, v3);
            uint32_t c = get_midpoint(v3, v1);

            new_indices.insert(new_indices.end(), {
                v1, a, c,
                v2, b, a,
                v3, c, b,
                a, b, c
            });
        }

        indices = std::move(new_indices);
    }

    Mesh mesh;
    mesh.vertices.reserve(positions.size());
    for (const auto& pos : positions) {
        Vertex vertex;
        vertex.position = pos * radius;
        vertex.normal = pos;
        vertex.uv = glm::vec2(
            0.5f + std::atan2(pos.z, pos.x) / (2.0f * std::numbers::pi_v<float>),
            0.5f - std::asin(std::clamp(pos.y, -1.0f, 1.0f)) / std::numbers::pi_v<float>);
        mesh.vertices.push_back(vertex);
    }
    mesh.indices = std::move(indices);
    generate_tangents(mesh);

    Logger::instance().debug("Generated icosphere: {} vertices, {} indices", mesh.vertices.size(), mesh.indices.size());
    return mesh;
}

Mesh make_quad(float width, float height)
{
    float hw = width * 0.5f;
    float hh = height * 0.5f;
    Mesh mesh;
    mesh.vertices = {
        Vertex{{-hw, -hh, 0.0f}, {0, 0, 1}, {0.0f, 1.0f}, {1, 0, 0}},
        Vertex{{ hw, -hh, 0.0f}, {0, 0, 1}, {1.0f, 1.0f}, {1, 0, 0}},
        Vertex{{ hw,  hh, 0.0f}, {0, 0, 1}, {1.0f, 0.0f}, {1, 0, 0}},
        Vertex{{-hw,  hh, 0.0f}, {0, 0, 1}, {0.0f, 0.0f}, {1, 0, 0}},
    };
    mesh.indices = {0, 1, 2, 0, 2, 3};
    return mesh;
}

uint64_t content_hash(const Mesh& mesh)
{
    constexpr uint64_t FNV_OFFSET = 14695981039346656037ull;
    constexpr uint64_t FNV_PRIME = 1099511628211ull;

    uint64_t hash = FNV_OFFSET;
    auto feed = [&](std::span<const std::byte> bytes) {
        for (auto b : bytes) {
            hash ^= static_cast<uint64_t>(b);
            hash *= FNV_PRIME;
        }
    };

    uint64_t vertex_count = mesh.vertices.size();
    feed(std::as_bytes(std::span{&vertex_count, 1}));
    feed(std::as_bytes(std::span{mesh.vertices}));
    feed(std::as_bytes(std::span{mesh.indices}));
    return hash;
}

} // namespace starfall
