#pragma once

#include <starfall/Camera.hpp>
#include <starfall/Pipeline.hpp>
#include <span>
#include <variant>
#include <vector>

namespace starfall {

/// Faces the camera, axes follow the camera's right and up
struct ScreenAligned {};

/// Long axis along the velocity, rolled to face the camera
struct VelocityAligned {
    glm::vec3 velocity;
};

/// Up stays on a world axis, turned about it towards the camera
struct WorldAxisAligned {
    glm::vec3 axis{0.0f, 1.0f, 0.0f};
};

using BillboardOrientation = std::variant<ScreenAligned, VelocityAligned, WorldAxisAligned>;

struct Billboard {
    glm::vec3 position{0.0f};
    glm::vec3 size{1.0f};
    glm::vec4 color{1.0f};
    BillboardOrientation orientation = ScreenAligned{};
    BlendMode blend = BlendMode::Alpha;
};

/**
 * @brief Orthonormal right-handed frame: cross(right, up) == forward, forward points at the viewer
 */
struct BillboardBasis {
    glm::vec3 right;
    glm::vec3 up;
    glm::vec3 forward;
};

/**
 * @brief Basis for a billboard seen from the camera
 *
 * Zero velocities or axes, and cameras sitting on the axis, fall back to a
 * deterministic perpendicular instead of producing NaNs.
 */
[[nodiscard]] BillboardBasis billboard_basis(const Billboard& billboard, const CameraState& camera);

/**
 * @brief Model matrix with columns right * size.x, up * size.y, forward * size.z, position
 */
[[nodiscard]] glm::mat4 billboard_transform(const Billboard& billboard, const CameraState& camera);

struct TrailStyle {
    float width = 0.1f;
    glm::vec4 head_color{1.0f};
    glm::vec4 tail_color{1.0f, 1.0f, 1.0f, 0.0f};
    BlendMode blend = BlendMode::Additive;
};

/**
 * @brief One velocity-aligned billboard per pair of consecutive distinct points
 *
 * Each segment is centred on its midpoint with size.x equal to its length, so
 * neighbouring quads meet without gaps. points[0] is the head.
 */
[[nodiscard]] std::vector<Billboard> build_trail(std::span<const glm::vec3> points, const TrailStyle& style);

} // namespace starfall
