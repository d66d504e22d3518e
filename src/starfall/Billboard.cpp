#include <starfall/Billboard.hpp>
#include <starfall/Common.hpp>
#include <starfall/Mesh.hpp>

namespace starfall {

namespace {

constexpr float DEGENERATE_LENGTH = 1e-6f;

bool degenerate(const glm::vec3& v)
{
    return glm::length(v) < DEGENERATE_LENGTH;
}

BillboardBasis screen_aligned(const CameraState& camera)
{
    glm::vec3 right = glm::normalize(camera.right());
    glm::vec3 up = glm::normalize(camera.up());
    return {right, up, glm::cross(right, up)};
}

BillboardBasis velocity_aligned(const glm::vec3& velocity, const glm::vec3& to_camera, const CameraState& camera)
{
    glm::vec3 right = degenerate(velocity) ? glm::normalize(camera.right()) : glm::normalize(velocity);

    glm::vec3 up = glm::cross(to_camera, right);
    if (degenerate(up)) {
        // Looking straight down the velocity
        up = any_perpendicular(right);
    }
    up = glm::normalize(up);
    return {right, up, glm::cross(right, up)};
}

BillboardBasis axis_aligned(const glm::vec3& axis, const glm::vec3& to_camera)
{
    glm::vec3 up = degenerate(axis) ? glm::vec3(0.0f, 1.0f, 0.0f) : glm::normalize(axis);

    glm::vec3 forward = to_camera - up * glm::dot(up, to_camera);
    if (degenerate(forward)) {
        // Camera on the axis
        forward = any_perpendicular(up);
    }
    forward = glm::normalize(forward);
    return {glm::cross(up, forward), up, forward};
}

} // anonymous namespace

BillboardBasis billboard_basis(const Billboard& billboard, const CameraState& camera)
{
    glm::vec3 to_camera = camera.position - billboard.position;

    return std::visit(overloaded{
        [&](const ScreenAligned&) { return screen_aligned(camera); },
        [&](const VelocityAligned& mode) { return velocity_aligned(mode.velocity, to_camera, camera); },
        [&](const WorldAxisAligned& mode) { return axis_aligned(mode.axis, to_camera); }
    }, billboard.orientation);
}

glm::mat4 billboard_transform(const Billboard& billboard, const CameraState& camera)
{
    auto basis = billboard_basis(billboard, camera);
    glm::mat4 transform(1.0f);
    transform[0] = glm::vec4(basis.right * billboard.size.x, 0.0f);
    transform[1] = glm::vec4(basis.up * billboard.size.y, 0.0f);
    transform[2] = glm::vec4(basis.forward * billboard.size.z, 0.0f);
    transform[3] = glm::vec4(billboard.position, 1.0f);
    return transform;
}

std::vector<Billboard> build_trail(std::span<const glm::vec3> points, const TrailStyle& style)
{
    std::vector<Billboard> segments;
    if (points.size() < 2) {
        return segments;
    }
    segments.reserve(points.size() - 1);

    auto segment_count = static_cast<float>(points.size() - 1);
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        glm::vec3 a = points[i];
        glm::vec3 b = points[i + 1];
        glm::vec3 delta = b - a;
        float length = glm::length(delta);
        if (length < DEGENERATE_LENGTH) {
            continue;
        }

        float t = (static_cast<float>(i) + 0.5f) / segment_count;
        segments.push_back(Billboard{
            .position = (a + b) * 0.5f,
            .size = glm::vec3(length, style.width, 1.0f),
            .color = glm::mix(style.head_color, style.tail_color, t),
            .orientation = VelocityAligned{delta},
            .blend = style.blend,
        });
    }
    return segments;
}

} // namespace starfall
