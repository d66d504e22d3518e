#include <starfall/Camera.hpp>
#include <algorithm>
#include <cmath>

namespace starfall {

namespace {

constexpr float MIN_DISTANCE = 0.5f;
constexpr float MAX_DISTANCE = 100.0f;

float wrap_degrees(float angle)
{
    while (angle < 0.0f) angle += 360.0f;
    while (angle >= 360.0f) angle -= 360.0f;
    return angle;
}

} // anonymous namespace

CameraState look_at(const glm::vec3& eye, const glm::vec3& target, float fov_degrees, float aspect_ratio, float near_plane, float far_plane)
{
    // GLM_FORCE_DEPTH_ZERO_TO_ONE gives the [0, 1] depth range
    return CameraState{
        .view = glm::lookAt(eye, target, glm::vec3(0.0f, 1.0f, 0.0f)),
        .projection = glm::perspective(glm::radians(fov_degrees), aspect_ratio, near_plane, far_plane),
        .position = eye,
    };
}

CameraUbo pack_camera(const CameraState& camera)
{
    CameraUbo ubo;
    ubo.view = camera.view;
    ubo.projection = camera.projection;
    ubo.view_projection = camera.projection * camera.view;
    ubo.position = glm::vec4(camera.position, 1.0f);
    return ubo;
}

OrbitCamera::OrbitCamera(uint32_t viewport_width, uint32_t viewport_height)
    : m_target(0.0f)
    , m_distance(8.0f)
    , m_azimuth(90.0f)
    , m_elevation(20.0f)
    , m_move_speed(2.0f)
    , m_fov(60.0f)
    , m_aspect_ratio(static_cast<float>(viewport_width) / static_cast<float>(std::max(viewport_height, 1u)))
    , m_near_plane(0.1f)
    , m_far_plane(200.0f)
    , m_mouse_sensitivity(0.25f)
    , m_scroll_sensitivity(0.5f)
{}

glm::vec3 OrbitCamera::position() const
{
    float azimuth_rad = glm::radians(m_azimuth);
    float elevation_rad = glm::radians(m_elevation);

    glm::vec3 pos;
    pos.x = m_target.x + m_distance * std::cos(elevation_rad) * std::cos(azimuth_rad);
    pos.y = m_target.y + m_distance * std::sin(elevation_rad);
    pos.z = m_target.z + m_distance * std::cos(elevation_rad) * std::sin(azimuth_rad);
    return pos;
}

CameraState OrbitCamera::state() const
{
    return look_at(position(), m_target, m_fov, m_aspect_ratio, m_near_plane, m_far_plane);
}

void OrbitCamera::handle_mouse_movement(double xoffset, double yoffset)
{
    m_azimuth = wrap_degrees(m_azimuth - static_cast<float>(xoffset) * m_mouse_sensitivity);
    // Clamp elevation to avoid gimbal lock
    m_elevation = std::clamp(m_elevation + static_cast<float>(yoffset) * m_mouse_sensitivity, -89.0f, 89.0f);
}

void OrbitCamera::handle_mouse_scroll(double yoffset)
{
    m_distance = std::clamp(m_distance - static_cast<float>(yoffset) * m_scroll_sensitivity, MIN_DISTANCE, MAX_DISTANCE);
}

void OrbitCamera::handle_resize(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0) {
        return;
    }
    m_aspect_ratio = static_cast<float>(width) / static_cast<float>(height);
}

void OrbitCamera::move_target_forward(float delta_time, float direction)
{
    // Camera looks from position towards the target, projected to XZ
    float azimuth_rad = glm::radians(m_azimuth);
    glm::vec3 forward(-std::cos(azimuth_rad), 0.0f, -std::sin(azimuth_rad));
    m_target += forward * m_move_speed * delta_time * direction;
}

void OrbitCamera::move_target_right(float delta_time, float direction)
{
    float azimuth_rad = glm::radians(m_azimuth);
    glm::vec3 right(std::sin(azimuth_rad), 0.0f, -std::cos(azimuth_rad));
    m_target += right * m_move_speed * delta_time * direction;
}

void OrbitCamera::set_target(const glm::vec3& target)
{
    m_target = target;
}

void OrbitCamera::set_distance(float distance)
{
    m_distance = std::clamp(distance, MIN_DISTANCE, MAX_DISTANCE);
}

void OrbitCamera::set_rotation(float azimuth, float elevation)
{
    m_azimuth = wrap_degrees(azimuth);
    m_elevation = std::clamp(elevation, -89.0f, 89.0f);
}

} // namespace starfall
