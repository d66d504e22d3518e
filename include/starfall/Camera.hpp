#pragma once

#include <starfall/GpuTypes.hpp>
#include <cstdint>

namespace starfall {

/**
 * @brief Camera descriptor handed to begin_frame
 *
 * The projection maps depth to [0, 1]. The renderer flips Y with a negative
 * viewport height, so an unmodified glm::perspective is expected.
 */
struct CameraState {
    glm::mat4 view{1.0f};
    glm::mat4 projection{1.0f};
    glm::vec3 position{0.0f};

    // World-space camera axes read from the view matrix
    [[nodiscard]] glm::vec3 right() const { return glm::vec3(view[0][0], view[1][0], view[2][0]); }
    [[nodiscard]] glm::vec3 up() const { return glm::vec3(view[0][1], view[1][1], view[2][1]); }
    /// Direction the camera looks along
    [[nodiscard]] glm::vec3 forward() const { return -glm::vec3(view[0][2], view[1][2], view[2][2]); }
};

[[nodiscard]] CameraState look_at(
    const glm::vec3& eye,
    const glm::vec3& target,
    float fov_degrees,
    float aspect_ratio,
    float near_plane = 0.1f,
    float far_plane = 100.0f
);

[[nodiscard]] CameraUbo pack_camera(const CameraState& camera);

/**
 * @brief Orbital camera around a focus point, used by the demo
 *
 * Mouse drag rotates (azimuth/elevation), scroll zooms, the focus point moves
 * in camera-relative directions.
 */
class OrbitCamera {
public:
    OrbitCamera(uint32_t viewport_width = 1280, uint32_t viewport_height = 720);

    [[nodiscard]] CameraState state() const;
    [[nodiscard]] glm::vec3 position() const;

    /**
     * @brief Handle mouse drag for orbit rotation
     *
     * @param xoffset Mouse X delta
     * @param yoffset Mouse Y delta
     */
    void handle_mouse_movement(double xoffset, double yoffset);

    /**
     * @brief Zoom; positive scrolls move closer
     */
    void handle_mouse_scroll(double yoffset);

    void handle_resize(uint32_t width, uint32_t height);

    void move_target_forward(float delta_time, float direction = 1.0f);
    void move_target_right(float delta_time, float direction = 1.0f);

    void set_target(const glm::vec3& target);
    void set_distance(float distance);

    /**
     * @brief Set camera rotation angles
     *
     * @param azimuth Horizontal angle in degrees
     * @param elevation Vertical angle in degrees (clamped to [-89, 89])
     */
    void set_rotation(float azimuth, float elevation);

    [[nodiscard]] glm::vec3 target() const { return m_target; }
    [[nodiscard]] float distance() const { return m_distance; }
    [[nodiscard]] float azimuth() const { return m_azimuth; }
    [[nodiscard]] float elevation() const { return m_elevation; }

private:
    glm::vec3 m_target;
    float m_distance;
    float m_azimuth;   ///< degrees
    float m_elevation; ///< degrees

    float m_move_speed;
    float m_fov;
    float m_aspect_ratio;
    float m_near_plane;
    float m_far_plane;

    float m_mouse_sensitivity;  ///< Degrees per pixel
    float m_scroll_sensitivity; ///< Distance per scroll unit
};

} // namespace starfall
