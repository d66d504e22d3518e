#pragma once

#include <starfall/GpuTypes.hpp>
#include <vector>

namespace starfall {

struct DirectionalLight {
    glm::vec3 direction{0.0f, -1.0f, 0.0f}; ///< Direction the light travels
    glm::vec3 color{1.0f};
    float intensity = 1.0f;
};

struct PointLight {
    glm::vec3 position{0.0f};
    glm::vec3 color{1.0f};
    float intensity = 1.0f;
    float range = 10.0f;
    float constant = 1.0f;
    float linear = 0.09f;
    float quadratic = 0.032f;
};

struct SpotLight {
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f, -1.0f, 0.0f};
    glm::vec3 color{1.0f};
    float intensity = 1.0f;
    float range = 10.0f;
    float inner_angle = 0.35f; ///< radians
    float outer_angle = 0.5f;  ///< radians
};

/**
 * @brief Lighting descriptor handed to begin_frame
 */
struct LightingEnvironment {
    glm::vec3 ambient_color{1.0f};
    float ambient_intensity = 0.2f;
    std::vector<DirectionalLight> directional_lights;
    std::vector<PointLight> point_lights;
    std::vector<SpotLight> spot_lights;
};

/**
 * @brief One warm directional light and a dim ambient term
 */
[[nodiscard]] LightingEnvironment default_lighting();

/**
 * @brief Pack into the Set 0 lighting UBO, dropping (with a warning) lights past the per-type limits
 */
[[nodiscard]] LightingUbo pack_lighting(const LightingEnvironment& lighting);

} // namespace starfall
