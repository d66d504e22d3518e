#include <starfall/Lighting.hpp>
#include <starfall/Logger.hpp>
#include <algorithm>
#include <cmath>

namespace starfall {

namespace {

glm::vec3 safe_normalize(const glm::vec3& v, const glm::vec3& fallback)
{
    float length = glm::length(v);
    return length > 1e-6f ? v / length : fallback;
}

template<class T>
std::size_t clamp_count(const std::vector<T>& lights, uint32_t limit, std::string_view kind)
{
    if (lights.size() > limit) {
        Logger::instance().warn("{} {} lights submitted, only the first {} are used", lights.size(), kind, limit);
        return limit;
    }
    return lights.size();
}

} // anonymous namespace

LightingEnvironment default_lighting()
{
    LightingEnvironment lighting;
    lighting.ambient_color = glm::vec3(1.0f);
    lighting.ambient_intensity = 0.2f;
    lighting.directional_lights.push_back(DirectionalLight{
        .direction = glm::normalize(glm::vec3(-0.5f, -1.0f, -0.3f)),
        .color = glm::vec3(0.8f, 0.76f, 0.72f),
        .intensity = 1.0f,
    });
    return lighting;
}

LightingUbo pack_lighting(const LightingEnvironment& lighting)
{
    LightingUbo ubo;
    ubo.ambient = glm::vec4(lighting.ambient_color, lighting.ambient_intensity);

    auto directional_count = clamp_count(lighting.directional_lights, MAX_DIRECTIONAL_LIGHTS, "directional");
    auto point_count = clamp_count(lighting.point_lights, MAX_POINT_LIGHTS, "point");
    auto spot_count = clamp_count(lighting.spot_lights, MAX_SPOT_LIGHTS, "spot");

    for (std::size_t i = 0; i < directional_count; ++i) {
        const auto& light = lighting.directional_lights[i];
        ubo.directional[i].direction = glm::vec4(safe_normalize(light.direction, glm::vec3(0.0f, -1.0f, 0.0f)), 0.0f);
        ubo.directional[i].color_intensity = glm::vec4(light.color, light.intensity);
    }
    for (std::size_t i = 0; i < point_count; ++i) {
        const auto& light = lighting.point_lights[i];
        ubo.point[i].position_range = glm::vec4(light.position, light.range);
        ubo.point[i].color_intensity = glm::vec4(light.color, light.intensity);
        ubo.point[i].attenuation = glm::vec4(light.constant, light.linear, light.quadratic, 0.0f);
    }
    for (std::size_t i = 0; i < spot_count; ++i) {
        const auto& light = lighting.spot_lights[i];
        ubo.spot[i].position_range = glm::vec4(light.position, light.range);
        ubo.spot[i].direction = glm::vec4(safe_normalize(light.direction, glm::vec3(0.0f, -1.0f, 0.0f)), 0.0f);
        ubo.spot[i].color_intensity = glm::vec4(light.color, light.intensity);
        float inner = std::min(light.inner_angle, light.outer_angle);
        ubo.spot[i].cone = glm::vec4(std::cos(inner), std::cos(light.outer_angle), 0.0f, 0.0f);
    }

    ubo.counts = glm::uvec4(directional_count, point_count, spot_count, 0u);
    return ubo;
}

} // namespace starfall
