#pragma once

#include <starfall/Common.hpp>
#include <array>
#include <cstddef>
#include <cstdint>

namespace starfall {

/**
 * @brief Vertex layout of binding 0, 44 bytes
 */
struct Vertex {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 0.0f, 1.0f};
    glm::vec2 uv{0.0f};
    glm::vec3 tangent{1.0f, 0.0f, 0.0f};
};
static_assert(sizeof(Vertex) == 44);
static_assert(offsetof(Vertex, normal) == 12);
static_assert(offsetof(Vertex, uv) == 24);
static_assert(offsetof(Vertex, tangent) == 32);

namespace texture_bits {
constexpr uint32_t BASE_COLOR = 1u << 0;
constexpr uint32_t NORMAL = 1u << 1;
constexpr uint32_t METALLIC_ROUGHNESS = 1u << 2;
constexpr uint32_t EMISSION_AO = 1u << 3;
}

/**
 * @brief Per-instance record of binding 1 (locations 4..15), 192 bytes
 *
 * The same array is exposed to shaders through the Set 2 storage buffer.
 */
struct InstanceData {
    glm::mat4 model{1.0f};
    std::array<glm::vec4, 4> normal_matrix{
        glm::vec4(1, 0, 0, 0), glm::vec4(0, 1, 0, 0), glm::vec4(0, 0, 1, 0), glm::vec4(0.0f)
    };
    glm::vec4 material_color{1.0f};
    glm::vec4 emission_color{0.0f};
    glm::uvec4 texture_flags{0u};
    uint32_t material_index = 0;
    uint32_t padding[3] = {0, 0, 0};
};
static_assert(sizeof(InstanceData) == 192);
static_assert(offsetof(InstanceData, normal_matrix) == 64);
static_assert(offsetof(InstanceData, material_color) == 128);
static_assert(offsetof(InstanceData, emission_color) == 144);
static_assert(offsetof(InstanceData, texture_flags) == 160);
static_assert(offsetof(InstanceData, material_index) == 176);

/**
 * @brief Push-constant block: model(64) + normal(48) + padding(16)
 */
struct PushConstants {
    glm::mat4 model{1.0f};
    std::array<glm::vec4, 3> normal_matrix{
        glm::vec4(1, 0, 0, 0), glm::vec4(0, 1, 0, 0), glm::vec4(0, 0, 1, 0)
    };
    glm::vec4 padding{0.0f};
};
constexpr uint32_t PUSH_CONSTANT_SIZE = 128;
static_assert(sizeof(PushConstants) == PUSH_CONSTANT_SIZE);

/**
 * @brief Inverse-transpose of the upper 3x3, one vec4 per column
 */
[[nodiscard]] std::array<glm::vec4, 3> normal_matrix_columns(const glm::mat4& model);

[[nodiscard]] PushConstants make_push_constants(const glm::mat4& model);

/**
 * @brief Set 0 binding 0
 */
struct CameraUbo {
    glm::mat4 view{1.0f};
    glm::mat4 projection{1.0f};
    glm::mat4 view_projection{1.0f};
    glm::vec4 position{0.0f, 0.0f, 0.0f, 1.0f};
};
static_assert(sizeof(CameraUbo) == 208);

constexpr uint32_t MAX_DIRECTIONAL_LIGHTS = 4;
constexpr uint32_t MAX_POINT_LIGHTS = 8;
constexpr uint32_t MAX_SPOT_LIGHTS = 4;

struct GpuDirectionalLight {
    glm::vec4 direction{0.0f};       ///< xyz, w unused
    glm::vec4 color_intensity{0.0f}; ///< rgb, intensity
};
static_assert(sizeof(GpuDirectionalLight) == 32);

struct GpuPointLight {
    glm::vec4 position_range{0.0f};
    glm::vec4 color_intensity{0.0f};
    glm::vec4 attenuation{1.0f, 0.0f, 0.0f, 0.0f}; ///< constant, linear, quadratic
};
static_assert(sizeof(GpuPointLight) == 48);

struct GpuSpotLight {
    glm::vec4 position_range{0.0f};
    glm::vec4 direction{0.0f};
    glm::vec4 color_intensity{0.0f};
    glm::vec4 cone{1.0f, 1.0f, 0.0f, 0.0f}; ///< cos(inner), cos(outer)
};
static_assert(sizeof(GpuSpotLight) == 64);

/**
 * @brief Set 0 binding 1
 */
struct LightingUbo {
    glm::vec4 ambient{0.0f};   ///< rgb, intensity
    glm::uvec4 counts{0u};     ///< directional, point, spot
    std::array<GpuDirectionalLight, MAX_DIRECTIONAL_LIGHTS> directional{};
    std::array<GpuPointLight, MAX_POINT_LIGHTS> point{};
    std::array<GpuSpotLight, MAX_SPOT_LIGHTS> spot{};
};
static_assert(sizeof(LightingUbo) == 800);

/**
 * @brief Set 1 binding 0 for StandardPbr-based materials
 */
struct StandardMaterialUbo {
    glm::vec4 base_color{0.8f, 0.8f, 0.8f, 1.0f};
    glm::vec4 params{0.0f, 0.5f, 1.0f, 1.0f};    ///< metallic, roughness, ao, normal_scale
    glm::vec4 emission{0.0f, 0.0f, 0.0f, 1.0f};  ///< rgb, strength
    glm::uvec4 texture_flags{0u};                ///< x: texture_bits
    glm::vec4 alpha_params{0.0f, 0.5f, 1.0f, 0.0f}; ///< mode, cutoff, opacity, unlit
    glm::vec4 padding{0.0f};
};
static_assert(sizeof(StandardMaterialUbo) == 96);

/**
 * @brief Set 1 binding 0 for Unlit-based materials
 */
struct UnlitMaterialUbo {
    glm::vec4 color{1.0f};
    glm::uvec4 texture_flags{0u};
    glm::vec4 alpha_params{0.0f, 0.5f, 1.0f, 1.0f};
    glm::vec4 padding{0.0f};
};
static_assert(sizeof(UnlitMaterialUbo) == 64);

constexpr vk::DeviceSize MATERIAL_UBO_SIZE = sizeof(StandardMaterialUbo);

} // namespace starfall
