#pragma once

#include <starfall/GpuTypes.hpp>
#include <starfall/Handle.hpp>
#include <starfall/Pipeline.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <variant>

namespace starfall {

struct MaterialTextures {
    std::optional<TextureId> base_color;
    std::optional<TextureId> normal;
    std::optional<TextureId> metallic_roughness;
    std::optional<TextureId> emission_ao;
};

struct StandardPbr {
    glm::vec4 base_color{0.8f, 0.8f, 0.8f, 1.0f};
    float metallic = 0.0f;
    float roughness = 0.5f;
    float ambient_occlusion = 1.0f;
    float normal_scale = 1.0f;
    glm::vec3 emission{0.0f};
    float emission_strength = 1.0f;
    MaterialTextures textures;
};

struct Unlit {
    glm::vec4 color{1.0f};
    std::optional<TextureId> texture;
};

struct AlphaOpaque {};
struct AlphaMask {
    float cutoff = 0.5f;
};
struct AlphaBlend {};

using AlphaMode = std::variant<AlphaOpaque, AlphaMask, AlphaBlend>;

/**
 * @brief Alpha handling around an opaque base; the base cannot itself be Transparent
 */
struct Transparent {
    std::variant<StandardPbr, Unlit> base;
    AlphaMode alpha_mode = AlphaBlend{};
    BlendMode blend = BlendMode::Alpha;
};

using Material = std::variant<StandardPbr, Unlit, Transparent>;

/**
 * @brief Pipeline a material draws with when its pool holds a single instance
 */
[[nodiscard]] PipelineVariant required_pipeline(const Material& material);

[[nodiscard]] BlendMode material_blend(const Material& material);

/**
 * @brief Range checks on colours, factors and cutoffs; InvalidMaterial on failure
 */
[[nodiscard]] std::expected<void, Error> validate_material(const Material& material);

[[nodiscard]] Material default_material();

/**
 * @brief Textures in Set 1 binding order (base colour, normal, metallic-roughness, emission/AO)
 */
[[nodiscard]] std::array<std::optional<TextureId>, 4> material_textures(const Material& material);

/**
 * @brief texture_bits for the textures the material references
 */
[[nodiscard]] uint32_t material_texture_flags(const Material& material);

[[nodiscard]] StandardMaterialUbo pack_standard(const StandardPbr& params, const AlphaMode& alpha);
[[nodiscard]] UnlitMaterialUbo pack_unlit(const Unlit& params, const AlphaMode& alpha);

/**
 * @brief Set 1 binding 0 contents, zero padded to MATERIAL_UBO_SIZE
 */
[[nodiscard]] std::array<std::byte, MATERIAL_UBO_SIZE> pack_material_ubo(const Material& material);

/**
 * @brief Per-instance colour and emission a material contributes
 */
struct InstanceAppearance {
    glm::vec4 color;
    glm::vec4 emission;
};

[[nodiscard]] InstanceAppearance instance_appearance(const Material& material);

} // namespace starfall
