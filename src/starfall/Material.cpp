#include <starfall/Material.hpp>
#include <cstring>

namespace starfall {

namespace {

constexpr float ALPHA_MODE_OPAQUE = 0.0f;
constexpr float ALPHA_MODE_MASK = 1.0f;
constexpr float ALPHA_MODE_BLEND = 2.0f;

glm::vec4 alpha_params(const AlphaMode& alpha, float opacity, bool unlit)
{
    return std::visit(overloaded{
        [&](const AlphaOpaque&) { return glm::vec4(ALPHA_MODE_OPAQUE, 0.5f, opacity, unlit ? 1.0f : 0.0f); },
        [&](const AlphaMask& mask) { return glm::vec4(ALPHA_MODE_MASK, mask.cutoff, opacity, unlit ? 1.0f : 0.0f); },
        [&](const AlphaBlend&) { return glm::vec4(ALPHA_MODE_BLEND, 0.5f, opacity, unlit ? 1.0f : 0.0f); }
    }, alpha);
}

bool in_unit_range(float value)
{
    return value >= 0.0f && value <= 1.0f;
}

std::expected<void, Error> invalid(std::string message)
{
    return std::unexpected(Error::make(ErrorCode::InvalidMaterial, std::move(message)));
}

std::expected<void, Error> validate_color(const glm::vec4& color, std::string_view what)
{
    if (!in_unit_range(color.a)) {
        return invalid(std::format("{} alpha {} is outside [0, 1]", what, color.a));
    }
    if (color.r < 0.0f || color.g < 0.0f || color.b < 0.0f) {
        return invalid(std::format("{} has a negative channel", what));
    }
    return {};
}

std::expected<void, Error> validate_base(const StandardPbr& pbr)
{
    if (auto result = validate_color(pbr.base_color, "base_color"); !result) {
        return result;
    }
    if (!in_unit_range(pbr.metallic)) {
        return invalid(std::format("metallic {} is outside [0, 1]", pbr.metallic));
    }
    if (!in_unit_range(pbr.roughness)) {
        return invalid(std::format("roughness {} is outside [0, 1]", pbr.roughness));
    }
    if (!in_unit_range(pbr.ambient_occlusion)) {
        return invalid(std::format("ambient_occlusion {} is outside [0, 1]", pbr.ambient_occlusion));
    }
    if (pbr.emission_strength < 0.0f) {
        return invalid(std::format("emission_strength {} is negative", pbr.emission_strength));
    }
    return {};
}

std::expected<void, Error> validate_base(const Unlit& unlit)
{
    return validate_color(unlit.color, "color");
}

} // anonymous namespace

PipelineVariant required_pipeline(const Material& material)
{
    return std::visit(overloaded{
        [](const StandardPbr&) { return PipelineVariant::OpaquePbr; },
        [](const Unlit&) { return PipelineVariant::OpaqueUnlit; },
        [](const Transparent& transparent) {
            bool pbr = std::holds_alternative<StandardPbr>(transparent.base);
            // Mask discards in the fragment shader and stays in the opaque pass
            if (std::holds_alternative<AlphaBlend>(transparent.alpha_mode)) {
                return pbr ? PipelineVariant::TransparentPbr : PipelineVariant::TransparentUnlit;
            }
            return pbr ? PipelineVariant::OpaquePbr : PipelineVariant::OpaqueUnlit;
        }
    }, material);
}

BlendMode material_blend(const Material& material)
{
    if (const auto* transparent = std::get_if<Transparent>(&material)) {
        return transparent->blend;
    }
    return BlendMode::Alpha;
}

std::expected<void, Error> validate_material(const Material& material)
{
    return std::visit(overloaded{
        [](const StandardPbr& pbr) { return validate_base(pbr); },
        [](const Unlit& unlit) { return validate_base(unlit); },
        [](const Transparent& transparent) -> std::expected<void, Error> {
            auto base = std::visit([](const auto& b) { return validate_base(b); }, transparent.base);
            if (!base) {
                return base;
            }
            if (const auto* mask = std::get_if<AlphaMask>(&transparent.alpha_mode); mask && !in_unit_range(mask->cutoff)) {
                return invalid(std::format("mask cutoff {} is outside [0, 1]", mask->cutoff));
            }
            return {};
        }
    }, material);
}

Material default_material()
{
    return StandardPbr{};
}

std::array<std::optional<TextureId>, 4> material_textures(const Material& material)
{
    auto from_pbr = [](const StandardPbr& pbr) {
        return std::array<std::optional<TextureId>, 4>{
            pbr.textures.base_color, pbr.textures.normal, pbr.textures.metallic_roughness, pbr.textures.emission_ao
        };
    };
    auto from_unlit = [](const Unlit& unlit) {
        return std::array<std::optional<TextureId>, 4>{unlit.texture, std::nullopt, std::nullopt, std::nullopt};
    };

    return std::visit(overloaded{
        from_pbr,
        from_unlit,
        [&](const Transparent& transparent) {
            return std::visit(overloaded{from_pbr, from_unlit}, transparent.base);
        }
    }, material);
}

uint32_t material_texture_flags(const Material& material)
{
    constexpr std::array<uint32_t, 4> bits = {
        texture_bits::BASE_COLOR, texture_bits::NORMAL, texture_bits::METALLIC_ROUGHNESS, texture_bits::EMISSION_AO
    };
    auto textures = material_textures(material);
    uint32_t flags = 0;
    for (std::size_t i = 0; i < textures.size(); ++i) {
        if (textures[i]) {
            flags |= bits[i];
        }
    }
    return flags;
}

StandardMaterialUbo pack_standard(const StandardPbr& params, const AlphaMode& alpha)
{
    StandardMaterialUbo ubo;
    ubo.base_color = params.base_color;
    ubo.params = glm::vec4(params.metallic, params.roughness, params.ambient_occlusion, params.normal_scale);
    ubo.emission = glm::vec4(params.emission, params.emission_strength);
    ubo.texture_flags = glm::uvec4(material_texture_flags(params), 0u, 0u, 0u);
    ubo.alpha_params = alpha_params(alpha, params.base_color.a, false);
    return ubo;
}

UnlitMaterialUbo pack_unlit(const Unlit& params, const AlphaMode& alpha)
{
    UnlitMaterialUbo ubo;
    ubo.color = params.color;
    ubo.texture_flags = glm::uvec4(material_texture_flags(params), 0u, 0u, 0u);
    ubo.alpha_params = alpha_params(alpha, params.color.a, true);
    return ubo;
}

std::array<std::byte, MATERIAL_UBO_SIZE> pack_material_ubo(const Material& material)
{
    std::array<std::byte, MATERIAL_UBO_SIZE> bytes{};
    auto store = [&bytes](const auto& ubo) {
        static_assert(sizeof(ubo) <= MATERIAL_UBO_SIZE);
        std::memcpy(bytes.data(), &ubo, sizeof(ubo));
    };
    auto pack_base = overloaded{
        [](const StandardPbr& pbr, const AlphaMode& alpha) -> std::variant<StandardMaterialUbo, UnlitMaterialUbo> { return pack_standard(pbr, alpha); },
        [](const Unlit& unlit, const AlphaMode& alpha) -> std::variant<StandardMaterialUbo, UnlitMaterialUbo> { return pack_unlit(unlit, alpha); }
    };

    std::variant<StandardMaterialUbo, UnlitMaterialUbo> packed = std::visit(overloaded{
        [&](const StandardPbr& pbr) { return pack_base(pbr, AlphaMode{AlphaOpaque{}}); },
        [&](const Unlit& unlit) { return pack_base(unlit, AlphaMode{AlphaOpaque{}}); },
        [&](const Transparent& transparent) {
            return std::visit([&](const auto& base) { return pack_base(base, transparent.alpha_mode); }, transparent.base);
        }
    }, material);

    std::visit(store, packed);
    return bytes;
}

InstanceAppearance instance_appearance(const Material& material)
{
    auto from_pbr = [](const StandardPbr& pbr) {
        return InstanceAppearance{pbr.base_color, glm::vec4(pbr.emission * pbr.emission_strength, 1.0f)};
    };
    auto from_unlit = [](const Unlit& unlit) {
        return InstanceAppearance{unlit.color, glm::vec4(0.0f)};
    };
    return std::visit(overloaded{
        from_pbr,
        from_unlit,
        [&](const Transparent& transparent) { return std::visit(overloaded{from_pbr, from_unlit}, transparent.base); }
    }, material);
}

} // namespace starfall
