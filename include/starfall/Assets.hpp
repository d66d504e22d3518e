#pragma once

#include <starfall/Events.hpp>
#include <starfall/Material.hpp>
#include <starfall/Mesh.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace starfall {

/**
 * @brief Decoded RGBA8 image as delivered by the asset layer
 */
struct ImageData {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgba;
};

[[nodiscard]] std::expected<void, Error> validate_image(const ImageData& image);

/**
 * @brief 1x1 magenta, substituted for unusable images
 */
[[nodiscard]] ImageData fallback_image();

// The resolve_* functions accept the asset layer's result and always return
// something drawable. Defects are logged and, when events is given, reported
// as AssetFallbackUsed.

[[nodiscard]] Mesh resolve_mesh_asset(std::expected<Mesh, Error> asset, EventQueue* events = nullptr);
[[nodiscard]] ImageData resolve_image_asset(std::expected<ImageData, Error> asset, EventQueue* events = nullptr);
[[nodiscard]] Material resolve_material_asset(std::expected<Material, Error> asset, EventQueue* events = nullptr);

} // namespace starfall
