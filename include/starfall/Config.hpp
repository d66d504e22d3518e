#pragma once

#include <starfall/Error.hpp>
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace starfall {

/**
 * @brief Renderer-wide settings
 *
 * Plain aggregate so callers can use designated initializers. Loading it from
 * disk or the command line is up to the application.
 */
struct RendererConfig {
    std::string application_name = "Starfall";
    std::array<uint32_t, 3> application_version = {1, 0, 0};

    uint32_t frames_in_flight = 2;
    glm::vec4 clear_color = {0.005f, 0.005f, 0.005f, 1.0f};

    /// Unset: validation layers on in debug builds, off otherwise
    std::optional<bool> enable_validation;

    uint32_t max_materials = 256;
    uint32_t max_textures = 256;
    uint32_t max_mesh_types = 64;

    // Instance capacities are per frame slot
    uint32_t default_pool_capacity = 1024;
    uint32_t billboard_pool_capacity = 2048;
    uint32_t ui_pool_capacity = 256;
    uint32_t text_pool_capacity = 16;

    float font_pixel_size = 48.0f;

    uint64_t fence_timeout_ns = 1'000'000'000;
    uint32_t max_fence_wait_retries = 10;
    uint64_t initial_acquire_timeout_ns = 100'000'000;

    /// Pretend the device reports this maxPushConstantsSize (device-limit guard testing)
    std::optional<uint32_t> simulated_push_constant_limit;

    bool enable_debug_overlay = false;

    [[nodiscard]] bool validation_enabled() const {
#ifdef NDEBUG
        return enable_validation.value_or(false);
#else
        return enable_validation.value_or(true);
#endif
    }
};

constexpr uint32_t MAX_FRAMES_IN_FLIGHT_LIMIT = 4;

/**
 * @brief Reject settings the renderer cannot honour
 */
[[nodiscard]] std::expected<void, Error> validate_config(const RendererConfig& config);

} // namespace starfall
