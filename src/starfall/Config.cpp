#include <starfall/Config.hpp>
#include <format>

namespace starfall {

std::expected<void, Error> validate_config(const RendererConfig& config) {
    if (config.frames_in_flight == 0 || config.frames_in_flight > MAX_FRAMES_IN_FLIGHT_LIMIT) {
        return std::unexpected(Error::make(ErrorCode::InvalidConfig,
            std::format("frames_in_flight must be in 1..{}, got {}", MAX_FRAMES_IN_FLIGHT_LIMIT, config.frames_in_flight)));
    }

    struct Capacity { const char* name; uint32_t value; };
    const std::array capacities = {
        Capacity{"max_materials", config.max_materials},
        Capacity{"max_mesh_types", config.max_mesh_types},
        Capacity{"default_pool_capacity", config.default_pool_capacity},
        Capacity{"billboard_pool_capacity", config.billboard_pool_capacity},
        Capacity{"ui_pool_capacity", config.ui_pool_capacity},
        Capacity{"text_pool_capacity", config.text_pool_capacity},
        Capacity{"max_fence_wait_retries", config.max_fence_wait_retries},
    };
    for (const auto& capacity : capacities) {
        if (capacity.value == 0) {
            return std::unexpected(Error::make(ErrorCode::InvalidConfig,
                std::format("{} must be greater than zero", capacity.name)));
        }
    }

    // White default and magenta fallback always occupy two slots
    if (config.max_textures < 2) {
        return std::unexpected(Error::make(ErrorCode::InvalidConfig,
            std::format("max_textures must be at least 2, got {}", config.max_textures)));
    }

    if (config.font_pixel_size <= 0.0f) {
        return std::unexpected(Error::make(ErrorCode::InvalidConfig, "font_pixel_size must be positive"));
    }

    if (config.fence_timeout_ns == 0) {
        return std::unexpected(Error::make(ErrorCode::InvalidConfig, "fence_timeout_ns must be positive"));
    }

    return {};
}

} // namespace starfall
