#pragma once

#include <starfall/Common.hpp>
#include <expected>
#include <vector>

namespace starfall {

/**
 * @brief Window-side collaborator the renderer presents through
 *
 * The renderer never talks to the windowing system directly. It asks the
 * provider for instance extensions, a surface, and the current framebuffer
 * size.
 */
class SurfaceProvider {
public:
    virtual ~SurfaceProvider() = default;

    /**
     * @brief Instance extensions the platform surface needs (VK_KHR_surface and friends)
     */
    [[nodiscard]] virtual std::vector<const char*> required_instance_extensions() const = 0;

    /**
     * @brief Create a presentable surface; ownership passes to the caller
     */
    [[nodiscard]] virtual std::expected<vk::SurfaceKHR, Error> create_surface(vk::Instance instance) const = 0;

    /**
     * @brief Current framebuffer size in pixels (zero while minimized)
     */
    [[nodiscard]] virtual vk::Extent2D framebuffer_extent() const = 0;
};

} // namespace starfall
