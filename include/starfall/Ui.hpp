#pragma once

#include <starfall/Common.hpp>

namespace starfall {

/**
 * @brief Screen-space rectangle in pixels, origin at the top-left corner
 */
struct UiPanel {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    glm::vec4 color{1.0f};
};

/**
 * @brief Map the unit quad (centred, side 1) onto the panel rectangle in clip space
 *
 * Clip +Y is the top of the screen because the viewport height is negative.
 */
[[nodiscard]] glm::mat4 ui_panel_transform(const UiPanel& panel, vk::Extent2D extent);

/**
 * @brief Place text laid out in font pixels with its first baseline at (x, y) screen pixels
 */
[[nodiscard]] glm::mat4 ui_text_transform(float x, float y, float pixel_scale, vk::Extent2D extent);

} // namespace starfall
