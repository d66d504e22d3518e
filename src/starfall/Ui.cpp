#include <starfall/Ui.hpp>
#include <algorithm>

namespace starfall {

namespace {

glm::vec2 pixels_to_clip(glm::vec2 pixel, glm::vec2 extent)
{
    return {2.0f * pixel.x / extent.x - 1.0f, 1.0f - 2.0f * pixel.y / extent.y};
}

glm::vec2 safe_extent(vk::Extent2D extent)
{
    return {static_cast<float>(std::max(extent.width, 1u)), static_cast<float>(std::max(extent.height, 1u))};
}

} // anonymous namespace

glm::mat4 ui_panel_transform(const UiPanel& panel, vk::Extent2D extent)
{
    glm::vec2 screen = safe_extent(extent);
    glm::vec2 center = pixels_to_clip({panel.x + panel.width * 0.5f, panel.y + panel.height * 0.5f}, screen);

    glm::mat4 transform(1.0f);
    transform[0][0] = 2.0f * panel.width / screen.x;
    transform[1][1] = 2.0f * panel.height / screen.y;
    transform[3] = glm::vec4(center, 0.0f, 1.0f);
    return transform;
}

glm::mat4 ui_text_transform(float x, float y, float pixel_scale, vk::Extent2D extent)
{
    glm::vec2 screen = safe_extent(extent);
    glm::vec2 origin = pixels_to_clip({x, y}, screen);

    glm::mat4 transform(1.0f);
    transform[0][0] = 2.0f * pixel_scale / screen.x;
    transform[1][1] = 2.0f * pixel_scale / screen.y;
    transform[3] = glm::vec4(origin, 0.0f, 1.0f);
    return transform;
}

} // namespace starfall
