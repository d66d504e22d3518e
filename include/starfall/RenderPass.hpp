#pragma once

#include <starfall/Common.hpp>
#include <expected>

namespace starfall {

/**
 * @brief Single forward pass: colour (cleared, presented) + depth (cleared, discarded)
 *
 * External -> subpass 0 dependency on COLOR_ATTACHMENT_OUTPUT | EARLY_FRAGMENT_TESTS
 * with colour and depth write access. Opaque, transparent and UI draws all
 * record into the one subpass.
 */
class RenderPass
{
public:
    static std::expected<RenderPass, Error> create(vk::Device device, vk::Format color_format, vk::Format depth_format);

    ~RenderPass();

    RenderPass(const RenderPass&) = delete;
    RenderPass& operator=(const RenderPass&) = delete;
    RenderPass(RenderPass&& other) noexcept;
    RenderPass& operator=(RenderPass&& other) noexcept;

    [[nodiscard]] vk::RenderPass get() const { return m_render_pass; }
    [[nodiscard]] vk::Format color_format() const { return m_color_format; }
    [[nodiscard]] vk::Format depth_format() const { return m_depth_format; }

private:
    RenderPass(vk::Device device, vk::RenderPass render_pass, vk::Format color_format, vk::Format depth_format);

    vk::Device m_device;
    vk::RenderPass m_render_pass;
    vk::Format m_color_format;
    vk::Format m_depth_format;
};

/**
 * @brief Clear values in attachment order: colour, then depth = 1.0
 */
[[nodiscard]] std::array<vk::ClearValue, 2> make_clear_values(const glm::vec4& clear_color);

} // namespace starfall
