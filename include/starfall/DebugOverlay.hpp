#pragma once

#include <starfall/GlfwWindow.hpp>
#include <starfall/RendererCore.hpp>
#include <expected>
#include <memory>

namespace starfall {

/**
 * @brief ImGui window with pool statistics, frame time and dropped instances
 *
 * Draws inside the renderer's render pass, after the UI pass, through
 * RendererCore::set_overlay_recorder.
 */
class DebugOverlay
{
public:
    static std::expected<std::unique_ptr<DebugOverlay>, Error> create(RendererCore& renderer, const GlfwWindow& window);

    ~DebugOverlay();

    DebugOverlay(const DebugOverlay&) = delete;
    DebugOverlay& operator=(const DebugOverlay&) = delete;
    DebugOverlay(DebugOverlay&&) = delete;
    DebugOverlay& operator=(DebugOverlay&&) = delete;

    /**
     * @brief Build this frame's widgets; call between begin_frame and end_frame
     */
    void build(const FrameReport& last_frame, float frame_time_ms);

private:
    explicit DebugOverlay(RendererCore& renderer);

    std::expected<void, Error> setup_imgui(const GlfwWindow& window);
    void record(vk::CommandBuffer command_buffer) const;
    void cleanup();

    RendererCore* m_renderer;
    vk::DescriptorPool m_descriptor_pool;
    bool m_frame_built = false;
    uint64_t m_total_dropped = 0;
};

} // namespace starfall
