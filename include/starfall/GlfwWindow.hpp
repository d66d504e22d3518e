#pragma once

#include <starfall/SurfaceProvider.hpp>
#include <GLFW/glfw3.h>
#include <expected>
#include <optional>
#include <string_view>

namespace starfall {

/**
 * @brief GLFW window acting as the renderer's surface provider
 *
 * Reports framebuffer resizes through take_resize() so the caller can forward
 * them to RendererCore::handle_resize between frames.
 */
class GlfwWindow : public SurfaceProvider {
public:
    /**
     * @brief Create a resizable window without a client API
     *
     * @param width Initial width in screen coordinates
     * @param height Initial height in screen coordinates
     * @param title Window title
     * @return Window or InitializationFailure
     */
    static std::expected<GlfwWindow, Error> create(int width, int height, std::string_view title);

    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;
    GlfwWindow(GlfwWindow&& other) noexcept;
    GlfwWindow& operator=(GlfwWindow&& other) noexcept;

    [[nodiscard]] std::vector<const char*> required_instance_extensions() const override;
    [[nodiscard]] std::expected<vk::SurfaceKHR, Error> create_surface(vk::Instance instance) const override;
    [[nodiscard]] vk::Extent2D framebuffer_extent() const override;

    [[nodiscard]] bool should_close() const;
    void poll_events() const;

    /**
     * @brief Programmatic resize (resize storms in the demo)
     */
    void set_size(int width, int height) const;

    /**
     * @brief Latest framebuffer size reported since the previous call, if any
     */
    [[nodiscard]] std::optional<vk::Extent2D> take_resize();

    [[nodiscard]] GLFWwindow* get_window_handle() const { return m_window_handle; }

private:
    explicit GlfwWindow(GLFWwindow* handle);

    static std::expected<void, Error> ensure_glfw_initialized();
    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    void rebind_user_pointer();

    GLFWwindow* m_window_handle;
    std::optional<vk::Extent2D> m_pending_resize;
};

} // namespace starfall
