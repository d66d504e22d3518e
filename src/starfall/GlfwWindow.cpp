#include <starfall/GlfwWindow.hpp>
#include <starfall/Logger.hpp>
#include <format>

namespace starfall {

std::expected<void, Error> GlfwWindow::ensure_glfw_initialized() {
    static bool initialized = false;
    if (!initialized) {
        if (!glfwInit()) {
            return std::unexpected(Error::make(ErrorCode::SurfaceCreationFailed, "Failed to initialize GLFW"));
        }
        initialized = true;
    }
    return {};
}

std::expected<GlfwWindow, Error> GlfwWindow::create(int width, int height, std::string_view title) {
    if (auto result = ensure_glfw_initialized(); !result) {
        return std::unexpected(result.error());
    }
    if (!glfwVulkanSupported()) {
        return std::unexpected(Error::make(ErrorCode::SurfaceCreationFailed, "GLFW reports no Vulkan support"));
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    std::string owned_title{title};
    GLFWwindow* handle = glfwCreateWindow(width, height, owned_title.c_str(), nullptr, nullptr);
    if (!handle) {
        return std::unexpected(Error::make(ErrorCode::SurfaceCreationFailed, "Failed to create GLFW window"));
    }

    Logger::instance().info("Created window '{}' ({}x{})", owned_title, width, height);
    GlfwWindow window(handle);
    return window;
}

GlfwWindow::GlfwWindow(GLFWwindow* handle)
    : m_window_handle(handle)
{
    glfwSetFramebufferSizeCallback(m_window_handle, framebuffer_size_callback);
    rebind_user_pointer();
}

GlfwWindow::~GlfwWindow() {
    if (m_window_handle) {
        glfwDestroyWindow(m_window_handle);
    }
}

GlfwWindow::GlfwWindow(GlfwWindow&& other) noexcept
    : m_window_handle(std::exchange(other.m_window_handle, nullptr))
    , m_pending_resize(std::exchange(other.m_pending_resize, std::nullopt))
{
    rebind_user_pointer();
}

GlfwWindow& GlfwWindow::operator=(GlfwWindow&& other) noexcept {
    if (this != &other) {
        if (m_window_handle) {
            glfwDestroyWindow(m_window_handle);
        }
        m_window_handle = std::exchange(other.m_window_handle, nullptr);
        m_pending_resize = std::exchange(other.m_pending_resize, std::nullopt);
        rebind_user_pointer();
    }
    return *this;
}

// The user pointer must follow the object across moves
void GlfwWindow::rebind_user_pointer() {
    if (m_window_handle) {
        glfwSetWindowUserPointer(m_window_handle, this);
    }
}

void GlfwWindow::framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    auto* self = static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
    if (!self) return;
    self->m_pending_resize = vk::Extent2D{static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

std::vector<const char*> GlfwWindow::required_instance_extensions() const {
    uint32_t count = 0;
    const char** names = glfwGetRequiredInstanceExtensions(&count);
    if (!names) {
        return {};
    }
    return {names, names + count};
}

std::expected<vk::SurfaceKHR, Error> GlfwWindow::create_surface(vk::Instance instance) const {
    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(instance),
        m_window_handle,
        nullptr,
        &surface_c
    );

    if (result != VK_SUCCESS) {
        return std::unexpected(Error::make(ErrorCode::SurfaceCreationFailed,
            std::format("Failed to create window surface: {}", vk::to_string(static_cast<vk::Result>(result)))));
    }
    return vk::SurfaceKHR(surface_c);
}

vk::Extent2D GlfwWindow::framebuffer_extent() const {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);
    return {static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

bool GlfwWindow::should_close() const {
    return glfwWindowShouldClose(m_window_handle);
}

void GlfwWindow::poll_events() const {
    glfwPollEvents();
}

void GlfwWindow::set_size(int width, int height) const {
    glfwSetWindowSize(m_window_handle, width, height);
}

std::optional<vk::Extent2D> GlfwWindow::take_resize() {
    return std::exchange(m_pending_resize, std::nullopt);
}

} // namespace starfall
