#ifndef STARFALL_VULKANCONTEXT_HPP
#define STARFALL_VULKANCONTEXT_HPP

#include <starfall/Common.hpp>
#include <starfall/Config.hpp>
#include <starfall/DeviceSelection.hpp>
#include <starfall/SurfaceProvider.hpp>
#include <expected>
#include <memory>
#include <string>

namespace starfall {

/**
 * @brief Limits cached once at device selection
 */
struct DeviceLimits {
    uint32_t max_push_constants_size;
    uint32_t max_bound_descriptor_sets;
    vk::DeviceSize min_uniform_buffer_offset_alignment;
    vk::PhysicalDeviceMemoryProperties memory_properties;
    std::string device_name;
};

/**
 * @brief Instance, surface, physical and logical device, queues
 *
 * Created once per process and destroyed last. Everything else borrows its
 * handles, so it must outlive every resource created from it.
 */
class VulkanContext
{
public:
    /**
     * @brief Bring up the GPU session
     *
     * @param config Validation override, application name, simulated limits
     * @param surface_provider Window to present to; nullptr creates a headless context
     * @return Context, or an InitializationFailure. On failure nothing stays alive.
     */
    static std::expected<std::unique_ptr<VulkanContext>, Error> create(
        const RendererConfig& config,
        const SurfaceProvider* surface_provider
    );

    ~VulkanContext();

    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;
    VulkanContext(VulkanContext&&) = delete;
    VulkanContext& operator=(VulkanContext&&) = delete;

    [[nodiscard]] vk::Instance instance() const { return m_instance; }
    [[nodiscard]] vk::SurfaceKHR surface() const { return m_surface; }
    [[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
    [[nodiscard]] vk::Device device() const { return m_device; }
    [[nodiscard]] const QueueFamilyIndices& queue_indices() const { return m_queue_indices; }
    [[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }
    [[nodiscard]] vk::Queue present_queue() const { return m_present_queue; }
    [[nodiscard]] const DeviceLimits& limits() const { return m_limits; }
    [[nodiscard]] bool headless() const { return !m_surface; }

    /**
     * @brief Block until the device is idle; DEVICE_LOST becomes a FatalDevice error
     */
    [[nodiscard]] std::expected<void, Error> wait_idle() const;

private:
    VulkanContext() = default;

    std::expected<void, Error> create_instance(const RendererConfig& config, const SurfaceProvider* surface_provider);
    std::expected<void, Error> create_debug_messenger();
    std::expected<void, Error> pick_physical_device(const RendererConfig& config);
    std::expected<void, Error> create_logical_device();

    vk::Instance m_instance;
    vk::DebugUtilsMessengerEXT m_debug_messenger;
    vk::SurfaceKHR m_surface;
    vk::PhysicalDevice m_physical_device;
    QueueFamilyIndices m_queue_indices{};
    DeviceLimits m_limits{};
    vk::Device m_device;
    vk::Queue m_graphics_queue;
    vk::Queue m_present_queue;
    bool m_validation = false;
};

} // namespace starfall
#endif // STARFALL_VULKANCONTEXT_HPP
