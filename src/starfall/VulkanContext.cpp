#include <starfall/VulkanContext.hpp>
#include <starfall/Logger.hpp>
#include <cstring>
#include <set>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace starfall {

namespace {

constexpr std::array VALIDATION_LAYERS = {
    "VK_LAYER_KHRONOS_validation"
};

spdlog::level::level_enum to_log_level(vk::DebugUtilsMessageSeverityFlagBitsEXT severity)
{
    using Severity = vk::DebugUtilsMessageSeverityFlagBitsEXT;
    switch (severity) {
        case Severity::eError: return spdlog::level::err;
        case Severity::eWarning: return spdlog::level::warn;
        case Severity::eInfo: return spdlog::level::debug;
        default: return spdlog::level::trace;
    }
}

// Performance warnings are marked so they can be grepped out of the log
vk::Bool32 validation_message(
    vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
    vk::DebugUtilsMessageTypeFlagsEXT type,
    const vk::DebugUtilsMessengerCallbackDataEXT* data,
    void* /*user_data*/)
{
    const char* id = data->pMessageIdName ? data->pMessageIdName : "-";
    bool performance = static_cast<bool>(type & vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance);
    Logger::tagged("VulkanDebug").log(to_log_level(severity), "{}{}: {}", performance ? "[perf] " : "", id, data->pMessage);
    return vk::False;
}

bool check_validation_layer_support()
{
    auto available_res = vk::enumerateInstanceLayerProperties();
    if (available_res.result != vk::Result::eSuccess) {
        Logger::instance().warn("Could not query instance layer properties {}", vk::to_string(available_res.result));
        return false;
    }
    for (const char* layer_name : VALIDATION_LAYERS) {
        bool found = std::ranges::any_of(available_res.value, [&](const vk::LayerProperties& layer) {
            return std::strcmp(layer_name, layer.layerName) == 0;
        });
        if (!found) {
            Logger::instance().warn("Validation layer {} not available", layer_name);
            return false;
        }
    }
    return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
    return vk::DebugUtilsMessengerCreateInfoEXT()
        .setMessageSeverity(
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
        .setMessageType(
            vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
            vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
            vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
        .setPfnUserCallback(validation_message);
}

DeviceCandidate describe_device(vk::PhysicalDevice device, vk::SurfaceKHR surface)
{
    auto props = device.getProperties();

    DeviceCandidate candidate;
    candidate.name = props.deviceName.data();
    candidate.type = props.deviceType;
    candidate.max_push_constants_size = props.limits.maxPushConstantsSize;
    candidate.max_bound_descriptor_sets = props.limits.maxBoundDescriptorSets;
    candidate.max_image_dimension_2d = props.limits.maxImageDimension2D;
    candidate.queue_families = device.getQueueFamilyProperties();

    if (surface) {
        for (uint32_t i = 0; i < candidate.queue_families.size(); i++) {
            auto support_res = device.getSurfaceSupportKHR(i, surface);
            candidate.present_support.push_back(support_res.result == vk::Result::eSuccess && support_res.value);
        }
    }

    auto ext_res = device.enumerateDeviceExtensionProperties();
    if (ext_res.result == vk::Result::eSuccess) {
        for (const auto& ext : ext_res.value) {
            candidate.extensions.emplace_back(ext.extensionName.data());
        }
    } else {
        Logger::instance().warn("Could not enumerate extensions of '{}': {}", candidate.name, vk::to_string(ext_res.result));
    }
    return candidate;
}

} // anonymous namespace

std::expected<std::unique_ptr<VulkanContext>, Error> VulkanContext::create(
    const RendererConfig& config,
    const SurfaceProvider* surface_provider
) {
    // unique_ptr cleans up whatever was created if a later step fails
    auto context = std::unique_ptr<VulkanContext>(new VulkanContext());

    if (auto result = context->create_instance(config, surface_provider); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = context->create_debug_messenger(); !result) {
        return std::unexpected(result.error());
    }
    if (surface_provider) {
        auto surface = surface_provider->create_surface(context->m_instance);
        if (!surface) {
            return std::unexpected(surface.error());
        }
        context->m_surface = *surface;
    }
    if (auto result = context->pick_physical_device(config); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = context->create_logical_device(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("VulkanContext VK_HEADER_VERSION: {}", VK_HEADER_VERSION);
    Logger::instance().info("VulkanContext initialized ({})", context->headless() ? "headless" : "presenting");
    return context;
}

std::expected<void, Error> VulkanContext::create_instance(const RendererConfig& config, const SurfaceProvider* surface_provider)
{
    static vk::detail::DynamicLoader dl;
    auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
    if (!vkGetInstanceProcAddr) {
        return std::unexpected(Error::make(ErrorCode::InstanceCreationFailed, "Vulkan loader not found"));
    }
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

    const auto& version = config.application_version;
    auto app_info = vk::ApplicationInfo()
        .setPApplicationName(config.application_name.c_str())
        .setApplicationVersion(VK_MAKE_API_VERSION(0, version[0], version[1], version[2]))
        .setPEngineName("Starfall")
        .setEngineVersion(VK_MAKE_API_VERSION(0, 1, 0, 0))
        .setApiVersion(VK_API_VERSION_1_3);

    std::vector<const char*> extensions;
    if (surface_provider) {
        extensions = surface_provider->required_instance_extensions();
        if (std::ranges::none_of(extensions, [](const char* e) { return std::strcmp(e, VK_KHR_SURFACE_EXTENSION_NAME) == 0; })) {
            extensions.push_back(VK_KHR_SURFACE_EXTENSION_NAME);
        }
    }

    m_validation = config.validation_enabled() && check_validation_layer_support();
    if (m_validation) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    Logger::instance().debug("Instance extensions:");
    for (const auto* ext : extensions) {
        Logger::instance().debug("  {}", ext);
    }

    auto create_info = vk::InstanceCreateInfo()
        .setPApplicationInfo(&app_info)
        .setPEnabledExtensionNames(extensions);

    vk::DebugUtilsMessengerCreateInfoEXT debug_create_info;
    if (m_validation) {
        create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
        debug_create_info = make_debug_messenger_create_info();
        create_info.setPNext(&debug_create_info);
        Logger::instance().info("Validation layers enabled");
    }

    auto instance_res = vk::createInstance(create_info);
    STARFALL_CHECK_VK_RESULT(instance_res, InstanceCreationFailed, "Failed to create instance {}");
    m_instance = instance_res.value;
    VULKAN_HPP_DEFAULT_DISPATCHER.init(m_instance);
    Logger::instance().debug("Created Vulkan instance");
    return {};
}

std::expected<void, Error> VulkanContext::create_debug_messenger()
{
    if (!m_validation) {
        return {};
    }

    auto debug_msngr_res = m_instance.createDebugUtilsMessengerEXT(make_debug_messenger_create_info(), nullptr);
    if (debug_msngr_res.result != vk::Result::eSuccess) {
        // Missing messenger only costs diagnostics
        Logger::instance().warn("Failed to create debug messenger {}", vk::to_string(debug_msngr_res.result));
        return {};
    }
    m_debug_messenger = debug_msngr_res.value;
    Logger::instance().debug("Created debug messenger");
    return {};
}

std::expected<void, Error> VulkanContext::pick_physical_device(const RendererConfig& config)
{
    auto devices_res = m_instance.enumeratePhysicalDevices();
    STARFALL_CHECK_VK_RESULT(devices_res, NoSuitableGpu, "Failed to enumerate physical devices {}");
    const auto& devices = devices_res.value;

    std::vector<DeviceCandidate> candidates;
    candidates.reserve(devices.size());
    for (const auto& dev : devices) {
        auto candidate = describe_device(dev, m_surface);
        if (config.simulated_push_constant_limit) {
            Logger::instance().warn("Simulating maxPushConstantsSize = {} on '{}'",
                *config.simulated_push_constant_limit, candidate.name);
            candidate.max_push_constants_size = *config.simulated_push_constant_limit;
        }
        candidates.push_back(std::move(candidate));
    }

    DeviceRequirements requirements;
    requirements.needs_present = static_cast<bool>(m_surface);
    if (!requirements.needs_present) {
        requirements.extensions.clear();
    }

    auto selection = select_physical_device(candidates, requirements);
    if (!selection) {
        return std::unexpected(selection.error());
    }

    const auto& chosen = candidates[selection->candidate_index];
    m_physical_device = devices[selection->candidate_index];
    m_queue_indices = selection->queues;

    auto props = m_physical_device.getProperties();
    m_limits = DeviceLimits{
        .max_push_constants_size = chosen.max_push_constants_size,
        .max_bound_descriptor_sets = chosen.max_bound_descriptor_sets,
        .min_uniform_buffer_offset_alignment = props.limits.minUniformBufferOffsetAlignment,
        .memory_properties = m_physical_device.getMemoryProperties(),
        .device_name = chosen.name,
    };

    Logger::instance().debug("Queue families - graphics: {}, present: {}",
        m_queue_indices.graphics, m_queue_indices.present);
    return {};
}

std::expected<void, Error> VulkanContext::create_logical_device()
{
    std::vector<vk::DeviceQueueCreateInfo> queue_create_infos;
    std::set<uint32_t> unique_families = {m_queue_indices.graphics, m_queue_indices.present};

    float queue_priority = 1.0f;
    for (uint32_t family : unique_families) {
        queue_create_infos.push_back(vk::DeviceQueueCreateInfo()
            .setQueueFamilyIndex(family)
            .setQueueCount(1)
            .setPQueuePriorities(&queue_priority));
    }

    std::vector<const char*> extensions;
    if (!headless()) {
        extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    }

    vk::PhysicalDeviceFeatures features{};

    auto create_info = vk::DeviceCreateInfo()
        .setQueueCreateInfos(queue_create_infos)
        .setPEnabledExtensionNames(extensions)
        .setPEnabledFeatures(&features);

    auto device_res = m_physical_device.createDevice(create_info);
    STARFALL_CHECK_VK_RESULT(device_res, DeviceCreationFailed, "Failed to create device {}");
    m_device = device_res.value;
    VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);

    m_graphics_queue = m_device.getQueue(m_queue_indices.graphics, 0);
    m_present_queue = m_device.getQueue(m_queue_indices.present, 0);
    Logger::instance().debug("Created logical device");
    return {};
}

std::expected<void, Error> VulkanContext::wait_idle() const
{
    auto result = m_device.waitIdle();
    STARFALL_CHECK_VK_RESULT_VOID(result, VulkanCallFailed, "waitIdle failed {}");
    return {};
}

VulkanContext::~VulkanContext()
{
    if (m_device) {
        if (auto idle = m_device.waitIdle(); idle != vk::Result::eSuccess) {
            Logger::instance().warn("waitIdle during teardown returned {}", vk::to_string(idle));
        }
        m_device.destroy();
        Logger::instance().trace("Destroyed logical device");
    }

    if (m_surface) {
        m_instance.destroySurfaceKHR(m_surface);
        Logger::instance().trace("Destroyed surface");
    }

    if (m_debug_messenger) {
        m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger, nullptr);
        Logger::instance().trace("Destroyed debug messenger");
    }

    if (m_instance) {
        m_instance.destroy();
        Logger::instance().trace("Destroyed instance");
    }
}

} // namespace starfall
