#pragma once

#include <starfall/Common.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace starfall {

constexpr uint32_t REQUIRED_PUSH_CONSTANT_BYTES = 128;
constexpr uint32_t REQUIRED_DESCRIPTOR_SETS = 3;

/**
 * @brief Everything device selection needs to know about one physical device
 *
 * Filled from vk::PhysicalDevice queries in VulkanContext, or by hand in tests.
 */
struct DeviceCandidate {
    std::string name;
    vk::PhysicalDeviceType type = vk::PhysicalDeviceType::eOther;
    uint32_t max_push_constants_size = 0;
    uint32_t max_bound_descriptor_sets = 0;
    uint32_t max_image_dimension_2d = 0;
    std::vector<vk::QueueFamilyProperties> queue_families;
    /// Per queue family: can it present to the target surface (empty when headless)
    std::vector<bool> present_support;
    std::vector<std::string> extensions;
};

struct DeviceRequirements {
    bool needs_present = true;
    uint32_t min_push_constants_size = REQUIRED_PUSH_CONSTANT_BYTES;
    uint32_t min_bound_descriptor_sets = REQUIRED_DESCRIPTOR_SETS;
    std::vector<std::string> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};
};

struct QueueFamilyIndices {
    uint32_t graphics;
    uint32_t present;

    [[nodiscard]] bool shared() const { return graphics == present; }
};

struct DeviceSelection {
    std::size_t candidate_index;
    QueueFamilyIndices queues;
    int64_t score;
};

/**
 * @brief Base ranking of a device type: discrete > integrated > virtual > cpu
 */
[[nodiscard]] int64_t device_type_score(vk::PhysicalDeviceType type);

/**
 * @brief Pick queue families; prefers one family that does graphics and present
 */
[[nodiscard]] std::optional<QueueFamilyIndices> find_queue_families(const DeviceCandidate& candidate, bool needs_present);

/**
 * @brief Check the limits the pipeline layout depends on
 */
[[nodiscard]] std::expected<void, Error> validate_device_limits(const DeviceCandidate& candidate, const DeviceRequirements& requirements);

/**
 * @brief Score one candidate, or explain why it cannot be used
 */
[[nodiscard]] std::expected<DeviceSelection, Error> evaluate_candidate(const DeviceCandidate& candidate, const DeviceRequirements& requirements);

/**
 * @brief Choose the highest scoring usable candidate
 *
 * When every candidate is rejected and at least one failed only on limits,
 * the result is DeviceLimitTooLow; otherwise the most specific rejection.
 */
[[nodiscard]] std::expected<DeviceSelection, Error> select_physical_device(
    const std::vector<DeviceCandidate>& candidates,
    const DeviceRequirements& requirements
);

} // namespace starfall
