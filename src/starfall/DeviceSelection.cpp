#include <starfall/DeviceSelection.hpp>
#include <starfall/Logger.hpp>
#include <algorithm>
#include <format>

namespace starfall {

int64_t device_type_score(vk::PhysicalDeviceType type) {
    switch (type) {
        case vk::PhysicalDeviceType::eDiscreteGpu: return 1000;
        case vk::PhysicalDeviceType::eIntegratedGpu: return 100;
        case vk::PhysicalDeviceType::eVirtualGpu: return 10;
        case vk::PhysicalDeviceType::eCpu: return 1;
        default: return 0;
    }
}

std::optional<QueueFamilyIndices> find_queue_families(const DeviceCandidate& candidate, bool needs_present) {
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    for (uint32_t i = 0; i < candidate.queue_families.size(); i++) {
        bool has_graphics = static_cast<bool>(candidate.queue_families[i].queueFlags & vk::QueueFlagBits::eGraphics);
        bool can_present = !needs_present ||
            (i < candidate.present_support.size() && candidate.present_support[i]);

        if (has_graphics && can_present) {
            return QueueFamilyIndices{i, i};
        }
        if (has_graphics && !graphics) {
            graphics = i;
        }
        if (can_present && !present) {
            present = i;
        }
    }

    if (!graphics || !present) {
        return std::nullopt;
    }
    return QueueFamilyIndices{*graphics, *present};
}

std::expected<void, Error> validate_device_limits(const DeviceCandidate& candidate, const DeviceRequirements& requirements) {
    if (candidate.max_push_constants_size < requirements.min_push_constants_size) {
        return std::unexpected(Error::make(ErrorCode::DeviceLimitTooLow,
            std::format("'{}' offers {} bytes of push constants, {} required",
                candidate.name, candidate.max_push_constants_size, requirements.min_push_constants_size)));
    }
    if (candidate.max_bound_descriptor_sets < requirements.min_bound_descriptor_sets) {
        return std::unexpected(Error::make(ErrorCode::DeviceLimitTooLow,
            std::format("'{}' binds {} descriptor sets, {} required",
                candidate.name, candidate.max_bound_descriptor_sets, requirements.min_bound_descriptor_sets)));
    }
    return {};
}

std::expected<DeviceSelection, Error> evaluate_candidate(const DeviceCandidate& candidate, const DeviceRequirements& requirements) {
    for (const auto& required : requirements.extensions) {
        if (std::ranges::find(candidate.extensions, required) == candidate.extensions.end()) {
            return std::unexpected(Error::make(ErrorCode::MissingExtension,
                std::format("'{}' lacks extension {}", candidate.name, required)));
        }
    }

    auto queues = find_queue_families(candidate, requirements.needs_present);
    if (!queues) {
        return std::unexpected(Error::make(ErrorCode::NoSuitableGpu,
            std::format("'{}' has no graphics queue that can present", candidate.name)));
    }

    if (auto limits = validate_device_limits(candidate, requirements); !limits) {
        return std::unexpected(limits.error());
    }

    int64_t score = device_type_score(candidate.type) + candidate.max_image_dimension_2d / 1024;
    return DeviceSelection{0, *queues, score};
}

std::expected<DeviceSelection, Error> select_physical_device(
    const std::vector<DeviceCandidate>& candidates,
    const DeviceRequirements& requirements
) {
    if (candidates.empty()) {
        return std::unexpected(Error::make(ErrorCode::NoSuitableGpu, "No Vulkan physical devices found"));
    }

    std::optional<DeviceSelection> best;
    std::optional<Error> limit_failure;
    std::optional<Error> other_failure;

    for (std::size_t i = 0; i < candidates.size(); i++) {
        auto result = evaluate_candidate(candidates[i], requirements);
        if (!result) {
            Logger::instance().warn("Rejected device: {}", result.error().describe());
            if (result.error().code == ErrorCode::DeviceLimitTooLow) {
                limit_failure = result.error();
            } else if (!other_failure) {
                other_failure = result.error();
            }
            continue;
        }

        Logger::instance().debug("Device '{}' scored {}", candidates[i].name, result->score);
        if (!best || result->score > best->score) {
            best = *result;
            best->candidate_index = i;
        }
    }

    if (best) {
        Logger::instance().info("Selected GPU: {}", candidates[best->candidate_index].name);
        return *best;
    }
    if (limit_failure) {
        return std::unexpected(*limit_failure);
    }
    return std::unexpected(*other_failure);
}

} // namespace starfall
