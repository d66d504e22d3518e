#include <catch2/catch_test_macros.hpp>
#include <starfall/DeviceSelection.hpp>

using namespace starfall;

namespace {

DeviceCandidate make_candidate(std::string name, vk::PhysicalDeviceType type)
{
    DeviceCandidate candidate;
    candidate.name = std::move(name);
    candidate.type = type;
    candidate.max_push_constants_size = 128;
    candidate.max_bound_descriptor_sets = 8;
    candidate.max_image_dimension_2d = 16384;
    candidate.queue_families = {vk::QueueFamilyProperties().setQueueFlags(vk::QueueFlagBits::eGraphics).setQueueCount(1)};
    candidate.present_support = {true};
    candidate.extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};
    return candidate;
}

} // namespace

TEST_CASE("Discrete GPUs win over integrated ones", "[device]")
{
    std::vector candidates = {
        make_candidate("integrated", vk::PhysicalDeviceType::eIntegratedGpu),
        make_candidate("discrete", vk::PhysicalDeviceType::eDiscreteGpu),
    };
    auto selection = select_physical_device(candidates, DeviceRequirements{});
    REQUIRE(selection.has_value());
    REQUIRE(selection->candidate_index == 1);
    REQUIRE(selection->queues.shared());
}

TEST_CASE("Devices below the push constant limit are rejected", "[device]")
{
    auto small = make_candidate("small", vk::PhysicalDeviceType::eDiscreteGpu);
    small.max_push_constants_size = 96;

    SECTION("alone it fails with DeviceLimitTooLow")
    {
        auto selection = select_physical_device({small}, DeviceRequirements{});
        REQUIRE_FALSE(selection.has_value());
        REQUIRE(selection.error().code == ErrorCode::DeviceLimitTooLow);
        REQUIRE(selection.error().kind == ErrorKind::InitializationFailure);
    }

    SECTION("a compliant device is chosen instead")
    {
        auto ok = make_candidate("ok", vk::PhysicalDeviceType::eIntegratedGpu);
        auto selection = select_physical_device({small, ok}, DeviceRequirements{});
        REQUIRE(selection.has_value());
        REQUIRE(selection->candidate_index == 1);
    }
}

TEST_CASE("Missing swapchain extension rejects a device", "[device]")
{
    auto candidate = make_candidate("headless", vk::PhysicalDeviceType::eDiscreteGpu);
    candidate.extensions.clear();
    auto selection = select_physical_device({candidate}, DeviceRequirements{});
    REQUIRE_FALSE(selection.has_value());
    REQUIRE(selection.error().code == ErrorCode::MissingExtension);
}

TEST_CASE("Limit failures take precedence when every device is rejected", "[device]")
{
    auto small = make_candidate("small", vk::PhysicalDeviceType::eDiscreteGpu);
    small.max_bound_descriptor_sets = 2;
    auto no_ext = make_candidate("no_ext", vk::PhysicalDeviceType::eDiscreteGpu);
    no_ext.extensions.clear();

    auto selection = select_physical_device({no_ext, small}, DeviceRequirements{});
    REQUIRE_FALSE(selection.has_value());
    REQUIRE(selection.error().code == ErrorCode::DeviceLimitTooLow);
}

TEST_CASE("Queue family search", "[device]")
{
    DeviceCandidate candidate;
    candidate.queue_families = {
        vk::QueueFamilyProperties().setQueueFlags(vk::QueueFlagBits::eGraphics),
        vk::QueueFamilyProperties().setQueueFlags(vk::QueueFlagBits::eTransfer),
    };

    SECTION("separate present family")
    {
        candidate.present_support = {false, true};
        auto queues = find_queue_families(candidate, true);
        REQUIRE(queues.has_value());
        REQUIRE(queues->graphics == 0);
        REQUIRE(queues->present == 1);
        REQUIRE_FALSE(queues->shared());
    }

    SECTION("no present support at all")
    {
        candidate.present_support = {false, false};
        REQUIRE_FALSE(find_queue_families(candidate, true).has_value());
    }

    SECTION("headless ignores present support")
    {
        auto queues = find_queue_families(candidate, false);
        REQUIRE(queues.has_value());
        REQUIRE(queues->shared());
    }
}

TEST_CASE("No devices at all", "[device]")
{
    auto selection = select_physical_device({}, DeviceRequirements{});
    REQUIRE_FALSE(selection.has_value());
    REQUIRE(selection.error().code == ErrorCode::NoSuitableGpu);
}
