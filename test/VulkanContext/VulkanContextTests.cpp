#include <catch2/catch_test_macros.hpp>
#include <starfall/Logger.hpp>
#include <starfall/VulkanContext.hpp>

using namespace starfall;

namespace {

RendererConfig headless_config()
{
    RendererConfig config;
    config.application_name = "Starfall Tests";
    config.enable_validation = false;
    return config;
}

} // anonymous namespace

TEST_CASE("VulkanContext headless creation", "[vulkan]")
{
    Logger::instance().set_level(spdlog::level::trace);
    auto ctx = VulkanContext::create(headless_config(), nullptr);
    if (!ctx) {
        SKIP("No Vulkan device available: " << ctx.error().describe());
    }

    SECTION("context is headless")
    {
        REQUIRE((*ctx)->headless());
        REQUIRE_FALSE((*ctx)->surface());
    }

    SECTION("handles are valid")
    {
        REQUIRE((*ctx)->instance());
        REQUIRE((*ctx)->physical_device());
        REQUIRE((*ctx)->device());
        REQUIRE((*ctx)->graphics_queue());
        REQUIRE((*ctx)->present_queue());
    }

    SECTION("wait_idle succeeds")
    {
        REQUIRE((*ctx)->wait_idle().has_value());
    }
}

TEST_CASE("VulkanContext queue indices are reasonable", "[vulkan]")
{
    auto ctx = VulkanContext::create(headless_config(), nullptr);
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    auto indices = (*ctx)->queue_indices();
    auto queue_families = (*ctx)->physical_device().getQueueFamilyProperties();

    SECTION("graphics index is within bounds")
    {
        REQUIRE(indices.graphics < queue_families.size());
    }

    SECTION("graphics queue supports graphics")
    {
        auto flags = queue_families[indices.graphics].queueFlags;
        REQUIRE((flags & vk::QueueFlagBits::eGraphics));
    }

    SECTION("headless contexts present on the graphics family")
    {
        REQUIRE(indices.shared());
    }
}

TEST_CASE("VulkanContext caches device limits", "[vulkan]")
{
    auto ctx = VulkanContext::create(headless_config(), nullptr);
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    const auto& limits = (*ctx)->limits();
    auto properties = (*ctx)->physical_device().getProperties();

    REQUIRE(limits.max_push_constants_size == properties.limits.maxPushConstantsSize);
    REQUIRE(limits.max_push_constants_size >= 128);
    REQUIRE(limits.max_bound_descriptor_sets >= 4);
    REQUIRE(limits.min_uniform_buffer_offset_alignment > 0);
    REQUIRE(limits.memory_properties.memoryTypeCount > 0);
    REQUIRE_FALSE(limits.device_name.empty());
}

TEST_CASE("VulkanContext rejects devices with a small push constant block", "[vulkan]")
{
    // Probe first so a machine without Vulkan skips instead of failing
    if (!VulkanContext::create(headless_config(), nullptr)) {
        SKIP("No Vulkan device available");
    }

    auto config = headless_config();
    config.simulated_push_constant_limit = 96;
    auto ctx = VulkanContext::create(config, nullptr);

    REQUIRE_FALSE(ctx.has_value());
    REQUIRE(ctx.error().code == ErrorCode::DeviceLimitTooLow);
    REQUIRE(ctx.error().kind == ErrorKind::InitializationFailure);
    REQUIRE(exit_code(ctx.error().kind) == 1);
}
