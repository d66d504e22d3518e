#include <catch2/catch_test_macros.hpp>
#include <starfall/FrameSync.hpp>
#include <optional>
#include <vector>

using namespace starfall;

TEST_CASE("Fence waits retry on timeout", "[sync]")
{
    SECTION("success after two timeouts")
    {
        std::vector<vk::Result> results = {vk::Result::eTimeout, vk::Result::eTimeout, vk::Result::eSuccess};
        std::size_t calls = 0;
        auto waited = wait_with_retries([&](uint64_t) { return results[calls++]; }, 1000, 5);
        REQUIRE(waited.has_value());
        REQUIRE(calls == 3);
    }

    SECTION("gives up after max retries")
    {
        std::size_t calls = 0;
        auto waited = wait_with_retries([&](uint64_t) { ++calls; return vk::Result::eTimeout; }, 1000, 3);
        REQUIRE_FALSE(waited.has_value());
        REQUIRE(waited.error().code == ErrorCode::FenceTimeout);
        REQUIRE(waited.error().kind == ErrorKind::FatalDevice);
        REQUIRE(calls == 3);
    }

    SECTION("device loss is fatal immediately")
    {
        std::size_t calls = 0;
        auto waited = wait_with_retries([&](uint64_t) { ++calls; return vk::Result::eErrorDeviceLost; }, 1000, 3);
        REQUIRE_FALSE(waited.has_value());
        REQUIRE(waited.error().code == ErrorCode::DeviceLost);
        REQUIRE(calls == 1);
    }

    SECTION("the timeout is passed through")
    {
        uint64_t seen = 0;
        auto waited = wait_with_retries([&](uint64_t timeout) { seen = timeout; return vk::Result::eSuccess; }, 12345, 1);
        REQUIRE(waited.has_value());
        REQUIRE(seen == 12345);
    }
}

TEST_CASE("A slot stays usable after its frame is abandoned", "[sync][gpu]")
{
    RendererConfig config;
    config.application_name = "Starfall FrameSync Tests";
    config.enable_validation = false;
    auto context = VulkanContext::create(config, nullptr);
    if (!context) {
        SKIP("No Vulkan device available: " << context.error().describe());
    }
    auto device = (*context)->device();
    auto queue = (*context)->graphics_queue();

    auto sync = FrameSync::create(**context, 2, 3);
    REQUIRE(sync.has_value());

    // Plays the part of vkAcquireNextImageKHR signaling the slot's semaphore
    auto acquire = [&](uint32_t slot) {
        auto info = vk::SubmitInfo().setSignalSemaphores(sync->image_available(slot));
        return queue.submit(info, nullptr);
    };
    constexpr uint64_t one_second = 1'000'000'000;

    SECTION("fence reset without a submission is re-armed by release_image")
    {
        REQUIRE(acquire(0) == vk::Result::eSuccess);
        // What a failed queue submit leaves behind
        REQUIRE(device.resetFences(sync->slot(0).in_flight) == vk::Result::eSuccess);

        REQUIRE(sync->release_image(0, queue, 1, 7).has_value());
        auto waited = sync->wait_for_slot(0, one_second, 1);
        REQUIRE(waited.has_value());
        REQUIRE(*waited == std::optional<uint64_t>(7));

        auto completed = sync->completed_frame();
        REQUIRE(completed.has_value());
        REQUIRE(*completed == 7);
    }

    SECTION("the next real frame on the slot submits and completes")
    {
        REQUIRE(acquire(0) == vk::Result::eSuccess);
        REQUIRE(sync->release_image(0, queue, 1, 7).has_value());
        REQUIRE(sync->wait_for_slot(0, one_second, 1).has_value());

        REQUIRE(acquire(0) == vk::Result::eSuccess);
        auto command_buffer = sync->begin_recording(0);
        REQUIRE(command_buffer.has_value());
        REQUIRE(command_buffer->end() == vk::Result::eSuccess);
        REQUIRE(sync->submit(0, queue, 2, 8).has_value());

        auto waited = sync->wait_for_slot(0, one_second, 1);
        REQUIRE(waited.has_value());
        REQUIRE(*waited == std::optional<uint64_t>(8));

        // Nothing presents in a headless test, so consume render_finished here
        vk::PipelineStageFlags stage = vk::PipelineStageFlagBits::eAllCommands;
        auto consume = vk::SubmitInfo()
            .setWaitSemaphores(sync->render_finished(2))
            .setWaitDstStageMask(stage);
        REQUIRE(queue.submit(consume, nullptr) == vk::Result::eSuccess);
    }

    REQUIRE(device.waitIdle() == vk::Result::eSuccess);
}
