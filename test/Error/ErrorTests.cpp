#include <catch2/catch_test_macros.hpp>
#include <starfall/Error.hpp>

using namespace starfall;

TEST_CASE("Error codes map to their kinds", "[error]")
{
    REQUIRE(default_kind(ErrorCode::NoSuitableGpu) == ErrorKind::InitializationFailure);
    REQUIRE(default_kind(ErrorCode::DeviceLimitTooLow) == ErrorKind::InitializationFailure);
    REQUIRE(default_kind(ErrorCode::MeshPoolExhausted) == ErrorKind::ResourceExhaustion);
    REQUIRE(default_kind(ErrorCode::DescriptorPoolExhausted) == ErrorKind::ResourceExhaustion);
    REQUIRE(default_kind(ErrorCode::SwapchainOutOfDate) == ErrorKind::TransientPresent);
    REQUIRE(default_kind(ErrorCode::DeviceLost) == ErrorKind::FatalDevice);
    REQUIRE(default_kind(ErrorCode::FenceTimeout) == ErrorKind::FatalDevice);
    REQUIRE(default_kind(ErrorCode::InvalidMesh) == ErrorKind::AssetDefect);
    REQUIRE(default_kind(ErrorCode::FontLoadFailed) == ErrorKind::AssetDefect);
}

TEST_CASE("Error::describe includes kind, code and message", "[error]")
{
    auto error = Error::make(ErrorCode::InvalidImage, "zero width");
    REQUIRE(error.describe() == "[AssetDefect/InvalidImage] zero width");
}

TEST_CASE("Vulkan results override the fallback code", "[error]")
{
    SECTION("device lost")
    {
        auto error = error_from_vk_result(vk::Result::eErrorDeviceLost, ErrorCode::VulkanCallFailed, "submit");
        REQUIRE(error.code == ErrorCode::DeviceLost);
        REQUIRE(error.kind == ErrorKind::FatalDevice);
    }

    SECTION("out of pool memory")
    {
        auto error = error_from_vk_result(vk::Result::eErrorOutOfPoolMemory, ErrorCode::VulkanCallFailed, "allocate");
        REQUIRE(error.code == ErrorCode::DescriptorPoolExhausted);
    }

    SECTION("out of date")
    {
        auto error = error_from_vk_result(vk::Result::eErrorOutOfDateKHR, ErrorCode::VulkanCallFailed, "present");
        REQUIRE(error.kind == ErrorKind::TransientPresent);
    }

    SECTION("anything else keeps the fallback")
    {
        auto error = error_from_vk_result(vk::Result::eErrorInitializationFailed, ErrorCode::DeviceCreationFailed, "device");
        REQUIRE(error.code == ErrorCode::DeviceCreationFailed);
        REQUIRE(error.message == "device");
    }
}

TEST_CASE("Exit codes", "[error]")
{
    REQUIRE(exit_code(ErrorKind::InitializationFailure) == 1);
    REQUIRE(exit_code(ErrorKind::FatalDevice) == 2);
    REQUIRE(exit_code(ErrorKind::ResourceExhaustion) == 3);
    REQUIRE(exit_code(ErrorKind::Unknown) == 3);
}
