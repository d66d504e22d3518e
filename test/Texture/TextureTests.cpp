#include <catch2/catch_test_macros.hpp>
#include <starfall/Commands.hpp>
#include <starfall/Logger.hpp>
#include <starfall/Texture.hpp>
#include <starfall/VulkanContext.hpp>

using namespace starfall;

namespace {

struct TextureFixture {
    std::unique_ptr<VulkanContext> context;
    std::optional<OneTimeCommands> commands;
};

std::optional<TextureFixture> texture_fixture()
{
    RendererConfig config;
    config.application_name = "Texture Test";
    config.enable_validation = false;
    auto ctx = VulkanContext::create(config, nullptr);
    if (!ctx) {
        return std::nullopt;
    }
    auto commands = OneTimeCommands::create(**ctx);
    if (!commands) {
        return std::nullopt;
    }
    TextureFixture fixture;
    fixture.context = std::move(*ctx);
    fixture.commands.emplace(std::move(*commands));
    return fixture;
}

std::vector<uint8_t> checkerboard(uint32_t width, uint32_t height)
{
    std::vector<uint8_t> pixels;
    pixels.reserve(width * height * 4);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            bool dark = (x + y) % 2 == 0;
            pixels.push_back(dark ? 10 : 240);
            pixels.push_back(static_cast<uint8_t>(x * 16));
            pixels.push_back(static_cast<uint8_t>(y * 16));
            pixels.push_back(255);
        }
    }
    return pixels;
}

} // anonymous namespace

TEST_CASE("Texture upload and read back", "[vulkan][texture]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto fixture = texture_fixture();
    if (!fixture) {
        SKIP("No Vulkan device available");
    }

    // Odd width keeps rows from lining up with any copy alignment
    auto pixels = checkerboard(5, 3);
    auto texture = Texture::from_rgba(*fixture->context, *fixture->commands, 5, 3, pixels);
    REQUIRE(texture.has_value());

    SECTION("metadata")
    {
        REQUIRE(texture->width() == 5);
        REQUIRE(texture->height() == 3);
        REQUIRE(texture->format() == vk::Format::eR8G8B8A8Unorm);
        REQUIRE(texture->channels() == 4);
        REQUIRE(texture->image());
        REQUIRE(texture->view());
        REQUIRE(texture->sampler());
    }

    SECTION("descriptor info is ready for sampling")
    {
        auto info = texture->descriptor_info();
        REQUIRE(info.imageLayout == vk::ImageLayout::eShaderReadOnlyOptimal);
        REQUIRE(info.imageView == texture->view());
        REQUIRE(info.sampler == texture->sampler());
    }

    SECTION("pixels survive the round trip")
    {
        auto read = texture->read_back(*fixture->context, *fixture->commands);
        REQUIRE(read.has_value());
        REQUIRE(*read == pixels);
    }
}

TEST_CASE("Solid colour textures", "[vulkan][texture]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto fixture = texture_fixture();
    if (!fixture) {
        SKIP("No Vulkan device available");
    }

    auto magenta = Texture::solid_color(*fixture->context, *fixture->commands, {255, 0, 255, 255});
    REQUIRE(magenta.has_value());
    REQUIRE(magenta->width() == 1);
    REQUIRE(magenta->height() == 1);

    auto read = magenta->read_back(*fixture->context, *fixture->commands);
    REQUIRE(read.has_value());
    REQUIRE(*read == std::vector<uint8_t>{255, 0, 255, 255});
}

TEST_CASE("Texture rejects malformed pixel data", "[vulkan][texture]")
{
    Logger::instance().set_level(spdlog::level::off);
    auto fixture = texture_fixture();
    if (!fixture) {
        SKIP("No Vulkan device available");
    }

    SECTION("byte count does not match the size")
    {
        std::vector<uint8_t> short_data(4 * 4 * 4 - 1, 0);
        auto texture = Texture::from_rgba(*fixture->context, *fixture->commands, 4, 4, short_data);
        REQUIRE_FALSE(texture.has_value());
        REQUIRE(texture.error().code == ErrorCode::InvalidImage);
    }

    SECTION("zero size")
    {
        auto texture = Texture::from_rgba(*fixture->context, *fixture->commands, 0, 0, {});
        REQUIRE_FALSE(texture.has_value());
        REQUIRE(texture.error().code == ErrorCode::InvalidImage);
    }
    Logger::instance().set_level(spdlog::level::warn);
}

TEST_CASE("Texture move leaves the source empty", "[vulkan][texture]")
{
    auto fixture = texture_fixture();
    if (!fixture) {
        SKIP("No Vulkan device available");
    }

    auto texture = Texture::solid_color(*fixture->context, *fixture->commands, {1, 2, 3, 4});
    REQUIRE(texture.has_value());

    Texture moved = std::move(*texture);
    REQUIRE(moved.image());
    REQUIRE_FALSE(texture->image());
}
