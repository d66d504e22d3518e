#include <catch2/catch_test_macros.hpp>
#include <starfall/GpuTypes.hpp>
#include <starfall/Logger.hpp>
#include <starfall/Pipeline.hpp>
#include <starfall/Shader.hpp>
#include <starfall/VulkanContext.hpp>

using namespace starfall;

namespace {

std::unique_ptr<VulkanContext> shader_test_context()
{
    RendererConfig config;
    config.application_name = "Shader Loading Test";
    config.enable_validation = false;
    auto ctx = VulkanContext::create(config, nullptr);
    if (!ctx) {
        return nullptr;
    }
    return std::move(*ctx);
}

} // anonymous namespace

TEST_CASE("Load mesh vertex shader", "[shader][loading]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto ctx = shader_test_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    auto shader_result = Shader::compile(ctx->device(), "starfall/mesh.vert.slang");
    REQUIRE(shader_result.has_value());
    auto& shader = shader_result.value();

    SECTION("shader module is valid")
    {
        REQUIRE(shader.module());
        REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eVertex);
        REQUIRE(shader.details().stage() == vk::ShaderStageFlagBits::eVertex);
    }

    SECTION("two vertex bindings")
    {
        const auto* details = std::get_if<VertexDetails>(&shader.details());
        REQUIRE(details != nullptr);
        REQUIRE(details->bindings.size() == 2);
        REQUIRE(details->bindings[0].binding == 0);
        REQUIRE(details->bindings[0].stride == sizeof(Vertex));
        REQUIRE(details->bindings[1].binding == 1);
        // Reflected strides are tightly packed; InstanceData pads its tail to 192
        REQUIRE(details->bindings[1].stride == 180);
        REQUIRE(details->bindings[1].stride <= sizeof(InstanceData));
    }

    SECTION("sixteen attributes matching the fixed layout")
    {
        const auto* details = std::get_if<VertexDetails>(&shader.details());
        REQUIRE(details != nullptr);
        REQUIRE(details->inputs.size() == 16);
        REQUIRE(check_vertex_interface(details->inputs, "starfall/mesh.vert.slang").has_value());

        auto expected = vertex_input_attributes();
        for (const auto& input : details->inputs) {
            REQUIRE(input.location < expected.size());
            REQUIRE(expected[input.location].format == input.format);
            REQUIRE(expected[input.location].binding == input.binding);
        }
    }

    SECTION("push constant block fits in 128 bytes")
    {
        const auto& push = shader.push_block();
        REQUIRE(push.has_value());
        REQUIRE(push->end() <= PUSH_CONSTANT_SIZE);
    }

    SECTION("frame uniforms live in set 0")
    {
        const auto& descriptors = shader.descriptors();
        bool camera_found = false;
        for (const auto& descriptor : descriptors) {
            if (descriptor.set == 0 && descriptor.binding == 0) {
                camera_found = true;
                REQUIRE(descriptor.type == vk::DescriptorType::eUniformBuffer);
            }
        }
        REQUIRE(camera_found);
    }
}

TEST_CASE("Load PBR fragment shader", "[shader][loading]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto ctx = shader_test_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    auto shader_result = Shader::compile(ctx->device(), "starfall/pbr.frag.slang");
    REQUIRE(shader_result.has_value());
    auto& shader = shader_result.value();

    REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eFragment);

    const auto* details = std::get_if<FragmentDetails>(&shader.details());
    REQUIRE(details != nullptr);
    REQUIRE(details->inputs.size() == 8);

    SECTION("material textures are combined image samplers in set 1")
    {
        uint32_t samplers = 0;
        for (const auto& descriptor : shader.descriptors()) {
            if (descriptor.set == 1 && descriptor.type == vk::DescriptorType::eCombinedImageSampler) {
                ++samplers;
            }
        }
        REQUIRE(samplers == MATERIAL_TEXTURE_SLOTS);
    }
}

TEST_CASE("Every built-in shader compiles", "[shader][loading]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto ctx = shader_test_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    for (auto variant : ALL_PIPELINE_VARIANTS) {
        auto description = describe_variant(variant);
        INFO(to_string(variant));

        auto vert = Shader::compile(ctx->device(), description.vertex_shader);
        REQUIRE(vert.has_value());
        REQUIRE(vert->stage() == vk::ShaderStageFlagBits::eVertex);

        auto frag = Shader::compile(ctx->device(), description.fragment_shader);
        REQUIRE(frag.has_value());
        REQUIRE(frag->stage() == vk::ShaderStageFlagBits::eFragment);
    }
}

TEST_CASE("Shader loading errors", "[shader][loading]")
{
    Logger::instance().set_level(spdlog::level::off);
    auto ctx = shader_test_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    SECTION("missing module")
    {
        auto result = Shader::compile(ctx->device(), "tests/does_not_exist.vert.slang");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ShaderCompilationFailed);
        REQUIRE(result.error().kind == ErrorKind::InitializationFailure);
    }

    SECTION("syntax error")
    {
        auto result = Shader::compile(ctx->device(), "tests/syntax_error.vert.slang");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ShaderCompilationFailed);
        REQUIRE_FALSE(result.error().message.empty());
    }

    SECTION("missing entry point")
    {
        auto result = Shader::compile(ctx->device(), "starfall/mesh.vert.slang", "vertex_main");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::ShaderCompilationFailed);
    }
    Logger::instance().set_level(spdlog::level::warn);
}
