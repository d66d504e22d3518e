#include <catch2/catch_test_macros.hpp>

#include <starfall/Logger.hpp>
#include <starfall/Pipeline.hpp>
#include <starfall/Shader.hpp>
#include <starfall/VulkanContext.hpp>
#include <string>
#include <vector>

using namespace starfall;

namespace {

std::unique_ptr<VulkanContext> validation_context()
{
    RendererConfig config;
    config.application_name = "Shader Validation Test";
    config.enable_validation = false;
    auto ctx = VulkanContext::create(config, nullptr);
    if (!ctx) {
        return nullptr;
    }
    return std::move(*ctx);
}

// Helper function to load a shader and require it succeeds
Shader load_shader(vk::Device device, std::string_view name)
{
    auto result = Shader::compile(device, name);
    REQUIRE(result.has_value());
    return std::move(result.value());
}

} // anonymous namespace

TEST_CASE("Built-in variants have matching stage interfaces", "[shader][validation][matching]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto ctx = validation_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    for (auto variant : ALL_PIPELINE_VARIANTS) {
        auto description = describe_variant(variant);
        INFO(to_string(variant));

        auto vert = load_shader(ctx->device(), description.vertex_shader);
        auto frag = load_shader(ctx->device(), description.fragment_shader);

        REQUIRE(vert.details().matches(frag.details()));

        const auto* vert_details = std::get_if<VertexDetails>(&vert.details());
        REQUIRE(vert_details != nullptr);
        REQUIRE(check_vertex_interface(vert_details->inputs, description.vertex_shader).has_value());
        REQUIRE(check_descriptor_interface(vert.descriptors(), description.vertex_shader).has_value());
        REQUIRE(check_descriptor_interface(frag.descriptors(), description.fragment_shader).has_value());
    }
}

TEST_CASE("Interface mismatches name each broken location", "[shader][validation][matching]")
{
    std::vector<StageVariable> outputs{
        {"world_position", 0, vk::Format::eR32G32B32Sfloat},
        {"normal", 1, vk::Format::eR32G32B32Sfloat},
        {"uv", 2, vk::Format::eR32G32Sfloat},
    };

    SECTION("consumer reads a subset")
    {
        std::vector<StageVariable> inputs{outputs[0], outputs[2]};
        REQUIRE(interface_mismatches(outputs, inputs).empty());
    }

    SECTION("unwritten location and format change are both reported")
    {
        std::vector<StageVariable> inputs{
            {"uv", 2, vk::Format::eR32G32B32A32Sfloat},
            {"wind", 9, vk::Format::eR32G32B32A32Sfloat},
        };
        auto problems = interface_mismatches(outputs, inputs);
        REQUIRE(problems.size() == 2);
        REQUIRE(problems[0].find("location 2") != std::string::npos);
        REQUIRE(problems[1].find("wind") != std::string::npos);
    }

    SECTION("only vertex feeds fragment")
    {
        ShaderDetails fragment = FragmentDetails{outputs, {}};
        ShaderDetails vertex = VertexDetails{{}, {}, outputs};
        REQUIRE(vertex.matches(fragment));
        REQUIRE_FALSE(fragment.matches(vertex));
        REQUIRE_FALSE(vertex.matches(vertex));
        REQUIRE(vertex.stage() == vk::ShaderStageFlagBits::eVertex);
        REQUIRE(fragment.stage() == vk::ShaderStageFlagBits::eFragment);
    }
}

TEST_CASE("Mesh vertex to PBR fragment", "[shader][validation][matching]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto ctx = validation_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    auto vert = load_shader(ctx->device(), "starfall/mesh.vert.slang");
    auto frag = load_shader(ctx->device(), "starfall/pbr.frag.slang");

    SECTION("vertex details are correct")
    {
        const auto* vert_details = std::get_if<VertexDetails>(&vert.details());
        REQUIRE(vert_details != nullptr);
        REQUIRE(vert_details->outputs.size() == 8); // SV_Position is a builtin
    }

    SECTION("fragment does not feed another stage")
    {
        REQUIRE_FALSE(frag.details().matches(vert.details()));
    }

    SECTION("fragment cannot be first in the chain")
    {
        REQUIRE_FALSE(frag.details().matches(frag.details()));
    }
}

TEST_CASE("Interface mismatches are detected", "[shader][validation][matching]")
{
    Logger::instance().set_level(spdlog::level::off);
    auto ctx = validation_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    auto vert = load_shader(ctx->device(), "starfall/mesh.vert.slang");

    SECTION("fragment reads a location the vertex shader never writes")
    {
        auto frag = load_shader(ctx->device(), "tests/extra_input.frag.slang");
        REQUIRE_FALSE(vert.details().matches(frag.details()));
    }

    SECTION("fragment reads a location with a different format")
    {
        auto frag = load_shader(ctx->device(), "tests/wrong_format.frag.slang");
        REQUIRE_FALSE(vert.details().matches(frag.details()));
    }

    SECTION("vertex cannot feed a vertex shader")
    {
        REQUIRE_FALSE(vert.details().matches(vert.details()));
    }
    Logger::instance().set_level(spdlog::level::warn);
}

TEST_CASE("Vertex layout mismatches are detected", "[shader][validation][layout]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto ctx = validation_context();
    if (!ctx) {
        SKIP("No Vulkan device available");
    }

    auto vert = load_shader(ctx->device(), "tests/flat_position.vert.slang");
    const auto* details = std::get_if<VertexDetails>(&vert.details());
    REQUIRE(details != nullptr);
    REQUIRE(details->bindings.size() == 1);
    REQUIRE(details->inputs.size() == 2);

    auto checked = check_vertex_interface(details->inputs, "tests/flat_position.vert.slang");
    REQUIRE_FALSE(checked.has_value());
    REQUIRE(checked.error().code == ErrorCode::PipelineCreationFailed);
    REQUIRE(checked.error().kind == ErrorKind::InitializationFailure);
}
