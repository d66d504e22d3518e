#include <catch2/catch_test_macros.hpp>
#include <starfall/Descriptors.hpp>

using namespace starfall;

TEST_CASE("Pool sizes follow the configured maxima", "[descriptors]")
{
    DescriptorBudget budget(2, 10, 5);
    auto sizes = budget.pool_sizes();

    REQUIRE(sizes.max_sets == 17);
    REQUIRE(sizes.uniform_buffers == 2 * 2 + 10);
    REQUIRE(sizes.combined_image_samplers == MATERIAL_TEXTURE_SLOTS * 10);
    REQUIRE(sizes.storage_buffers == 5);
}

TEST_CASE("Budget derives from the renderer config", "[descriptors]")
{
    RendererConfig config;
    config.frames_in_flight = 3;
    config.max_materials = 7;
    config.max_mesh_types = 4;

    auto budget = DescriptorBudget::from_config(config);
    REQUIRE(budget.capacity(SetKind::Frame) == 3);
    REQUIRE(budget.capacity(SetKind::Material) == 7);
    REQUIRE(budget.capacity(SetKind::Object) == 4);
}

TEST_CASE("Reservations past the budget fail", "[descriptors]")
{
    DescriptorBudget budget(1, 2, 1);

    REQUIRE(budget.reserve(SetKind::Material).has_value());
    REQUIRE(budget.reserve(SetKind::Material).has_value());
    REQUIRE(budget.remaining(SetKind::Material) == 0);

    auto exhausted = budget.reserve(SetKind::Material);
    REQUIRE_FALSE(exhausted.has_value());
    REQUIRE(exhausted.error().code == ErrorCode::DescriptorPoolExhausted);
    REQUIRE(exhausted.error().kind == ErrorKind::ResourceExhaustion);

    SECTION("other kinds are unaffected")
    {
        REQUIRE(budget.reserve(SetKind::Object).has_value());
    }

    SECTION("releasing frees a slot")
    {
        budget.release(SetKind::Material);
        REQUIRE(budget.in_use(SetKind::Material) == 1);
        REQUIRE(budget.reserve(SetKind::Material).has_value());
    }
}

TEST_CASE("Releasing more than reserved is ignored", "[descriptors]")
{
    DescriptorBudget budget(1, 1, 1);
    budget.release(SetKind::Frame);
    REQUIRE(budget.in_use(SetKind::Frame) == 0);
}

TEST_CASE("Slot table agrees with the pool sizes", "[descriptors]")
{
    std::array<uint32_t, 3> uniforms{};
    std::array<uint32_t, 3> samplers{};
    std::array<uint32_t, 3> storage{};
    for (const auto& slot : DESCRIPTOR_SLOTS) {
        auto set = static_cast<std::size_t>(slot.set);
        if (slot.type == vk::DescriptorType::eUniformBuffer) uniforms[set]++;
        if (slot.type == vk::DescriptorType::eCombinedImageSampler) samplers[set]++;
        if (slot.type == vk::DescriptorType::eStorageBuffer) storage[set]++;
        REQUIRE(find_descriptor_slot(static_cast<uint32_t>(slot.set), slot.binding) == &slot);
    }

    REQUIRE(samplers[static_cast<std::size_t>(SetKind::Material)] == MATERIAL_TEXTURE_SLOTS);

    DescriptorBudget budget(2, 5, 7);
    auto sizes = budget.pool_sizes();
    REQUIRE(sizes.uniform_buffers == 2 * uniforms[0] + 5 * uniforms[1] + 7 * uniforms[2]);
    REQUIRE(sizes.combined_image_samplers == 5 * samplers[1]);
    REQUIRE(sizes.storage_buffers == 7 * storage[2]);

    REQUIRE(find_descriptor_slot(3, 0) == nullptr);
    REQUIRE(find_descriptor_slot(1, MATERIAL_TEXTURE_SLOTS + 1) == nullptr);
}
