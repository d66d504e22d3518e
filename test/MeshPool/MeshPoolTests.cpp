#include <catch2/catch_test_macros.hpp>
#include <starfall/MeshPool.hpp>

using namespace starfall;

namespace {

InstanceData instance_at(float x)
{
    InstanceData instance;
    instance.model = glm::translate(glm::mat4(1.0f), glm::vec3(x, 0.0f, 0.0f));
    return instance;
}

} // namespace

TEST_CASE("Pools stage instances densely per frame slot", "[pool]")
{
    MeshPool pool(PoolKind::Mesh, std::nullopt, 4, 2);
    pool.begin_frame(0, 0);

    REQUIRE(pool.push_instance(0, instance_at(1.0f)) == 0u);
    REQUIRE(pool.push_instance(0, instance_at(2.0f)) == 1u);
    REQUIRE(pool.instance_count(0) == 2);
    REQUIRE(pool.instance_count(1) == 0);
    REQUIRE(pool.staged(0)[1].model[3].x == 2.0f);

    SECTION("regions are one capacity apart")
    {
        REQUIRE(pool.region_offset(0) == 0);
        REQUIRE(pool.region_offset(1) == 4 * sizeof(InstanceData));
    }

    SECTION("upload without buffers is a no-op")
    {
        REQUIRE(pool.upload(0).has_value());
    }
}

TEST_CASE("Exhausted pools drop the rest of the frame", "[pool]")
{
    MeshPoolManager manager(2);
    auto id = manager.add_pool(MeshPool(PoolKind::Mesh, std::nullopt, 4, 2));
    EventQueue events;

    manager.begin_frame(0, 0);
    uint32_t accepted = 0;
    for (int i = 0; i < 10; ++i) {
        if (manager.submit(id, instance_at(static_cast<float>(i)))) {
            ++accepted;
        }
    }
    manager.end_frame(1, 1, events);

    REQUIRE(accepted == 4);
    REQUIRE(manager.get(id)->instance_count(0) == 4);
    REQUIRE(manager.stats().dropped_this_frame == 6);
    REQUIRE(manager.stats().total_spawned == 4);
    REQUIRE(manager.stats().total_despawned == 4);

    auto drained = events.drain();
    REQUIRE(drained.size() == 1);
    const auto* dropped = std::get_if<InstancesDropped>(&drained[0]);
    REQUIRE(dropped != nullptr);
    REQUIRE(dropped->mesh_type == id);
    REQUIRE(dropped->dropped == 6);
    REQUIRE(dropped->frame == 1);
}

TEST_CASE("Slots come back only after their frame completes", "[pool]")
{
    MeshPoolManager manager(2);
    auto id = manager.add_pool(MeshPool(PoolKind::Mesh, std::nullopt, 2, 2));
    EventQueue events;

    // Frame 1 in slot 0 fills the pool
    manager.begin_frame(0, 0);
    REQUIRE(manager.submit(id, instance_at(0.0f)));
    REQUIRE(manager.submit(id, instance_at(1.0f)));
    manager.end_frame(1, 1, events);

    // Frame 2 in slot 1 has its own slots
    manager.begin_frame(1, 0);
    REQUIRE(manager.submit(id, instance_at(2.0f)));
    manager.end_frame(2, 1, events);

    SECTION("frame 1 still in flight")
    {
        manager.begin_frame(0, 0);
        REQUIRE_FALSE(manager.submit(id, instance_at(3.0f)));
    }

    SECTION("frame 1 completed")
    {
        manager.begin_frame(0, 1);
        REQUIRE(manager.submit(id, instance_at(3.0f)));
        REQUIRE(manager.submit(id, instance_at(4.0f)));
        REQUIRE(manager.get(id)->instance_count(0) == 2);
    }
}

TEST_CASE("Pools are found by content hash", "[pool]")
{
    MeshPoolManager manager(1);
    auto id = manager.add_pool(MeshPool(PoolKind::Mesh, std::nullopt, 8, 1), 42);

    REQUIRE(manager.find_by_hash(42) == id);
    REQUIRE_FALSE(manager.find_by_hash(43).has_value());
    REQUIRE(manager.stats().active_pools == 1);
}

TEST_CASE("Stale pool ids are rejected", "[pool]")
{
    MeshPoolManager manager(1);
    manager.begin_frame(0, 0);
    REQUIRE_FALSE(manager.submit(MeshTypeId{5, 0}, InstanceData{}));
    REQUIRE(manager.stats().dropped_this_frame == 0);
}
