#include <catch2/catch_test_macros.hpp>
#include <starfall/Handle.hpp>
#include <string>
#include <unordered_set>

using namespace starfall;

TEST_CASE("Default handles are invalid", "[handle]")
{
    MeshTypeId id;
    REQUIRE_FALSE(id.valid());
}

TEST_CASE("SlotMap insert and lookup", "[handle]")
{
    SlotMap<std::string, MaterialTag> map;
    auto a = map.insert("a");
    auto b = map.insert("b");

    REQUIRE(a.valid());
    REQUIRE(a != b);
    REQUIRE(map.size() == 2);
    REQUIRE(*map.get(a) == "a");
    REQUIRE(*map.get(b) == "b");
}

TEST_CASE("Erased handles go stale even when the slot is reused", "[handle]")
{
    SlotMap<int, TextureTag> map;
    auto first = map.insert(1);

    auto removed = map.erase(first);
    REQUIRE(removed == 1);
    REQUIRE_FALSE(map.contains(first));
    REQUIRE(map.get(first) == nullptr);

    auto second = map.insert(2);
    REQUIRE(second.index == first.index);
    REQUIRE(second.generation != first.generation);
    REQUIRE(map.get(first) == nullptr);
    REQUIRE(*map.get(second) == 2);

    SECTION("erasing twice is a no-op")
    {
        REQUIRE_FALSE(map.erase(first).has_value());
        REQUIRE(map.size() == 1);
    }
}

TEST_CASE("SlotMap for_each and clear", "[handle]")
{
    SlotMap<int, MeshTypeTag> map;
    auto a = map.insert(1);
    map.insert(2);
    map.insert(3);
    map.erase(a);

    int sum = 0;
    map.for_each([&](MeshTypeId, int& value) { sum += value; });
    REQUIRE(sum == 5);

    map.clear();
    REQUIRE(map.empty());
}

TEST_CASE("Handles hash by index and generation", "[handle]")
{
    std::unordered_set<MaterialId> set;
    set.insert(MaterialId{1, 0});
    set.insert(MaterialId{1, 1});
    set.insert(MaterialId{1, 0});
    REQUIRE(set.size() == 2);
}
