#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <starfall/Ui.hpp>
#include <cmath>

using namespace starfall;
using Catch::Matchers::WithinAbs;

namespace {

glm::vec2 to_clip(const glm::mat4& transform, glm::vec2 local)
{
    return glm::vec2(transform * glm::vec4(local, 0.0f, 1.0f));
}

} // namespace

TEST_CASE("Panel corners land on their pixels", "[ui]")
{
    vk::Extent2D extent{800, 600};
    UiPanel panel{.x = 0.0f, .y = 0.0f, .width = 400.0f, .height = 300.0f};
    auto transform = ui_panel_transform(panel, extent);

    auto top_left = to_clip(transform, {-0.5f, 0.5f});
    auto bottom_right = to_clip(transform, {0.5f, -0.5f});

    REQUIRE_THAT(top_left.x, WithinAbs(-1.0, 1e-5));
    REQUIRE_THAT(top_left.y, WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(bottom_right.x, WithinAbs(0.0, 1e-5));
    REQUIRE_THAT(bottom_right.y, WithinAbs(0.0, 1e-5));
}

TEST_CASE("Full-screen panel covers clip space", "[ui]")
{
    vk::Extent2D extent{1280, 720};
    auto transform = ui_panel_transform(UiPanel{.x = 0, .y = 0, .width = 1280, .height = 720}, extent);
    auto corner = to_clip(transform, {0.5f, -0.5f});
    REQUIRE_THAT(corner.x, WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(corner.y, WithinAbs(-1.0, 1e-5));
}

TEST_CASE("Text origin maps to the baseline pixel", "[ui]")
{
    vk::Extent2D extent{1000, 500};
    auto transform = ui_text_transform(250.0f, 125.0f, 2.0f, extent);

    auto origin = to_clip(transform, {0.0f, 0.0f});
    REQUIRE_THAT(origin.x, WithinAbs(-0.5, 1e-5));
    REQUIRE_THAT(origin.y, WithinAbs(0.5, 1e-5));

    SECTION("font pixels scale to screen pixels, +Y up")
    {
        auto glyph_top = to_clip(transform, {0.0f, 10.0f});
        REQUIRE_THAT(glyph_top.y - origin.y, WithinAbs(2.0 * 20.0 / 500.0, 1e-5));
    }
}

TEST_CASE("Zero extent does not divide by zero", "[ui]")
{
    auto transform = ui_panel_transform(UiPanel{.width = 10, .height = 10}, vk::Extent2D{0, 0});
    REQUIRE(std::isfinite(transform[0][0]));
    REQUIRE(std::isfinite(transform[3][1]));
}
