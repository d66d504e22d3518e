#pragma once

#include <starfall/Handle.hpp>
#include <starfall/Mesh.hpp>
#include <array>
#include <optional>
#include <string_view>

namespace starfall {

constexpr char FIRST_GLYPH = 32;
constexpr char LAST_GLYPH = 126;
constexpr std::size_t GLYPH_COUNT = LAST_GLYPH - FIRST_GLYPH + 1;

/**
 * @brief Placement of one glyph, in atlas pixels at the rasterized size
 *
 * bearing is the offset of the bottom-left corner from the pen position on
 * the baseline (+Y up).
 */
struct GlyphMetrics {
    glm::vec2 uv_min{0.0f}; ///< Top-left in the atlas
    glm::vec2 uv_max{0.0f}; ///< Bottom-right in the atlas
    glm::vec2 size{0.0f};
    glm::vec2 bearing{0.0f};
    float advance = 0.0f;
};

struct GlyphTable {
    std::array<std::optional<GlyphMetrics>, GLYPH_COUNT> glyphs{};
    float line_height = 0.0f;
    float ascent = 0.0f;
    float descent = 0.0f;

    [[nodiscard]] const GlyphMetrics* find(char c) const;
    [[nodiscard]] float space_advance() const;
};

struct TextBounds {
    glm::vec2 min{0.0f};
    glm::vec2 max{0.0f};

    [[nodiscard]] float width() const { return max.x - min.x; }
    [[nodiscard]] float height() const { return max.y - min.y; }
};

enum class TextSpace : uint8_t {
    World,  ///< Drawn as a transparent mesh in the 3D scene
    Screen  ///< Drawn in the UI pass, positioned in pixels
};

/**
 * @brief A laid-out string registered as its own mesh pool
 */
struct TextMesh {
    MeshTypeId mesh_type;
    MaterialId material;
    TextBounds bounds;
    TextSpace space = TextSpace::World;
};

/**
 * @brief Quads for a string: 4 vertices and 6 indices per visible glyph
 *
 * Origin at the first baseline, +X right, +Y up. '\n' starts a new line one
 * line height lower. Characters outside the table advance by a space.
 */
[[nodiscard]] Mesh layout_text(const GlyphTable& glyphs, std::string_view text, float scale = 1.0f);

/**
 * @brief Bounds of the quads layout_text would produce; zero-sized for blank text
 */
[[nodiscard]] TextBounds measure_text(const GlyphTable& glyphs, std::string_view text, float scale = 1.0f);

} // namespace starfall
