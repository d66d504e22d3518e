#include <starfall/Text.hpp>
#include <algorithm>
#include <functional>

namespace starfall {

const GlyphMetrics* GlyphTable::find(char c) const
{
    if (c < FIRST_GLYPH || c > LAST_GLYPH) {
        return nullptr;
    }
    const auto& glyph = glyphs[static_cast<std::size_t>(c - FIRST_GLYPH)];
    return glyph ? &*glyph : nullptr;
}

float GlyphTable::space_advance() const
{
    const auto* space = find(' ');
    return space ? space->advance : 0.0f;
}

namespace {

struct PlacedGlyph {
    const GlyphMetrics* glyph;
    glm::vec2 bottom_left;
    glm::vec2 top_right;
};

/// Walk the string, calling emit for every glyph with a non-empty quad
void for_each_glyph(const GlyphTable& glyphs, std::string_view text, float scale, const std::function<void(const PlacedGlyph&)>& emit)
{
    glm::vec2 pen(0.0f);
    for (char c : text) {
        if (c == '\n') {
            pen.x = 0.0f;
            pen.y -= glyphs.line_height * scale;
            continue;
        }

        const auto* glyph = glyphs.find(c);
        if (!glyph) {
            pen.x += glyphs.space_advance() * scale;
            continue;
        }

        if (glyph->size.x > 0.0f && glyph->size.y > 0.0f) {
            glm::vec2 bottom_left = pen + glyph->bearing * scale;
            emit(PlacedGlyph{glyph, bottom_left, bottom_left + glyph->size * scale});
        }
        pen.x += glyph->advance * scale;
    }
}

} // anonymous namespace

Mesh layout_text(const GlyphTable& glyphs, std::string_view text, float scale)
{
    Mesh mesh;
    for_each_glyph(glyphs, text, scale, [&](const PlacedGlyph& placed) {
        auto base = static_cast<uint32_t>(mesh.vertices.size());
        const auto& g = *placed.glyph;
        const glm::vec3 normal(0.0f, 0.0f, 1.0f);
        const glm::vec3 tangent(1.0f, 0.0f, 0.0f);

        // Counter-clockwise seen from +Z
        mesh.vertices.push_back(Vertex{{placed.bottom_left.x, placed.bottom_left.y, 0.0f}, normal, {g.uv_min.x, g.uv_max.y}, tangent});
        mesh.vertices.push_back(Vertex{{placed.top_right.x, placed.bottom_left.y, 0.0f}, normal, {g.uv_max.x, g.uv_max.y}, tangent});
        mesh.vertices.push_back(Vertex{{placed.top_right.x, placed.top_right.y, 0.0f}, normal, {g.uv_max.x, g.uv_min.y}, tangent});
        mesh.vertices.push_back(Vertex{{placed.bottom_left.x, placed.top_right.y, 0.0f}, normal, {g.uv_min.x, g.uv_min.y}, tangent});
        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    });
    return mesh;
}

TextBounds measure_text(const GlyphTable& glyphs, std::string_view text, float scale)
{
    std::optional<TextBounds> bounds;
    for_each_glyph(glyphs, text, scale, [&](const PlacedGlyph& placed) {
        if (!bounds) {
            bounds = TextBounds{placed.bottom_left, placed.top_right};
            return;
        }
        bounds->min = glm::min(bounds->min, placed.bottom_left);
        bounds->max = glm::max(bounds->max, placed.top_right);
    });
    return bounds.value_or(TextBounds{});
}

} // namespace starfall
