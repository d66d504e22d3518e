#pragma once

#include <starfall/Error.hpp>
#include <starfall/Text.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace starfall {

constexpr uint32_t MIN_ATLAS_SIZE = 256;

/**
 * @brief Bounds-check an sfnt table directory before stb_truetype reads it
 *
 * stb_truetype trusts every offset in the file. This rejects collections,
 * truncated headers, directories or tables that run past the end, and fonts
 * missing a table stb needs (cmap, head, hhea, hmtx, maxp, plus loca/glyf or CFF).
 */
[[nodiscard]] std::expected<void, Error> check_font_directory(std::span<const uint8_t> ttf);
constexpr uint32_t MAX_ATLAS_SIZE = 4096;

/**
 * @brief Printable ASCII rasterized once into a square RGBA8 atlas
 *
 * Pixels are white with alpha holding glyph coverage.
 */
class FontAtlas
{
public:
    /**
     * @brief Rasterize a TrueType font
     *
     * The atlas starts at MIN_ATLAS_SIZE and doubles until every glyph fits.
     *
     * @param ttf Font file contents
     * @param pixel_size Em height in pixels
     * @return Atlas, or FontLoadFailed for unreadable fonts or glyphs that do not fit MAX_ATLAS_SIZE
     */
    static std::expected<FontAtlas, Error> from_ttf(std::span<const uint8_t> ttf, float pixel_size);

    [[nodiscard]] uint32_t width() const { return m_size; }
    [[nodiscard]] uint32_t height() const { return m_size; }
    [[nodiscard]] float pixel_size() const { return m_pixel_size; }
    [[nodiscard]] const std::vector<uint8_t>& rgba() const { return m_rgba; }
    [[nodiscard]] const GlyphTable& glyphs() const { return m_glyphs; }

private:
    FontAtlas(uint32_t size, float pixel_size, std::vector<uint8_t> rgba, GlyphTable glyphs);

    uint32_t m_size;
    float m_pixel_size;
    std::vector<uint8_t> m_rgba;
    GlyphTable m_glyphs;
};

} // namespace starfall
