#include <starfall/FontAtlas.hpp>
#include <starfall/Logger.hpp>
#include <array>
#include <format>
#include <string>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace starfall {

namespace {

uint16_t read_u16(std::span<const uint8_t> data, std::size_t at)
{
    return static_cast<uint16_t>(data[at] << 8 | data[at + 1]);
}

uint32_t read_u32(std::span<const uint8_t> data, std::size_t at)
{
    return static_cast<uint32_t>(read_u16(data, at)) << 16 | read_u16(data, at + 2);
}

constexpr uint32_t tag(const char (&name)[5])
{
    return static_cast<uint32_t>(static_cast<uint8_t>(name[0])) << 24 | static_cast<uint32_t>(static_cast<uint8_t>(name[1])) << 16
        | static_cast<uint32_t>(static_cast<uint8_t>(name[2])) << 8 | static_cast<uint32_t>(static_cast<uint8_t>(name[3]));
}

Error font_error(std::string message)
{
    return Error::make(ErrorCode::FontLoadFailed, std::move(message));
}

constexpr std::size_t SFNT_HEADER_SIZE = 12;
constexpr std::size_t TABLE_RECORD_SIZE = 16;

} // anonymous namespace

std::expected<void, Error> check_font_directory(std::span<const uint8_t> ttf)
{
    if (ttf.size() < SFNT_HEADER_SIZE) {
        return std::unexpected(font_error(std::format("Font data is {} bytes, shorter than an sfnt header", ttf.size())));
    }

    uint32_t version = read_u32(ttf, 0);
    if (version != 0x00010000 && version != tag("true") && version != tag("OTTO") && version != tag("typ1")) {
        return std::unexpected(font_error(std::format("Unsupported sfnt version 0x{:08x}", version)));
    }

    std::size_t table_count = read_u16(ttf, 4);
    if (table_count == 0 || SFNT_HEADER_SIZE + table_count * TABLE_RECORD_SIZE > ttf.size()) {
        return std::unexpected(font_error(std::format("Table directory of {} entries does not fit {} bytes", table_count, ttf.size())));
    }

    // Minimum sizes cover the fixed fields stb reads from each table
    struct Required {
        uint32_t tag;
        uint32_t min_size;
        bool found = false;
    };
    std::array required{
        Required{tag("cmap"), 4}, Required{tag("head"), 54}, Required{tag("hhea"), 36},
        Required{tag("hmtx"), 4}, Required{tag("maxp"), 6},
    };
    bool has_glyf = false;
    bool has_loca = false;
    bool has_cff = false;

    for (std::size_t i = 0; i < table_count; ++i) {
        std::size_t record = SFNT_HEADER_SIZE + i * TABLE_RECORD_SIZE;
        uint32_t table_tag = read_u32(ttf, record);
        uint64_t offset = read_u32(ttf, record + 8);
        uint64_t length = read_u32(ttf, record + 12);
        if (offset + length > ttf.size()) {
            return std::unexpected(font_error(std::format("Table {} at {}+{} runs past the {} byte file", i, offset, length, ttf.size())));
        }
        for (auto& table : required) {
            if (table.tag == table_tag) {
                if (length < table.min_size) {
                    return std::unexpected(font_error(std::format("Table {} is {} bytes, needs {}", i, length, table.min_size)));
                }
                table.found = true;
            }
        }
        has_glyf = has_glyf || table_tag == tag("glyf");
        has_loca = has_loca || table_tag == tag("loca");
        has_cff = has_cff || table_tag == tag("CFF ");
    }

    for (const auto& table : required) {
        if (!table.found) {
            return std::unexpected(font_error("Font is missing a required table"));
        }
    }
    if (!(has_glyf && has_loca) && !has_cff) {
        return std::unexpected(font_error("Font has neither glyf/loca nor CFF outlines"));
    }
    return {};
}

FontAtlas::FontAtlas(uint32_t size, float pixel_size, std::vector<uint8_t> rgba, GlyphTable glyphs)
    : m_size(size)
    , m_pixel_size(pixel_size)
    , m_rgba(std::move(rgba))
    , m_glyphs(std::move(glyphs))
{}

std::expected<FontAtlas, Error> FontAtlas::from_ttf(std::span<const uint8_t> ttf, float pixel_size)
{
    if (ttf.empty() || pixel_size <= 0.0f) {
        return std::unexpected(Error::make(ErrorCode::FontLoadFailed, "Empty font data or non-positive pixel size"));
    }

    if (auto checked = check_font_directory(ttf); !checked) {
        Logger::instance().warn("Rejecting font: {}", checked.error().message);
        return std::unexpected(checked.error());
    }

    const unsigned char* data = ttf.data();
    int offset = stbtt_GetFontOffsetForIndex(data, 0);
    stbtt_fontinfo info{};
    if (offset < 0 || !stbtt_InitFont(&info, data, offset)) {
        return std::unexpected(Error::make(ErrorCode::FontLoadFailed, "Data is not a TrueType font"));
    }

    int ascent = 0;
    int descent = 0;
    int line_gap = 0;
    stbtt_GetFontVMetrics(&info, &ascent, &descent, &line_gap);
    float scale = stbtt_ScaleForPixelHeight(&info, pixel_size);

    std::array<stbtt_bakedchar, GLYPH_COUNT> baked{};
    std::vector<uint8_t> coverage;
    uint32_t size = MIN_ATLAS_SIZE;
    for (; size <= MAX_ATLAS_SIZE; size *= 2) {
        coverage.assign(static_cast<std::size_t>(size) * size, 0);
        int result = stbtt_BakeFontBitmap(data, offset, pixel_size, coverage.data(),
            static_cast<int>(size), static_cast<int>(size), FIRST_GLYPH, static_cast<int>(GLYPH_COUNT), baked.data());
        if (result > 0) {
            break;
        }
        Logger::instance().debug("Glyphs do not fit a {0}x{0} atlas, growing", size);
    }
    if (size > MAX_ATLAS_SIZE) {
        return std::unexpected(Error::make(ErrorCode::FontLoadFailed,
            std::format("Glyphs at {} px do not fit a {}x{} atlas", pixel_size, MAX_ATLAS_SIZE, MAX_ATLAS_SIZE)));
    }

    GlyphTable table;
    table.ascent = static_cast<float>(ascent) * scale;
    table.descent = static_cast<float>(descent) * scale;
    table.line_height = static_cast<float>(ascent - descent + line_gap) * scale;

    auto atlas_size = static_cast<float>(size);
    for (std::size_t i = 0; i < GLYPH_COUNT; ++i) {
        const auto& b = baked[i];
        glm::vec2 extent(static_cast<float>(b.x1 - b.x0), static_cast<float>(b.y1 - b.y0));
        table.glyphs[i] = GlyphMetrics{
            .uv_min = glm::vec2(b.x0, b.y0) / atlas_size,
            .uv_max = glm::vec2(b.x1, b.y1) / atlas_size,
            .size = extent,
            // stb offsets point down from the baseline to the top edge
            .bearing = glm::vec2(b.xoff, -(b.yoff + extent.y)),
            .advance = b.xadvance,
        };
    }

    std::vector<uint8_t> rgba(coverage.size() * 4);
    for (std::size_t i = 0; i < coverage.size(); ++i) {
        rgba[i * 4 + 0] = 255;
        rgba[i * 4 + 1] = 255;
        rgba[i * 4 + 2] = 255;
        rgba[i * 4 + 3] = coverage[i];
    }

    Logger::instance().info("Font atlas {0}x{0} at {1} px, line height {2:.1f}", size, pixel_size, table.line_height);
    return FontAtlas(size, pixel_size, std::move(rgba), table);
}

} // namespace starfall
