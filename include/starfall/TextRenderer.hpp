#pragma once

#include <starfall/FontAtlas.hpp>
#include <starfall/RendererCore.hpp>
#include <expected>
#include <span>
#include <string_view>

namespace starfall {

struct TextStyle {
    TextSpace space = TextSpace::World;
    bool lit = false;   ///< World text only: shade with the PBR variant
    float scale = 1.0f; ///< Multiplier on atlas pixels; world text is further scaled by its transform
};

/**
 * @brief Font atlas on the GPU plus the materials text is drawn with
 *
 * Every string becomes its own small mesh pool, so it is drawn through the
 * same instanced path as any other mesh.
 */
class TextRenderer
{
public:
    /**
     * @brief Rasterize the font and upload the atlas
     *
     * @param renderer Renderer that will own the atlas texture, materials and pools
     * @param ttf TrueType font data
     * @param pixel_size Rasterization size; the configured font_pixel_size when unset
     */
    static std::expected<TextRenderer, Error> create(
        RendererCore& renderer,
        std::span<const uint8_t> ttf,
        std::optional<float> pixel_size = std::nullopt
    );

    /**
     * @brief Lay out text and register it as a pool of kind Mesh (world) or UiText (screen)
     *
     * @return InvalidMesh for text without visible glyphs
     */
    std::expected<TextMesh, Error> create_text(RendererCore& renderer, std::string_view text, const TextStyle& style) const;

    [[nodiscard]] const FontAtlas& atlas() const { return m_atlas; }
    [[nodiscard]] TextureId atlas_texture() const { return m_atlas_texture; }
    [[nodiscard]] MaterialId lit_material() const { return m_lit_material; }
    [[nodiscard]] MaterialId unlit_material() const { return m_unlit_material; }
    [[nodiscard]] MaterialId ui_material() const { return m_ui_material; }

private:
    TextRenderer(FontAtlas atlas, TextureId atlas_texture, MaterialId lit, MaterialId unlit, MaterialId ui);

    FontAtlas m_atlas;
    TextureId m_atlas_texture;
    MaterialId m_lit_material;
    MaterialId m_unlit_material;
    MaterialId m_ui_material;
};

} // namespace starfall
