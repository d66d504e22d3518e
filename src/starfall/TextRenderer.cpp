#include <starfall/TextRenderer.hpp>
#include <starfall/Logger.hpp>

namespace starfall {

TextRenderer::TextRenderer(FontAtlas atlas, TextureId atlas_texture, MaterialId lit, MaterialId unlit, MaterialId ui)
    : m_atlas(std::move(atlas))
    , m_atlas_texture(atlas_texture)
    , m_lit_material(lit)
    , m_unlit_material(unlit)
    , m_ui_material(ui)
{}

std::expected<TextRenderer, Error> TextRenderer::create(
    RendererCore& renderer,
    std::span<const uint8_t> ttf,
    std::optional<float> pixel_size
) {
    auto atlas = FontAtlas::from_ttf(ttf, pixel_size.value_or(renderer.config().font_pixel_size));
    if (!atlas) {
        Logger::instance().error("{}", atlas.error().describe());
        return std::unexpected(atlas.error());
    }

    auto texture = renderer.upload_texture(atlas->width(), atlas->height(), atlas->rgba());
    if (!texture) {
        return std::unexpected(texture.error());
    }

    // Coverage lives in alpha, so all three blend
    StandardPbr lit_params;
    lit_params.base_color = glm::vec4(1.0f);
    lit_params.roughness = 0.8f;
    lit_params.textures.base_color = *texture;
    auto lit = renderer.create_material(Transparent{lit_params, AlphaBlend{}, BlendMode::Alpha});
    if (!lit) {
        return std::unexpected(lit.error());
    }

    auto unlit = renderer.create_material(Transparent{Unlit{glm::vec4(1.0f), *texture}, AlphaBlend{}, BlendMode::Alpha});
    if (!unlit) {
        return std::unexpected(unlit.error());
    }

    auto ui = renderer.create_material(Unlit{glm::vec4(1.0f), *texture});
    if (!ui) {
        return std::unexpected(ui.error());
    }

    return TextRenderer(std::move(*atlas), *texture, *lit, *unlit, *ui);
}

std::expected<TextMesh, Error> TextRenderer::create_text(RendererCore& renderer, std::string_view text, const TextStyle& style) const
{
    Mesh mesh = layout_text(m_atlas.glyphs(), text, style.scale);
    if (mesh.vertices.empty()) {
        return std::unexpected(Error::make(ErrorCode::InvalidMesh,
            std::format("Text \"{}\" has no visible glyphs", text)));
    }

    MaterialId material = m_ui_material;
    PoolKind kind = PoolKind::UiText;
    if (style.space == TextSpace::World) {
        material = style.lit ? m_lit_material : m_unlit_material;
        kind = PoolKind::Mesh;
    }

    auto mesh_type = renderer.load_mesh(mesh, material, kind, renderer.config().text_pool_capacity);
    if (!mesh_type) {
        return std::unexpected(mesh_type.error());
    }
    return TextMesh{*mesh_type, material, measure_text(m_atlas.glyphs(), text, style.scale), style.space};
}

} // namespace starfall
