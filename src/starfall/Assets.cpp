#include <starfall/Assets.hpp>
#include <starfall/Logger.hpp>

namespace starfall {

namespace {

void report_fallback(const Error& error, std::string_view fallback, EventQueue* events)
{
    Logger::instance().warn("{} - using {}", error.describe(), fallback);
    if (events) {
        events->push(AssetFallbackUsed{error.code, error.message});
    }
}

/// Asset errors keep their code but are always treated as defects
Error as_defect(Error error)
{
    error.kind = ErrorKind::AssetDefect;
    return error;
}

} // anonymous namespace

std::expected<void, Error> validate_image(const ImageData& image)
{
    if (image.width == 0 || image.height == 0) {
        return std::unexpected(Error::make(ErrorCode::InvalidImage,
            std::format("Image has zero extent {}x{}", image.width, image.height)));
    }
    std::size_t expected_size = static_cast<std::size_t>(image.width) * image.height * 4;
    if (image.rgba.size() != expected_size) {
        return std::unexpected(Error::make(ErrorCode::InvalidImage,
            std::format("Image {}x{} needs {} bytes, got {}", image.width, image.height, expected_size, image.rgba.size())));
    }
    return {};
}

ImageData fallback_image()
{
    return ImageData{1, 1, {255, 0, 255, 255}};
}

Mesh resolve_mesh_asset(std::expected<Mesh, Error> asset, EventQueue* events)
{
    if (!asset) {
        report_fallback(as_defect(asset.error()), "cube mesh", events);
        return make_cube();
    }
    if (auto valid = validate_mesh(*asset); !valid) {
        report_fallback(valid.error(), "cube mesh", events);
        return make_cube();
    }
    return std::move(*asset);
}

ImageData resolve_image_asset(std::expected<ImageData, Error> asset, EventQueue* events)
{
    if (!asset) {
        report_fallback(as_defect(asset.error()), "magenta texture", events);
        return fallback_image();
    }
    if (auto valid = validate_image(*asset); !valid) {
        report_fallback(valid.error(), "magenta texture", events);
        return fallback_image();
    }
    return std::move(*asset);
}

Material resolve_material_asset(std::expected<Material, Error> asset, EventQueue* events)
{
    if (!asset) {
        report_fallback(as_defect(asset.error()), "default material", events);
        return default_material();
    }
    if (auto valid = validate_material(*asset); !valid) {
        report_fallback(valid.error(), "default material", events);
        return default_material();
    }
    return std::move(*asset);
}

} // namespace starfall
