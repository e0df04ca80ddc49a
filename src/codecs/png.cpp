#include <tagden/codecs/png.hpp>
#include <lodepng.h>

#include <fstream>

namespace tagden {

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(surf.width());
    const auto h = static_cast<unsigned>(surf.height());
    const auto pixels = surf.pixels();

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, pixels.data(), w, h, LCT_RGB, 8);
    if (error) {
        return {};
    }

    return png_data;
}

result save_png(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return result::failure(error_code::internal_error,
            "Failed to encode PNG for '" + path.string() + "'");
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return result::failure(error_code::io_error,
            "Failed to open '" + path.string() + "' for writing");
    }

    file.write(reinterpret_cast<const char*>(png_data.data()),
               static_cast<std::streamsize>(png_data.size()));

    if (!file.good()) {
        return result::failure(error_code::io_error,
            "Failed to write '" + path.string() + "'");
    }
    return result::success();
}

// ============================================================================
// PNG Surface
// ============================================================================

std::vector<std::uint8_t> png_surface::encode() const {
    return encode_png(*this);
}

result png_surface::save(const std::filesystem::path& path) const {
    return save_png(*this, path);
}

} // namespace tagden
