#ifndef TAGDEN_CODECS_PNG_HPP_
#define TAGDEN_CODECS_PNG_HPP_

#include <tagden/tagden_export.h>
#include <tagden/types.hpp>
#include <tagden/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace tagden {

// ============================================================================
// PNG Encoder Functions
// ============================================================================

inline constexpr std::string_view PNG_EXTENSION = ".png";

/**
 * Encode a memory surface to PNG format (8-bit RGB).
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] TAGDEN_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return Result with internal_error if encoding failed, io_error if the
 *         file could not be written
 */
[[nodiscard]] TAGDEN_EXPORT result save_png(const memory_surface& surf,
                                            const std::filesystem::path& path);

// ============================================================================
// PNG Surface
// ============================================================================

/**
 * Surface that can save its contents as PNG.
 * Inherits from memory_surface and adds save functionality.
 */
class TAGDEN_EXPORT png_surface : public memory_surface {
public:
    png_surface() = default;
    ~png_surface() override = default;

    png_surface(const png_surface&) = delete;
    png_surface& operator=(const png_surface&) = delete;
    png_surface(png_surface&&) noexcept = default;
    png_surface& operator=(png_surface&&) noexcept = default;

    /**
     * Encode surface contents to PNG format.
     * @return PNG-encoded data, or empty vector on failure
     */
    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    /**
     * Save surface contents to a PNG file.
     * @param path Output file path
     */
    [[nodiscard]] result save(const std::filesystem::path& path) const;
};

} // namespace tagden

#endif // TAGDEN_CODECS_PNG_HPP_
