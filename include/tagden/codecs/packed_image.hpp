#ifndef TAGDEN_CODECS_PACKED_IMAGE_HPP_
#define TAGDEN_CODECS_PACKED_IMAGE_HPP_

#include <tagden/tagden_export.h>
#include <tagden/types.hpp>
#include <tagden/surface.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace tagden {

// ============================================================================
// Packed Image (sparse RLE, 15-bit RGB) Decoder
// ============================================================================

struct packed_image_header {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    // One entry per row, in 16-bit units from the payload start.
    // std::nullopt marks a blank row.
    std::vector<std::optional<std::uint32_t>> row_offsets;
    // Byte offset of the payload within the file.
    std::size_t payload_start = 0;
};

class TAGDEN_EXPORT packed_image_decoder {
public:
    static constexpr std::string_view name = "packed_image";
    static constexpr std::string_view extensions[] = {".tpk"};
    static constexpr std::array<std::uint8_t, 8> signature = {
        'T', 'G', 'P', 'K', 'I', 'M', 'G', 0x00
    };
    static constexpr std::uint32_t blank_row = 0xFFFFFFFF;

    /**
     * Check if data starts with the packed image signature.
     * @param data Raw file data
     * @return true if the signature matches
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Check if a stored archive path names a packed image.
     * Compares the extension case-insensitively.
     * @param path Stored path (either separator style)
     */
    [[nodiscard]] static bool matches_extension(std::string_view path) noexcept;

    /**
     * Parse the signature, dimensions and row offset table.
     * @param data Raw file data
     * @param info Receives the parsed header
     * @param options Decode options (dimension limits)
     * @return Decode result with success/error status
     */
    [[nodiscard]] static result parse_header(std::span<const std::uint8_t> data,
                                             packed_image_header& info,
                                             const decode_options& options = {});

    /**
     * Decode packed image data to a surface.
     *
     * Each present row is a chain of runs: x_start and run_count, then
     * run_count big-endian RGB555 codes, then x_delta. A zero x_delta ends
     * the row; otherwise the next run starts x_delta columns after the end
     * of the previous run and its run_count follows. Columns not covered by
     * a run stay black.
     *
     * Fails with truncated_image on any read past the data and with
     * out_of_bounds when a run extends past the image width.
     *
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static result decode(std::span<const std::uint8_t> data,
                                       surface& surf,
                                       const decode_options& options = {});
};

} // namespace tagden

#endif // TAGDEN_CODECS_PACKED_IMAGE_HPP_
