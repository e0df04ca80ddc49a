#include <tagden/codecs/packed_image.hpp>
#include <tagden/pixel.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "string_helpers.hpp"

#include <algorithm>
#include <string>

namespace tagden {

namespace {

// Signature (8) + width (4) + height (4)
constexpr std::size_t PACKED_FIXED_HEADER_SIZE = 16;

result truncated_row(std::size_t y) {
    return result::failure(error_code::truncated_image,
        "Packed image data truncated in row " + std::to_string(y));
}

// Decode one row's run chain into an RGB row buffer.
result decode_row(std::span<const std::uint8_t> payload,
                  std::uint32_t offset,
                  std::size_t y,
                  std::size_t width,
                  std::vector<std::uint8_t>& row_buffer) {
    // Offsets count 16-bit words
    const std::uint64_t start = static_cast<std::uint64_t>(offset) * 2;
    if (start >= payload.size()) {
        return result::failure(error_code::truncated_image,
            "Row " + std::to_string(y) + " starts past the end of the pixel data");
    }

    byte_reader reader(payload, static_cast<std::size_t>(start));

    std::uint16_t x_start = 0;
    std::uint16_t run_count = 0;
    if (!reader.read_u16(x_start) || !reader.read_u16(run_count)) {
        return truncated_row(y);
    }

    std::uint64_t x = x_start;
    std::uint64_t count = run_count;

    while (true) {
        if (x + count > width) {
            return result::failure(error_code::out_of_bounds,
                "Run in row " + std::to_string(y) + " covers columns " + std::to_string(x) +
                ".." + std::to_string(x + count) + " of a " + std::to_string(width) +
                "-pixel row");
        }

        std::uint8_t* dest = row_buffer.data() + static_cast<std::size_t>(x) * surface::bytes_per_pixel;
        for (std::uint64_t i = 0; i < count; ++i) {
            std::uint16_t code = 0;
            if (!reader.read_u16(code)) {
                return truncated_row(y);
            }
            const rgb px = unpack_rgb555(code);
            *dest++ = px.r;
            *dest++ = px.g;
            *dest++ = px.b;
        }

        std::uint16_t x_delta = 0;
        if (!reader.read_u16(x_delta)) {
            return truncated_row(y);
        }
        if (x_delta == 0) {
            break;
        }

        // The gap is measured from the end of the previous run
        x += static_cast<std::uint64_t>(x_delta) + count;

        if (!reader.read_u16(run_count)) {
            return truncated_row(y);
        }
        count = run_count;
    }

    return result::success();
}

} // namespace

bool packed_image_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < signature.size()) {
        return false;
    }
    return std::equal(signature.begin(), signature.end(), data.begin());
}

bool packed_image_decoder::matches_extension(std::string_view path) noexcept {
    for (const auto& ext : extensions) {
        // A bare ".tpk" has no base name
        if (path.size() > ext.size() && ends_with_ignore_case(path, ext)) {
            const char before = path[path.size() - ext.size() - 1];
            if (before != '\\' && before != '/') {
                return true;
            }
        }
    }
    return false;
}

result packed_image_decoder::parse_header(std::span<const std::uint8_t> data,
                                          packed_image_header& info,
                                          const decode_options& options) {
    if (data.size() < signature.size()) {
        return result::failure(error_code::truncated_image, "Packed image too small for signature");
    }

    if (!sniff(data)) {
        return result::failure(error_code::invalid_format, "Not a valid packed image file");
    }

    byte_reader reader(data, signature.size());

    std::uint32_t width = 0;
    std::uint32_t height = 0;
    if (!reader.read_u32(width) || !reader.read_u32(height)) {
        return result::failure(error_code::truncated_image, "Packed image header truncated");
    }

    if (width == 0 || height == 0) {
        return result::failure(error_code::invalid_format, "Invalid image dimensions");
    }

    auto res = validate_dimensions(width, height, options);
    if (!res) return res;

    const std::size_t table_size = static_cast<std::size_t>(height) * 4;
    if (reader.remaining() < table_size) {
        return result::failure(error_code::truncated_image,
            "Packed image data truncated: incomplete row offset table");
    }

    info.width = width;
    info.height = height;
    info.row_offsets.clear();
    info.row_offsets.reserve(height);

    for (std::uint32_t y = 0; y < height; ++y) {
        std::uint32_t offset = 0;
        if (!reader.read_u32(offset)) {
            return result::failure(error_code::truncated_image,
                "Packed image data truncated: incomplete row offset table");
        }
        if (offset == blank_row) {
            info.row_offsets.emplace_back(std::nullopt);
        } else {
            info.row_offsets.emplace_back(offset);
        }
    }

    info.payload_start = PACKED_FIXED_HEADER_SIZE + table_size;
    return result::success();
}

result packed_image_decoder::decode(std::span<const std::uint8_t> data,
                                    surface& surf,
                                    const decode_options& options) {
    packed_image_header info;
    auto res = parse_header(data, info, options);
    if (!res) return res;

    const auto payload = data.subspan(info.payload_start);

    // x_start, run_count and x_delta of an empty row
    constexpr std::uint64_t MIN_ROW_SIZE = 6;
    for (std::size_t y = 0; y < info.row_offsets.size(); ++y) {
        const auto& offset = info.row_offsets[y];
        if (offset && static_cast<std::uint64_t>(*offset) * 2 + MIN_ROW_SIZE > payload.size()) {
            return result::failure(error_code::truncated_image,
                "Row " + std::to_string(y) + " starts past the end of the pixel data");
        }
    }

    if (!surf.set_size(static_cast<int>(info.width), static_cast<int>(info.height))) {
        return result::failure(error_code::internal_error, "Failed to allocate surface");
    }

    const std::size_t width = info.width;
    std::vector<std::uint8_t> row_buffer(width * surface::bytes_per_pixel);

    for (std::size_t y = 0; y < info.row_offsets.size(); ++y) {
        const auto& offset = info.row_offsets[y];
        if (!offset) {
            continue;  // Blank row, already black
        }

        std::fill(row_buffer.begin(), row_buffer.end(), 0);
        res = decode_row(payload, *offset, y, width, row_buffer);
        if (!res) return res;

        surf.write_pixels(0, static_cast<int>(y), static_cast<int>(row_buffer.size()),
                          row_buffer.data());
    }

    return result::success();
}

} // namespace tagden
