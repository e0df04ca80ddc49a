#pragma once

#include <tagden/types.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

namespace tagden {

// Default dimension limits
constexpr int DEFAULT_MAX_DIMENSION = 16384;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options,
                                                 int default_limit = DEFAULT_MAX_DIMENSION) {
    int max_w = options.max_width > 0 ? options.max_width : default_limit;
    int max_h = options.max_height > 0 ? options.max_height : default_limit;
    return {max_w, max_h};
}

// Validate dimensions against limits, returning failure result if exceeded
// Returns success() if dimensions are within limits
inline result validate_dimensions(std::uint32_t width, std::uint32_t height,
                                  const decode_options& options,
                                  int default_limit = DEFAULT_MAX_DIMENSION) {
    constexpr auto max_int = static_cast<std::uint32_t>(std::numeric_limits<int>::max());
    if (width > max_int || height > max_int) {
        return result::failure(error_code::dimensions_exceeded,
            "Image dimensions exceed maximum supported size");
    }

    auto [max_w, max_h] = get_dimension_limits(options, default_limit);
    if (static_cast<int>(width) > max_w || static_cast<int>(height) > max_h) {
        return result::failure(error_code::dimensions_exceeded,
            "Image dimensions exceed limits");
    }
    return result::success();
}

} // namespace tagden
