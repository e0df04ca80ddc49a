#ifndef TAGDEN_TYPES_HPP_
#define TAGDEN_TYPES_HPP_

#include <tagden/tagden_export.h>

#include <cstdint>
#include <string>
#include <utility>

namespace tagden {

// ============================================================================
// Errors
// ============================================================================

enum class error_code {
    none,
    archive_not_found,
    truncated_archive,
    truncated_image,
    invalid_format,
    invalid_path,
    out_of_bounds,
    dimensions_exceeded,
    io_error,
    internal_error
};

[[nodiscard]] TAGDEN_EXPORT const char* to_string(error_code err) noexcept;

// ============================================================================
// Result
// ============================================================================

struct result {
    bool ok = false;
    error_code error = error_code::none;
    std::string message;

    [[nodiscard]] static result success() {
        return {true, error_code::none, {}};
    }

    [[nodiscard]] static result failure(error_code err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;
};

} // namespace tagden

#endif // TAGDEN_TYPES_HPP_
