#include <tagden/types.hpp>

namespace tagden {

const char* to_string(error_code err) noexcept {
    switch (err) {
        case error_code::none:                return "none";
        case error_code::archive_not_found:   return "archive_not_found";
        case error_code::truncated_archive:   return "truncated_archive";
        case error_code::truncated_image:     return "truncated_image";
        case error_code::invalid_format:      return "invalid_format";
        case error_code::invalid_path:        return "invalid_path";
        case error_code::out_of_bounds:       return "out_of_bounds";
        case error_code::dimensions_exceeded: return "dimensions_exceeded";
        case error_code::io_error:            return "io_error";
        case error_code::internal_error:      return "internal_error";
    }
    return "unknown";
}

} // namespace tagden
