#include <tagden/path.hpp>
#include "string_helpers.hpp"

namespace tagden {

std::vector<std::string> split_stored_path(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find_first_of("\\/", start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.emplace_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

result normalize_path(std::string_view stored_path,
                      std::filesystem::path& out,
                      std::string_view prefix) {
    const auto segments = split_stored_path(stored_path);
    const auto prefix_segments = split_stored_path(prefix);

    if (segments.size() <= prefix_segments.size()) {
        return result::failure(error_code::invalid_path,
            "Stored path is not below '" + std::string(prefix) + "': " + std::string(stored_path));
    }

    for (std::size_t i = 0; i < prefix_segments.size(); ++i) {
        if (!equals_ignore_case(segments[i], prefix_segments[i])) {
            return result::failure(error_code::invalid_path,
                "Stored path does not start with '" + std::string(prefix) + "': " +
                std::string(stored_path));
        }
    }

    std::filesystem::path relative;
    for (std::size_t i = prefix_segments.size(); i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment == "." || segment == "..") {
            return result::failure(error_code::invalid_path,
                "Stored path leaves the output directory: " + std::string(stored_path));
        }
        relative /= segment;
    }

    out = std::move(relative);
    return result::success();
}

} // namespace tagden
