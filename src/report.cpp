#include <tagden/report.hpp>

#include <ostream>

namespace tagden {

const char* to_string(severity level) noexcept {
    switch (level) {
        case severity::debug:   return "DEBUG";
        case severity::info:    return "INFO";
        case severity::warning: return "WARNING";
        case severity::error:   return "ERROR";
    }
    return "UNKNOWN";
}

void stream_reporter::report(severity level, std::string_view message) {
    if (level < min_level_) {
        return;
    }
    out_ << to_string(level) << ": " << message << '\n';
}

} // namespace tagden
