#ifndef TAGDEN_REPORT_HPP_
#define TAGDEN_REPORT_HPP_

#include <tagden/tagden_export.h>

#include <iosfwd>
#include <string_view>

namespace tagden {

// ============================================================================
// Diagnostics
// ============================================================================

enum class severity {
    debug,
    info,
    warning,
    error
};

[[nodiscard]] TAGDEN_EXPORT const char* to_string(severity level) noexcept;

/**
 * Receiver for progress and diagnostic messages.
 * Passed explicitly to every operation that reports; there is no global
 * logger.
 */
class TAGDEN_EXPORT reporter {
public:
    virtual ~reporter() = default;

    virtual void report(severity level, std::string_view message) = 0;

    void debug(std::string_view message) { report(severity::debug, message); }
    void info(std::string_view message) { report(severity::info, message); }
    void warning(std::string_view message) { report(severity::warning, message); }
    void error(std::string_view message) { report(severity::error, message); }
};

/**
 * Writes "LEVEL: message" lines to a stream.
 * Messages below the minimum severity are dropped.
 */
class TAGDEN_EXPORT stream_reporter : public reporter {
public:
    explicit stream_reporter(std::ostream& out, severity min_level = severity::info) noexcept
        : out_(out), min_level_(min_level) {}

    void report(severity level, std::string_view message) override;

    [[nodiscard]] severity min_level() const noexcept { return min_level_; }

private:
    std::ostream& out_;
    severity min_level_;
};

/**
 * Discards every message.
 */
class TAGDEN_EXPORT null_reporter : public reporter {
public:
    void report(severity level, std::string_view message) override {
        (void)level;
        (void)message;
    }
};

} // namespace tagden

#endif // TAGDEN_REPORT_HPP_
