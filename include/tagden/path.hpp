#ifndef TAGDEN_PATH_HPP_
#define TAGDEN_PATH_HPP_

#include <tagden/tagden_export.h>
#include <tagden/types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tagden {

// ============================================================================
// Stored Path Normalization
// ============================================================================

// Absolute directory on the machine the archive was built on. Every stored
// path starts with it.
inline constexpr std::string_view DEFAULT_PATH_PREFIX = "l:\\scorpc\\game";

/**
 * Split a Windows-style path into its segments.
 * Both '\\' and '/' are separators; empty segments are dropped.
 * @param path Stored path
 * @return Path segments in order
 */
[[nodiscard]] TAGDEN_EXPORT std::vector<std::string> split_stored_path(std::string_view path);

/**
 * Strip the build-machine prefix from a stored path.
 *
 * The prefix is compared segment by segment, ignoring ASCII case. The
 * remaining segments are joined with native separators, so
 * "l:\\scorpc\\game\\foo\\bar.txt" becomes "foo/bar.txt" on POSIX.
 *
 * Fails with invalid_path when the prefix does not match, when nothing is
 * left after it, or when a remaining segment is "." or "..".
 *
 * @param stored_path Path as stored in the archive
 * @param out Relative destination path
 * @param prefix Prefix to strip
 * @return Result with success/error status
 */
[[nodiscard]] TAGDEN_EXPORT result normalize_path(std::string_view stored_path,
                                                  std::filesystem::path& out,
                                                  std::string_view prefix = DEFAULT_PATH_PREFIX);

} // namespace tagden

#endif // TAGDEN_PATH_HPP_
