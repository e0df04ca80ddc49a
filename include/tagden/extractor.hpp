#ifndef TAGDEN_EXTRACTOR_HPP_
#define TAGDEN_EXTRACTOR_HPP_

#include <tagden/tagden_export.h>
#include <tagden/types.hpp>
#include <tagden/archive.hpp>
#include <tagden/path.hpp>
#include <tagden/report.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tagden {

// ============================================================================
// Extraction Options
// ============================================================================

inline constexpr std::string_view DEFAULT_ARCHIVE_NAME = "TAGDEN.BIN";

struct extract_options {
    // Root of the extracted tree; created if missing
    std::filesystem::path output_dir = "output";

    // Build-machine directory stripped from every stored path
    std::string path_prefix = std::string(DEFAULT_PATH_PREFIX);

    // Write a .png next to every extracted packed image
    bool convert_images = true;

    decode_options image_options;
};

// An entry together with the file written for it
struct extracted_file {
    directory_entry entry;
    std::filesystem::path destination;
};

// ============================================================================
// Extraction
// ============================================================================

/**
 * Read a whole file into memory.
 * @param path File to read
 * @param data Receives the file contents
 * @return Result with io_error if the file cannot be read
 */
[[nodiscard]] TAGDEN_EXPORT result read_file(const std::filesystem::path& path,
                                             std::vector<std::uint8_t>& data);

/**
 * Write one entry's payload below the output directory.
 * Parent directories are created as needed; an existing file is replaced.
 * @param archive Complete archive contents
 * @param entry Entry to extract
 * @param options Extraction options
 * @param destination Receives the path of the written file
 * @param log Diagnostics sink
 * @return Result with success/error status
 */
[[nodiscard]] TAGDEN_EXPORT result extract_entry(std::span<const std::uint8_t> archive,
                                                 const directory_entry& entry,
                                                 const extract_options& options,
                                                 std::filesystem::path& destination,
                                                 reporter& log);

/**
 * Read the directory, then extract every entry in archive order.
 * Stops at the first failure.
 * @param archive Complete archive contents
 * @param options Extraction options
 * @param files Receives one record per extracted entry
 * @param log Diagnostics sink
 * @return Result with success/error status
 */
[[nodiscard]] TAGDEN_EXPORT result extract_all(std::span<const std::uint8_t> archive,
                                               const extract_options& options,
                                               std::vector<extracted_file>& files,
                                               reporter& log);

/**
 * Decode every extracted packed image and save it as PNG beside the
 * extracted file (same base name, .png extension). An image whose PNG
 * name is taken by another extracted file is skipped with a warning.
 * @param archive Complete archive contents
 * @param files Records returned by extract_all
 * @param options Extraction options
 * @param converted Receives the number of images written
 * @param log Diagnostics sink
 * @return Result with success/error status
 */
[[nodiscard]] TAGDEN_EXPORT result convert_images(std::span<const std::uint8_t> archive,
                                                  const std::vector<extracted_file>& files,
                                                  const extract_options& options,
                                                  std::size_t& converted,
                                                  reporter& log);

/**
 * Full run: load the archive, create the output directory, extract all
 * entries and convert packed images.
 * @param archive_path Archive file
 * @param options Extraction options
 * @param log Diagnostics sink
 * @return Result with archive_not_found if the archive is missing, io_error
 *         if it is not a readable regular file
 */
[[nodiscard]] TAGDEN_EXPORT result run(const std::filesystem::path& archive_path,
                                       const extract_options& options,
                                       reporter& log);

} // namespace tagden

#endif // TAGDEN_EXTRACTOR_HPP_
