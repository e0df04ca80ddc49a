#ifndef TAGDEN_ARCHIVE_HPP_
#define TAGDEN_ARCHIVE_HPP_

#include <tagden/tagden_export.h>
#include <tagden/types.hpp>
#include <tagden/report.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tagden {

// ============================================================================
// Archive Directory
// ============================================================================

// Frame type tag of a directory entry. Any other tag ends the directory.
inline constexpr std::uint16_t DIRECTORY_ENTRY_TAG = 16;

// Fixed part of a frame: 2 skipped bytes, then type, offset, size,
// reserved and frame size (all big-endian).
inline constexpr std::size_t FRAME_HEADER_SIZE = 16;

struct directory_entry {
    std::string internal_path;        // As stored, UTF-8, Windows separators
    std::uint16_t type_tag = 0;
    std::uint32_t payload_offset = 0; // Absolute offset into the archive
    std::uint32_t payload_size = 0;
    std::uint16_t reserved = 0;
};

enum class frame_kind {
    entry,
    end_of_directory
};

struct frame_outcome {
    frame_kind kind = frame_kind::end_of_directory;
    directory_entry entry;            // Valid only when kind == entry
};

/**
 * Lazy reader for the directory section at the start of an archive.
 *
 * Each call to next() parses one frame. The first frame whose tag is not
 * DIRECTORY_ENTRY_TAG yields end_of_directory; the cursor then rests right
 * after that frame's header and is never advanced again. A reader cannot be
 * rewound; create a new one to read the directory a second time.
 */
class TAGDEN_EXPORT archive_reader {
public:
    /**
     * @param data Complete archive contents (must outlive the reader)
     * @param start Offset of the first frame
     */
    explicit archive_reader(std::span<const std::uint8_t> data, std::size_t start = 0) noexcept
        : data_(data), pos_(start) {}

    /**
     * Parse the next frame.
     * @param out Entry or end-of-directory marker
     * @return Result with success/error status. After a failure, every
     *         later call returns the same failure.
     */
    [[nodiscard]] result next(frame_outcome& out);

    /**
     * Current cursor offset into the archive.
     */
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_;
    bool finished_ = false;
    result failure_ = result::success();
};

/**
 * Read the whole directory section.
 * @param data Complete archive contents
 * @param entries Receives the entries in archive order
 * @param log Diagnostics sink
 * @return Result with success/error status
 */
[[nodiscard]] TAGDEN_EXPORT result read_directory(std::span<const std::uint8_t> data,
                                                  std::vector<directory_entry>& entries,
                                                  reporter& log);

/**
 * Check that an entry's payload lies inside the archive.
 */
[[nodiscard]] TAGDEN_EXPORT bool payload_in_bounds(const directory_entry& entry,
                                                   std::size_t archive_size) noexcept;

/**
 * Check that bytes are well-formed UTF-8.
 */
[[nodiscard]] TAGDEN_EXPORT bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept;

} // namespace tagden

#endif // TAGDEN_ARCHIVE_HPP_
