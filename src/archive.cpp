#include <tagden/archive.hpp>
#include "byte_io.hpp"

#include <algorithm>
#include <string>

namespace tagden {

namespace {

result truncated_at(std::size_t pos) {
    return result::failure(error_code::truncated_archive,
        "Archive directory truncated at offset " + std::to_string(pos));
}

} // namespace

bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t lead = bytes[i];
        std::size_t length = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
            min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
            min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
            min_cp = 0x10000;
        } else {
            return false;
        }

        if (bytes.size() - i < length) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const std::uint8_t cont = bytes[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += length;
    }
    return true;
}

bool payload_in_bounds(const directory_entry& entry, std::size_t archive_size) noexcept {
    const std::uint64_t end = static_cast<std::uint64_t>(entry.payload_offset) +
                              static_cast<std::uint64_t>(entry.payload_size);
    return end <= static_cast<std::uint64_t>(archive_size);
}

result archive_reader::next(frame_outcome& out) {
    if (!failure_) {
        return failure_;
    }
    if (finished_) {
        out = frame_outcome{};
        return result::success();
    }

    const std::size_t frame_start = pos_;
    byte_reader reader(data_, pos_);

    directory_entry entry;
    std::uint16_t frame_size = 0;
    if (!reader.skip(2) ||
        !reader.read_u16(entry.type_tag) ||
        !reader.read_u32(entry.payload_offset) ||
        !reader.read_u32(entry.payload_size) ||
        !reader.read_u16(entry.reserved) ||
        !reader.read_u16(frame_size)) {
        failure_ = truncated_at(frame_start);
        return failure_;
    }

    if (entry.type_tag != DIRECTORY_ENTRY_TAG) {
        pos_ = reader.position();
        finished_ = true;
        out = frame_outcome{};
        return result::success();
    }

    if (frame_size < FRAME_HEADER_SIZE) {
        failure_ = result::failure(error_code::invalid_format,
            "Frame at offset " + std::to_string(frame_start) + " has size " +
            std::to_string(frame_size) + ", smaller than its header");
        return failure_;
    }

    std::span<const std::uint8_t> path_field;
    if (!reader.read_bytes(frame_size - FRAME_HEADER_SIZE, path_field)) {
        failure_ = truncated_at(frame_start);
        return failure_;
    }

    const auto nul = std::find(path_field.begin(), path_field.end(), std::uint8_t{0});
    const auto path_bytes = path_field.first(static_cast<std::size_t>(nul - path_field.begin()));
    if (!is_valid_utf8(path_bytes)) {
        failure_ = result::failure(error_code::invalid_path,
            "Frame at offset " + std::to_string(frame_start) + " has a path that is not valid UTF-8");
        return failure_;
    }
    entry.internal_path.assign(reinterpret_cast<const char*>(path_bytes.data()), path_bytes.size());

    pos_ = reader.position();
    out.kind = frame_kind::entry;
    out.entry = std::move(entry);
    return result::success();
}

result read_directory(std::span<const std::uint8_t> data,
                      std::vector<directory_entry>& entries,
                      reporter& log) {
    entries.clear();
    archive_reader reader(data);

    while (true) {
        frame_outcome frame;
        auto res = reader.next(frame);
        if (!res) {
            return res;
        }
        if (frame.kind == frame_kind::end_of_directory) {
            break;
        }
        log.debug("Found file '" + frame.entry.internal_path + "'");
        entries.push_back(std::move(frame.entry));
    }

    return result::success();
}

} // namespace tagden
