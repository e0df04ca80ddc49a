#pragma once

#include <tagden/tagden.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fixtures {

inline void append_be16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

inline void append_be32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 24));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

// One directory frame. The path field is NUL terminated and padded with
// `padding` extra zero bytes.
inline std::vector<std::uint8_t> make_frame(std::uint16_t type_tag,
                                            std::uint32_t offset,
                                            std::uint32_t size,
                                            const std::string& path,
                                            std::size_t padding = 0,
                                            std::uint16_t reserved = 0) {
    std::vector<std::uint8_t> frame;
    const std::size_t field = path.size() + 1 + padding;
    append_be16(frame, 0);
    append_be16(frame, type_tag);
    append_be32(frame, offset);
    append_be32(frame, size);
    append_be16(frame, reserved);
    append_be16(frame, static_cast<std::uint16_t>(tagden::FRAME_HEADER_SIZE + field));
    frame.insert(frame.end(), path.begin(), path.end());
    frame.insert(frame.end(), 1 + padding, 0);
    return frame;
}

// Terminating frame: any tag other than 16
inline std::vector<std::uint8_t> make_end_frame(std::uint16_t type_tag = 0) {
    return make_frame(type_tag, 0, 0, std::string());
}

struct archive_file {
    std::string path;
    std::vector<std::uint8_t> content;
};

// Directory frames, a terminating frame, then the payloads back to back.
inline std::vector<std::uint8_t> make_archive(const std::vector<archive_file>& files) {
    std::size_t directory_size = make_end_frame().size();
    for (const auto& file : files) {
        directory_size += tagden::FRAME_HEADER_SIZE + file.path.size() + 1;
    }

    std::vector<std::uint8_t> out;
    std::uint32_t offset = static_cast<std::uint32_t>(directory_size);
    for (const auto& file : files) {
        const auto size = static_cast<std::uint32_t>(file.content.size());
        auto frame = make_frame(tagden::DIRECTORY_ENTRY_TAG, offset, size, file.path);
        out.insert(out.end(), frame.begin(), frame.end());
        offset += size;
    }
    auto end = make_end_frame();
    out.insert(out.end(), end.begin(), end.end());

    for (const auto& file : files) {
        out.insert(out.end(), file.content.begin(), file.content.end());
    }
    return out;
}

// Packed image from per-row word streams. A row without words is blank;
// each present row starts at the next free word in the payload.
inline std::vector<std::uint8_t> make_packed_image(
    std::uint32_t width,
    std::uint32_t height,
    const std::vector<std::optional<std::vector<std::uint16_t>>>& rows)
{
    std::vector<std::uint8_t> out(tagden::packed_image_decoder::signature.begin(),
                                  tagden::packed_image_decoder::signature.end());
    append_be32(out, width);
    append_be32(out, height);

    std::vector<std::uint8_t> payload;
    for (const auto& row : rows) {
        if (!row) {
            append_be32(out, tagden::packed_image_decoder::blank_row);
            continue;
        }
        append_be32(out, static_cast<std::uint32_t>(payload.size() / 2));
        for (std::uint16_t word : *row) {
            append_be16(payload, word);
        }
    }

    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

// Pack 8-bit channels that are multiples of 8 into a 5-5-5 code
inline std::uint16_t pack_rgb555(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return static_cast<std::uint16_t>(((r >> 3) << 10) | ((g >> 3) << 5) | (b >> 3));
}

class recording_reporter : public tagden::reporter {
public:
    void report(tagden::severity level, std::string_view message) override {
        messages.emplace_back(level, std::string(message));
    }

    [[nodiscard]] bool contains(std::string_view fragment) const {
        for (const auto& entry : messages) {
            if (entry.second.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::pair<tagden::severity, std::string>> messages;
};

// Fresh directory under the system temp dir, removed on destruction
class temp_dir {
public:
    temp_dir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("tagden_test_" + std::to_string(stamp) + "_" + std::to_string(counter()++));
        std::filesystem::create_directories(path_);
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    static int& counter() {
        static int value = 0;
        return value;
    }

    std::filesystem::path path_;
};

} // namespace fixtures
