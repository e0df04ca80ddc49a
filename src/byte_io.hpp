#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace tagden {

// Big-endian readers
inline std::uint16_t read_be16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                      static_cast<std::uint16_t>(p[1]));
}

inline std::uint32_t read_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

// Forward cursor over a byte span. Every read is bounds checked; a failed
// read leaves the position unchanged.
class byte_reader {
public:
    explicit byte_reader(std::span<const std::uint8_t> data, std::size_t pos = 0) noexcept
        : data_(data), pos_(pos) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return pos_ < data_.size() ? data_.size() - pos_ : 0;
    }

    [[nodiscard]] bool seek(std::size_t pos) noexcept {
        if (pos > data_.size()) {
            return false;
        }
        pos_ = pos;
        return true;
    }

    [[nodiscard]] bool skip(std::size_t count) noexcept {
        if (count > remaining()) {
            return false;
        }
        pos_ += count;
        return true;
    }

    [[nodiscard]] bool read_u16(std::uint16_t& out) noexcept {
        if (remaining() < 2) {
            return false;
        }
        out = read_be16(data_.data() + pos_);
        pos_ += 2;
        return true;
    }

    [[nodiscard]] bool read_u32(std::uint32_t& out) noexcept {
        if (remaining() < 4) {
            return false;
        }
        out = read_be32(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    [[nodiscard]] bool read_bytes(std::size_t count, std::span<const std::uint8_t>& out) noexcept {
        if (count > remaining()) {
            return false;
        }
        out = data_.subspan(pos_, count);
        pos_ += count;
        return true;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

} // namespace tagden
