#ifndef TAGDEN_PIXEL_HPP_
#define TAGDEN_PIXEL_HPP_

#include <cstdint>

namespace tagden {

// ============================================================================
// RGB555 Pixel Unpacking
// ============================================================================

struct rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend constexpr bool operator==(const rgb&, const rgb&) = default;
};

/**
 * Expand a 5-5-5 packed color code into 8-bit channels.
 *
 * Layout (bit 0 = LSB): red [10,15), green [5,10), blue [0,5). Bit 15 is
 * unused. Each channel is shifted left by 3, so the result is always a
 * multiple of 8 in [0, 248]; the low bits are NOT replicated.
 *
 * @param code Packed color code (already byte-swapped from big-endian)
 * @return Unpacked RGB triplet
 */
[[nodiscard]] constexpr rgb unpack_rgb555(std::uint16_t code) noexcept {
    return {
        static_cast<std::uint8_t>(((code >> 10) & 0x1F) << 3),
        static_cast<std::uint8_t>(((code >> 5) & 0x1F) << 3),
        static_cast<std::uint8_t>((code & 0x1F) << 3)
    };
}

} // namespace tagden

#endif // TAGDEN_PIXEL_HPP_
