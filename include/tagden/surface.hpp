#ifndef TAGDEN_SURFACE_HPP_
#define TAGDEN_SURFACE_HPP_

#include <tagden/tagden_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tagden {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for RGB888 raster targets.
 * Decoders write pixels to surfaces, so the destination can be swapped
 * without touching the decode loop.
 */
class TAGDEN_EXPORT surface {
public:
    static constexpr std::size_t bytes_per_pixel = 3;

    virtual ~surface() = default;

    /**
     * Set the surface dimensions.
     * Called before any pixel writes. All pixels start black.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * Use x = pixel_x * 3.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to RGB triplets
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 * Stores RGB triplets in a contiguous row-major buffer.
 */
class TAGDEN_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

    /**
     * Get a pointer to the RGB triplet at (x, y).
     * @return nullptr if the coordinates are outside the surface
     */
    [[nodiscard]] const std::uint8_t* pixel_at(int x, int y) const noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
};

} // namespace tagden

#endif // TAGDEN_SURFACE_HPP_
