#include <tagden/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace tagden {

bool memory_surface::set_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);

    // Check for overflow in pitch calculation (width * bpp)
    if (w > std::numeric_limits<std::size_t>::max() / bytes_per_pixel) {
        return false;
    }
    const std::size_t pitch = w * bytes_per_pixel;

    // Check for overflow in total size calculation (pitch * height)
    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }
    const std::size_t total_size = pitch * h;

    // Additional sanity check - limit to reasonable maximum (1GB)
    constexpr std::size_t MAX_BUFFER_SIZE = 1024ULL * 1024ULL * 1024ULL;
    if (total_size > MAX_BUFFER_SIZE) {
        return false;
    }

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    pitch_ = pitch;

    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    const std::size_t x_offset = static_cast<std::size_t>(x);

    // Guard against x >= pitch_ to prevent underflow in max_bytes calculation
    if (x_offset >= pitch_) {
        return;
    }

    const std::size_t offset = static_cast<std::size_t>(y) * pitch_ + x_offset;
    const std::size_t max_bytes = pitch_ - x_offset;
    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), max_bytes);

    if (offset + bytes_to_copy <= pixels_.size()) {
        std::memcpy(pixels_.data() + offset, pixels, bytes_to_copy);
    }
}

const std::uint8_t* memory_surface::pixel_at(int x, int y) const noexcept {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return nullptr;
    }
    return pixels_.data() + static_cast<std::size_t>(y) * pitch_ +
           static_cast<std::size_t>(x) * bytes_per_pixel;
}

} // namespace tagden
