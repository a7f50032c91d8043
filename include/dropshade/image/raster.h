#pragma once

#include <dropshade/core/error.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dropshade::image {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Row-major RGBA8 pixel buffer, straight (non-premultiplied) alpha.
class Raster {
public:
    static constexpr std::size_t kChannels = 4;

    Raster() = default;

    Raster(int width, int height) {
        resize(width, height);
    }

    // Takes ownership of an existing RGBA buffer. A buffer whose size does not
    // match width*height*4 yields an empty raster.
    static Raster from_rgba(int width, int height, std::vector<std::uint8_t> pixels);

    void resize(int width, int height) {
        width_ = std::max(width, 0);
        height_ = std::max(height, 0);
        pixels_.assign(byte_count(width_, height_), 0);
    }

    [[nodiscard]] int width() const {
        return width_;
    }

    [[nodiscard]] int height() const {
        return height_;
    }

    [[nodiscard]] bool empty() const {
        return width_ <= 0 || height_ <= 0 || pixels_.empty();
    }

    [[nodiscard]] bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    [[nodiscard]] const std::vector<std::uint8_t>& pixels() const {
        return pixels_;
    }

    [[nodiscard]] std::vector<std::uint8_t>& pixels() {
        return pixels_;
    }

    [[nodiscard]] std::size_t offset(int x, int y) const {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                static_cast<std::size_t>(x)) * kChannels;
    }

    // Out-of-bounds reads return transparent black.
    [[nodiscard]] Color pixel(int x, int y) const;

    // Plain store, no blending. Out-of-bounds writes are ignored.
    void set_pixel(int x, int y, Color color);

    [[nodiscard]] std::uint8_t alpha(int x, int y) const {
        return contains(x, y) ? pixels_[offset(x, y) + 3] : 0;
    }

    void clear(Color color);

    bool operator==(const Raster& other) const {
        return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
    }
    bool operator!=(const Raster& other) const { return !(*this == other); }

    static std::size_t byte_count(int width, int height) {
        return static_cast<std::size_t>(std::max(width, 0)) *
               static_cast<std::size_t>(std::max(height, 0)) * kChannels;
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

struct RasterResult {
    bool ok = false;
    Raster raster;
    core::Error error;
};

}  // namespace dropshade::image
