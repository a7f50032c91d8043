#include <dropshade/image/raster.h>

#include <utility>

namespace dropshade::image {

Raster Raster::from_rgba(int width, int height, std::vector<std::uint8_t> pixels) {
    Raster raster;
    if (width <= 0 || height <= 0 || pixels.size() != byte_count(width, height)) {
        return raster;
    }
    raster.width_ = width;
    raster.height_ = height;
    raster.pixels_ = std::move(pixels);
    return raster;
}

Color Raster::pixel(int x, int y) const {
    if (!contains(x, y)) {
        return {};
    }
    const std::size_t idx = offset(x, y);
    return {pixels_[idx + 0], pixels_[idx + 1], pixels_[idx + 2], pixels_[idx + 3]};
}

void Raster::set_pixel(int x, int y, Color color) {
    if (!contains(x, y)) {
        return;
    }
    const std::size_t idx = offset(x, y);
    pixels_[idx + 0] = color.r;
    pixels_[idx + 1] = color.g;
    pixels_[idx + 2] = color.b;
    pixels_[idx + 3] = color.a;
}

void Raster::clear(Color color) {
    for (std::size_t i = 0; i < pixels_.size(); i += kChannels) {
        pixels_[i + 0] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
        pixels_[i + 3] = color.a;
    }
}

}  // namespace dropshade::image
