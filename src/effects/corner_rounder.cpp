#include <dropshade/effects/corner_rounder.h>

#include <algorithm>
#include <cmath>

namespace dropshade::effects {

int clamp_corner_radius(int radius, int width, int height) {
    const int half_min = std::max(0, std::min(width, height) / 2);
    return std::clamp(radius, 0, half_min);
}

image::RasterResult round_corners(const image::Raster& source, int radius) {
    image::RasterResult result;
    if (source.empty()) {
        result.error = {core::ErrorCode::InvalidDimensions,
                        "cannot round corners of an empty raster"};
        return result;
    }

    const int w = source.width();
    const int h = source.height();
    const int r = clamp_corner_radius(radius, w, h);

    result.raster = source;
    result.ok = true;
    if (r == 0) {
        return result;
    }

    auto& out = result.raster.pixels();
    const float rf = static_cast<float>(r);
    const float right_cx = static_cast<float>(w - r - 1);
    const float bottom_cy = static_cast<float>(h - r - 1);

    for (int y = 0; y < h; ++y) {
        const bool top = y < r;
        const bool bottom = y >= h - r;
        if (!top && !bottom) continue;

        const float dy = top ? rf - static_cast<float>(y) : static_cast<float>(y) - bottom_cy;

        for (int x = 0; x < w; ++x) {
            const bool left = x < r;
            const bool right = x >= w - r;
            if (!left && !right) continue;

            const float dx = left ? rf - static_cast<float>(x) : static_cast<float>(x) - right_cx;
            const float distance = std::sqrt(dx * dx + dy * dy);
            if (distance <= rf) continue;

            // One pixel of feather past the circle, transparent beyond it.
            const float feather = std::clamp((rf + 1.0f - distance) * 255.0f, 0.0f, 255.0f);
            const std::size_t idx = result.raster.offset(x, y) + 3;
            out[idx] = std::min(static_cast<std::uint8_t>(feather), out[idx]);
        }
    }

    return result;
}

}  // namespace dropshade::effects
