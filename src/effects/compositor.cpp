#include <dropshade/effects/compositor.h>

#include <dropshade/core/config.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

namespace dropshade::effects {

namespace {

image::RasterResult fail(std::string message) {
    image::RasterResult result;
    result.error = {core::ErrorCode::InvalidDimensions, std::move(message)};
    return result;
}

struct AxisPlacement {
    std::int64_t extent = 0;
    std::int64_t shadow = 0;
    std::int64_t source = 0;
};

// Offset >= 0: shadow at padding, source at padding + offset. Offset < 0: shadow at
// padding + offset, source at padding. A negative shadow position shifts both layers,
// and the extent grows past size + |offset| + 2*padding until both layers fit.
AxisPlacement place_axis(std::int64_t size, std::int64_t padding, std::int64_t offset) {
    AxisPlacement axis;
    axis.shadow = offset >= 0 ? padding : padding + offset;
    axis.source = offset >= 0 ? padding + offset : padding;
    if (axis.shadow < 0) {
        axis.source -= axis.shadow;
        axis.shadow = 0;
    }
    axis.extent = std::max({size + std::abs(offset) + 2 * padding,
                            axis.shadow + size + 2 * padding,
                            axis.source + size});
    return axis;
}

}  // namespace

std::optional<LayerPlacement> compute_placement(int source_width, int source_height,
                                                int padding, int offset_x, int offset_y) {
    if (source_width <= 0 || source_height <= 0 || padding < 0) {
        return std::nullopt;
    }

    const AxisPlacement x = place_axis(source_width, padding, offset_x);
    const AxisPlacement y = place_axis(source_height, padding, offset_y);
    if (x.extent > core::config::kMaxCanvasDimension ||
        y.extent > core::config::kMaxCanvasDimension ||
        x.extent * y.extent > core::config::kMaxCanvasPixels) {
        return std::nullopt;
    }

    LayerPlacement placement;
    placement.canvas_width = static_cast<int>(x.extent);
    placement.canvas_height = static_cast<int>(y.extent);
    placement.shadow_x = static_cast<int>(x.shadow);
    placement.shadow_y = static_cast<int>(y.shadow);
    placement.source_x = static_cast<int>(x.source);
    placement.source_y = static_cast<int>(y.source);
    return placement;
}

void blend_over(image::Raster& canvas, const image::Raster& layer, int x, int y) {
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(canvas.width(), x + layer.width());
    const int y1 = std::min(canvas.height(), y + layer.height());
    if (x0 >= x1 || y0 >= y1) return;

    auto& dst = canvas.pixels();
    const auto& src = layer.pixels();

    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            const std::size_t si = layer.offset(px - x, py - y);
            const std::size_t di = canvas.offset(px, py);
            const std::uint8_t src_a = src[si + 3];

            if (src_a == 0) {
                continue;
            }
            if (src_a == 255) {
                std::copy(src.begin() + static_cast<std::ptrdiff_t>(si),
                          src.begin() + static_cast<std::ptrdiff_t>(si + 4),
                          dst.begin() + static_cast<std::ptrdiff_t>(di));
                continue;
            }

            // out_a = sa + da(1 - sa); out_c = (sc*sa + dc*da(1 - sa)) / out_a
            const float sa = static_cast<float>(src_a) / 255.0f;
            const float da = static_cast<float>(dst[di + 3]) / 255.0f;
            const float dst_weight = da * (1.0f - sa);
            const float out_a = sa + dst_weight;

            for (int c = 0; c < 3; ++c) {
                const float value = (static_cast<float>(src[si + c]) * sa +
                                     static_cast<float>(dst[di + c]) * dst_weight) / out_a;
                dst[di + c] = static_cast<std::uint8_t>(std::lround(std::clamp(value, 0.0f, 255.0f)));
            }
            dst[di + 3] = static_cast<std::uint8_t>(std::lround(std::clamp(out_a * 255.0f, 0.0f, 255.0f)));
        }
    }
}

image::RasterResult compose(const image::Raster& rounded, const image::Raster& shadow,
                            int offset_x, int offset_y) {
    if (rounded.empty() || shadow.empty()) {
        return fail("cannot compose empty layers");
    }

    const int extra_w = shadow.width() - rounded.width();
    const int extra_h = shadow.height() - rounded.height();
    if (extra_w < 0 || extra_w != extra_h || extra_w % 2 != 0) {
        return fail("shadow " + std::to_string(shadow.width()) + "x" + std::to_string(shadow.height()) +
                    " is not evenly padded around " + std::to_string(rounded.width()) + "x" +
                    std::to_string(rounded.height()));
    }

    const auto placement = compute_placement(rounded.width(), rounded.height(), extra_w / 2,
                                             offset_x, offset_y);
    if (!placement) {
        return fail("composed canvas exceeds the maximum dimension");
    }

    image::RasterResult result;
    result.raster.resize(placement->canvas_width, placement->canvas_height);
    blend_over(result.raster, shadow, placement->shadow_x, placement->shadow_y);
    blend_over(result.raster, rounded, placement->source_x, placement->source_y);
    result.ok = true;
    return result;
}

}  // namespace dropshade::effects
