#include <dropshade/effects/shadow_synthesizer.h>
#include <dropshade/effects/gaussian_blur.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace dropshade::effects {

namespace {

ShadowResult fail(core::ErrorCode code, std::string message) {
    ShadowResult result;
    result.error = {code, std::move(message)};
    return result;
}

// t^exp where t is the distance to the nearest border over the fade band.
float edge_fade_factor(int x, int y, int width, int height, int band, float exponent) {
    if (band <= 0) return 1.0f;
    const int edge = std::min(std::min(x, y), std::min(width - 1 - x, height - 1 - y));
    const float t = std::min(static_cast<float>(edge) / static_cast<float>(band), 1.0f);
    return std::pow(t, exponent);
}

}  // namespace

std::int64_t shadow_padding(int spread, int blur_radius) {
    return static_cast<std::int64_t>(std::max(spread, 0)) +
           2 * static_cast<std::int64_t>(std::max(blur_radius, 0));
}

float shadow_blur_sigma(int spread, int blur_radius) {
    return static_cast<float>(static_cast<std::int64_t>(std::max(blur_radius, 0)) +
                              std::max(spread, 0) / 2);
}

ShadowResult synthesize_shadow(const image::Raster& source, const ShadowParams& params) {
    if (source.empty()) {
        return fail(core::ErrorCode::InvalidDimensions,
                    "cannot build a shadow for an empty raster");
    }
    if (params.blur_radius < 0 || params.blur_radius > core::config::kMaxBlurRadius) {
        return fail(core::ErrorCode::BlurParameterOutOfRange,
                    "blur radius " + std::to_string(params.blur_radius) +
                    " outside [0, " + std::to_string(core::config::kMaxBlurRadius) + "]");
    }

    const std::int64_t padding = shadow_padding(params.spread, params.blur_radius);
    const std::int64_t width = source.width() + 2 * padding;
    const std::int64_t height = source.height() + 2 * padding;
    if (width > core::config::kMaxCanvasDimension || height > core::config::kMaxCanvasDimension ||
        width * height > core::config::kMaxCanvasPixels) {
        return fail(core::ErrorCode::InvalidDimensions,
                    "shadow canvas " + std::to_string(width) + "x" + std::to_string(height) +
                    " exceeds the maximum size");
    }

    ShadowResult result;
    result.padding = static_cast<int>(padding);
    result.raster.resize(static_cast<int>(width), static_cast<int>(height));
    const int pad = result.padding;
    const int shadow_alpha = std::clamp(params.alpha, 0, 255);

    // Silhouette: black, alpha scaled by the shadow opacity.
    const auto& src = source.pixels();
    auto& dst = result.raster.pixels();
    for (int y = 0; y < source.height(); ++y) {
        for (int x = 0; x < source.width(); ++x) {
            const int a = src[source.offset(x, y) + 3];
            if (a == 0) continue;
            dst[result.raster.offset(x + pad, y + pad) + 3] =
                static_cast<std::uint8_t>(a * shadow_alpha / 255);
        }
    }

    const float sigma = shadow_blur_sigma(params.spread, params.blur_radius);
    if (sigma > 0.0f) {
        blur_alpha(result.raster, sigma);
    }

    // The silhouette itself sits a full padding away from the border, so only
    // the blurred fringe is affected.
    if (params.edge_fade && pad > 0) {
        for (int y = 0; y < result.raster.height(); ++y) {
            for (int x = 0; x < result.raster.width(); ++x) {
                const std::size_t idx = result.raster.offset(x, y) + 3;
                if (dst[idx] == 0) continue;
                const float factor = edge_fade_factor(x, y, result.raster.width(),
                                                      result.raster.height(), pad,
                                                      params.fade_exponent);
                dst[idx] = static_cast<std::uint8_t>(static_cast<float>(dst[idx]) * factor);
            }
        }
    }

    // Rolloff only smooths blur fringes; an unblurred silhouette keeps its exact alpha.
    if (sigma > 0.0f && params.cleanup) {
        for (std::size_t i = 0; i < dst.size(); i += image::Raster::kChannels) {
            const std::uint8_t a = dst[i + 3];
            if (a == 0) continue;
            const float factor = std::pow(static_cast<float>(a) / 255.0f, params.cleanup_exponent);
            for (std::size_t c = 0; c < image::Raster::kChannels; ++c) {
                dst[i + c] = static_cast<std::uint8_t>(static_cast<float>(dst[i + c]) * factor);
            }
        }
    }

    result.ok = true;
    return result;
}

}  // namespace dropshade::effects
