#pragma once

#include <dropshade/core/config.h>
#include <dropshade/core/error.h>
#include <dropshade/image/raster.h>

#include <cstdint>

namespace dropshade::effects {

struct ShadowParams {
    // Layer offset used by compose(); see compute_placement().
    int offset_x = core::config::kDefaultShadowOffsetX;
    int offset_y = core::config::kDefaultShadowOffsetY;
    // Extra padding around the silhouette; also widens the blur. Negative clamps to 0.
    int spread = core::config::kDefaultShadowSpread;
    int blur_radius = core::config::kDefaultBlurRadius;
    // Opacity cap of the shadow, clamped to 0-255.
    int alpha = core::config::kDefaultShadowAlpha;

    // Attenuate alpha towards the shadow layer's own border after blurring.
    bool edge_fade = false;
    float fade_exponent = core::config::kDefaultFadeExponent;

    // Post-blur rolloff: every non-transparent pixel is scaled by (a/255)^exp.
    bool cleanup = true;
    float cleanup_exponent = core::config::kDefaultCleanupExponent;
};

// spread + 2 * blur_radius, with spread clamped to >= 0.
std::int64_t shadow_padding(int spread, int blur_radius);

// Sigma actually used for the blur: blur_radius + spread / 2.
float shadow_blur_sigma(int spread, int blur_radius);

struct ShadowResult {
    bool ok = false;
    image::Raster raster;
    int padding = 0;
    core::Error error;
};

// Builds the black shadow layer for `source`: its alpha silhouette scaled by
// params.alpha, pasted into a canvas padded by shadow_padding() on every side,
// then blurred. The result never carries source colors.
ShadowResult synthesize_shadow(const image::Raster& source, const ShadowParams& params);

}  // namespace dropshade::effects
