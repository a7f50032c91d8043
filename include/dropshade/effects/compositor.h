#pragma once

#include <dropshade/image/raster.h>

#include <optional>

namespace dropshade::effects {

// Canvas size and top-left positions of both layers.
struct LayerPlacement {
    int canvas_width = 0;
    int canvas_height = 0;
    int shadow_x = 0;
    int shadow_y = 0;
    int source_x = 0;
    int source_y = 0;
};

// Per axis, offset >= 0 puts the shadow layer at padding and the source at
// padding + offset; offset < 0 puts the shadow at padding + offset and the source
// at padding. A negative position shifts both layers to 0. The canvas is at least
// (w + |offset_x| + 2*padding) x (h + |offset_y| + 2*padding) and grows until
// neither layer is clipped. nullopt when the canvas would exceed the size limits.
std::optional<LayerPlacement> compute_placement(int source_width, int source_height,
                                                int padding, int offset_x, int offset_y);

// Source-over of `layer` onto `canvas` with its top-left at (x, y), straight alpha.
// Parts of the layer that fall outside the canvas are skipped.
void blend_over(image::Raster& canvas, const image::Raster& layer, int x, int y);

// Draws `shadow` then `rounded` onto a fresh transparent canvas. The shadow
// must be the rounded raster padded equally on every side (synthesize_shadow()).
image::RasterResult compose(const image::Raster& rounded, const image::Raster& shadow,
                            int offset_x, int offset_y);

}  // namespace dropshade::effects
