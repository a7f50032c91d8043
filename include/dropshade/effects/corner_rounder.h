#pragma once

#include <dropshade/image/raster.h>

namespace dropshade::effects {

// Clamps radius into [0, min(width, height) / 2] so opposite corner squares never overlap.
int clamp_corner_radius(int radius, int width, int height);

// Feathers the alpha of pixels outside the four quarter-circles of radius
// `radius`, centred `radius` pixels in from each corner. Pixels within the
// circles are copied unchanged; pixels beyond get one pixel of antialiasing
// and are then clipped to transparent. RGB channels are never touched.
// radius 0 is the identity. Fails only on an empty source.
image::RasterResult round_corners(const image::Raster& source, int radius);

}  // namespace dropshade::effects
