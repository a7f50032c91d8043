#pragma once

#include <dropshade/image/raster.h>

#include <vector>

namespace dropshade::effects {

// Normalized 1D Gaussian kernel of size 2*ceil(3*sigma)+1. Empty when sigma <= 0.
std::vector<float> gaussian_kernel(float sigma);

// Separable Gaussian blur of the alpha channel only. Samples outside the
// raster count as transparent, so coverage falls off towards the borders.
// RGB channels are left as they are.
void blur_alpha(image::Raster& raster, float sigma);

}  // namespace dropshade::effects
