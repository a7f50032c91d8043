#include <dropshade/effects/gaussian_blur.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace dropshade::effects {

std::vector<float> gaussian_kernel(float sigma) {
    if (!(sigma > 0.0f)) {
        return {};
    }

    const int radius = std::max(1, static_cast<int>(std::ceil(sigma * 3.0f)));
    std::vector<float> kernel(static_cast<std::size_t>(radius * 2 + 1), 0.0f);
    float kernel_sum = 0.0f;
    for (int k = -radius; k <= radius; k++) {
        float value = std::exp(-(static_cast<float>(k * k)) / (2.0f * sigma * sigma));
        kernel[static_cast<size_t>(k + radius)] = value;
        kernel_sum += value;
    }
    if (kernel_sum > 0.0f) {
        for (float& w : kernel) w /= kernel_sum;
    }
    return kernel;
}

void blur_alpha(image::Raster& raster, float sigma) {
    if (raster.empty()) return;

    const std::vector<float> kernel = gaussian_kernel(sigma);
    if (kernel.empty()) return;

    const int radius = static_cast<int>(kernel.size() / 2);
    const int w = raster.width();
    const int h = raster.height();
    const size_t count = static_cast<size_t>(w) * static_cast<size_t>(h);
    auto& pixels = raster.pixels();

    std::vector<float> src_alpha(count, 0.0f);
    for (size_t i = 0; i < count; i++) {
        src_alpha[i] = static_cast<float>(pixels[i * 4 + 3]);
    }

    // Horizontal pass.
    std::vector<float> temp_alpha(count, 0.0f);
    for (int py = 0; py < h; py++) {
        const size_t row = static_cast<size_t>(py) * static_cast<size_t>(w);
        for (int px = 0; px < w; px++) {
            const int k0 = std::max(-radius, -px);
            const int k1 = std::min(radius, w - 1 - px);
            float accum = 0.0f;
            for (int k = k0; k <= k1; k++) {
                accum += src_alpha[row + static_cast<size_t>(px + k)] *
                         kernel[static_cast<size_t>(k + radius)];
            }
            temp_alpha[row + static_cast<size_t>(px)] = accum;
        }
    }

    // Vertical pass, written straight back into the alpha channel.
    for (int py = 0; py < h; py++) {
        const int k0 = std::max(-radius, -py);
        const int k1 = std::min(radius, h - 1 - py);
        for (int px = 0; px < w; px++) {
            float accum = 0.0f;
            for (int k = k0; k <= k1; k++) {
                const size_t idx = static_cast<size_t>(py + k) * static_cast<size_t>(w) +
                                   static_cast<size_t>(px);
                accum += temp_alpha[idx] * kernel[static_cast<size_t>(k + radius)];
            }
            pixels[raster.offset(px, py) + 3] =
                static_cast<uint8_t>(std::lround(std::clamp(accum, 0.0f, 255.0f)));
        }
    }
}

}  // namespace dropshade::effects
