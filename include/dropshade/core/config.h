#pragma once

#include <cstdint>

namespace dropshade::core::config {

inline constexpr int kDefaultCornerRadius = 8;
inline constexpr int kDefaultShadowOffsetX = -20;
inline constexpr int kDefaultShadowOffsetY = -20;
inline constexpr int kDefaultShadowAlpha = 150;
inline constexpr int kDefaultShadowSpread = 26;

// Not exposed as a flag.
inline constexpr int kDefaultBlurRadius = 5;
inline constexpr int kMaxBlurRadius = 1024;

// Exponent of the post-blur rolloff pass: alpha *= (alpha/255)^exp.
inline constexpr float kDefaultCleanupExponent = 0.5f;
// Exponent of the optional border fade of the shadow layer.
inline constexpr float kDefaultFadeExponent = 2.0f;

// stb_image_write takes int strides, keep width*4 well inside that.
inline constexpr std::int64_t kMaxCanvasDimension = 1 << 16;
// 256 MiB of RGBA per canvas.
inline constexpr std::int64_t kMaxCanvasPixels = std::int64_t{1} << 26;

inline constexpr const char kProgramName[] = "dropshade";
inline constexpr const char kVersionString[] = "dropshade 0.1.0";

}  // namespace dropshade::core::config
