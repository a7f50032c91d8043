#pragma once

#include <dropshade/core/error.h>
#include <dropshade/image/raster.h>

#include <cstdint>
#include <string>
#include <vector>

namespace dropshade::image {

enum class ImageFormat {
    Unknown,
    Png,
    Jpeg,
    Gif,
    Bmp,
    Psd,
    Hdr,
    Pnm,
};

const char* image_format_name(ImageFormat format);

// Sniffs the container from its magic bytes. Formats without a signature
// (TGA) come back as Unknown; decode_image() still tries them.
ImageFormat detect_format(const std::vector<std::uint8_t>& bytes);

struct DecodeResult {
    bool ok = false;
    Raster raster;
    ImageFormat format = ImageFormat::Unknown;
    int source_channels = 0;
    core::Error error;
};

// Decodes any format stb_image understands into RGBA8.
DecodeResult decode_image(const std::vector<std::uint8_t>& bytes);

enum class EncodeFormat {
    Png,
    Bmp,
    Tga,
    Jpeg,
};

const char* encode_format_name(EncodeFormat format);

// Picks the output container from a file extension; anything unrecognised is PNG.
EncodeFormat encode_format_for_path(const std::string& path);

struct EncodeResult {
    bool ok = false;
    std::vector<std::uint8_t> bytes;
    core::Error error;
};

inline constexpr int kJpegQuality = 90;

EncodeResult encode_image(const Raster& raster, EncodeFormat format = EncodeFormat::Png);

}  // namespace dropshade::image
