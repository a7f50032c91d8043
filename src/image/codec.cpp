#include <dropshade/image/codec.h>

#include <stb_image.h>
#include <stb_image_write.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>
#include <string>
#include <utility>

namespace dropshade::image {

namespace {

bool starts_with_bytes(const std::vector<std::uint8_t>& bytes, const char* magic, std::size_t length) {
    return bytes.size() >= length && std::memcmp(bytes.data(), magic, length) == 0;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    const auto* begin = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), begin, begin + size);
}

}  // namespace

const char* image_format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::Unknown: return "unknown";
        case ImageFormat::Png:     return "png";
        case ImageFormat::Jpeg:    return "jpeg";
        case ImageFormat::Gif:     return "gif";
        case ImageFormat::Bmp:     return "bmp";
        case ImageFormat::Psd:     return "psd";
        case ImageFormat::Hdr:     return "hdr";
        case ImageFormat::Pnm:     return "pnm";
    }
    return "unknown";
}

ImageFormat detect_format(const std::vector<std::uint8_t>& bytes) {
    if (starts_with_bytes(bytes, "\x89PNG\r\n\x1a\n", 8)) return ImageFormat::Png;
    if (starts_with_bytes(bytes, "\xFF\xD8\xFF", 3)) return ImageFormat::Jpeg;
    if (starts_with_bytes(bytes, "GIF87a", 6) || starts_with_bytes(bytes, "GIF89a", 6)) {
        return ImageFormat::Gif;
    }
    if (starts_with_bytes(bytes, "BM", 2)) return ImageFormat::Bmp;
    if (starts_with_bytes(bytes, "8BPS", 4)) return ImageFormat::Psd;
    if (starts_with_bytes(bytes, "#?RADIANCE", 10) || starts_with_bytes(bytes, "#?RGBE", 6)) {
        return ImageFormat::Hdr;
    }
    // P5 (graymap) and P6 (pixmap) are the binary PNM variants stb reads.
    if (bytes.size() >= 2 && bytes[0] == 'P' && (bytes[1] == '5' || bytes[1] == '6')) {
        return ImageFormat::Pnm;
    }
    return ImageFormat::Unknown;
}

DecodeResult decode_image(const std::vector<std::uint8_t>& bytes) {
    DecodeResult result;
    result.format = detect_format(bytes);

    if (bytes.empty()) {
        result.error = {core::ErrorCode::EmptyInput, "no input data received"};
        return result;
    }
    if (bytes.size() > static_cast<std::size_t>(INT_MAX)) {
        result.error = {core::ErrorCode::DecodeFailed, "input is too large to decode"};
        return result;
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(
        bytes.data(), static_cast<int>(bytes.size()),
        &w, &h, &channels, 4  // force RGBA
    );

    if (!data) {
        const char* reason = stbi_failure_reason();
        const std::string detail = reason ? reason : "unknown error";
        if (result.format == ImageFormat::Unknown) {
            result.error = {core::ErrorCode::UnsupportedFormat,
                            "unrecognised image format (" + detail + ")"};
        } else {
            result.error = {core::ErrorCode::DecodeFailed,
                            std::string("failed to decode ") + image_format_name(result.format) +
                            " image (" + detail + ")"};
        }
        return result;
    }

    std::vector<std::uint8_t> pixels(data, data + Raster::byte_count(w, h));
    stbi_image_free(data);

    result.raster = Raster::from_rgba(w, h, std::move(pixels));
    if (result.raster.empty()) {
        result.error = {core::ErrorCode::InvalidDimensions,
                        "decoded image has zero width or height"};
        return result;
    }
    result.source_channels = channels;
    result.ok = true;
    return result;
}

const char* encode_format_name(EncodeFormat format) {
    switch (format) {
        case EncodeFormat::Png:  return "png";
        case EncodeFormat::Bmp:  return "bmp";
        case EncodeFormat::Tga:  return "tga";
        case EncodeFormat::Jpeg: return "jpeg";
    }
    return "png";
}

EncodeFormat encode_format_for_path(const std::string& path) {
    const auto dot = path.find_last_of('.');
    const auto slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return EncodeFormat::Png;
    }
    const std::string ext = to_lower(path.substr(dot + 1));
    if (ext == "bmp") return EncodeFormat::Bmp;
    if (ext == "tga") return EncodeFormat::Tga;
    if (ext == "jpg" || ext == "jpeg") return EncodeFormat::Jpeg;
    return EncodeFormat::Png;
}

EncodeResult encode_image(const Raster& raster, EncodeFormat format) {
    EncodeResult result;
    if (raster.empty()) {
        result.error = {core::ErrorCode::InvalidDimensions, "cannot encode an empty raster"};
        return result;
    }

    const int w = raster.width();
    const int h = raster.height();
    const void* data = raster.pixels().data();
    int written = 0;
    switch (format) {
        case EncodeFormat::Png:
            written = stbi_write_png_to_func(append_to_vector, &result.bytes, w, h, 4, data, w * 4);
            break;
        case EncodeFormat::Bmp:
            written = stbi_write_bmp_to_func(append_to_vector, &result.bytes, w, h, 4, data);
            break;
        case EncodeFormat::Tga:
            written = stbi_write_tga_to_func(append_to_vector, &result.bytes, w, h, 4, data);
            break;
        case EncodeFormat::Jpeg:
            written = stbi_write_jpg_to_func(append_to_vector, &result.bytes, w, h, 4, data, kJpegQuality);
            break;
    }

    if (written == 0 || result.bytes.empty()) {
        result.bytes.clear();
        result.error = {core::ErrorCode::EncodeFailed,
                        std::string("failed to encode ") + encode_format_name(format)};
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace dropshade::image
