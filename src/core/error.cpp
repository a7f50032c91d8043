#include <dropshade/core/error.h>

namespace dropshade::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                    return "none";
        case ErrorCode::InvalidDimensions:       return "invalid-dimensions";
        case ErrorCode::UnsupportedRadius:       return "unsupported-radius";
        case ErrorCode::BlurParameterOutOfRange: return "blur-parameter-out-of-range";
        case ErrorCode::EmptyInput:              return "empty-input";
        case ErrorCode::ReadFailed:              return "read-failed";
        case ErrorCode::UnsupportedFormat:       return "unsupported-format";
        case ErrorCode::DecodeFailed:            return "decode-failed";
        case ErrorCode::EncodeFailed:            return "encode-failed";
        case ErrorCode::WriteFailed:             return "write-failed";
    }
    return "unknown";
}

std::string format_error(const Error& error) {
    std::string text = error_code_name(error.code);
    if (!error.message.empty()) {
        text += ": ";
        text += error.message;
    }
    return text;
}

}  // namespace dropshade::core
