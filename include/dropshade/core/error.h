#pragma once

#include <string>

namespace dropshade::core {

enum class ErrorCode {
    None,
    InvalidDimensions,
    UnsupportedRadius,
    BlurParameterOutOfRange,
    EmptyInput,
    ReadFailed,
    UnsupportedFormat,
    DecodeFailed,
    EncodeFailed,
    WriteFailed,
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    bool is_error() const { return code != ErrorCode::None; }
};

// "<code name>: <message>"
std::string format_error(const Error& error);

}  // namespace dropshade::core
