#pragma once

#include <dropshade/engine/pipeline.h>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dropshade::cli {

struct Options {
    std::optional<std::string> input_path;   // stdin when empty
    std::optional<std::string> output_path;  // stdout when empty
    engine::PipelineConfig pipeline;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

enum class ParseErrorKind {
    None,
    UnknownFlag,
    MissingValue,
    InvalidNumber,
    OutOfRange,
    InvalidOffset,
    DuplicateFlag,
    UnexpectedArgument,
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string flag;
    std::string value;
    std::string message;
};

struct ParseResult {
    bool ok = false;
    Options options;
    ParseError error;
};

// Accepts "--flag value", "--flag=value" and the short forms "-f value".
ParseResult parse_arguments(const std::vector<std::string>& args);
ParseResult parse_arguments(int argc, const char* const* argv);

std::string format_parse_error(const ParseError& error);

void print_usage(std::ostream& stream);

}  // namespace dropshade::cli
