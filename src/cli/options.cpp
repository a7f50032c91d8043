#include <dropshade/cli/options.h>

#include <dropshade/core/config.h>

#include <charconv>
#include <set>
#include <string_view>
#include <system_error>
#include <utility>

namespace dropshade::cli {

namespace {

enum class Flag {
    Input,
    Output,
    Radius,
    Offset,
    Alpha,
    Spread,
    Verbose,
    EdgeFade,
    Help,
    Version,
};

struct FlagSpec {
    Flag flag;
    std::string_view long_name;
    std::string_view short_name;
    bool takes_value;
};

constexpr FlagSpec kFlags[] = {
    {Flag::Input, "--input", "-i", true},
    {Flag::Output, "--output", "-o", true},
    {Flag::Radius, "--radius", "-r", true},
    {Flag::Offset, "--offset", "-e", true},
    {Flag::Alpha, "--alpha", "-a", true},
    {Flag::Spread, "--spread", "-s", true},
    {Flag::Verbose, "--verbose", "-v", false},
    {Flag::EdgeFade, "--edge-fade", "", false},
    {Flag::Help, "--help", "-h", false},
    {Flag::Version, "--version", "-V", false},
};

const FlagSpec* find_flag(std::string_view name) {
    for (const auto& spec : kFlags) {
        if (name == spec.long_name || (!spec.short_name.empty() && name == spec.short_name)) {
            return &spec;
        }
    }
    return nullptr;
}

ParseResult fail(ParseErrorKind kind, std::string_view flag, std::string_view value,
                 std::string message) {
    ParseResult result;
    result.error.kind = kind;
    result.error.flag = std::string(flag);
    result.error.value = std::string(value);
    result.error.message = std::move(message);
    return result;
}

bool parse_int(std::string_view text, int& value) {
    if (text.empty()) {
        return false;
    }
    // from_chars rejects a leading '+'.
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-') return false;
    }

    int parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }

    value = parsed;
    return true;
}

bool parse_offset(std::string_view text, int& x, int& y) {
    const std::size_t separator = text.find(',');
    if (separator == std::string_view::npos ||
        text.find(',', separator + 1) != std::string_view::npos) {
        return false;
    }
    int parsed_x = 0;
    int parsed_y = 0;
    if (!parse_int(text.substr(0, separator), parsed_x) ||
        !parse_int(text.substr(separator + 1), parsed_y)) {
        return false;
    }
    x = parsed_x;
    y = parsed_y;
    return true;
}

}  // namespace

ParseResult parse_arguments(const std::vector<std::string>& args) {
    ParseResult result;
    Options& options = result.options;
    std::set<Flag> seen;

    for (std::size_t index = 0; index < args.size(); ++index) {
        const std::string_view argument(args[index]);

        std::string_view name = argument;
        std::string_view inline_value;
        bool has_inline_value = false;
        if (argument.size() > 2 && argument.compare(0, 2, "--") == 0) {
            const std::size_t eq = argument.find('=');
            if (eq != std::string_view::npos) {
                name = argument.substr(0, eq);
                inline_value = argument.substr(eq + 1);
                has_inline_value = true;
            }
        }

        const FlagSpec* spec = find_flag(name);
        if (spec == nullptr) {
            if (!argument.empty() && argument.front() == '-') {
                return fail(ParseErrorKind::UnknownFlag, argument, {},
                            "unknown flag '" + std::string(argument) + "'");
            }
            return fail(ParseErrorKind::UnexpectedArgument, {}, argument,
                        "unexpected argument '" + std::string(argument) + "'");
        }
        if (!seen.insert(spec->flag).second) {
            return fail(ParseErrorKind::DuplicateFlag, spec->long_name, {},
                        "flag " + std::string(spec->long_name) + " given more than once");
        }

        std::string_view value;
        if (spec->takes_value) {
            if (has_inline_value) {
                value = inline_value;
            } else if (index + 1 < args.size()) {
                value = args[++index];
            } else {
                return fail(ParseErrorKind::MissingValue, spec->long_name, {},
                            std::string(spec->long_name) + " requires a value");
            }
            if (value.empty()) {
                return fail(ParseErrorKind::MissingValue, spec->long_name, {},
                            std::string(spec->long_name) + " requires a value");
            }
        } else if (has_inline_value) {
            return fail(ParseErrorKind::UnexpectedArgument, spec->long_name, inline_value,
                        std::string(spec->long_name) + " does not take a value");
        }

        auto& shadow = options.pipeline.shadow;
        int number = 0;
        switch (spec->flag) {
            case Flag::Input:
                options.input_path = std::string(value);
                break;
            case Flag::Output:
                options.output_path = std::string(value);
                break;
            case Flag::Radius:
                if (!parse_int(value, number)) {
                    return fail(ParseErrorKind::InvalidNumber, spec->long_name, value,
                                "expected an integer, got '" + std::string(value) + "'");
                }
                if (number < 0) {
                    return fail(ParseErrorKind::OutOfRange, spec->long_name, value,
                                "corner radius must not be negative");
                }
                options.pipeline.corner_radius = number;
                break;
            case Flag::Offset:
                if (!parse_offset(value, shadow.offset_x, shadow.offset_y)) {
                    return fail(ParseErrorKind::InvalidOffset, spec->long_name, value,
                                "expected X,Y integers, got '" + std::string(value) + "'");
                }
                break;
            case Flag::Alpha:
                if (!parse_int(value, number)) {
                    return fail(ParseErrorKind::InvalidNumber, spec->long_name, value,
                                "expected an integer, got '" + std::string(value) + "'");
                }
                if (number < 0 || number > 255) {
                    return fail(ParseErrorKind::OutOfRange, spec->long_name, value,
                                "shadow alpha must be within 0-255");
                }
                shadow.alpha = number;
                break;
            case Flag::Spread:
                if (!parse_int(value, number)) {
                    return fail(ParseErrorKind::InvalidNumber, spec->long_name, value,
                                "expected an integer, got '" + std::string(value) + "'");
                }
                if (number < 0) {
                    return fail(ParseErrorKind::OutOfRange, spec->long_name, value,
                                "shadow spread must not be negative");
                }
                shadow.spread = number;
                break;
            case Flag::Verbose:
                options.verbose = true;
                break;
            case Flag::EdgeFade:
                shadow.edge_fade = true;
                break;
            case Flag::Help:
                options.show_help = true;
                break;
            case Flag::Version:
                options.show_version = true;
                break;
        }
    }

    result.ok = true;
    return result;
}

ParseResult parse_arguments(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int index = 1; index < argc; ++index) {
        args.emplace_back(argv[index] != nullptr ? argv[index] : "");
    }
    return parse_arguments(args);
}

std::string format_parse_error(const ParseError& error) {
    std::string text = "Invalid ";
    text += error.flag.empty() ? std::string("argument") : error.flag;
    text += ": ";
    text += error.message;
    return text;
}

void print_usage(std::ostream& stream) {
    namespace config = core::config;
    stream << "usage: " << config::kProgramName << " [options]\n"
           << "\n"
           << "Rounds the corners of an image and adds a soft drop shadow.\n"
           << "\n"
           << "  -i, --input PATH     input image (default: standard input)\n"
           << "  -o, --output PATH    output image (default: PNG on standard output)\n"
           << "  -r, --radius N       corner radius (default: " << config::kDefaultCornerRadius << ")\n"
           << "  -e, --offset X,Y     shadow offset (default: " << config::kDefaultShadowOffsetX
           << "," << config::kDefaultShadowOffsetY << ")\n"
           << "  -a, --alpha N        shadow alpha 0-255 (default: " << config::kDefaultShadowAlpha << ")\n"
           << "  -s, --spread N       shadow spread distance (default: " << config::kDefaultShadowSpread << ")\n"
           << "      --edge-fade      fade the shadow towards its bounding box\n"
           << "  -v, --verbose        print diagnostics to standard error\n"
           << "  -h, --help           show this help\n"
           << "  -V, --version        show the version\n";
}

}  // namespace dropshade::cli
