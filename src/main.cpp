#include <dropshade/cli/options.h>
#include <dropshade/core/config.h>
#include <dropshade/core/diagnostics.h>
#include <dropshade/engine/engine.h>

#include <iostream>

int main(int argc, char** argv) {
    const dropshade::cli::ParseResult parsed = dropshade::cli::parse_arguments(argc, argv);
    if (!parsed.ok) {
        std::cerr << dropshade::cli::format_parse_error(parsed.error) << "\n";
        dropshade::cli::print_usage(std::cerr);
        return 1;
    }

    const dropshade::cli::Options& options = parsed.options;
    if (options.show_help) {
        dropshade::cli::print_usage(std::cout);
        return 0;
    }
    if (options.show_version) {
        std::cout << dropshade::core::config::kVersionString << "\n";
        return 0;
    }

    std::ios::sync_with_stdio(false);

    dropshade::core::DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(options.verbose ? dropshade::core::Severity::Info
                                                 : dropshade::core::Severity::Warning);
    const bool verbose = options.verbose;
    diagnostics.add_observer([verbose](const dropshade::core::DiagnosticEvent& event) {
        // Failures are reported once, below, unless the full trace was asked for.
        if (event.severity == dropshade::core::Severity::Error && !verbose) {
            return;
        }
        std::cerr << dropshade::core::format_diagnostic(event) << "\n";
    });

    dropshade::engine::ShadowEngine engine(diagnostics);
    const dropshade::engine::EngineResult result = engine.run(options, std::cin, std::cout);

    if (!result.ok) {
        std::cerr << result.message << "\n";
        return 1;
    }

    if (!result.message.empty()) {
        std::cerr << result.message << "\n";
    }
    return 0;
}
