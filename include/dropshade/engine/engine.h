#pragma once

#include <dropshade/cli/options.h>
#include <dropshade/core/diagnostics.h>
#include <dropshade/core/error.h>
#include <dropshade/core/lifecycle.h>
#include <dropshade/image/codec.h>
#include <dropshade/image/raster.h>

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace dropshade::engine {

struct EngineResult {
    bool ok = false;
    std::string message;
    core::Error error;
    image::ImageFormat input_format = image::ImageFormat::Unknown;
    image::Raster output;
    std::vector<std::uint8_t> encoded;
    core::LifecycleTrace trace;
};

// Outer driver: read, decode, run the pipeline, encode, write. The only layer
// that turns errors into a user-facing message.
class ShadowEngine {
public:
    explicit ShadowEngine(core::DiagnosticEmitter& diagnostics);

    // Full run. Input comes from options.input_path or `in`, output goes to
    // options.output_path or `out`.
    EngineResult run(const cli::Options& options, std::istream& in, std::ostream& out);

    // Decode -> pipeline -> encode on an in-memory buffer, no I/O.
    EngineResult process(const std::vector<std::uint8_t>& input, const PipelineConfig& config,
                         image::EncodeFormat format = image::EncodeFormat::Png);

    const core::LifecycleTrace& trace() const;

private:
    core::DiagnosticEmitter& diagnostics_;
    core::LifecycleTrace trace_;

    void begin_run();
    void finish(EngineResult& result);
    EngineResult transform(const std::vector<std::uint8_t>& input, const PipelineConfig& config,
                           image::EncodeFormat format);
    void transition_to(core::LifecycleStage stage, const std::string& detail = {});
    EngineResult& fail(EngineResult& result, core::Error error);
};

}  // namespace dropshade::engine
