#include <dropshade/engine/engine.h>

#include <dropshade/engine/pipeline.h>
#include <dropshade/io/byte_stream.h>

#include <string>
#include <utility>

namespace dropshade::engine {

namespace {

constexpr const char kModule[] = "engine";

}  // namespace

ShadowEngine::ShadowEngine(core::DiagnosticEmitter& diagnostics)
    : diagnostics_(diagnostics) {}

const core::LifecycleTrace& ShadowEngine::trace() const {
    return trace_;
}

void ShadowEngine::transition_to(core::LifecycleStage stage, const std::string& detail) {
    trace_.record(stage);
    if (!detail.empty()) {
        diagnostics_.info(kModule, core::lifecycle_stage_name(stage), detail);
    }
}

EngineResult& ShadowEngine::fail(EngineResult& result, core::Error error) {
    const core::LifecycleStage stage = trace_.last_stage();
    diagnostics_.error(kModule, core::lifecycle_stage_name(stage), core::format_error(error));
    trace_.record(core::LifecycleStage::Error);

    result.ok = false;
    result.message = "Error: " + error.message;
    result.error = std::move(error);
    result.output = {};
    result.encoded.clear();
    result.trace = trace_;
    return result;
}

void ShadowEngine::begin_run() {
    trace_ = {};
    diagnostics_.set_run_id(diagnostics_.run_id() + 1);
    trace_.record(core::LifecycleStage::Idle);
}

void ShadowEngine::finish(EngineResult& result) {
    trace_.record(core::LifecycleStage::Complete);
    diagnostics_.info(kModule, core::lifecycle_stage_name(core::LifecycleStage::Complete),
                      "finished in " + std::to_string(trace_.total_elapsed_ms()) + " ms");
    result.trace = trace_;
}

EngineResult ShadowEngine::process(const std::vector<std::uint8_t>& input,
                                   const PipelineConfig& config,
                                   image::EncodeFormat format) {
    begin_run();
    EngineResult result = transform(input, config, format);
    if (result.ok) {
        finish(result);
    }
    return result;
}

EngineResult ShadowEngine::transform(const std::vector<std::uint8_t>& input,
                                     const PipelineConfig& config,
                                     image::EncodeFormat format) {
    EngineResult result;
    transition_to(core::LifecycleStage::Decoding,
                  "input data size: " + std::to_string(input.size()) + " bytes");
    result.input_format = image::detect_format(input);
    diagnostics_.info(kModule, "decoding",
                      std::string("guessed image format: ") +
                      image::image_format_name(result.input_format));

    image::DecodeResult decoded = image::decode_image(input);
    if (!decoded.ok) {
        return fail(result, std::move(decoded.error));
    }
    diagnostics_.info(kModule, "decoding",
                      "decoded " + std::to_string(decoded.raster.width()) + "x" +
                      std::to_string(decoded.raster.height()) + " image with " +
                      std::to_string(decoded.source_channels) + " channel(s)");

    PipelineResult pipeline = run_pipeline(decoded.raster, config, &diagnostics_);
    for (const auto& entry : pipeline.trace.entries) {
        // The engine records its own terminal stage.
        if (entry.stage != core::LifecycleStage::Complete &&
            entry.stage != core::LifecycleStage::Error) {
            trace_.entries.push_back(entry);
        }
    }
    if (!pipeline.ok) {
        return fail(result, std::move(pipeline.error));
    }

    transition_to(core::LifecycleStage::Encoding,
                  std::string("encoding as ") + image::encode_format_name(format));
    image::EncodeResult encoded = image::encode_image(pipeline.raster, format);
    if (!encoded.ok) {
        return fail(result, std::move(encoded.error));
    }

    result.ok = true;
    result.output = std::move(pipeline.raster);
    result.encoded = std::move(encoded.bytes);
    result.trace = trace_;
    return result;
}

EngineResult ShadowEngine::run(const cli::Options& options, std::istream& in, std::ostream& out) {
    begin_run();
    EngineResult result;

    transition_to(core::LifecycleStage::Reading,
                  options.input_path ? "reading " + *options.input_path
                                     : std::string("reading standard input"));
    io::ReadResult input = options.input_path ? io::read_file(*options.input_path)
                                              : io::read_stream(in);
    if (!input.ok) {
        if (input.error.code == core::ErrorCode::EmptyInput && !options.input_path) {
            input.error.message =
                "No input data received. Make sure you're piping an image to this program.";
        }
        return fail(result, std::move(input.error));
    }
    diagnostics_.info(kModule, "reading", "read " + std::to_string(input.bytes.size()) + " bytes");

    const image::EncodeFormat format = options.output_path
                                           ? image::encode_format_for_path(*options.output_path)
                                           : image::EncodeFormat::Png;
    result = transform(input.bytes, options.pipeline, format);
    if (!result.ok) {
        return result;
    }

    transition_to(core::LifecycleStage::Writing,
                  "writing " + std::to_string(result.encoded.size()) + " bytes");
    core::Error written = options.output_path ? io::write_file(*options.output_path, result.encoded)
                                              : io::write_stream(out, result.encoded);
    if (written.is_error()) {
        return fail(result, std::move(written));
    }

    finish(result);
    if (options.output_path) {
        result.message = "Image with rounded corners and drop shadow saved as: " + *options.output_path;
    }
    return result;
}

}  // namespace dropshade::engine
