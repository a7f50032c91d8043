#include <dropshade/engine/pipeline.h>

#include <dropshade/effects/compositor.h>
#include <dropshade/effects/corner_rounder.h>

#include <sstream>
#include <string>
#include <utility>

namespace dropshade::engine {

namespace {

constexpr const char kModule[] = "pipeline";

std::string describe(const image::Raster& raster) {
    std::ostringstream oss;
    oss << raster.width() << "x" << raster.height();
    return oss.str();
}

class StageReporter {
public:
    StageReporter(PipelineResult& result, core::DiagnosticEmitter* diagnostics)
        : result_(result), diagnostics_(diagnostics) {}

    void enter(core::LifecycleStage stage) {
        result_.trace.record(stage);
        stage_ = stage;
    }

    void info(const std::string& message) const {
        if (diagnostics_) {
            diagnostics_->info(kModule, core::lifecycle_stage_name(stage_), message);
        }
    }

    void warning(const std::string& message) const {
        if (diagnostics_) {
            diagnostics_->warning(kModule, core::lifecycle_stage_name(stage_), message);
        }
    }

    PipelineResult& fail(core::Error error) {
        if (diagnostics_) {
            diagnostics_->error(kModule, core::lifecycle_stage_name(stage_),
                                core::format_error(error));
        }
        result_.trace.record(core::LifecycleStage::Error);
        result_.ok = false;
        result_.error = std::move(error);
        result_.raster = {};
        return result_;
    }

private:
    PipelineResult& result_;
    core::DiagnosticEmitter* diagnostics_;
    core::LifecycleStage stage_ = core::LifecycleStage::Idle;
};

}  // namespace

PipelineResult run_pipeline(const image::Raster& source, const PipelineConfig& config,
                            core::DiagnosticEmitter* diagnostics) {
    PipelineResult result;
    StageReporter reporter(result, diagnostics);

    reporter.enter(core::LifecycleStage::Rounding);
    if (source.empty()) {
        return reporter.fail({core::ErrorCode::InvalidDimensions, "source raster is empty"});
    }
    const int radius =
        effects::clamp_corner_radius(config.corner_radius, source.width(), source.height());
    if (radius != config.corner_radius) {
        reporter.warning("corner radius " + std::to_string(config.corner_radius) +
                      " clamped to " + std::to_string(radius));
    }
    image::RasterResult rounded = effects::round_corners(source, radius);
    if (!rounded.ok) {
        return reporter.fail(std::move(rounded.error));
    }
    reporter.info("rounded " + describe(rounded.raster) + " with radius " + std::to_string(radius));

    reporter.enter(core::LifecycleStage::Shadowing);
    effects::ShadowResult shadow = effects::synthesize_shadow(rounded.raster, config.shadow);
    if (!shadow.ok) {
        return reporter.fail(std::move(shadow.error));
    }
    result.shadow_padding = shadow.padding;
    {
        std::ostringstream oss;
        oss << "shadow " << describe(shadow.raster) << " padding=" << shadow.padding
            << " sigma=" << effects::shadow_blur_sigma(config.shadow.spread, config.shadow.blur_radius);
        reporter.info(oss.str());
    }

    reporter.enter(core::LifecycleStage::Compositing);
    image::RasterResult composed = effects::compose(rounded.raster, shadow.raster,
                                                    config.shadow.offset_x, config.shadow.offset_y);
    if (!composed.ok) {
        return reporter.fail(std::move(composed.error));
    }
    reporter.info("composed " + describe(composed.raster) + " at offset " +
                  std::to_string(config.shadow.offset_x) + "," +
                  std::to_string(config.shadow.offset_y));

    reporter.enter(core::LifecycleStage::Complete);
    result.raster = std::move(composed.raster);
    result.ok = true;
    return result;
}

}  // namespace dropshade::engine
