#pragma once

#include <dropshade/core/config.h>
#include <dropshade/core/diagnostics.h>
#include <dropshade/core/error.h>
#include <dropshade/core/lifecycle.h>
#include <dropshade/effects/shadow_synthesizer.h>
#include <dropshade/image/raster.h>

namespace dropshade::engine {

struct PipelineConfig {
    int corner_radius = core::config::kDefaultCornerRadius;
    effects::ShadowParams shadow;
};

struct PipelineResult {
    bool ok = false;
    image::Raster raster;
    core::Error error;
    core::LifecycleTrace trace;
    int shadow_padding = 0;
};

// Rounds the corners of `source`, builds its shadow and composes both.
// `diagnostics` may be null; when given, every stage reports into it.
PipelineResult run_pipeline(const image::Raster& source, const PipelineConfig& config,
                            core::DiagnosticEmitter* diagnostics = nullptr);

}  // namespace dropshade::engine
