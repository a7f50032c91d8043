#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace dropshade::core {

enum class LifecycleStage {
    Idle,
    Reading,
    Decoding,
    Rounding,
    Shadowing,
    Compositing,
    Encoding,
    Writing,
    Complete,
    Error,
};

const char* lifecycle_stage_name(LifecycleStage stage);

struct StageTimingEntry {
    LifecycleStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
};

struct LifecycleTrace {
    std::vector<StageTimingEntry> entries;

    void record(LifecycleStage stage);

    bool contains(LifecycleStage stage) const;
    LifecycleStage last_stage() const;
    double total_elapsed_ms() const;
};

}  // namespace dropshade::core
