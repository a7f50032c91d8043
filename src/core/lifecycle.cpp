#include <dropshade/core/lifecycle.h>

#include <algorithm>

namespace dropshade::core {

const char* lifecycle_stage_name(LifecycleStage stage) {
    switch (stage) {
        case LifecycleStage::Idle:        return "idle";
        case LifecycleStage::Reading:     return "reading";
        case LifecycleStage::Decoding:    return "decoding";
        case LifecycleStage::Rounding:    return "rounding";
        case LifecycleStage::Shadowing:   return "shadowing";
        case LifecycleStage::Compositing: return "compositing";
        case LifecycleStage::Encoding:    return "encoding";
        case LifecycleStage::Writing:     return "writing";
        case LifecycleStage::Complete:    return "complete";
        case LifecycleStage::Error:       return "error";
    }
    return "unknown";
}

void LifecycleTrace::record(LifecycleStage stage) {
    StageTimingEntry entry;
    entry.stage = stage;
    entry.entered_at = std::chrono::steady_clock::now();
    entry.elapsed_since_prev_ms = 0.0;

    if (!entries.empty()) {
        const auto delta = entry.entered_at - entries.back().entered_at;
        entry.elapsed_since_prev_ms =
            std::chrono::duration<double, std::milli>(delta).count();
    }

    entries.push_back(entry);
}

bool LifecycleTrace::contains(LifecycleStage stage) const {
    return std::any_of(entries.begin(), entries.end(),
                       [stage](const StageTimingEntry& e) { return e.stage == stage; });
}

LifecycleStage LifecycleTrace::last_stage() const {
    if (entries.empty()) {
        return LifecycleStage::Idle;
    }
    return entries.back().stage;
}

double LifecycleTrace::total_elapsed_ms() const {
    double total = 0.0;
    for (const auto& e : entries) {
        total += e.elapsed_since_prev_ms;
    }
    return total;
}

}  // namespace dropshade::core
