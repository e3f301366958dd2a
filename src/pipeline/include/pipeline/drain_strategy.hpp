#pragma once
#include "core/config.hpp"

namespace vt::pipeline {

// How the pipeline moves decoded frames through the transformer.
enum class DrainStrategy {
    // Drain everything available each cycle. Needs a transformer input
    // surface that never drops frames and applies backpressure.
    Batch,
    // At most one frame in flight between decoder and transformer.
    SingleFrame,
};

const char* drain_strategy_name(DrainStrategy strategy) noexcept;

struct PlatformCapabilities {
    // The transformer input surface queues every rendered frame instead of
    // keeping only the latest one.
    bool lossless_surface_backpressure = true;

    static PlatformCapabilities detect();
};

DrainStrategy select_drain_strategy(const PlatformCapabilities& capabilities, DrainStrategyOverride override_mode);

// Strategy for this process: detected capabilities, unless VT_DRAIN_STRATEGY
// forces one.
DrainStrategy default_drain_strategy();

} // namespace vt::pipeline
