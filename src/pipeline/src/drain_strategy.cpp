#include "pipeline/drain_strategy.hpp"
#include "core/log.hpp"

namespace vt::pipeline {

const char* drain_strategy_name(DrainStrategy strategy) noexcept {
    switch(strategy) {
        case DrainStrategy::Batch: return "batch";
        case DrainStrategy::SingleFrame: return "single-frame";
    }
    return "unknown";
}

PlatformCapabilities PlatformCapabilities::detect() {
    // InputSurfaceTexture keeps an unbounded FIFO of delivered frames.
    PlatformCapabilities caps;
    caps.lossless_surface_backpressure = true;
    return caps;
}

DrainStrategy select_drain_strategy(const PlatformCapabilities& capabilities, DrainStrategyOverride override_mode) {
    switch(override_mode) {
        case DrainStrategyOverride::Batch: return DrainStrategy::Batch;
        case DrainStrategyOverride::SingleFrame: return DrainStrategy::SingleFrame;
        case DrainStrategyOverride::Auto: break;
    }
    return capabilities.lossless_surface_backpressure ? DrainStrategy::Batch : DrainStrategy::SingleFrame;
}

DrainStrategy default_drain_strategy() {
    DrainStrategy strategy = select_drain_strategy(PlatformCapabilities::detect(), vt::config().drain_strategy);
    vt::log::debug(std::string("Drain strategy: ") + drain_strategy_name(strategy));
    return strategy;
}

} // namespace vt::pipeline
