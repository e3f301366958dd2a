#include "transformer/input_frame_tracker.hpp"
#include "core/error.hpp"
#include "core/log.hpp"

namespace vt::transformer {

void InputFrameTracker::register_input_frame() {
    check_state(!input_ended_.load(), "Input frame registered after end of input stream");
    pending_.fetch_add(1);
}

void InputFrameTracker::on_frame_delivered() {
    int before = pending_.fetch_sub(1);
    if(before <= 0) {
        // Runs on the notifier thread, so report instead of throwing or
        // asserting, in every build.
        pending_.fetch_add(1);
        vt::log::error("Frame delivered without a registered input frame");
        return;
    }
    available_.fetch_add(1);
}

void InputFrameTracker::on_frame_processed() {
    check_state(available_.load() > 0, "No input frame available to process");
    available_.fetch_sub(1);
}

} // namespace vt::transformer
