#pragma once
#include <atomic>

namespace vt::transformer {

// Counts decoded frames on their way into the transformer.
//
// A frame is *pending* from the moment the decoder releases it for rendering
// until the input surface delivers it, then *available* until it is rendered.
// Delivery runs on the surface notifier thread; everything else runs on the
// pipeline thread.
class InputFrameTracker {
public:
    // Throws std::logic_error after signal_end_of_input_stream().
    void register_input_frame();

    // Called once per frame by the surface notifier thread.
    void on_frame_delivered();

    bool can_process_data() const { return available_.load() > 0; }

    // Throws std::logic_error if no frame is available.
    void on_frame_processed();

    void signal_end_of_input_stream() { input_ended_.store(true); }

    bool is_ended() const {
        return input_ended_.load() && pending_.load() == 0 && available_.load() == 0;
    }

    int pending() const { return pending_.load(); }
    int available() const { return available_.load(); }

private:
    std::atomic<int> pending_{0};
    std::atomic<int> available_{0};
    std::atomic<bool> input_ended_{false};
};

} // namespace vt::transformer
