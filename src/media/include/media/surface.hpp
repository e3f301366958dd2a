#pragma once
#include <cstdint>
#include <memory>

extern "C" {
#include <libavutil/frame.h>
}

namespace vt::media {

struct AVFrameDeleter {
    void operator()(AVFrame* f) const { av_frame_free(&f); }
};
using FramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;

// Allocates an empty frame. Throws std::bad_alloc on failure.
FramePtr make_frame();

// Presentation time in microseconds: the best effort timestamp if set, else
// pts, else 0 for frames without any timestamp.
int64_t frame_time_us(const AVFrame& frame);

// Opaque hand-off point for raw video frames between pipeline stages (decoder ->
// transformer, decoder/transformer -> encoder) without an explicit copy by the
// producer. Frames carry their presentation time in AVFrame::pts (microseconds).
class Surface {
public:
    virtual ~Surface() = default;

    // Hands one frame to whatever consumes this surface. Takes ownership.
    // Frames are never dropped, even past capacity.
    virtual void queue_frame(FramePtr frame) = 0;

    // False while the consumer holds as many frames as it buffers. Producers
    // hold frames back until it turns true again.
    virtual bool can_accept_frame() const { return true; }
};

} // namespace vt::media
