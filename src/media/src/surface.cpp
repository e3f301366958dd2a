#include "media/surface.hpp"

#include <new>

namespace vt::media {

FramePtr make_frame() {
    FramePtr frame(av_frame_alloc());
    if(!frame) throw std::bad_alloc();
    return frame;
}

int64_t frame_time_us(const AVFrame& frame) {
    if(frame.best_effort_timestamp != AV_NOPTS_VALUE) return frame.best_effort_timestamp;
    if(frame.pts != AV_NOPTS_VALUE) return frame.pts;
    return 0;
}

} // namespace vt::media
