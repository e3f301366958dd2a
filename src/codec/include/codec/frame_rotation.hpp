#pragma once
#include "media/surface.hpp"

extern "C" {
#include <libavutil/pixfmt.h>
}

struct SwsContext;

namespace vt::codec {

// Packed format rotated frames are produced in. Sources deeper than 8 bits
// keep 10 bits per channel, everything else becomes RGBA.
AVPixelFormat upright_pixel_format(AVPixelFormat source);

// Returns a copy of |src| rotated clockwise by |degrees| (0, 90, 180 or 270),
// converted to upright_pixel_format(). |sws| is a cached converter owned by
// the caller. Throws TranscodeError(DecodingFailed) on conversion failure.
media::FramePtr rotate_frame(const AVFrame& src, int degrees, SwsContext*& sws);

} // namespace vt::codec
