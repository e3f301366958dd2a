#include "codec/frame_rotation.hpp"
#include "core/error.hpp"

#include <cstddef>
#include <cstdint>

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

namespace vt::codec {

namespace {

media::FramePtr alloc_frame(AVPixelFormat format, int width, int height) {
    media::FramePtr frame = media::make_frame();
    frame->format = format;
    frame->width = width;
    frame->height = height;
    if(av_frame_get_buffer(frame.get(), 32) < 0) {
        throw TranscodeError(ErrorCode::DecodingFailed, "Unable to allocate rotation buffer");
    }
    return frame;
}

} // namespace

AVPixelFormat upright_pixel_format(AVPixelFormat source) {
    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(source);
    if(desc && desc->comp[0].depth > 8) return AV_PIX_FMT_X2BGR10LE;
    return AV_PIX_FMT_RGBA;
}

media::FramePtr rotate_frame(const AVFrame& src, int degrees, SwsContext*& sws) {
    const auto src_format = static_cast<AVPixelFormat>(src.format);
    const AVPixelFormat format = upright_pixel_format(src_format);

    // Both target formats are 32 bits per pixel, so the rotation copies words.
    const AVFrame* packed = &src;
    media::FramePtr converted;
    if(src_format != format) {
        sws = sws_getCachedContext(sws, src.width, src.height, src_format,
                                   src.width, src.height, format, SWS_BILINEAR, nullptr, nullptr, nullptr);
        if(!sws) throw TranscodeError(ErrorCode::DecodingFailed, "Unable to create rotation converter");
        converted = alloc_frame(format, src.width, src.height);
        sws_scale(sws, src.data, src.linesize, 0, src.height, converted->data, converted->linesize);
        packed = converted.get();
    }

    const bool swap = degrees % 180 != 0;
    const int w = src.width;
    const int h = src.height;
    media::FramePtr dst = alloc_frame(format, swap ? h : w, swap ? w : h);
    av_frame_copy_props(dst.get(), &src);

    for(int y = 0; y < dst->height; ++y) {
        uint32_t* out = reinterpret_cast<uint32_t*>(dst->data[0] + static_cast<ptrdiff_t>(y) * dst->linesize[0]);
        for(int x = 0; x < dst->width; ++x) {
            int sx = x;
            int sy = y;
            switch(degrees) {
                case 90: sx = y; sy = h - 1 - x; break;
                case 180: sx = w - 1 - x; sy = h - 1 - y; break;
                case 270: sx = w - 1 - y; sy = x; break;
                default: break;
            }
            const uint32_t* in = reinterpret_cast<const uint32_t*>(packed->data[0] + static_cast<ptrdiff_t>(sy) * packed->linesize[0]);
            out[x] = in[sx];
        }
    }
    return dst;
}

} // namespace vt::codec
