#include "codec/ffmpeg_codecs.hpp"
#include "codec/codec_ids.hpp"
#include "media/mime_types.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"

#include <deque>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
#include <libavutil/pixdesc.h>
#include <libavutil/rational.h>
#include <libswscale/swscale.h>
}

namespace vt::codec {

namespace {

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Encoded samples held for the caller before the input surface reports full.
constexpr size_t kMaxPendingOutputPackets = 8;

constexpr AVRational kMicrosecondTimeBase{1, 1000000};

// MPEG-4 part 2 and H.263 limit the time base denominator to 16 bits.
AVRational encoder_time_base(AVCodecID id) {
    if(id == AV_CODEC_ID_MPEG4 || id == AV_CODEC_ID_H263) return AVRational{1, 60000};
    return kMicrosecondTimeBase;
}

struct AVPacketDeleter {
    void operator()(AVPacket* p) const { av_packet_free(&p); }
};
using PacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;

AVPixelFormat pick_pixel_format(const AVCodec* codec, bool hdr) {
    if(!codec->pix_fmts) return AV_PIX_FMT_YUV420P;
    if(hdr) {
        for(const AVPixelFormat* p = codec->pix_fmts; *p != AV_PIX_FMT_NONE; ++p) {
            if(*p == AV_PIX_FMT_YUV420P10LE || *p == AV_PIX_FMT_P010LE) return *p;
        }
        vt::log::warn(std::string(codec->name) + " has no 10-bit input, HDR output loses precision");
    }
    for(const AVPixelFormat* p = codec->pix_fmts; *p != AV_PIX_FMT_NONE; ++p) {
        if(*p == AV_PIX_FMT_YUV420P) return *p;
    }
    return codec->pix_fmts[0];
}

class FfmpegEncoder;

// Frames queued here are converted to the encoder pixel format and submitted
// to the encoder right away.
class EncoderInputSurface final : public media::Surface {
public:
    explicit EncoderInputSurface(FfmpegEncoder& encoder) : encoder_(encoder) {}
    void queue_frame(media::FramePtr frame) override;
    bool can_accept_frame() const override;

private:
    FfmpegEncoder& encoder_;
};

class FfmpegEncoder final : public ICodec {
public:
    FfmpegEncoder(const media::Format& format, const AVCodec* codec)
        : format_(format), input_surface_(*this) {
        packet_.reset(av_packet_alloc());
        if(!packet_) throw TranscodeError(ErrorCode::EncoderInitFailed, "Failed to allocate packet");
        ctx_ = avcodec_alloc_context3(codec);
        if(!ctx_) throw TranscodeError(ErrorCode::EncoderInitFailed, "Failed to allocate encoder context");

        ctx_->width = format.width;
        ctx_->height = format.height;
        ctx_->pix_fmt = pick_pixel_format(codec, format.hdr);
        if(format.hdr) {
            ctx_->color_primaries = AVCOL_PRI_BT2020;
            ctx_->color_trc = AVCOL_TRC_SMPTE2084;
            ctx_->colorspace = AVCOL_SPC_BT2020_NCL;
        }
        ctx_->time_base = encoder_time_base(codec->id);
        if(format.frame_rate > 0) ctx_->framerate = av_d2q(format.frame_rate, 1000);
        ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

        int ret = avcodec_open2(ctx_, codec, nullptr);
        if(ret < 0) {
            avcodec_free_context(&ctx_);
            throw TranscodeError(ErrorCode::EncoderInitFailed,
                                 std::string("Failed to open encoder ") + codec->name + ": " + av_error_string(ret));
        }
        output_format_.sample_mime_type = format.sample_mime_type;
        output_format_.width = ctx_->width;
        output_format_.height = ctx_->height;
        output_format_.frame_rate = format.frame_rate;
        output_format_.hdr = format.hdr;
        if(ctx_->extradata && ctx_->extradata_size > 0) {
            output_format_.initialization_data.assign(ctx_->extradata, ctx_->extradata + ctx_->extradata_size);
        }
        vt::log::info(std::string("Encoder selected: ") + codec->name + " " + std::to_string(format.width) + "x" +
                      std::to_string(format.height) + " " + av_get_pix_fmt_name(ctx_->pix_fmt));
    }

    ~FfmpegEncoder() override { release(); }

    const media::Format& configuration_format() const override { return format_; }

    media::Surface& input_surface() override { return input_surface_; }

    bool maybe_dequeue_input_buffer(media::SampleBuffer&) override {
        throw std::logic_error("Video encoders take their input from the input surface");
    }

    void queue_input_buffer(media::SampleBuffer&) override {
        throw std::logic_error("Video encoders take their input from the input surface");
    }

    void signal_end_of_input_stream() override {
        check_state(!input_ended_, "Encoder input already ended");
        input_ended_ = true;
        send(nullptr);
        vt::log::debug("Encoder input ended");
    }

    std::optional<media::Format> get_output_format() override { return output_format_; }

    const std::vector<uint8_t>* get_output_buffer() override {
        return next_packet() ? &current_->data : nullptr;
    }

    std::optional<BufferInfo> get_output_buffer_info() override {
        if(!next_packet()) return std::nullopt;
        BufferInfo info;
        info.presentation_time_us = current_->time_us;
        info.flags = current_->flags;
        info.size = static_cast<int>(current_->data.size());
        return info;
    }

    void release_output_buffer(bool) override {
        check_state(current_.has_value(), "No output buffer to release");
        current_.reset();
    }

    bool is_ended() const override { return output_ended_ && !current_ && packets_.empty(); }

    bool has_output_capacity() const { return packets_.size() < kMaxPendingOutputPackets; }

    void release() override {
        packets_.clear();
        current_.reset();
        packet_.reset();
        converted_.reset();
        if(sws_) {
            sws_freeContext(sws_);
            sws_ = nullptr;
        }
        if(ctx_) {
            avcodec_free_context(&ctx_);
            vt::log::debug("Encoder released");
        }
    }

    void encode(media::FramePtr frame) {
        check_state(ctx_ != nullptr, "Frame queued to a released encoder");
        check_state(!input_ended_, "Frame queued to the encoder after end of input");
        VT_PROFILE_SCOPE("encoder.encode");
        const int64_t pts = frame->pts;
        AVFrame* input = frame.get();
        if(frame->format != ctx_->pix_fmt || frame->width != ctx_->width || frame->height != ctx_->height) {
            input = convert(*frame);
        }
        input->pts = pts == AV_NOPTS_VALUE ? AV_NOPTS_VALUE : av_rescale_q(pts, kMicrosecondTimeBase, ctx_->time_base);
        send(input);
    }

private:
    struct Packet {
        std::vector<uint8_t> data;
        int64_t time_us = 0;
        uint32_t flags = 0;
    };

    AVFrame* convert(const AVFrame& frame) {
        sws_ = sws_getCachedContext(sws_, frame.width, frame.height, static_cast<AVPixelFormat>(frame.format),
                                    ctx_->width, ctx_->height, ctx_->pix_fmt, SWS_BICUBIC, nullptr, nullptr, nullptr);
        if(!sws_) throw TranscodeError(ErrorCode::EncodingFailed, "Unable to create encoder input converter");
        // The encoder may keep a reference to the previous frame.
        converted_ = media::make_frame();
        converted_->format = ctx_->pix_fmt;
        converted_->width = ctx_->width;
        converted_->height = ctx_->height;
        if(av_frame_get_buffer(converted_.get(), 32) < 0) {
            throw TranscodeError(ErrorCode::EncodingFailed, "Unable to allocate encoder input frame");
        }
        sws_scale(sws_, frame.data, frame.linesize, 0, frame.height, converted_->data, converted_->linesize);
        converted_->color_primaries = frame.color_primaries;
        converted_->color_trc = frame.color_trc;
        converted_->colorspace = frame.colorspace;
        return converted_.get();
    }

    // Submits |frame| (nullptr flushes), draining output while the device is full.
    void send(const AVFrame* frame) {
        while(true) {
            int ret = avcodec_send_frame(ctx_, frame);
            if(ret == AVERROR(EAGAIN)) {
                size_t before = packets_.size();
                drain_packets();
                if(packets_.size() == before && !output_ended_) {
                    throw TranscodeError(ErrorCode::EncodingFailed, "Encoder refused input without producing output");
                }
                continue;
            }
            if(ret < 0 && !(frame == nullptr && ret == AVERROR_EOF)) {
                throw TranscodeError(ErrorCode::EncodingFailed, "Failed to encode frame: " + av_error_string(ret));
            }
            break;
        }
        drain_packets();
    }

    void drain_packets() {
        while(!output_ended_) {
            int ret = avcodec_receive_packet(ctx_, packet_.get());
            if(ret == AVERROR(EAGAIN)) return;
            if(ret == AVERROR_EOF) {
                output_ended_ = true;
                vt::log::debug("Encoder output ended");
                return;
            }
            if(ret < 0) throw TranscodeError(ErrorCode::EncodingFailed, "Failed to receive packet: " + av_error_string(ret));
            Packet p;
            p.data.assign(packet_->data, packet_->data + packet_->size);
            p.time_us = packet_->pts == AV_NOPTS_VALUE
                            ? 0
                            : av_rescale_q(packet_->pts, ctx_->time_base, kMicrosecondTimeBase);
            if(packet_->flags & AV_PKT_FLAG_KEY) p.flags |= media::kBufferFlagKeyFrame;
            packets_.push_back(std::move(p));
            av_packet_unref(packet_.get());
        }
    }

    bool next_packet() {
        if(current_) return true;
        if(packets_.empty() && ctx_) drain_packets();
        if(packets_.empty()) return false;
        current_ = std::move(packets_.front());
        packets_.pop_front();
        return true;
    }

    media::Format format_;
    media::Format output_format_;
    EncoderInputSurface input_surface_;
    AVCodecContext* ctx_ = nullptr;
    PacketPtr packet_;
    SwsContext* sws_ = nullptr;
    media::FramePtr converted_;
    std::deque<Packet> packets_;
    std::optional<Packet> current_;
    bool input_ended_ = false;
    bool output_ended_ = false;
};

void EncoderInputSurface::queue_frame(media::FramePtr frame) {
    encoder_.encode(std::move(frame));
}

bool EncoderInputSurface::can_accept_frame() const {
    return encoder_.has_output_capacity();
}

class FfmpegEncoderFactory final : public IEncoderFactory {
public:
    explicit FfmpegEncoderFactory(std::unique_ptr<IEncoderSelector> selector) : selector_(std::move(selector)) {}

    std::unique_ptr<ICodec> create_for_video_encoding(const media::Format& format,
                                                      const std::vector<std::string>& allowed_mime_types) override {
        if(!format.has_dimensions() || format.sample_mime_type.empty()) {
            throw TranscodeError(ErrorCode::EncoderInitFailed, "Incomplete encoder format: " + media::to_string(format));
        }
        if(!media::mime::is_video(format.sample_mime_type)) {
            throw TranscodeError(ErrorCode::OutputFormatUnsupported, "Not a video mime type: " + format.sample_mime_type);
        }
        auto mime = supported_mime_type(*selector_, format.sample_mime_type, allowed_mime_types);
        if(!mime) {
            throw TranscodeError(ErrorCode::OutputFormatUnsupported,
                                 "No allowed encoder for mime type " + format.sample_mime_type);
        }

        std::string last_error = "no encoder supports " + std::to_string(format.width) + "x" + std::to_string(format.height);
        for(const EncoderInfo& info : selector_->select_encoder_infos(*mime)) {
            auto resolution = supported_resolution(info, format.width, format.height);
            if(!resolution) continue;
            const AVCodec* codec = avcodec_find_encoder_by_name(info.name.c_str());
            if(!codec) continue;

            media::Format configured = format;
            configured.sample_mime_type = *mime;
            configured.width = resolution->width;
            configured.height = resolution->height;
            configured.rotation_degrees = 0;
            try {
                auto encoder = std::make_unique<FfmpegEncoder>(configured, codec);
                if(configured.width != format.width || configured.height != format.height) {
                    vt::log::info("Encoder resolution fallback: " + std::to_string(format.width) + "x" +
                                  std::to_string(format.height) + " -> " + std::to_string(configured.width) + "x" +
                                  std::to_string(configured.height));
                }
                return encoder;
            } catch(const TranscodeError& e) {
                vt::log::warn(e.what());
                last_error = e.what();
            }
        }
        throw TranscodeError(ErrorCode::EncoderInitFailed, "No usable encoder for " + *mime + ": " + last_error);
    }

private:
    std::unique_ptr<IEncoderSelector> selector_;
};

} // namespace

std::unique_ptr<IEncoderFactory> create_ffmpeg_encoder_factory(std::unique_ptr<IEncoderSelector> selector) {
    if(!selector) selector = create_default_encoder_selector();
    return std::make_unique<FfmpegEncoderFactory>(std::move(selector));
}

} // namespace vt::codec
