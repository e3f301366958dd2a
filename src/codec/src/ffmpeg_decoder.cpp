#include "codec/ffmpeg_codecs.hpp"
#include "codec/codec_ids.hpp"
#include "codec/frame_rotation.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"

#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/hwcontext.h>
#include <libavutil/mem.h>
#include <libswscale/swscale.h>
}

namespace vt::codec {

namespace {

constexpr const char* kHardwareDecoderSuffixes[] = {"_cuvid", "_v4l2m2m"};

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

struct AVPacketDeleter {
    void operator()(AVPacket* p) const { av_packet_free(&p); }
};
using PacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;

const AVCodec* find_decoder(AVCodecID id) {
    const AVCodec* software = avcodec_find_decoder(id);
    if(!software) return nullptr;
    for(const char* suffix : kHardwareDecoderSuffixes) {
        std::string name = std::string(software->name) + suffix;
        if(const AVCodec* hw = avcodec_find_decoder_by_name(name.c_str())) {
            return hw;
        }
    }
    return software;
}

class FfmpegDecoder final : public ICodec {
public:
    FfmpegDecoder(const media::Format& format, media::Surface& output_surface)
        : format_(format), output_surface_(output_surface) {
        AVCodecID id = codec_id_for_mime(format.sample_mime_type);
        if(id == AV_CODEC_ID_NONE) {
            throw TranscodeError(ErrorCode::DecoderInitFailed, "No decoder for mime type " + format.sample_mime_type);
        }
        packet_.reset(av_packet_alloc());
        if(!packet_) throw TranscodeError(ErrorCode::DecoderInitFailed, "Failed to allocate packet");
        open(find_decoder(id), id);
        rotation_ = ((format.rotation_degrees % 360) + 360) % 360;
    }

    ~FfmpegDecoder() override { release(); }

    const media::Format& configuration_format() const override { return format_; }

    media::Surface& input_surface() override {
        throw std::logic_error("Decoders have no input surface");
    }

    bool maybe_dequeue_input_buffer(media::SampleBuffer& buffer) override {
        if(input_ended_) return false;
        if(has_pending_packet_ && !send_pending_packet()) return false;
        buffer.clear();
        return true;
    }

    void queue_input_buffer(media::SampleBuffer& buffer) override {
        check_state(!input_ended_, "Input buffer queued after end of stream");
        check_state(!has_pending_packet_, "Input buffer queued without capacity");
        if(buffer.is_end_of_stream()) {
            input_ended_ = true;
            int ret = avcodec_send_packet(ctx_, nullptr);
            if(ret < 0 && ret != AVERROR_EOF) {
                throw TranscodeError(ErrorCode::DecodingFailed, "Failed to signal end of stream: " + av_error_string(ret));
            }
            vt::log::debug("Decoder input ended");
            return;
        }
        av_packet_unref(packet_.get());
        if(av_new_packet(packet_.get(), static_cast<int>(buffer.data.size())) < 0) {
            throw TranscodeError(ErrorCode::DecodingFailed, "Failed to allocate packet");
        }
        if(!buffer.data.empty()) std::memcpy(packet_->data, buffer.data.data(), buffer.data.size());
        packet_->pts = buffer.time_us;
        packet_->dts = AV_NOPTS_VALUE;
        if(buffer.is_key_frame()) packet_->flags |= AV_PKT_FLAG_KEY;
        has_pending_packet_ = true;
        send_pending_packet();
    }

    void signal_end_of_input_stream() override {
        check_state(false, "Decoders end their input with an end of stream buffer");
    }

    std::optional<media::Format> get_output_format() override {
        if(!output_format_ && !receive_frame()) return std::nullopt;
        return output_format_;
    }

    const std::vector<uint8_t>* get_output_buffer() override {
        return receive_frame() ? &empty_buffer_ : nullptr;
    }

    std::optional<BufferInfo> get_output_buffer_info() override {
        if(!receive_frame()) return std::nullopt;
        BufferInfo info;
        info.presentation_time_us = media::frame_time_us(*current_frame_);
        return info;
    }

    void release_output_buffer(bool render) override {
        check_state(current_frame_ != nullptr, "No output buffer to release");
        media::FramePtr frame = std::move(current_frame_);
        if(!render) return;
        VT_PROFILE_SCOPE("decoder.render");
        const int64_t pts = media::frame_time_us(*frame);
        if(rotation_ != 0) {
            frame = rotate_frame(*frame, rotation_, rotate_sws_);
        }
        frame->pts = pts;
        output_surface_.queue_frame(std::move(frame));
    }

    bool is_ended() const override { return output_ended_ && !current_frame_; }

    void release() override {
        current_frame_.reset();
        packet_.reset();
        if(ctx_) {
            avcodec_free_context(&ctx_);
            vt::log::debug("Decoder released");
        }
        if(rotate_sws_) {
            sws_freeContext(rotate_sws_);
            rotate_sws_ = nullptr;
        }
    }

private:
    void open(const AVCodec* codec, AVCodecID id) {
        if(!codec) {
            throw TranscodeError(ErrorCode::DecoderInitFailed, std::string("No decoder for ") + avcodec_get_name(id));
        }
        ctx_ = avcodec_alloc_context3(codec);
        if(!ctx_) throw TranscodeError(ErrorCode::DecoderInitFailed, "Failed to allocate decoder context");
        if(format_.has_dimensions()) {
            ctx_->width = format_.width;
            ctx_->height = format_.height;
        }
        ctx_->pkt_timebase = AVRational{1, 1000000};
        if(!format_.initialization_data.empty()) {
            size_t size = format_.initialization_data.size();
            ctx_->extradata = static_cast<uint8_t*>(av_mallocz(size + AV_INPUT_BUFFER_PADDING_SIZE));
            if(!ctx_->extradata) {
                avcodec_free_context(&ctx_);
                throw TranscodeError(ErrorCode::DecoderInitFailed, "Failed to allocate extradata");
            }
            std::memcpy(ctx_->extradata, format_.initialization_data.data(), size);
            ctx_->extradata_size = static_cast<int>(size);
        }
        int ret = avcodec_open2(ctx_, codec, nullptr);
        if(ret < 0) {
            avcodec_free_context(&ctx_);
            const AVCodec* software = avcodec_find_decoder(id);
            if(software && software != codec) {
                vt::log::warn(std::string("Decoder ") + codec->name + " failed to open (" + av_error_string(ret) +
                              "), falling back to " + software->name);
                open(software, id);
                return;
            }
            throw TranscodeError(ErrorCode::DecoderInitFailed,
                                 std::string("Failed to open decoder ") + codec->name + ": " + av_error_string(ret));
        }
        vt::log::info(std::string("Decoder selected: ") + codec->name + " for " + format_.sample_mime_type);
    }

    // Returns false if the device has no capacity; the packet stays pending.
    bool send_pending_packet() {
        int ret = avcodec_send_packet(ctx_, packet_.get());
        if(ret == AVERROR(EAGAIN)) return false;
        if(ret < 0) throw TranscodeError(ErrorCode::DecodingFailed, "Failed to decode packet: " + av_error_string(ret));
        av_packet_unref(packet_.get());
        has_pending_packet_ = false;
        return true;
    }

    // Makes a decoded frame current if one is ready.
    bool receive_frame() {
        if(current_frame_) return true;
        if(output_ended_) return false;
        media::FramePtr frame = media::make_frame();
        int ret = avcodec_receive_frame(ctx_, frame.get());
        if(ret == AVERROR(EAGAIN)) {
            if(has_pending_packet_) send_pending_packet();
            return false;
        }
        if(ret == AVERROR_EOF) {
            output_ended_ = true;
            vt::log::debug("Decoder output ended");
            return false;
        }
        if(ret < 0) throw TranscodeError(ErrorCode::DecodingFailed, "Failed to receive frame: " + av_error_string(ret));

        if(frame->hw_frames_ctx) {
            media::FramePtr sw = media::make_frame();
            ret = av_hwframe_transfer_data(sw.get(), frame.get(), 0);
            if(ret < 0) {
                throw TranscodeError(ErrorCode::DecodingFailed, "Failed to transfer hardware frame: " + av_error_string(ret));
            }
            av_frame_copy_props(sw.get(), frame.get());
            frame = std::move(sw);
        }
        if(!output_format_) {
            media::Format out;
            out.sample_mime_type = format_.sample_mime_type;
            out.width = frame->width;
            out.height = frame->height;
            out.frame_rate = format_.frame_rate;
            out.pixel_width_height_ratio = format_.pixel_width_height_ratio;
            out.hdr = format_.hdr || frame->color_trc == AVCOL_TRC_SMPTE2084
                      || frame->color_trc == AVCOL_TRC_ARIB_STD_B67;
            output_format_ = out;
        }
        current_frame_ = std::move(frame);
        return true;
    }

    media::Format format_;
    media::Surface& output_surface_;
    AVCodecContext* ctx_ = nullptr;
    PacketPtr packet_;
    bool has_pending_packet_ = false;
    bool input_ended_ = false;
    bool output_ended_ = false;
    int rotation_ = 0;
    SwsContext* rotate_sws_ = nullptr;
    media::FramePtr current_frame_;
    std::optional<media::Format> output_format_;
    const std::vector<uint8_t> empty_buffer_;
};

class FfmpegDecoderFactory final : public IDecoderFactory {
public:
    std::unique_ptr<ICodec> create_for_video_decoding(const media::Format& format,
                                                      media::Surface& output_surface) override {
        return std::make_unique<FfmpegDecoder>(format, output_surface);
    }
};

} // namespace

std::unique_ptr<IDecoderFactory> create_ffmpeg_decoder_factory() {
    return std::make_unique<FfmpegDecoderFactory>();
}

} // namespace vt::codec
