#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include "codec/ffmpeg_codecs.hpp"
#include "core/error.hpp"
#include "fake_pipeline_stages.hpp"
#include "media/mime_types.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
}

using namespace vt;

namespace {

constexpr int kWidth = 64;
constexpr int kHeight = 64;
constexpr int kFrameCount = 5;
constexpr int64_t kFrameDurationUs = 33'333;

media::FramePtr gradient_frame(int index) {
    media::FramePtr frame = media::make_frame();
    frame->format = AV_PIX_FMT_RGBA;
    frame->width = kWidth;
    frame->height = kHeight;
    REQUIRE(av_frame_get_buffer(frame.get(), 32) == 0);
    for(int y = 0; y < kHeight; ++y) {
        uint8_t* row = frame->data[0] + static_cast<ptrdiff_t>(y) * frame->linesize[0];
        for(int x = 0; x < kWidth; ++x) {
            row[4 * x + 0] = static_cast<uint8_t>(x * 4 + index * 16);
            row[4 * x + 1] = static_cast<uint8_t>(y * 4);
            row[4 * x + 2] = static_cast<uint8_t>(index * 40);
            row[4 * x + 3] = 255;
        }
    }
    frame->pts = index * kFrameDurationUs;
    return frame;
}

struct EncodedSample {
    std::vector<uint8_t> data;
    int64_t time_us;
    uint32_t flags;
};

// Moves every ready output buffer out of |encoder|.
void pull_encoded(codec::ICodec& encoder, std::vector<EncodedSample>& out) {
    while(true) {
        const std::vector<uint8_t>* buffer = encoder.get_output_buffer();
        std::optional<codec::BufferInfo> info = encoder.get_output_buffer_info();
        REQUIRE((buffer != nullptr) == info.has_value());
        if(!buffer) return;
        REQUIRE(info->size == static_cast<int>(buffer->size()));
        out.push_back({*buffer, info->presentation_time_us, info->flags});
        encoder.release_output_buffer(false);
    }
}

// Renders every ready decoded frame to the decoder's output surface.
void render_decoded(codec::ICodec& decoder) {
    while(true) {
        const std::vector<uint8_t>* buffer = decoder.get_output_buffer();
        std::optional<codec::BufferInfo> info = decoder.get_output_buffer_info();
        REQUIRE((buffer != nullptr) == info.has_value());
        if(!buffer) return;
        decoder.release_output_buffer(true);
    }
}

media::Format mp4v_format() {
    media::Format format;
    format.sample_mime_type = media::mime::kVideoMp4v;
    format.width = kWidth;
    format.height = kHeight;
    format.frame_rate = 30.0f;
    return format;
}

} // namespace

TEST_CASE("software MPEG-4 round trip through the libavcodec devices", "[codec][ffmpeg]") {
    if(!avcodec_find_encoder(AV_CODEC_ID_MPEG4) || !avcodec_find_decoder(AV_CODEC_ID_MPEG4)) {
        WARN("libavcodec was built without MPEG-4 support");
        return;
    }

    auto encoder = codec::create_ffmpeg_encoder_factory()->create_for_video_encoding(
        mp4v_format(), {media::mime::kVideoMp4v});
    REQUIRE(encoder->configuration_format().sample_mime_type == media::mime::kVideoMp4v);
    REQUIRE(encoder->configuration_format().width == kWidth);
    REQUIRE(encoder->configuration_format().height == kHeight);
    media::SampleBuffer unused;
    REQUIRE_THROWS_AS(encoder->queue_input_buffer(unused), std::logic_error);

    std::vector<EncodedSample> samples;
    for(int i = 0; i < kFrameCount; ++i) {
        encoder->input_surface().queue_frame(gradient_frame(i));
        pull_encoded(*encoder, samples);
    }
    encoder->signal_end_of_input_stream();
    REQUIRE_THROWS_AS(encoder->signal_end_of_input_stream(), std::logic_error);
    pull_encoded(*encoder, samples);
    REQUIRE(encoder->is_ended());
    REQUIRE(samples.size() == kFrameCount);
    REQUIRE((samples.front().flags & media::kBufferFlagKeyFrame) != 0);

    std::optional<media::Format> encoded_format = encoder->get_output_format();
    REQUIRE(encoded_format);
    REQUIRE(encoded_format->width == kWidth);

    media::Format decoder_format = mp4v_format();
    decoder_format.initialization_data = encoded_format->initialization_data;
    testing::RecordingSurface decoded;
    std::vector<std::pair<int, int>> decoded_sizes;
    decoded.on_frame = [&](media::FramePtr frame) { decoded_sizes.emplace_back(frame->width, frame->height); };
    auto decoder = codec::create_ffmpeg_decoder_factory()->create_for_video_decoding(decoder_format, decoded);
    REQUIRE(decoder->configuration_format() == decoder_format);
    REQUIRE_THROWS_AS(decoder->input_surface(), std::logic_error);

    media::SampleBuffer input;
    for(const EncodedSample& sample : samples) {
        while(!decoder->maybe_dequeue_input_buffer(input)) render_decoded(*decoder);
        input.data = sample.data;
        input.time_us = sample.time_us;
        input.set_flags(sample.flags);
        decoder->queue_input_buffer(input);
        render_decoded(*decoder);
    }
    while(!decoder->maybe_dequeue_input_buffer(input)) render_decoded(*decoder);
    input.set_flags(media::kBufferFlagEndOfStream);
    decoder->queue_input_buffer(input);
    REQUIRE_THROWS_AS(decoder->queue_input_buffer(input), std::logic_error);
    REQUIRE_FALSE(decoder->maybe_dequeue_input_buffer(input));

    for(int spins = 0; !decoder->is_ended() && spins < 100; ++spins) render_decoded(*decoder);
    REQUIRE(decoder->is_ended());

    REQUIRE(decoded.timestamps_us.size() == kFrameCount);
    REQUIRE(decoded.timestamps_us.front() == 0);
    for(size_t i = 1; i < decoded.timestamps_us.size(); ++i) {
        REQUIRE(decoded.timestamps_us[i] > decoded.timestamps_us[i - 1]);
    }
    for(const auto& size : decoded_sizes) {
        REQUIRE(size == std::make_pair(kWidth, kHeight));
    }
    std::optional<media::Format> decoded_format = decoder->get_output_format();
    REQUIRE(decoded_format);
    REQUIRE(decoded_format->width == kWidth);
    REQUIRE(decoded_format->height == kHeight);
    REQUIRE_FALSE(decoded_format->hdr);

    decoder->release();
    decoder->release();
    encoder->release();
}

TEST_CASE("factories reject formats they cannot handle", "[codec][ffmpeg]") {
    testing::RecordingSurface surface;
    media::Format unknown;
    unknown.sample_mime_type = "video/x-unknown";
    unknown.width = kWidth;
    unknown.height = kHeight;
    try {
        codec::create_ffmpeg_decoder_factory()->create_for_video_decoding(unknown, surface);
        FAIL("decoder creation did not throw");
    } catch(const TranscodeError& e) {
        REQUIRE(e.code() == ErrorCode::DecoderInitFailed);
    }

    media::Format audio = mp4v_format();
    audio.sample_mime_type = "audio/mp4a-latm";
    try {
        codec::create_ffmpeg_encoder_factory()->create_for_video_encoding(audio, {});
        FAIL("encoder creation did not throw");
    } catch(const TranscodeError& e) {
        REQUIRE(e.code() == ErrorCode::OutputFormatUnsupported);
        REQUIRE(e.is_configuration_error());
    }
}
