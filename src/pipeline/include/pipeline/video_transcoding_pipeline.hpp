#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "codec/codec.hpp"
#include "media/format.hpp"
#include "media/sample_buffer.hpp"
#include "pipeline/drain_strategy.hpp"
#include "pipeline/output_geometry.hpp"
#include "pipeline/transformation_request.hpp"
#include "transformer/frame_transformer.hpp"

namespace vt::gfx { class IGraphicsContextFactory; }

namespace vt::pipeline {

using TransformerFactory = std::function<std::unique_ptr<transformer::IFrameTransformer>(
    const transformer::FrameTransformerParams& params, media::Surface& output_surface)>;

// Builds GL frame transformers on |context_factory|, which must outlive every
// pipeline using the returned factory.
TransformerFactory gl_transformer_factory(gfx::IGraphicsContextFactory& context_factory,
                                          transformer::DebugPreviewProvider debug_preview_provider = {});

// Transcodes one video track: decoder -> optional frame transformer -> encoder.
//
// Driven by a single thread. Compressed input goes in through
// dequeue_input_buffer() / queue_input_buffer(), process_data() moves frames
// towards the encoder, and encoded samples come out through
// get_output_buffer() / release_output_buffer().
class VideoTranscodingPipeline {
public:
    // Creates the encoder, then the transformer if needed, then the decoder.
    // Throws TranscodeError on failure; anything already created is released.
    VideoTranscodingPipeline(const media::Format& input_format,
                             const TransformationRequest& request,
                             codec::IDecoderFactory& decoder_factory,
                             codec::IEncoderFactory& encoder_factory,
                             const TransformerFactory& transformer_factory,
                             const std::vector<std::string>& allowed_output_mime_types,
                             const FallbackListener& fallback_listener,
                             DrainStrategy drain_strategy);
    ~VideoTranscodingPipeline();

    VideoTranscodingPipeline(const VideoTranscodingPipeline&) = delete;
    VideoTranscodingPipeline& operator=(const VideoTranscodingPipeline&) = delete;

    // Decoder input buffer to fill, or nullptr if the decoder has no capacity.
    media::SampleBuffer* dequeue_input_buffer();
    void queue_input_buffer();

    // Returns whether calling again right away may make more progress. Returns
    // false while the encoder output is full; pull samples with
    // get_output_buffer() to resume.
    bool process_data();

    // Encoder output format tagged with the output rotation.
    std::optional<media::Format> get_output_format();
    media::SampleBuffer* get_output_buffer();
    void release_output_buffer();
    bool is_ended() const;

    // Releases the transformer, decoder and encoder, in that order. Idempotent.
    void release();

    int output_rotation_degrees() const { return output_rotation_degrees_; }
    DrainStrategy drain_strategy() const { return drain_strategy_; }
    bool has_frame_transformer() const { return transformer_ != nullptr; }

private:
    bool process_data_batch();
    bool process_data_single_frame();
    bool has_processed_all_input_data() const;
    void signal_end_of_input_stream();

    DrainStrategy drain_strategy_;
    int output_rotation_degrees_ = 0;
    media::SampleBuffer decoder_input_buffer_;
    media::SampleBuffer encoder_output_buffer_;

    // Declared so that destruction releases the decoder before the surfaces
    // it renders onto.
    std::unique_ptr<codec::ICodec> encoder_;
    std::unique_ptr<transformer::IFrameTransformer> transformer_;
    std::unique_ptr<codec::ICodec> decoder_;
    // Transformer input, or the encoder input when there is no transformer.
    media::Surface* decoder_output_ = nullptr;

    bool waiting_for_transformer_input_ = false;
    bool encoder_end_of_input_signaled_ = false;
    bool released_ = false;
};

} // namespace vt::pipeline
