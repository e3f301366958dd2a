#include "pipeline/video_transcoding_pipeline.hpp"
#include "core/debug.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"

namespace vt::pipeline {

TransformerFactory gl_transformer_factory(gfx::IGraphicsContextFactory& context_factory,
                                          transformer::DebugPreviewProvider debug_preview_provider) {
    return [&context_factory, debug_preview_provider](const transformer::FrameTransformerParams& params,
                                                      media::Surface& output_surface) {
        return transformer::create_gl_frame_transformer(params, output_surface, context_factory,
                                                        debug_preview_provider);
    };
}

VideoTranscodingPipeline::VideoTranscodingPipeline(const media::Format& input_format,
                                                   const TransformationRequest& request,
                                                   codec::IDecoderFactory& decoder_factory,
                                                   codec::IEncoderFactory& encoder_factory,
                                                   const TransformerFactory& transformer_factory,
                                                   const std::vector<std::string>& allowed_output_mime_types,
                                                   const FallbackListener& fallback_listener,
                                                   DrainStrategy drain_strategy)
    : drain_strategy_(drain_strategy) {
    const OutputGeometry geometry = derive_output_geometry(input_format, request);
    output_rotation_degrees_ = geometry.output_rotation_degrees;
    vt::log::debug("Output geometry: decoded " + std::to_string(geometry.decoded_width) + "x" +
                   std::to_string(geometry.decoded_height) + ", output " + std::to_string(geometry.output_width) +
                   "x" + std::to_string(geometry.output_height) + ", rotation " +
                   std::to_string(output_rotation_degrees_));

    encoder_ = encoder_factory.create_for_video_encoding(geometry.requested_encoder_format, allowed_output_mime_types);
    const media::Format& granted = encoder_->configuration_format();

    TransformationRequest fallback = create_fallback_transformation_request(
        request, /* resolution_is_height= */ geometry.swapped_for_encoder, geometry.requested_encoder_format, granted);
    if(fallback != request) {
        vt::log::info("Transformation request adjusted to encoder: " + to_string(fallback));
    }
    if(fallback_listener) fallback_listener(fallback);

    if(needs_frame_transformer(geometry, request, granted)) {
        check_state(static_cast<bool>(transformer_factory), "A frame transformer is needed but no factory was given");
        transformer::FrameTransformerParams params;
        params.output_width = granted.width;
        params.output_height = granted.height;
        params.pixel_width_height_ratio = input_format.pixel_width_height_ratio;
        params.transformation_matrix = geometry.transformation_matrix;
        params.enable_hdr_editing = request.enable_hdr_editing;
        transformer_ = transformer_factory(params, encoder_->input_surface());
    }

    decoder_output_ = transformer_ ? &transformer_->input_surface() : &encoder_->input_surface();
    decoder_ = decoder_factory.create_for_video_decoding(input_format, *decoder_output_);
    vt::log::info(std::string("Video pipeline ready: ") + media::to_string(input_format) + " -> " +
                  media::to_string(granted) + (transformer_ ? " via frame transformer" : " direct") +
                  ", " + drain_strategy_name(drain_strategy_) + " drain");
}

VideoTranscodingPipeline::~VideoTranscodingPipeline() {
    release();
}

media::SampleBuffer* VideoTranscodingPipeline::dequeue_input_buffer() {
    return decoder_->maybe_dequeue_input_buffer(decoder_input_buffer_) ? &decoder_input_buffer_ : nullptr;
}

void VideoTranscodingPipeline::queue_input_buffer() {
    decoder_->queue_input_buffer(decoder_input_buffer_);
}

bool VideoTranscodingPipeline::process_data() {
    if(has_processed_all_input_data()) {
        // The transformer can end on the call after the decoder's end was
        // seen, so the encoder may not have been told yet.
        signal_end_of_input_stream();
        return false;
    }
    VT_PROFILE_SCOPE("pipeline.process_data");
    return drain_strategy_ == DrainStrategy::Batch ? process_data_batch() : process_data_single_frame();
}

bool VideoTranscodingPipeline::process_data_batch() {
    media::Surface& encoder_input = encoder_->input_surface();
    if(transformer_) {
        // Stops while the encoder holds its maximum of unread samples.
        while(transformer_->can_process_data() && encoder_input.can_accept_frame()) {
            transformer_->process_data();
        }
    }

    while(decoder_output_->can_accept_frame() && decoder_->get_output_buffer_info()) {
        if(transformer_) {
            transformer_->register_input_frame();
        }
        decoder_->release_output_buffer(/* render= */ true);
    }
    if(decoder_->is_ended()) {
        signal_end_of_input_stream();
    }

    return transformer_ && transformer_->can_process_data() && encoder_input.can_accept_frame();
}

bool VideoTranscodingPipeline::process_data_single_frame() {
    VT_ASSERT(transformer_ || !waiting_for_transformer_input_);
    if(transformer_) {
        if(transformer_->can_process_data()) {
            if(!encoder_->input_surface().can_accept_frame()) {
                return false;
            }
            waiting_for_transformer_input_ = false;
            transformer_->process_data();
            return true;
        }
        if(waiting_for_transformer_input_) {
            return false;
        }
    }

    const bool decoder_has_output_buffer =
        decoder_output_->can_accept_frame() && decoder_->get_output_buffer_info().has_value();
    if(decoder_has_output_buffer) {
        if(transformer_) {
            transformer_->register_input_frame();
            waiting_for_transformer_input_ = true;
        }
        decoder_->release_output_buffer(/* render= */ true);
    }
    if(decoder_->is_ended()) {
        signal_end_of_input_stream();
        return false;
    }
    return decoder_has_output_buffer && !waiting_for_transformer_input_;
}

std::optional<media::Format> VideoTranscodingPipeline::get_output_format() {
    std::optional<media::Format> format = encoder_->get_output_format();
    if(format) {
        format->rotation_degrees = output_rotation_degrees_;
    }
    return format;
}

media::SampleBuffer* VideoTranscodingPipeline::get_output_buffer() {
    const std::vector<uint8_t>* data = encoder_->get_output_buffer();
    if(!data) {
        return nullptr;
    }
    std::optional<codec::BufferInfo> info = encoder_->get_output_buffer_info();
    check_state(info.has_value(), "Encoder output buffer without buffer info");
    encoder_output_buffer_.data = *data;
    encoder_output_buffer_.time_us = info->presentation_time_us;
    encoder_output_buffer_.set_flags(info->flags);
    return &encoder_output_buffer_;
}

void VideoTranscodingPipeline::release_output_buffer() {
    encoder_->release_output_buffer(/* render= */ false);
}

bool VideoTranscodingPipeline::is_ended() const {
    return encoder_->is_ended();
}

void VideoTranscodingPipeline::release() {
    if(released_) return;
    released_ = true;
    if(transformer_) {
        transformer_->release();
    }
    if(decoder_) {
        decoder_->release();
    }
    if(encoder_) {
        encoder_->release();
    }
    vt::log::debug("Video pipeline released");
    prof::Accumulator::instance().log_summary();
}

bool VideoTranscodingPipeline::has_processed_all_input_data() const {
    return decoder_->is_ended() && (!transformer_ || transformer_->is_ended());
}

void VideoTranscodingPipeline::signal_end_of_input_stream() {
    if(transformer_) {
        transformer_->signal_end_of_input_stream();
    }
    if((!transformer_ || transformer_->is_ended()) && !encoder_end_of_input_signaled_) {
        encoder_end_of_input_signaled_ = true;
        vt::log::debug("Signaling end of input to the encoder");
        encoder_->signal_end_of_input_stream();
    }
}

} // namespace vt::pipeline
