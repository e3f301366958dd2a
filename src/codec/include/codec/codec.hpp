#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "media/format.hpp"
#include "media/sample_buffer.hpp"
#include "media/surface.hpp"

namespace vt::codec {

// Metadata of the current output buffer of a codec.
struct BufferInfo {
    int64_t presentation_time_us = 0;
    uint32_t flags = 0;
    int size = 0;
};

// A decoder or encoder device. Every call except release() may throw
// TranscodeError (DecodingFailed / EncodingFailed); failures are not retried.
// Misuse (e.g. queueing input after end of stream) throws std::logic_error.
//
// At most one output buffer is current at a time. get_output_buffer() and
// get_output_buffer_info() are either both present or both absent, and the
// buffer must be released before the next one can become current.
class ICodec {
public:
    virtual ~ICodec() = default;

    // The format the device was configured with, after any fallback.
    virtual const media::Format& configuration_format() const = 0;

    // Surface feeding a video encoder. Not valid on decoders.
    virtual media::Surface& input_surface() = 0;

    // Prepares |buffer| for input if the device has capacity. Never blocks.
    // Not valid on a surface-input encoder.
    virtual bool maybe_dequeue_input_buffer(media::SampleBuffer& buffer) = 0;
    // Submits |buffer|. A buffer flagged end-of-stream ends the input.
    virtual void queue_input_buffer(media::SampleBuffer& buffer) = 0;
    // Ends the input of a surface-input video encoder.
    virtual void signal_end_of_input_stream() = 0;

    virtual std::optional<media::Format> get_output_format() = 0;
    virtual const std::vector<uint8_t>* get_output_buffer() = 0;
    virtual std::optional<BufferInfo> get_output_buffer_info() = 0;
    // Releases the current output buffer. With |render| a video decoder pushes
    // the decoded frame onto its output surface.
    virtual void release_output_buffer(bool render) = 0;

    // True once end of stream was reached and all output was released.
    virtual bool is_ended() const = 0;

    // Idempotent.
    virtual void release() = 0;
};

class IDecoderFactory {
public:
    virtual ~IDecoderFactory() = default;
    // Decoded frames are queued to |output_surface|, which must outlive the
    // decoder. Throws TranscodeError(DecoderInitFailed).
    virtual std::unique_ptr<ICodec> create_for_video_decoding(const media::Format& format,
                                                              media::Surface& output_surface) = 0;
};

class IEncoderFactory {
public:
    virtual ~IEncoderFactory() = default;
    // The returned encoder may be configured differently from |format| (mime
    // type and resolution fallback); see ICodec::configuration_format().
    // Throws TranscodeError(EncoderInitFailed / OutputFormatUnsupported).
    virtual std::unique_ptr<ICodec> create_for_video_encoding(const media::Format& format,
                                                              const std::vector<std::string>& allowed_mime_types) = 0;
};

} // namespace vt::codec
