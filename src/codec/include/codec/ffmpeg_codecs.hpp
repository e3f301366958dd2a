#pragma once
#include <memory>

#include "codec/codec.hpp"
#include "codec/encoder_selector.hpp"

namespace vt::codec {

// libavcodec decoders, preferring hardware decoders (cuvid, v4l2m2m) over
// software ones. Frames are queued to the output surface upright: the input
// rotation hint is applied by the decoder.
std::unique_ptr<IDecoderFactory> create_ffmpeg_decoder_factory();

// libavcodec encoders fed through an input surface. Applies mime type and
// resolution fallback using |selector|, or the default selector if null.
std::unique_ptr<IEncoderFactory> create_ffmpeg_encoder_factory(std::unique_ptr<IEncoderSelector> selector = nullptr);

} // namespace vt::codec
