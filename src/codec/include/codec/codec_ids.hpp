#pragma once
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace vt::codec {

// AV_CODEC_ID_NONE if the mime type has no libavcodec counterpart.
AVCodecID codec_id_for_mime(const std::string& mime_type);
// Empty if the codec has no mime type.
std::string mime_for_codec_id(AVCodecID id);
// Every video mime type with a libavcodec counterpart.
std::vector<std::string> known_video_mime_types();

} // namespace vt::codec
