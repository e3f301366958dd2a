#include "codec/codec_ids.hpp"
#include "media/mime_types.hpp"

namespace vt::codec {

namespace {

struct MimeCodec {
    const char* mime;
    AVCodecID id;
};

constexpr MimeCodec kMimeCodecs[] = {
    {media::mime::kVideoH263, AV_CODEC_ID_H263},
    {media::mime::kVideoH264, AV_CODEC_ID_H264},
    {media::mime::kVideoH265, AV_CODEC_ID_HEVC},
    {media::mime::kVideoMp4v, AV_CODEC_ID_MPEG4},
    {media::mime::kVideoVp8, AV_CODEC_ID_VP8},
    {media::mime::kVideoVp9, AV_CODEC_ID_VP9},
    {media::mime::kVideoAv1, AV_CODEC_ID_AV1},
};

} // namespace

AVCodecID codec_id_for_mime(const std::string& mime_type) {
    for(const auto& entry : kMimeCodecs) {
        if(mime_type == entry.mime) return entry.id;
    }
    return AV_CODEC_ID_NONE;
}

std::string mime_for_codec_id(AVCodecID id) {
    for(const auto& entry : kMimeCodecs) {
        if(entry.id == id) return entry.mime;
    }
    return {};
}

std::vector<std::string> known_video_mime_types() {
    std::vector<std::string> mime_types;
    for(const auto& entry : kMimeCodecs) mime_types.emplace_back(entry.mime);
    return mime_types;
}

} // namespace vt::codec
