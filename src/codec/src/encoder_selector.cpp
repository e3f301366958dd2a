#include "codec/encoder_selector.hpp"
#include "codec/codec_ids.hpp"
#include "core/config.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace vt::codec {

namespace {

// Hardware encoders that accept frames in system memory.
constexpr const char* kHardwareSuffixes[] = {"_nvenc", "_v4l2m2m"};
// Hardware encoders that need hardware frame uploads, which the encoder
// input surface does not do.
constexpr const char* kUnsupportedSuffixes[] = {"_vaapi", "_qsv", "_amf", "_vulkan", "_mf", "_videotoolbox"};

bool ends_with(const std::string& s, const char* suffix) {
    size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

class DefaultEncoderSelector final : public IEncoderSelector {
public:
    std::vector<EncoderInfo> select_encoder_infos(const std::string& mime_type) override {
        std::vector<EncoderInfo> hardware;
        std::vector<EncoderInfo> software;
        AVCodecID id = codec_id_for_mime(mime_type);
        if(id == AV_CODEC_ID_NONE) return {};

        void* opaque = nullptr;
        while(const AVCodec* codec = av_codec_iterate(&opaque)) {
            if(!av_codec_is_encoder(codec) || codec->id != id || codec->type != AVMEDIA_TYPE_VIDEO) continue;
            std::string name = codec->name;
            bool unsupported = std::any_of(std::begin(kUnsupportedSuffixes), std::end(kUnsupportedSuffixes),
                                           [&](const char* s) { return ends_with(name, s); });
            if(unsupported) continue;

            EncoderInfo info;
            info.name = name;
            info.mime_type = mime_type;
            info.hardware = std::any_of(std::begin(kHardwareSuffixes), std::end(kHardwareSuffixes),
                                        [&](const char* s) { return ends_with(name, s); });
            info.max_width = vt::config().encoder_max_width;
            info.max_height = vt::config().encoder_max_height;
            info.alignment = 2;
            (info.hardware ? hardware : software).push_back(std::move(info));
        }
        hardware.insert(hardware.end(), software.begin(), software.end());
        return hardware;
    }
};

int align_down(int value, int alignment) {
    return alignment > 1 ? value / alignment * alignment : value;
}

} // namespace

std::unique_ptr<IEncoderSelector> create_default_encoder_selector() {
    return std::make_unique<DefaultEncoderSelector>();
}

std::optional<Resolution> supported_resolution(const EncoderInfo& encoder, int width, int height) {
    if(width <= 0 || height <= 0) return std::nullopt;
    double factor = 1.0;
    if(encoder.max_width > 0 && width > encoder.max_width) {
        factor = std::min(factor, static_cast<double>(encoder.max_width) / width);
    }
    if(encoder.max_height > 0 && height > encoder.max_height) {
        factor = std::min(factor, static_cast<double>(encoder.max_height) / height);
    }
    Resolution r;
    r.width = align_down(static_cast<int>(std::floor(width * factor)), encoder.alignment);
    r.height = align_down(static_cast<int>(std::floor(height * factor)), encoder.alignment);
    if(r.width <= 0 || r.height <= 0) return std::nullopt;
    return r;
}

std::optional<std::string> supported_mime_type(IEncoderSelector& selector,
                                               const std::string& requested_mime_type,
                                               const std::vector<std::string>& allowed_mime_types) {
    auto allowed = [&](const std::string& mime) {
        return allowed_mime_types.empty() ||
               std::find(allowed_mime_types.begin(), allowed_mime_types.end(), mime) != allowed_mime_types.end();
    };
    if(allowed(requested_mime_type) && !selector.select_encoder_infos(requested_mime_type).empty()) {
        return requested_mime_type;
    }
    const std::vector<std::string> candidates =
        allowed_mime_types.empty() ? known_video_mime_types() : allowed_mime_types;
    for(const auto& mime : candidates) {
        if(mime == requested_mime_type) continue;
        if(!selector.select_encoder_infos(mime).empty()) {
            vt::log::info("Encoder mime type fallback: " + requested_mime_type + " -> " + mime);
            return mime;
        }
    }
    return std::nullopt;
}

} // namespace vt::codec
