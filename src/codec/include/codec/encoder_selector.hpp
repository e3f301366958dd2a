#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vt::codec {

// An encoder implementation able to produce one mime type.
struct EncoderInfo {
    std::string name;
    std::string mime_type;
    bool hardware = false;
    int max_width = 0;
    int max_height = 0;
    // Width and height must be multiples of this.
    int alignment = 2;
};

// Chooses which encoders may be used for a mime type, in priority order.
class IEncoderSelector {
public:
    virtual ~IEncoderSelector() = default;
    virtual std::vector<EncoderInfo> select_encoder_infos(const std::string& mime_type) = 0;
};

// Lists the libavcodec encoders for the mime type: hardware encoders that take
// system memory frames first, then software ones. Size limits come from
// VT_ENCODER_MAX_WIDTH / VT_ENCODER_MAX_HEIGHT.
std::unique_ptr<IEncoderSelector> create_default_encoder_selector();

struct Resolution {
    int width = 0;
    int height = 0;
};

// Closest resolution the encoder supports: scaled down to its maximum size
// preserving the aspect ratio, then aligned down. Empty if nothing fits.
std::optional<Resolution> supported_resolution(const EncoderInfo& encoder, int width, int height);

// The requested mime type if it is allowed and has encoders, else the first
// allowed mime type that has encoders. An empty allow list allows everything.
// Empty if no allowed mime type has an encoder.
std::optional<std::string> supported_mime_type(IEncoderSelector& selector,
                                               const std::string& requested_mime_type,
                                               const std::vector<std::string>& allowed_mime_types);

} // namespace vt::codec
