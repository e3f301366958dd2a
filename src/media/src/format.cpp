#include "media/format.hpp"

#include <sstream>

namespace vt::media {

std::string to_string(const Format& format) {
    std::ostringstream oss;
    oss << (format.sample_mime_type.empty() ? "<no mime>" : format.sample_mime_type)
        << ' ' << format.width << 'x' << format.height
        << " rot=" << format.rotation_degrees;
    if(format.pixel_width_height_ratio != 1.0f) oss << " par=" << format.pixel_width_height_ratio;
    if(format.frame_rate > 0) oss << " fps=" << format.frame_rate;
    if(format.hdr) oss << " hdr";
    return oss.str();
}

} // namespace vt::media
