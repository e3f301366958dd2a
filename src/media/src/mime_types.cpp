#include "media/mime_types.hpp"

namespace vt::media::mime {

bool is_video(const std::string& mime_type) {
    return mime_type.rfind("video/", 0) == 0;
}

} // namespace vt::media::mime
