#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vt::media {

inline constexpr int kLengthUnset = -1;

// Geometry and codec description of a video track, used both for configuring
// codecs and for describing what they actually produce.
struct Format {
    std::string sample_mime_type;
    int width = kLengthUnset;
    int height = kLengthUnset;
    // Clockwise rotation to apply for display. The decoder removes it.
    int rotation_degrees = 0;
    float pixel_width_height_ratio = 1.0f;
    float frame_rate = -1.0f;
    // Codec specific data (e.g. avcC / hvcC), handed to the decoder as extradata.
    std::vector<uint8_t> initialization_data;
    // Set when the track carries a PQ or HLG transfer function.
    bool hdr = false;

    bool has_dimensions() const { return width != kLengthUnset && height != kLengthUnset; }
};

inline bool operator==(const Format& a, const Format& b) {
    return a.sample_mime_type == b.sample_mime_type && a.width == b.width && a.height == b.height
        && a.rotation_degrees == b.rotation_degrees
        && a.pixel_width_height_ratio == b.pixel_width_height_ratio
        && a.frame_rate == b.frame_rate && a.initialization_data == b.initialization_data
        && a.hdr == b.hdr;
}
inline bool operator!=(const Format& a, const Format& b) { return !(a == b); }

std::string to_string(const Format& format);

} // namespace vt::media
