#pragma once
#include <functional>
#include <string>

#include "gfx/matrix.hpp"
#include "media/format.hpp"

namespace vt::pipeline {

// What the caller asks the video pipeline to produce.
struct TransformationRequest {
    // Applied to frames in normalized device coordinates.
    gfx::Matrix transformation_matrix;
    // Output height in pixels, or kLengthUnset to keep the transformed height.
    int output_height = media::kLengthUnset;
    bool enable_hdr_editing = false;
    // Empty keeps the input mime type.
    std::string video_mime_type;
};

inline bool operator==(const TransformationRequest& a, const TransformationRequest& b) {
    return a.transformation_matrix == b.transformation_matrix && a.output_height == b.output_height
        && a.enable_hdr_editing == b.enable_hdr_editing && a.video_mime_type == b.video_mime_type;
}
inline bool operator!=(const TransformationRequest& a, const TransformationRequest& b) { return !(a == b); }

std::string to_string(const TransformationRequest& request);

// Receives the request as adjusted to what the encoder granted. Called once
// per pipeline, during construction.
using FallbackListener = std::function<void(const TransformationRequest&)>;

} // namespace vt::pipeline
