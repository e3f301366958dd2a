#include "pipeline/output_geometry.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>

namespace vt::pipeline {

namespace {

int round_to_int(float value) {
    return static_cast<int>(std::floor(value + 0.5f));
}

} // namespace

std::string to_string(const TransformationRequest& request) {
    std::ostringstream oss;
    oss << "TransformationRequest{matrix=" << request.transformation_matrix.to_string()
        << ", output_height=" << request.output_height
        << ", hdr=" << (request.enable_hdr_editing ? "true" : "false")
        << ", mime=" << (request.video_mime_type.empty() ? "<input>" : request.video_mime_type) << "}";
    return oss.str();
}

OutputGeometry derive_output_geometry(const media::Format& input, const TransformationRequest& request) {
    OutputGeometry g;
    const bool rotated = input.rotation_degrees % 180 != 0;
    g.decoded_width = rotated ? input.height : input.width;
    g.decoded_height = rotated ? input.width : input.height;
    const float decoded_aspect_ratio = static_cast<float>(g.decoded_width) / static_cast<float>(g.decoded_height);

    gfx::Matrix matrix = request.transformation_matrix;
    int output_width = g.decoded_width;
    int output_height = g.decoded_height;
    if(!matrix.is_identity()) {
        // Operate on a rectangle spanning x in [-aspect, aspect] and y in
        // [-1, 1] so rotations keep the displayed shape of input pixels.
        matrix.pre_scale(decoded_aspect_ratio, 1.0f);
        matrix.post_scale(1.0f / decoded_aspect_ratio, 1.0f);

        std::array<gfx::Point, 4> corners = {{{-1, -1}, {-1, 1}, {1, -1}, {1, 1}}};
        matrix.map_points(corners);
        float x_min = std::numeric_limits<float>::max();
        float x_max = std::numeric_limits<float>::lowest();
        float y_min = std::numeric_limits<float>::max();
        float y_max = std::numeric_limits<float>::lowest();
        for(const auto& p : corners) {
            x_min = std::min(x_min, p.x);
            x_max = std::max(x_max, p.x);
            y_min = std::min(y_min, p.y);
            y_max = std::max(y_max, p.y);
        }

        matrix.post_translate(-(x_max + x_min) / 2.0f, -(y_max + y_min) / 2.0f);

        constexpr float kNdcWidthAndHeight = 2.0f;
        const float x_scale = (x_max - x_min) / kNdcWidthAndHeight;
        const float y_scale = (y_max - y_min) / kNdcWidthAndHeight;
        matrix.post_scale(1.0f / x_scale, 1.0f / y_scale);
        output_width = round_to_int(static_cast<float>(g.decoded_width) * x_scale);
        output_height = round_to_int(static_cast<float>(g.decoded_height) * y_scale);
    }

    if(request.output_height != media::kLengthUnset && request.output_height != output_height) {
        output_width = round_to_int(static_cast<float>(request.output_height) * static_cast<float>(output_width)
                                    / static_cast<float>(output_height));
        output_height = request.output_height;
    }
    g.output_width = output_width;
    g.output_height = output_height;

    int encoder_width = output_width;
    int encoder_height = output_height;
    g.swapped_for_encoder = output_height > output_width;
    if(g.swapped_for_encoder) {
        g.output_rotation_degrees = 90;
        encoder_width = output_height;
        encoder_height = output_width;
        matrix.post_rotate(90.0f);
    }
    g.transformation_matrix = matrix;

    g.requested_encoder_format.sample_mime_type =
        request.video_mime_type.empty() ? input.sample_mime_type : request.video_mime_type;
    g.requested_encoder_format.width = encoder_width;
    g.requested_encoder_format.height = encoder_height;
    g.requested_encoder_format.rotation_degrees = 0;
    g.requested_encoder_format.frame_rate = input.frame_rate;
    // HDR editing renders BT.2020 PQ, so the encoder must tag it as such.
    g.requested_encoder_format.hdr = request.enable_hdr_editing;
    return g;
}

TransformationRequest create_fallback_transformation_request(const TransformationRequest& request,
                                                             bool resolution_is_height,
                                                             const media::Format& requested_format,
                                                             const media::Format& granted_format) {
    const bool same_resolution = resolution_is_height ? requested_format.height == granted_format.height
                                                      : requested_format.width == granted_format.width;
    if(requested_format.sample_mime_type == granted_format.sample_mime_type && same_resolution) {
        return request;
    }
    TransformationRequest fallback = request;
    fallback.video_mime_type = granted_format.sample_mime_type;
    fallback.output_height = resolution_is_height ? granted_format.height : granted_format.width;
    return fallback;
}

bool needs_frame_transformer(const OutputGeometry& geometry,
                             const TransformationRequest& request,
                             const media::Format& granted_format) {
    return request.enable_hdr_editing
        || granted_format.height != geometry.decoded_height
        || granted_format.width != geometry.decoded_width
        || !geometry.transformation_matrix.is_identity();
}

} // namespace vt::pipeline
