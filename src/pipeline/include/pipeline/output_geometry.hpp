#pragma once
#include "gfx/matrix.hpp"
#include "media/format.hpp"
#include "pipeline/transformation_request.hpp"

namespace vt::pipeline {

struct OutputGeometry {
    // Input size after the decoder removed the rotation hint.
    int decoded_width = 0;
    int decoded_height = 0;
    // Size of the transformed frames, before any encoder swap.
    int output_width = 0;
    int output_height = 0;
    // 90 if width and height were swapped for the encoder, else 0.
    int output_rotation_degrees = 0;
    bool swapped_for_encoder = false;
    // Request matrix adapted to the decoded aspect ratio, recentered and
    // rescaled to fill the output, including the swap rotation.
    gfx::Matrix transformation_matrix;
    // Mime type, size and zero rotation to request from the encoder.
    media::Format requested_encoder_format;
};

// Computes the frame geometry for transcoding |input| as |request| asks.
// Encoders commonly support larger widths than heights, so portrait output is
// encoded as landscape and tagged with a 90 degree rotation.
OutputGeometry derive_output_geometry(const media::Format& input, const TransformationRequest& request);

// Returns |request| unchanged if the encoder granted the requested mime type
// and controlling dimension (height if the encoder swap happened, else width),
// or a copy carrying the granted mime type and controlling dimension.
TransformationRequest create_fallback_transformation_request(const TransformationRequest& request,
                                                             bool resolution_is_height,
                                                             const media::Format& requested_format,
                                                             const media::Format& granted_format);

// Whether the GPU stage is needed, or the decoder can render straight into
// the encoder input surface.
bool needs_frame_transformer(const OutputGeometry& geometry,
                             const TransformationRequest& request,
                             const media::Format& granted_format);

} // namespace vt::pipeline
