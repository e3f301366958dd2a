#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include "pipeline/output_geometry.hpp"
#include "media/mime_types.hpp"

using namespace vt;
using namespace vt::pipeline;

namespace {

media::Format input(int width, int height, int rotation = 0) {
    media::Format f;
    f.sample_mime_type = media::mime::kVideoH264;
    f.width = width;
    f.height = height;
    f.rotation_degrees = rotation;
    return f;
}

bool approx(float a, float b) {
    return std::fabs(a - b) <= 1e-4f;
}

} // namespace

TEST_CASE("identity transform keeps the decoded size", "[geometry]") {
    OutputGeometry g = derive_output_geometry(input(1920, 1080), TransformationRequest{});
    REQUIRE(g.output_width == 1920);
    REQUIRE(g.output_height == 1080);
    REQUIRE(g.output_rotation_degrees == 0);
    REQUIRE(g.transformation_matrix.is_identity());
    REQUIRE(g.requested_encoder_format.width == 1920);
    REQUIRE(g.requested_encoder_format.height == 1080);
    REQUIRE(g.requested_encoder_format.sample_mime_type == media::mime::kVideoH264);

    media::Format granted = g.requested_encoder_format;
    REQUIRE_FALSE(needs_frame_transformer(g, TransformationRequest{}, granted));
}

TEST_CASE("rotation hint swaps the decoded size", "[geometry]") {
    OutputGeometry g = derive_output_geometry(input(1080, 1920, 90), TransformationRequest{});
    REQUIRE(g.decoded_width == 1920);
    REQUIRE(g.decoded_height == 1080);
    REQUIRE(g.output_width == 1920);
    REQUIRE(g.output_height == 1080);
    REQUIRE(g.output_rotation_degrees == 0);
    REQUIRE_FALSE(g.swapped_for_encoder);

    OutputGeometry upside_down = derive_output_geometry(input(1920, 1080, 180), TransformationRequest{});
    REQUIRE(upside_down.decoded_width == 1920);
    REQUIRE(upside_down.decoded_height == 1080);
}

TEST_CASE("requested output height scales the width", "[geometry]") {
    TransformationRequest request;
    request.output_height = 540;
    OutputGeometry g = derive_output_geometry(input(1920, 1080), request);
    REQUIRE(g.output_width == 960);
    REQUIRE(g.output_height == 540);
    REQUIRE(g.output_rotation_degrees == 0);

    TransformationRequest same;
    same.output_height = 1080;
    OutputGeometry unchanged = derive_output_geometry(input(1920, 1080), same);
    REQUIRE(unchanged.output_width == 1920);
}

TEST_CASE("quarter rotation is encoded landscape with a rotation tag", "[geometry]") {
    TransformationRequest request;
    request.transformation_matrix = gfx::Matrix::rotate(90.0f);
    OutputGeometry g = derive_output_geometry(input(1920, 1080), request);

    REQUIRE(g.output_width == 1080);
    REQUIRE(g.output_height == 1920);
    REQUIRE(g.swapped_for_encoder);
    REQUIRE(g.output_rotation_degrees == 90);
    REQUIRE(g.requested_encoder_format.width == 1920);
    REQUIRE(g.requested_encoder_format.height == 1080);
    REQUIRE(g.requested_encoder_format.rotation_degrees == 0);

    // Requested rotation and compensating rotation cancel out, leaving the
    // aspect ratio correction only.
    std::array<gfx::Point, 4> corners = {{{-1, -1}, {-1, 1}, {1, -1}, {1, 1}}};
    g.transformation_matrix.map_points(corners);
    for(const auto& p : corners) {
        REQUIRE(approx(std::fabs(p.x), 1.0f));
        REQUIRE(approx(std::fabs(p.y), 1.0f));
    }
    REQUIRE(approx(corners[3].x, -1.0f));
    REQUIRE(approx(corners[3].y, -1.0f));
}

TEST_CASE("scaling transform shrinks the output and fills normalized space", "[geometry]") {
    TransformationRequest request;
    request.transformation_matrix = gfx::Matrix::scale(0.5f, 0.5f);
    OutputGeometry g = derive_output_geometry(input(1280, 720), request);
    REQUIRE(g.output_width == 640);
    REQUIRE(g.output_height == 360);

    gfx::Point corner = g.transformation_matrix.map_point({1, 1});
    REQUIRE(approx(corner.x, 1.0f));
    REQUIRE(approx(corner.y, 1.0f));
    REQUIRE(needs_frame_transformer(g, request, g.requested_encoder_format));
}

TEST_CASE("requested mime type overrides the input one", "[geometry]") {
    TransformationRequest request;
    request.video_mime_type = media::mime::kVideoH265;
    OutputGeometry g = derive_output_geometry(input(1920, 1080), request);
    REQUIRE(g.requested_encoder_format.sample_mime_type == media::mime::kVideoH265);
}

TEST_CASE("fallback request reflects the granted format", "[geometry][fallback]") {
    media::Format requested = input(1920, 1080);
    TransformationRequest request;

    SECTION("nothing changed") {
        REQUIRE(create_fallback_transformation_request(request, false, requested, requested) == request);
    }
    SECTION("width is controlling when not swapped") {
        media::Format granted = requested;
        granted.width = 1280;
        granted.height = 720;
        TransformationRequest fallback = create_fallback_transformation_request(request, false, requested, granted);
        REQUIRE(fallback.output_height == 1280);
        REQUIRE(fallback.video_mime_type == media::mime::kVideoH264);
    }
    SECTION("height alone does not count when width controls") {
        media::Format granted = requested;
        granted.height = 1072;
        REQUIRE(create_fallback_transformation_request(request, false, requested, granted) == request);
    }
    SECTION("height is controlling after a swap") {
        media::Format granted = requested;
        granted.height = 720;
        TransformationRequest fallback = create_fallback_transformation_request(request, true, requested, granted);
        REQUIRE(fallback.output_height == 720);
    }
    SECTION("mime type change") {
        media::Format granted = requested;
        granted.sample_mime_type = media::mime::kVideoH265;
        TransformationRequest fallback = create_fallback_transformation_request(request, false, requested, granted);
        REQUIRE(fallback.video_mime_type == media::mime::kVideoH265);
        REQUIRE(fallback.output_height == 1920);
    }
}

TEST_CASE("transformer is needed when the granted size differs from the decoded size", "[geometry]") {
    OutputGeometry g = derive_output_geometry(input(1920, 1080), TransformationRequest{});
    media::Format granted = g.requested_encoder_format;
    granted.width = 1280;
    granted.height = 720;
    REQUIRE(needs_frame_transformer(g, TransformationRequest{}, granted));

    TransformationRequest hdr;
    hdr.enable_hdr_editing = true;
    REQUIRE(needs_frame_transformer(g, hdr, g.requested_encoder_format));
}

TEST_CASE("HDR editing tags the requested encoder format", "[geometry]") {
    TransformationRequest request;
    REQUIRE_FALSE(derive_output_geometry(input(1920, 1080), request).requested_encoder_format.hdr);
    request.enable_hdr_editing = true;
    OutputGeometry g = derive_output_geometry(input(1920, 1080), request);
    REQUIRE(g.requested_encoder_format.hdr);
    REQUIRE(needs_frame_transformer(g, request, g.requested_encoder_format));
}
