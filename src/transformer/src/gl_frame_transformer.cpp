#include "transformer/frame_transformer.hpp"
#include "transformer/input_frame_tracker.hpp"
#include "transformer/input_surface_texture.hpp"
#include "gfx/gl_program.hpp"
#include "gfx/graphics_context.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"

#include <sstream>

namespace vt::transformer {

namespace {

const char* kVertexShader = R"(
attribute vec4 aFramePosition;
attribute vec4 aTexCoords;
uniform mat4 uTexTransform;
uniform mat4 uTransformationMatrix;
varying vec2 vTexCoords;
void main() {
  gl_Position = uTransformationMatrix * aFramePosition;
  vTexCoords = (uTexTransform * aTexCoords).xy;
}
)";

const char* kFragmentShader = R"(
precision mediump float;
uniform sampler2D uTexSampler;
varying vec2 vTexCoords;
void main() {
  gl_FragColor = texture2D(uTexSampler, vTexCoords);
}
)";

class GlFrameTransformer final : public IFrameTransformer {
public:
    GlFrameTransformer(const FrameTransformerParams& params,
                       media::Surface& output_surface,
                       gfx::IGraphicsContextFactory& context_factory,
                       const std::optional<DebugPreview>& preview)
        : output_width_(params.output_width),
          output_height_(params.output_height),
          input_texture_(params.enable_hdr_editing) {
        gfx::ContextOptions options;
        options.hdr = params.enable_hdr_editing;
        context_ = context_factory.create_context(options);
        output_target_ = context_->create_render_target(output_surface, output_width_, output_height_);
        if(preview && preview->surface) {
            preview_ = *preview;
            preview_target_ = context_->create_render_target(*preview->surface, preview->width, preview->height);
        }

        gfx::gl_util::focus_render_target(*context_, output_target_, output_width_, output_height_);
        texture_id_ = gfx::gl_util::create_texture();
        program_ = std::make_unique<gfx::GlProgram>(kVertexShader, kFragmentShader);

        auto positions = gfx::gl_util::normalized_coordinate_bounds();
        auto tex_coords = gfx::gl_util::texture_coordinate_bounds();
        program_->set_buffer_attribute("aFramePosition", positions.data(), positions.size(), 4);
        program_->set_buffer_attribute("aTexCoords", tex_coords.data(), tex_coords.size(), 4);
        auto transformation = params.transformation_matrix.to_gl_matrix();
        program_->set_floats_uniform("uTransformationMatrix", transformation.data(), transformation.size());
        program_->set_sampler_tex_id_uniform("uTexSampler", texture_id_, 0);

        input_texture_.set_on_frame_available_listener([this] { tracker_.on_frame_delivered(); });
    }

    ~GlFrameTransformer() override { release(); }

    media::Surface& input_surface() override { return input_texture_; }

    void register_input_frame() override { tracker_.register_input_frame(); }

    bool can_process_data() const override { return tracker_.can_process_data(); }

    void process_data() override {
        check_state(can_process_data(), "process_data called without an available input frame");
        VT_PROFILE_SCOPE("transformer.process_data");
        try {
            input_texture_.update_tex_image(texture_id_);
            auto tex_transform = input_texture_.transform_matrix();
            gfx::gl_util::focus_render_target(*context_, output_target_, output_width_, output_height_);
            program_->set_floats_uniform("uTexTransform", tex_transform.data(), tex_transform.size());
            program_->use();
            program_->bind_attributes_and_uniforms();
            glDrawArrays(GL_TRIANGLE_STRIP, 0, gfx::gl_util::kRectangleVerticesCount);
            gfx::gl_util::check_gl_error();
            context_->set_presentation_time(output_target_, input_texture_.timestamp_ns());
            context_->swap_buffers(output_target_);

            if(preview_target_) {
                gfx::gl_util::focus_render_target(*context_, *preview_target_, preview_.width, preview_.height);
                glClearColor(0, 0, 0, 0);
                glClear(GL_COLOR_BUFFER_BIT);
                glDrawArrays(GL_TRIANGLE_STRIP, 0, gfx::gl_util::kRectangleVerticesCount);
                gfx::gl_util::check_gl_error();
                context_->set_presentation_time(*preview_target_, input_texture_.timestamp_ns());
                context_->swap_buffers(*preview_target_);
            }
        } catch(const gfx::GlException& e) {
            throw TranscodeError(ErrorCode::GlProcessingFailed, e.what());
        }
        tracker_.on_frame_processed();
        vt::log::trace("Transformed frame at " + std::to_string(input_texture_.timestamp_ns()) + "ns");
    }

    bool is_ended() const override { return tracker_.is_ended(); }

    void signal_end_of_input_stream() override { tracker_.signal_end_of_input_stream(); }

    void release() override {
        if(released_) return;
        released_ = true;
        // Stop deliveries before tearing down GL state.
        input_texture_.release();
        if(context_) {
            try {
                context_->make_current(output_target_);
                if(program_) program_->release();
                if(texture_id_ != 0) gfx::gl_util::delete_texture(texture_id_);
            } catch(const gfx::GlException& e) {
                vt::log::warn(std::string("Error releasing GL resources: ") + e.what());
            }
            context_->destroy();
        }
        program_.reset();
        texture_id_ = 0;
    }

private:
    const int output_width_;
    const int output_height_;
    InputFrameTracker tracker_;
    InputSurfaceTexture input_texture_;
    std::unique_ptr<gfx::IGraphicsContext> context_;
    gfx::RenderTargetId output_target_ = 0;
    std::optional<gfx::RenderTargetId> preview_target_;
    DebugPreview preview_;
    GLuint texture_id_ = 0;
    std::unique_ptr<gfx::GlProgram> program_;
    bool released_ = false;
};

} // namespace

std::unique_ptr<IFrameTransformer> create_gl_frame_transformer(
    const FrameTransformerParams& params,
    media::Surface& output_surface,
    gfx::IGraphicsContextFactory& context_factory,
    const DebugPreviewProvider& debug_preview_provider) {
    if(params.pixel_width_height_ratio != 1.0f) {
        std::ostringstream oss;
        oss << "Frame edits on non-square pixels are not supported. The pixel width/height ratio is: "
            << params.pixel_width_height_ratio;
        throw TranscodeError(ErrorCode::GlInitFailed, oss.str());
    }

    std::optional<DebugPreview> preview;
    if(debug_preview_provider) {
        preview = debug_preview_provider(params.output_width, params.output_height);
    }

    try {
        auto transformer = std::make_unique<GlFrameTransformer>(params, output_surface, context_factory, preview);
        vt::log::info("GL frame transformer created: " + std::to_string(params.output_width) + "x" +
                      std::to_string(params.output_height) + (params.enable_hdr_editing ? " (HDR)" : "") +
                      (preview ? " with debug preview" : ""));
        return transformer;
    } catch(const gfx::GlException& e) {
        throw TranscodeError(ErrorCode::GlInitFailed, e.what());
    }
}

} // namespace vt::transformer
