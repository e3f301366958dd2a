#pragma once
#include <functional>
#include <memory>
#include <optional>

#include "gfx/matrix.hpp"
#include "media/surface.hpp"

namespace vt::gfx { class IGraphicsContextFactory; }

namespace vt::transformer {

// Surface showing a live copy of every transformed frame, for debugging.
struct DebugPreview {
    media::Surface* surface = nullptr;
    int width = 0;
    int height = 0;
};

// Given the output size, returns a preview surface or nothing.
using DebugPreviewProvider = std::function<std::optional<DebugPreview>(int width, int height)>;

// Renders decoded frames from input_surface() onto the output surface with a
// fixed transformation. All calls except the surface delivery happen on the
// pipeline thread.
class IFrameTransformer {
public:
    virtual ~IFrameTransformer() = default;

    virtual media::Surface& input_surface() = 0;

    // Announces a frame the decoder is about to render onto input_surface().
    virtual void register_input_frame() = 0;
    virtual bool can_process_data() const = 0;
    // Renders one available frame. Throws TranscodeError(GlProcessingFailed).
    virtual void process_data() = 0;
    virtual bool is_ended() const = 0;
    virtual void signal_end_of_input_stream() = 0;
    virtual void release() = 0;
};

struct FrameTransformerParams {
    int output_width = 0;
    int output_height = 0;
    float pixel_width_height_ratio = 1.0f;
    gfx::Matrix transformation_matrix;
    bool enable_hdr_editing = false;
};

// Creates the GL implementation drawing into |output_surface|, which must
// outlive the transformer. Throws TranscodeError(GlInitFailed).
std::unique_ptr<IFrameTransformer> create_gl_frame_transformer(
    const FrameTransformerParams& params,
    media::Surface& output_surface,
    gfx::IGraphicsContextFactory& context_factory,
    const DebugPreviewProvider& debug_preview_provider);

} // namespace vt::transformer
