#pragma once
#include <cstdint>
#include <memory>

#include "gfx/gl_util.hpp"

namespace vt::media { class Surface; }

namespace vt::gfx {

struct ContextOptions {
    // Negotiate an RGBA 10:10:10:2 ES3 config with BT.2020 PQ render targets.
    bool hdr = false;
};

// A rendering context plus the render targets drawn through it. A context is
// single-owner and must only be used from the thread that created it.
class IGraphicsContext {
public:
    virtual ~IGraphicsContext() = default;

    // Creates a render target whose presented frames are queued to |surface|.
    // The surface must outlive the target.
    virtual RenderTargetId create_render_target(media::Surface& surface, int width, int height) = 0;
    virtual void make_current(RenderTargetId target) = 0;
    // Timestamp attached to the next frame presented on |target|.
    virtual void set_presentation_time(RenderTargetId target, int64_t time_ns) = 0;
    // Presents the rendered frame to the target's surface.
    virtual void swap_buffers(RenderTargetId target) = 0;
    // Destroys all targets and the context. Safe to call more than once.
    virtual void destroy() = 0;
};

class IGraphicsContextFactory {
public:
    virtual ~IGraphicsContextFactory() = default;
    // Throws GlException if no suitable display/config/context exists.
    virtual std::unique_ptr<IGraphicsContext> create_context(const ContextOptions& options) = 0;
};

// Offscreen EGL implementation: render targets are pbuffers whose contents are
// read back and queued to the target surface on every swap.
std::unique_ptr<IGraphicsContextFactory> create_egl_context_factory();

} // namespace vt::gfx
