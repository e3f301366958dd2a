#include "gfx/graphics_context.hpp"
#include "media/surface.hpp"
#include "core/log.hpp"

#include <EGL/egl.h>
#include <EGL/eglext.h>

extern "C" {
#include <libavutil/pixfmt.h>
}

#include <cstdio>
#include <cstring>
#include <map>
#include <vector>

namespace vt::gfx {

namespace {

// https://www.khronos.org/registry/EGL/extensions/KHR/EGL_KHR_gl_colorspace.txt
constexpr EGLint kEglGlColorspaceKhr = 0x309D;
// https://www.khronos.org/registry/EGL/extensions/EXT/EGL_EXT_gl_colorspace_bt2020_linear.txt
constexpr EGLint kEglGlColorspaceBt2020PqExt = 0x3340;
constexpr const char* kExtensionBt2020Pq = "EGL_EXT_gl_colorspace_bt2020_pq";

constexpr EGLint kConfigAttributesRgba8888[] = {
    EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
    EGL_RENDERABLE_TYPE, EGL_OPENGL_ES2_BIT,
    EGL_RED_SIZE, 8,
    EGL_GREEN_SIZE, 8,
    EGL_BLUE_SIZE, 8,
    EGL_ALPHA_SIZE, 8,
    EGL_DEPTH_SIZE, 0,
    EGL_STENCIL_SIZE, 0,
    EGL_NONE};

constexpr EGLint kConfigAttributesRgba1010102[] = {
    EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
    EGL_RENDERABLE_TYPE, EGL_OPENGL_ES3_BIT_KHR,
    EGL_RED_SIZE, 10,
    EGL_GREEN_SIZE, 10,
    EGL_BLUE_SIZE, 10,
    EGL_ALPHA_SIZE, 2,
    EGL_DEPTH_SIZE, 0,
    EGL_STENCIL_SIZE, 0,
    EGL_NONE};

[[noreturn]] void throw_egl_exception(const std::string& message) {
    char code[16];
    std::snprintf(code, sizeof(code), "0x%x", static_cast<unsigned>(eglGetError()));
    gl_util::throw_gl_exception(message + ", error code: " + code);
}

bool has_extension(EGLDisplay display, const char* name) {
    const char* extensions = eglQueryString(display, EGL_EXTENSIONS);
    return extensions && std::strstr(extensions, name) != nullptr;
}

class EglContext final : public IGraphicsContext {
public:
    EglContext(EGLDisplay display, EGLConfig config, EGLContext context, bool hdr)
        : display_(display), config_(config), context_(context), hdr_(hdr) {}

    ~EglContext() override { destroy(); }

    RenderTargetId create_render_target(media::Surface& surface, int width, int height) override {
        std::vector<EGLint> attributes = {EGL_WIDTH, width, EGL_HEIGHT, height};
        if(hdr_) {
            if(has_extension(display_, kExtensionBt2020Pq)) {
                attributes.push_back(kEglGlColorspaceKhr);
                attributes.push_back(kEglGlColorspaceBt2020PqExt);
            } else {
                vt::log::warn("EGL: BT.2020 PQ colorspace unsupported, rendering without colorspace tag");
            }
        }
        attributes.push_back(EGL_NONE);
        EGLSurface egl_surface = eglCreatePbufferSurface(display_, config_, attributes.data());
        if(egl_surface == EGL_NO_SURFACE) throw_egl_exception("eglCreatePbufferSurface failed");

        RenderTargetId id = next_id_++;
        Target target;
        target.egl_surface = egl_surface;
        target.surface = &surface;
        target.width = width;
        target.height = height;
        targets_.emplace(id, std::move(target));
        vt::log::debug("EGL: render target " + std::to_string(id) + " " + std::to_string(width) + "x" + std::to_string(height));
        return id;
    }

    void make_current(RenderTargetId id) override {
        Target& target = lookup(id);
        if(!eglMakeCurrent(display_, target.egl_surface, target.egl_surface, context_)) {
            throw_egl_exception("eglMakeCurrent failed");
        }
    }

    void set_presentation_time(RenderTargetId id, int64_t time_ns) override {
        lookup(id).presentation_time_ns = time_ns;
    }

    void swap_buffers(RenderTargetId id) override {
        Target& target = lookup(id);
        media::FramePtr frame = read_back(target);
        if(!eglSwapBuffers(display_, target.egl_surface)) {
            throw_egl_exception("eglSwapBuffers failed");
        }
        target.surface->queue_frame(std::move(frame));
    }

    void destroy() override {
        if(display_ == EGL_NO_DISPLAY) return;
        eglMakeCurrent(display_, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        for(auto& kv : targets_) eglDestroySurface(display_, kv.second.egl_surface);
        targets_.clear();
        if(context_ != EGL_NO_CONTEXT) eglDestroyContext(display_, context_);
        eglReleaseThread();
        eglTerminate(display_);
        context_ = EGL_NO_CONTEXT;
        display_ = EGL_NO_DISPLAY;
    }

private:
    struct Target {
        EGLSurface egl_surface = EGL_NO_SURFACE;
        media::Surface* surface = nullptr;
        int width = 0;
        int height = 0;
        int64_t presentation_time_ns = 0;
        std::vector<uint8_t> scratch;
    };

    Target& lookup(RenderTargetId id) {
        auto it = targets_.find(id);
        if(it == targets_.end()) gl_util::throw_gl_exception("Unknown render target " + std::to_string(id));
        return it->second;
    }

    // Copies the current framebuffer into a new frame, flipping rows so the
    // frame is top-down.
    media::FramePtr read_back(Target& target) {
        const int row_bytes = target.width * 4;
        target.scratch.resize(static_cast<size_t>(row_bytes) * static_cast<size_t>(target.height));
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(0, 0, target.width, target.height, GL_RGBA,
                     hdr_ ? GL_UNSIGNED_INT_2_10_10_10_REV : GL_UNSIGNED_BYTE,
                     target.scratch.data());
        gl_util::check_gl_error();

        media::FramePtr frame = media::make_frame();
        frame->format = hdr_ ? AV_PIX_FMT_X2BGR10LE : AV_PIX_FMT_RGBA;
        frame->width = target.width;
        frame->height = target.height;
        if(av_frame_get_buffer(frame.get(), 32) < 0) {
            gl_util::throw_gl_exception("Failed to allocate readback frame");
        }
        for(int y = 0; y < target.height; ++y) {
            const uint8_t* src = target.scratch.data() + static_cast<size_t>(target.height - 1 - y) * row_bytes;
            std::memcpy(frame->data[0] + static_cast<ptrdiff_t>(y) * frame->linesize[0], src, static_cast<size_t>(row_bytes));
        }
        frame->pts = target.presentation_time_ns / 1000;
        if(hdr_) {
            frame->color_primaries = AVCOL_PRI_BT2020;
            frame->color_trc = AVCOL_TRC_SMPTE2084;
            frame->colorspace = AVCOL_SPC_BT2020_NCL;
        }
        return frame;
    }

    EGLDisplay display_;
    EGLConfig config_;
    EGLContext context_;
    bool hdr_;
    RenderTargetId next_id_ = 1;
    std::map<RenderTargetId, Target> targets_;
};

class EglContextFactory final : public IGraphicsContextFactory {
public:
    std::unique_ptr<IGraphicsContext> create_context(const ContextOptions& options) override {
        EGLDisplay display = eglGetDisplay(EGL_DEFAULT_DISPLAY);
        if(display == EGL_NO_DISPLAY) throw_egl_exception("No EGL display");
        EGLint major = 0;
        EGLint minor = 0;
        if(!eglInitialize(display, &major, &minor)) throw_egl_exception("eglInitialize failed");
        if(!eglBindAPI(EGL_OPENGL_ES_API)) {
            eglTerminate(display);
            throw_egl_exception("eglBindAPI failed");
        }

        EGLConfig config = nullptr;
        EGLint num_configs = 0;
        const EGLint* config_attributes = options.hdr ? kConfigAttributesRgba1010102 : kConfigAttributesRgba8888;
        if(!eglChooseConfig(display, config_attributes, &config, 1, &num_configs) || num_configs < 1) {
            eglTerminate(display);
            throw_egl_exception("eglChooseConfig failed");
        }

        const EGLint context_attributes[] = {EGL_CONTEXT_CLIENT_VERSION, options.hdr ? 3 : 2, EGL_NONE};
        EGLContext context = eglCreateContext(display, config, EGL_NO_CONTEXT, context_attributes);
        if(context == EGL_NO_CONTEXT) {
            eglTerminate(display);
            throw_egl_exception("eglCreateContext failed");
        }
        vt::log::info("EGL " + std::to_string(major) + "." + std::to_string(minor) +
                      " context created (" + (options.hdr ? "ES3 RGBA1010102" : "ES2 RGBA8888") + ")");
        return std::make_unique<EglContext>(display, config, context, options.hdr);
    }
};

} // namespace

std::unique_ptr<IGraphicsContextFactory> create_egl_context_factory() {
    return std::make_unique<EglContextFactory>();
}

} // namespace vt::gfx
