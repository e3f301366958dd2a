#include "transformer/input_surface_texture.hpp"
#include "core/log.hpp"

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace vt::transformer {

InputSurfaceTexture::InputSurfaceTexture(bool hdr, size_t max_queued_frames)
    : hdr_(hdr), max_queued_frames_(max_queued_frames) {
    notifier_ = std::thread([this] { notifier_loop(); });
}

InputSurfaceTexture::~InputSurfaceTexture() {
    release();
}

void InputSurfaceTexture::set_on_frame_available_listener(FrameAvailableListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void InputSurfaceTexture::queue_frame(media::FramePtr frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(stopping_) return;
        frames_.push_back(std::move(frame));
        ++notifications_;
    }
    cv_.notify_one();
}

void InputSurfaceTexture::notifier_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while(true) {
        cv_.wait(lock, [this] { return stopping_ || notifications_ > 0; });
        if(stopping_) return;
        --notifications_;
        FrameAvailableListener listener = listener_;
        lock.unlock();
        if(listener) listener();
        lock.lock();
    }
}

bool InputSurfaceTexture::can_accept_frame() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size() < max_queued_frames_;
}

size_t InputSurfaceTexture::queued_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

void InputSurfaceTexture::update_tex_image(GLuint texture_id) {
    media::FramePtr frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(frames_.empty()) gfx::gl_util::throw_gl_exception("update_tex_image called with no queued frame");
        frame = std::move(frames_.front());
        frames_.pop_front();
    }
    upload(*frame, texture_id);
    timestamp_ns_ = media::frame_time_us(*frame) * 1000;
}

void InputSurfaceTexture::upload(const AVFrame& frame, GLuint texture_id) {
    const AVPixelFormat dst_format = hdr_ ? AV_PIX_FMT_X2BGR10LE : AV_PIX_FMT_RGBA;
    sws_ = sws_getCachedContext(sws_, frame.width, frame.height, static_cast<AVPixelFormat>(frame.format),
                                frame.width, frame.height, dst_format, SWS_BILINEAR, nullptr, nullptr, nullptr);
    if(!sws_) gfx::gl_util::throw_gl_exception("Unable to create pixel converter for input frame");

    if(!converted_ || converted_->width != frame.width || converted_->height != frame.height) {
        converted_ = media::make_frame();
        converted_->format = dst_format;
        converted_->width = frame.width;
        converted_->height = frame.height;
        // Tightly packed rows, as glTexImage2D expects.
        if(av_frame_get_buffer(converted_.get(), 1) < 0) {
            gfx::gl_util::throw_gl_exception("Unable to allocate texture upload buffer");
        }
    }
    sws_scale(sws_, frame.data, frame.linesize, 0, frame.height, converted_->data, converted_->linesize);

    glBindTexture(GL_TEXTURE_2D, texture_id);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    const GLenum internal_format = hdr_ ? GL_RGB10_A2 : GL_RGBA;
    const GLenum type = hdr_ ? GL_UNSIGNED_INT_2_10_10_10_REV : GL_UNSIGNED_BYTE;
    if(frame.width != texture_width_ || frame.height != texture_height_) {
        glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(internal_format), frame.width, frame.height, 0,
                     GL_RGBA, type, converted_->data[0]);
        texture_width_ = frame.width;
        texture_height_ = frame.height;
    } else {
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, frame.width, frame.height, GL_RGBA, type, converted_->data[0]);
    }
    gfx::gl_util::check_gl_error();
}

gfx::GlMatrix InputSurfaceTexture::transform_matrix() const {
    // Rows are uploaded top-down, so t must be flipped for a y-up quad.
    return {1, 0, 0, 0,
            0, -1, 0, 0,
            0, 0, 1, 0,
            0, 1, 0, 1};
}

void InputSurfaceTexture::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(stopping_) return;
        stopping_ = true;
        frames_.clear();
    }
    cv_.notify_all();
    if(notifier_.joinable()) notifier_.join();
    if(sws_) {
        sws_freeContext(sws_);
        sws_ = nullptr;
    }
    converted_.reset();
    vt::log::debug("InputSurfaceTexture released");
}

} // namespace vt::transformer
