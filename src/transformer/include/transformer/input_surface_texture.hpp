#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "gfx/gl_util.hpp"
#include "gfx/matrix.hpp"
#include "media/surface.hpp"

struct SwsContext;

namespace vt::transformer {

// Surface that decoded frames are rendered onto, backing one GL texture.
//
// Frames are kept in arrival order. For every queued frame the listener is
// invoked once on a dedicated notifier thread, after the frame is queued. The
// pipeline thread later latches the oldest frame into a texture with
// update_tex_image(). Nothing is dropped; can_accept_frame() reports when
// the queue is full so the producer stops rendering into it.
class InputSurfaceTexture : public media::Surface {
public:
    using FrameAvailableListener = std::function<void()>;

    static constexpr size_t kDefaultMaxQueuedFrames = 8;

    explicit InputSurfaceTexture(bool hdr, size_t max_queued_frames = kDefaultMaxQueuedFrames);
    ~InputSurfaceTexture() override;

    InputSurfaceTexture(const InputSurfaceTexture&) = delete;
    InputSurfaceTexture& operator=(const InputSurfaceTexture&) = delete;

    // Must be set before the first frame is queued.
    void set_on_frame_available_listener(FrameAvailableListener listener);

    void queue_frame(media::FramePtr frame) override;
    // False once max_queued_frames frames wait to be latched.
    bool can_accept_frame() const override;

    // Uploads the oldest queued frame into |texture_id|. The texture must be
    // a GL_TEXTURE_2D and the GL context current. Throws GlException if no
    // frame is queued or the upload fails.
    void update_tex_image(GLuint texture_id);

    // Texture coordinate transform of the latched frame.
    gfx::GlMatrix transform_matrix() const;
    // Presentation time of the latched frame.
    int64_t timestamp_ns() const { return timestamp_ns_; }

    size_t queued_frames() const;

    // Stops the notifier thread and drops queued frames. Idempotent.
    void release();

private:
    void notifier_loop();
    void upload(const AVFrame& frame, GLuint texture_id);

    const bool hdr_;
    const size_t max_queued_frames_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<media::FramePtr> frames_;
    int notifications_ = 0;
    bool stopping_ = false;
    FrameAvailableListener listener_;
    std::thread notifier_;

    SwsContext* sws_ = nullptr;
    media::FramePtr converted_;
    int texture_width_ = 0;
    int texture_height_ = 0;
    int64_t timestamp_ns_ = 0;
};

} // namespace vt::transformer
