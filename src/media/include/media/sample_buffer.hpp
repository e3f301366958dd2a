#pragma once
#include <cstdint>
#include <vector>

namespace vt::media {

// Buffer flags, numerically identical to the platform codec flags.
inline constexpr uint32_t kBufferFlagKeyFrame = 1;
inline constexpr uint32_t kBufferFlagCodecConfig = 2;
inline constexpr uint32_t kBufferFlagEndOfStream = 4;

// Reusable descriptor for one compressed sample travelling into a decoder or out
// of an encoder. The pipeline owns exactly one of each and hands out references.
struct SampleBuffer {
    std::vector<uint8_t> data;
    int64_t time_us = 0;
    uint32_t flags = 0;

    bool is_end_of_stream() const { return (flags & kBufferFlagEndOfStream) != 0; }
    bool is_key_frame() const { return (flags & kBufferFlagKeyFrame) != 0; }
    void set_flags(uint32_t f) { flags = f; }

    void clear() {
        data.clear();
        time_us = 0;
        flags = 0;
    }
};

} // namespace vt::media
