#pragma once
#include <string>

namespace vt::media::mime {

inline constexpr const char* kVideoH263 = "video/3gpp";
inline constexpr const char* kVideoH264 = "video/avc";
inline constexpr const char* kVideoH265 = "video/hevc";
inline constexpr const char* kVideoMp4v = "video/mp4v-es";
inline constexpr const char* kVideoVp8 = "video/x-vnd.on2.vp8";
inline constexpr const char* kVideoVp9 = "video/x-vnd.on2.vp9";
inline constexpr const char* kVideoAv1 = "video/av01";

bool is_video(const std::string& mime_type);

} // namespace vt::media::mime
