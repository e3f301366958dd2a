#pragma once

#include <stdexcept>
#include <string>

namespace vt {

// Failure categories of a transcoding pipeline. Nothing is retried: any error
// invalidates the whole pipeline and the caller tears it down with release().
enum class ErrorCode {
    // Configuration errors, raised while the pipeline is being built.
    DecoderInitFailed,
    EncoderInitFailed,
    OutputFormatUnsupported,
    GlInitFailed,
    // Device errors, raised during steady-state operation.
    DecodingFailed,
    EncodingFailed,
    GlProcessingFailed,
};

const char* error_code_name(ErrorCode code) noexcept;

class TranscodeError : public std::runtime_error {
public:
    TranscodeError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }
    bool is_configuration_error() const noexcept;
    bool is_device_error() const noexcept { return !is_configuration_error(); }

private:
    ErrorCode code_;
};

// Contract violation by the caller (e.g. processing with no available input).
// Unreachable in correct code.
inline void check_state(bool expression, const char* message) {
    if(!expression) {
        throw std::logic_error(message);
    }
}

} // namespace vt
