#include "core/error.hpp"

namespace vt {

const char* error_code_name(ErrorCode code) noexcept {
    switch(code) {
        case ErrorCode::DecoderInitFailed: return "DECODER_INIT_FAILED";
        case ErrorCode::EncoderInitFailed: return "ENCODER_INIT_FAILED";
        case ErrorCode::OutputFormatUnsupported: return "OUTPUT_FORMAT_UNSUPPORTED";
        case ErrorCode::GlInitFailed: return "GL_INIT_FAILED";
        case ErrorCode::DecodingFailed: return "DECODING_FAILED";
        case ErrorCode::EncodingFailed: return "ENCODING_FAILED";
        case ErrorCode::GlProcessingFailed: return "GL_PROCESSING_FAILED";
    }
    return "UNKNOWN";
}

TranscodeError::TranscodeError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + message), code_(code) {}

bool TranscodeError::is_configuration_error() const noexcept {
    switch(code_) {
        case ErrorCode::DecoderInitFailed:
        case ErrorCode::EncoderInitFailed:
        case ErrorCode::OutputFormatUnsupported:
        case ErrorCode::GlInitFailed:
            return true;
        default:
            return false;
    }
}

} // namespace vt
