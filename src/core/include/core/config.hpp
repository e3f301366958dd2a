#pragma once
#include <string>

#include "core/log.hpp"

namespace vt {

enum class DrainStrategyOverride { Auto, Batch, SingleFrame };

// Runtime settings read once from the environment:
//   VT_LOG_LEVEL            trace|debug|info|warn|error|critical
//   VT_LOG_JSON             0/1
//   VT_DRAIN_STRATEGY       auto|batch|single
//   VT_GL_ERROR_CHECKS      0/1
//   VT_ENCODER_MAX_WIDTH    pixels
//   VT_ENCODER_MAX_HEIGHT   pixels
struct Config {
    log::Level log_level = log::Level::Info;
    bool log_json = false;
    DrainStrategyOverride drain_strategy = DrainStrategyOverride::Auto;
    bool gl_error_checks = true;
    int encoder_max_width = 4096;
    int encoder_max_height = 2304;

    // Parses the current process environment. Malformed values are logged and ignored.
    static Config from_environment();

    // Parses one NAME=value setting into this config. Returns false if the name is
    // unknown or the value is malformed.
    bool apply(const std::string& name, const std::string& value);

    // Pushes the logging part of the config into vt::log.
    void apply_logging() const;
};

// Process-wide config, lazily read from the environment on first use.
const Config& config();

} // namespace vt
