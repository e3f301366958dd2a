#include "core/config.hpp"
#include "core/log.hpp"

#include <cstdlib>
#include <stdexcept>

namespace vt {

namespace {

bool parse_bool(const std::string& value, bool& out) {
    if(value == "1" || value == "true" || value == "on") { out = true; return true; }
    if(value == "0" || value == "false" || value == "off") { out = false; return true; }
    return false;
}

bool parse_positive(const std::string& value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if(used != value.size() || parsed <= 0) return false;
        out = parsed;
        return true;
    } catch(const std::exception&) {
        return false;
    }
}

constexpr const char* kKnownVariables[] = {
    "VT_LOG_LEVEL", "VT_LOG_JSON", "VT_DRAIN_STRATEGY", "VT_GL_ERROR_CHECKS",
    "VT_ENCODER_MAX_WIDTH", "VT_ENCODER_MAX_HEIGHT",
};

} // namespace

bool Config::apply(const std::string& name, const std::string& value) {
    if(name == "VT_LOG_LEVEL") return log::parse_level(value, log_level);
    if(name == "VT_LOG_JSON") return parse_bool(value, log_json);
    if(name == "VT_GL_ERROR_CHECKS") return parse_bool(value, gl_error_checks);
    if(name == "VT_ENCODER_MAX_WIDTH") return parse_positive(value, encoder_max_width);
    if(name == "VT_ENCODER_MAX_HEIGHT") return parse_positive(value, encoder_max_height);
    if(name == "VT_DRAIN_STRATEGY") {
        if(value == "auto") { drain_strategy = DrainStrategyOverride::Auto; return true; }
        if(value == "batch") { drain_strategy = DrainStrategyOverride::Batch; return true; }
        if(value == "single") { drain_strategy = DrainStrategyOverride::SingleFrame; return true; }
        return false;
    }
    return false;
}

Config Config::from_environment() {
    Config cfg;
    for(const char* name : kKnownVariables) {
        const char* value = std::getenv(name);
        if(!value) continue;
        if(!cfg.apply(name, value)) {
            log::warn(std::string("Ignoring malformed ") + name + "=" + value);
        }
    }
    return cfg;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    log::set_json_mode(log_json);
}

const Config& config() {
    static const Config cfg = [] {
        Config c = Config::from_environment();
        c.apply_logging();
        return c;
    }();
    return cfg;
}

} // namespace vt
