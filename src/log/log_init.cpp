//! # Log Initialization from the Environment
//!
//! Reads JIG_LOG, JIG_LOG_FILE and JIG_LOG_FORMAT to produce a LogConfig.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace jig::log {

namespace {

std::string env_value(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

LogConfig config_from_env() {
    LogConfig config;

    std::string spec = env_value("JIG_LOG");
    if (!spec.empty()) {
        // "vfs=debug" and "vfs,diag" are filter specs, anything else is a level
        if (spec.find('=') != std::string::npos || spec.find(',') != std::string::npos) {
            config.filter_spec = spec;
        } else {
            config.level = parse_level(spec);
        }
    }

    config.log_file = env_value("JIG_LOG_FILE");

    std::string format = env_value("JIG_LOG_FORMAT");
    if (format == "json" || format == "JSON") {
        config.format = LogFormat::JSON;
    }

    return config;
}

} // namespace jig::log
