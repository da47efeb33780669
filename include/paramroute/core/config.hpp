#pragma once

#include <string>

#include "paramroute/core/logging.hpp"

namespace paramroute {

enum class LogFormat {
    Console,
    Json
};

struct Config {
    // Logging
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Console;
    bool log_color = true;

    // Load configuration from environment variables:
    //   PARAMROUTE_LOG_LEVEL   trace|debug|info|warn|error|fatal|off
    //   PARAMROUTE_LOG_FORMAT  console|json
    //   PARAMROUTE_LOG_COLOR   0|false disables ANSI colors
    static Config from_env();

    // Reconfigure the given logger (level and sinks) from these settings.
    void apply(Logger& logger) const;

    // Same as apply(default_logger()).
    void apply() const;
};

} // namespace paramroute
