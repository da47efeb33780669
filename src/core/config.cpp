#include "paramroute/core/config.hpp"

#include <cstdlib>
#include <memory>
#include <string_view>

namespace paramroute {

Config Config::from_env() {
    Config config;

    if (const char* level = std::getenv("PARAMROUTE_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }
    if (const char* format = std::getenv("PARAMROUTE_LOG_FORMAT")) {
        std::string_view f = format;
        config.log_format = (f == "json" || f == "JSON") ? LogFormat::Json : LogFormat::Console;
    }
    if (const char* color = std::getenv("PARAMROUTE_LOG_COLOR")) {
        std::string_view c = color;
        config.log_color = !(c == "0" || c == "false" || c == "no" || c == "off");
    }

    return config;
}

void Config::apply(Logger& logger) const {
    logger.set_level(log_level);
    logger.clear_sinks();
    if (log_format == LogFormat::Json) {
        logger.add_sink(std::make_shared<JsonSink>());
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>(log_color));
    }
}

void Config::apply() const {
    apply(default_logger());
}

} // namespace paramroute
