#include "Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

void setLogLevel(const std::string& level) {
    auto v = toLower(trim(level));
    auto lvl = spdlog::level::from_str(v);
    // from_str maps anything it does not know to "off"
    if (lvl == spdlog::level::off && v != "off")
        throw ConfigError("unknown log level: " + level);
    spdlog::set_level(lvl);
}

void initLogging(const std::string& level) {
    auto logger = spdlog::get("chartwheel");
    if (!logger) logger = spdlog::stderr_color_mt("chartwheel");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    setLogLevel(level);
}

} // namespace chartwheel
