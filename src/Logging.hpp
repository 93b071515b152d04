#pragma once

#include <string>

namespace chartwheel {

// Installs the "chartwheel" stderr logger as spdlog's default so that chart
// and CSV output on stdout stay clean. Throws ConfigError on an unknown level.
void initLogging(const std::string& level);

void setLogLevel(const std::string& level);

} // namespace chartwheel
