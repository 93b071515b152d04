#pragma once

#include <string>

#include "ChartEngine.hpp"

namespace chartwheel {

// Defaults applied to every chart request before command line overrides.
struct ChartConfig {
    std::string timezone{"America/New_York"};
    bool useFixedOffset{true};        // "no DST" style
    double fixedUtcOffset{-5.0};      // hours (EST)
    Center center{Center::Geocentric};
    HouseSystem houseSystem{HouseSystem::EqualAscCusp};
    ZodiacMode zodiac{ZodiacMode::Tropical};
    SiderealFrame frame{SiderealFrame::FaganBradley};
    double ayanamsaOffset{0.0};
    bool includeNodes{true};
    NodeType nodeType{NodeType::True};
    double orb{6.0};                  // degrees (fallback)
    std::string orbs;                 // "8,5,6,6,8" for conj,sext,sqr,tri,opp
    std::string ephemerisPath;
    std::string logLevel{"info"};

    TimezoneSpec timezoneSpec() const;
    ChartRequest request() const;     // date/time left at their defaults
};

// All keys optional. Throws ConfigError on bad YAML or values.
ChartConfig loadConfigFromString(const std::string& yaml);
ChartConfig loadConfigFile(const std::string& path);

} // namespace chartwheel
