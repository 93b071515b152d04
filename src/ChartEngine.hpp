#pragma once

#include <optional>
#include <string>
#include <vector>

#include "AspectDetector.hpp"
#include "Ephemeris.hpp"
#include "HouseCalculator.hpp"
#include "PositionResolver.hpp"
#include "TimeNormalizer.hpp"

namespace chartwheel {

enum class ZodiacMode { Tropical, Sidereal };

ZodiacMode parseZodiacMode(const std::string& s);
const char* zodiacModeName(ZodiacMode z);

struct GeoLocation {
    double latitude{};   // south negative
    double longitude{};  // west negative
};

struct ChartRequest {
    std::string date{"1962-07-02"};
    std::string time{"23:33"};
    TimezoneSpec timezone = TimezoneSpec::fixedOffset(-5.0);
    ResolverOptions resolver;
    ZodiacMode zodiac{ZodiacMode::Tropical};
    bool includeNodes{true};
    std::optional<GeoLocation> location;   // houses only when present
    HouseSystem houseSystem{HouseSystem::EqualAscCusp};
    std::vector<AspectDefinition> aspects = defaultAspects();
};

// Everything a renderer needs; the caller owns it.
struct ChartSnapshot {
    NormalizedTime time;
    Center center{Center::Geocentric};
    ZodiacMode zodiac{ZodiacMode::Tropical};
    SiderealFrame frame{SiderealFrame::FaganBradley};
    double ayanamsa{};
    std::vector<BodyPosition> bodies;
    std::optional<HouseResult> houses;
    std::vector<AspectDefinition> aspectTable;
    std::vector<AspectHit> aspects;

    // Body order and longitudes of the selected zodiac, as fed to aspect detection.
    std::vector<Body> bodyIds() const;
    std::vector<double> longitudes() const;
};

// Normalizer -> resolver and houses -> aspects.
ChartSnapshot computeChart(const EphemerisOracle& oracle, const ChartRequest& request);

// Same, for a time already normalized.
ChartSnapshot computeChart(const EphemerisOracle& oracle, const NormalizedTime& time, const ChartRequest& request);

} // namespace chartwheel
