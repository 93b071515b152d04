#include "ChartEngine.hpp"

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

ZodiacMode parseZodiacMode(const std::string& s) {
    auto v = toLower(trim(s));
    if (v == "tropical") return ZodiacMode::Tropical;
    if (v == "sidereal" || v == "sidereal_fb") return ZodiacMode::Sidereal;
    throw MalformedInputError("unknown zodiac mode: " + s);
}

const char* zodiacModeName(ZodiacMode z) {
    return z == ZodiacMode::Tropical ? "Tropical" : "Sidereal";
}

std::vector<Body> ChartSnapshot::bodyIds() const {
    std::vector<Body> out;
    out.reserve(bodies.size());
    for (const auto& b : bodies) out.push_back(b.body);
    return out;
}

std::vector<double> ChartSnapshot::longitudes() const {
    std::vector<double> out;
    out.reserve(bodies.size());
    for (const auto& b : bodies) out.push_back(zodiac == ZodiacMode::Tropical ? b.tropical : b.sidereal);
    return out;
}

ChartSnapshot computeChart(const EphemerisOracle& oracle, const NormalizedTime& time, const ChartRequest& request) {
    PositionResolver resolver(oracle, request.resolver);

    ChartSnapshot S;
    S.time = time;
    S.center = request.resolver.center;
    S.zodiac = request.zodiac;
    S.frame = request.resolver.frame;
    S.ayanamsa = resolver.ayanamsa(time.moment);
    S.bodies = resolver.resolve(time.moment, chartBodies(request.includeNodes));

    if (request.location)
        S.houses = computeHouses(oracle, time.moment, request.location->latitude, request.location->longitude,
            request.houseSystem);

    S.aspectTable = request.aspects;
    S.aspects = detectAspects(S.bodyIds(), S.longitudes(), S.aspectTable);
    return S;
}

ChartSnapshot computeChart(const EphemerisOracle& oracle, const ChartRequest& request) {
    auto local = parseCivil(request.date, request.time);
    auto time = resolveLocalTime(local, request.timezone);
    spdlog::debug("chart for {} [{}], {} zodiac", time.local.str(), time.zoneLabel, zodiacModeName(request.zodiac));
    return computeChart(oracle, time, request);
}

} // namespace chartwheel
