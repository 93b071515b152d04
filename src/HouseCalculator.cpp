#include "HouseCalculator.hpp"

#include <cmath>
#include <sstream>

#include <spdlog/spdlog.h>

#include "Angles.hpp"
#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

namespace {

void checkCoordinates(double lat, double lon) {
    if (!std::isfinite(lat) || lat < -90.0 || lat > 90.0) {
        std::ostringstream os;
        os << "latitude " << lat << " outside [-90, 90]";
        throw InvalidCoordinateError(os.str());
    }
    if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0) {
        std::ostringstream os;
        os << "longitude " << lon << " outside [-180, 180]";
        throw InvalidCoordinateError(os.str());
    }
}

bool allFinite(const OracleHouses& H) {
    if (!std::isfinite(H.ascendant) || !std::isfinite(H.midheaven)) return false;
    for (double c : H.cusps)
        if (!std::isfinite(c)) return false;
    return true;
}

void equalCusps(HouseResult& R, double base) {
    for (int i = 0; i < 12; ++i)
        R.cusps[i] = norm360(base + 30.0 * i);
}

} // namespace

HouseSystem parseHouseSystem(const std::string& s) {
    auto v = toUpper(trim(s));
    if (v == "E" || v == "EQUAL" || v == "EQUAL_ASC_CUSP") return HouseSystem::EqualAscCusp;
    if (v == "EQUAL_ASC_MID") return HouseSystem::EqualAscMid;
    if (v == "P" || v == "PLACIDUS") return HouseSystem::Placidus;
    throw MalformedInputError("unknown house system: " + s);
}

const char* houseSystemName(HouseSystem hs) {
    switch (hs) {
    case HouseSystem::EqualAscCusp: return "Equal (Asc on cusp)";
    case HouseSystem::EqualAscMid:  return "Equal (Asc at midpoint)";
    case HouseSystem::Placidus:     return "Placidus";
    }
    return "Custom";
}

HouseResult computeHouses(const EphemerisOracle& oracle, const Moment& t,
                          double latitude, double longitude, HouseSystem system) {
    checkCoordinates(latitude, longitude);

    if (std::fabs(latitude) >= 90.0)
        throw HouseSystemDegenerateError("ascendant is undefined at the geographic poles");
    if (system == HouseSystem::Placidus && std::fabs(latitude) > kPolarCircleLatitude) {
        std::ostringstream os;
        os << "Placidus houses are undefined at latitude " << latitude << " (beyond the polar circle)";
        throw HouseSystemDegenerateError(os.str());
    }

    const char hsys = system == HouseSystem::Placidus ? 'P' : 'E';
    OracleHouses H = oracle.houses(t, latitude, longitude, hsys);
    if (!allFinite(H))
        throw HouseSystemDegenerateError(std::string("non-finite house cusps for ") + houseSystemName(system));

    HouseResult R;
    R.system = system;
    R.ascendant = norm360(H.ascendant);
    R.midheaven = norm360(H.midheaven);

    switch (system) {
    case HouseSystem::EqualAscCusp:
        equalCusps(R, R.ascendant);
        break;
    case HouseSystem::EqualAscMid:
        equalCusps(R, R.ascendant - 15.0);
        break;
    case HouseSystem::Placidus:
        for (int i = 0; i < 12; ++i) R.cusps[i] = norm360(H.cusps[i]);
        break;
    }

    spdlog::debug("houses {}: ASC {:.4f} MC {:.4f}", houseSystemName(system), R.ascendant, R.midheaven);
    return R;
}

} // namespace chartwheel
