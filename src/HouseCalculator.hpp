#pragma once

#include <array>
#include <string>

#include "Ephemeris.hpp"

namespace chartwheel {

enum class HouseSystem {
    EqualAscCusp,   // Ascendant on the cusp of house 1
    EqualAscMid,    // Ascendant in the middle of house 1
    Placidus
};

// Accepts E / EQUAL / EQUAL_ASC_CUSP, EQUAL_ASC_MID, P / PLACIDUS.
HouseSystem parseHouseSystem(const std::string& s);
const char* houseSystemName(HouseSystem hs);

struct HouseResult {
    HouseSystem system{HouseSystem::EqualAscCusp};
    std::array<double, 12> cusps{};  // house 1 first, [0, 360)
    double ascendant{};
    double midheaven{};
};

// Latitude beyond which Placidus has no solution for part of the ecliptic.
constexpr double kPolarCircleLatitude = 90.0 - 23.4393;

HouseResult computeHouses(const EphemerisOracle& oracle, const Moment& t,
                          double latitude, double longitude, HouseSystem system);

} // namespace chartwheel
