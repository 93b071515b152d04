#pragma once

#include <array>
#include <string>

#include "Bodies.hpp"
#include "TimeNormalizer.hpp"

namespace chartwheel {

enum class SiderealFrame { FaganBradley, Lahiri, DeLuce, Raman, Krishnamurti, Yukteshwar };

SiderealFrame parseSiderealFrame(const std::string& s);
const char* siderealFrameName(SiderealFrame f);

struct EclipticPosition {
    double longitude{};  // degrees, not necessarily normalized
    double latitude{};
    double distance{};   // AU
    double speed{};      // degrees per day in longitude
};

struct OracleHouses {
    std::array<double, 12> cusps{};  // house 1 first
    double ascendant{};
    double midheaven{};
};

// Position-at-time backend. Julian Day (UT) in, degrees out.
// Failures throw EphemerisRangeError or HouseSystemDegenerateError.
class EphemerisOracle {
public:
    virtual ~EphemerisOracle() = default;

    // North node only for the node pair; SouthNode is never asked for.
    virtual EclipticPosition position(const Moment& t, Body body, Center center, NodeType node) const = 0;

    virtual double ayanamsa(const Moment& t, SiderealFrame frame) const = 0;

    // hsys is the single-letter house code ('E' equal, 'P' Placidus).
    virtual OracleHouses houses(const Moment& t, double lat, double lon, char hsys) const = 0;

    virtual std::string name() const = 0;
};

} // namespace chartwheel
