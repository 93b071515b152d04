#pragma once

#include <string>

#include "Ephemeris.hpp"

namespace chartwheel {

// EphemerisOracle over the Swiss Ephemeris C library.
//
// The library keeps process-wide state (ephemeris path, sidereal mode, open
// files) and is not reentrant, so every call goes through one process-wide
// lock. Construct one instance per process; the destructor calls swe_close().
// With no .se1 files on the path the library falls back to its built-in
// Moshier ephemeris.
class SwissEphemeris : public EphemerisOracle {
public:
    explicit SwissEphemeris(const std::string& ephePath = {});
    ~SwissEphemeris() override;

    SwissEphemeris(const SwissEphemeris&) = delete;
    SwissEphemeris& operator=(const SwissEphemeris&) = delete;

    EclipticPosition position(const Moment& t, Body body, Center center, NodeType node) const override;
    double ayanamsa(const Moment& t, SiderealFrame frame) const override;
    OracleHouses houses(const Moment& t, double lat, double lon, char hsys) const override;
    std::string name() const override;

private:
    std::string path;
};

} // namespace chartwheel
