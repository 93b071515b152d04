#pragma once

#include <string>
#include <vector>

#include "Ephemeris.hpp"

namespace chartwheel {

struct ResolverOptions {
    SiderealFrame frame{SiderealFrame::FaganBradley};
    double ayanamsaOffset{0.0};   // added to the frame's ayanamsa, may be negative
    Center center{Center::Geocentric};
    NodeType nodeType{NodeType::True};
};

// One row of the positions table.
struct BodyPosition {
    Body body{};
    double tropical{};
    double sidereal{};
    std::string tropicalSign;
    std::string siderealSign;
    double latitude{};
    double speed{};
    bool retrograde{};
};

// Tropical and sidereal longitudes of chart bodies. A resolver keeps one
// sidereal frame and one extra offset for its whole lifetime.
class PositionResolver {
public:
    PositionResolver(const EphemerisOracle& oracle, ResolverOptions options = {});

    // Normalized to [0, 360). The south node is derived from the north node.
    double tropicalLongitude(const Moment& t, Body body) const;

    double ayanamsa(const Moment& t) const;

    static double siderealLongitude(double tropical, double ayanamsa);

    // Rows for the requested bodies. Nodes are dropped in the heliocentric frame.
    std::vector<BodyPosition> resolve(const Moment& t, const std::vector<Body>& bodies) const;

private:
    const EphemerisOracle& oracle;
    ResolverOptions opts;
};

} // namespace chartwheel
