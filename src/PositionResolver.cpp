#include "PositionResolver.hpp"

#include <cmath>
#include <optional>

#include <spdlog/spdlog.h>

#include "Angles.hpp"
#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

SiderealFrame parseSiderealFrame(const std::string& s) {
    auto v = toLower(trim(s));
    if (v == "fagan_bradley" || v == "fagan-bradley" || v == "fb") return SiderealFrame::FaganBradley;
    if (v == "lahiri") return SiderealFrame::Lahiri;
    if (v == "deluce" || v == "de_luce") return SiderealFrame::DeLuce;
    if (v == "raman") return SiderealFrame::Raman;
    if (v == "krishnamurti" || v == "kp") return SiderealFrame::Krishnamurti;
    if (v == "yukteshwar") return SiderealFrame::Yukteshwar;
    throw MalformedInputError("unknown sidereal frame: " + s);
}

const char* siderealFrameName(SiderealFrame f) {
    switch (f) {
    case SiderealFrame::FaganBradley: return "Fagan/Bradley";
    case SiderealFrame::Lahiri:       return "Lahiri";
    case SiderealFrame::DeLuce:       return "De Luce";
    case SiderealFrame::Raman:        return "Raman";
    case SiderealFrame::Krishnamurti: return "Krishnamurti";
    case SiderealFrame::Yukteshwar:   return "Yukteshwar";
    }
    return "Custom";
}

PositionResolver::PositionResolver(const EphemerisOracle& oracle, ResolverOptions options)
    : oracle(oracle), opts(options) {}

double PositionResolver::tropicalLongitude(const Moment& t, Body body) const {
    if (isNode(body) && opts.center == Center::Heliocentric)
        throw UnsupportedFrameError(std::string(bodyName(body)) + " is defined only in the geocentric frame");

    if (body == Body::SouthNode)
        return norm360(tropicalLongitude(t, Body::NorthNode) + 180.0);

    auto p = oracle.position(t, body, opts.center, opts.nodeType);
    if (!std::isfinite(p.longitude))
        throw EphemerisRangeError(body, "non-finite longitude");
    return norm360(p.longitude);
}

double PositionResolver::ayanamsa(const Moment& t) const {
    return oracle.ayanamsa(t, opts.frame) + opts.ayanamsaOffset;
}

double PositionResolver::siderealLongitude(double tropical, double ayanamsa) {
    return norm360(tropical - ayanamsa);
}

std::vector<BodyPosition> PositionResolver::resolve(const Moment& t, const std::vector<Body>& bodies) const {
    const double ayan = ayanamsa(t);
    spdlog::debug("ayanamsa {} {:+.4f} at JD {:.5f} = {:.6f}", siderealFrameName(opts.frame), opts.ayanamsaOffset,
        t.julianDayUT(), ayan);

    std::optional<EclipticPosition> northNode;
    auto queryNorth = [&]() {
        if (!northNode) {
            auto p = oracle.position(t, Body::NorthNode, Center::Geocentric, opts.nodeType);
            if (!std::isfinite(p.longitude))
                throw EphemerisRangeError(Body::NorthNode, "non-finite longitude");
            p.longitude = norm360(p.longitude);
            northNode = p;
        }
        return *northNode;
    };

    std::vector<BodyPosition> rows;
    rows.reserve(bodies.size());
    for (Body body : bodies) {
        if (isNode(body) && opts.center == Center::Heliocentric) {
            spdlog::debug("skipping {} in heliocentric frame", bodyName(body));
            continue;
        }

        EclipticPosition p;
        if (body == Body::NorthNode) {
            p = queryNorth();
        }
        else if (body == Body::SouthNode) {
            p = queryNorth();
            p.longitude = norm360(p.longitude + 180.0);
            p.latitude = -p.latitude;
        }
        else {
            p = oracle.position(t, body, opts.center, opts.nodeType);
            if (!std::isfinite(p.longitude))
                throw EphemerisRangeError(body, "non-finite longitude");
        }

        BodyPosition row;
        row.body = body;
        row.tropical = norm360(p.longitude);
        row.sidereal = siderealLongitude(row.tropical, ayan);
        row.tropicalSign = fmtZodiac(row.tropical);
        row.siderealSign = fmtZodiac(row.sidereal);
        row.latitude = p.latitude;
        row.speed = p.speed;
        row.retrograde = (p.speed < 0);
        rows.push_back(row);
    }
    return rows;
}

} // namespace chartwheel
