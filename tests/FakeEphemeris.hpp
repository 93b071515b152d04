#pragma once

#include <limits>
#include <map>
#include <set>
#include <stdexcept>

#include "Ephemeris.hpp"
#include "Errors.hpp"

namespace chartwheel::test {

// Scripted oracle: fixed answers, call counters and injectable failures.
class FakeEphemeris : public EphemerisOracle {
public:
    std::map<Body, double> longitudes;
    double trueNode{100.0};
    double meanNode{101.5};
    double nodeSpeed{-0.05};
    double ayanamsaValue{24.0};
    OracleHouses houseAnswer;
    std::set<Body> failing;
    double failFromJd{std::numeric_limits<double>::infinity()};

    mutable std::map<Body, int> positionCalls;
    mutable std::map<Body, Center> lastCenter;
    mutable int ayanamsaCalls{0};
    mutable int houseCalls{0};
    mutable char lastHouseCode{0};

    EclipticPosition position(const Moment& t, Body body, Center center, NodeType node) const override {
        if (body == Body::SouthNode)
            throw std::logic_error("south node must never be queried");
        ++positionCalls[body];
        lastCenter[body] = center;
        if (failing.count(body) || t.julianDayUT() >= failFromJd)
            throw EphemerisRangeError(body, "outside the fake's time range");

        EclipticPosition p;
        if (body == Body::NorthNode) {
            p.longitude = node == NodeType::Mean ? meanNode : trueNode;
            p.speed = nodeSpeed;
            return p;
        }
        auto it = longitudes.find(body);
        p.longitude = it != longitudes.end() ? it->second : 10.0 * (int)body;
        p.latitude = 1.0;
        p.speed = 1.0;
        return p;
    }

    double ayanamsa(const Moment& t, SiderealFrame) const override {
        ++ayanamsaCalls;
        if (t.julianDayUT() >= failFromJd)
            throw EphemerisRangeError("outside the fake's time range");
        return ayanamsaValue;
    }

    OracleHouses houses(const Moment&, double, double, char hsys) const override {
        ++houseCalls;
        lastHouseCode = hsys;
        return houseAnswer;
    }

    std::string name() const override { return "fake"; }
};

} // namespace chartwheel::test
