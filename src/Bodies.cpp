#include "Bodies.hpp"

#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

const char* bodyName(Body b) {
    switch (b) {
    case Body::Sun:       return "Sun";
    case Body::Moon:      return "Moon";
    case Body::Mercury:   return "Mercury";
    case Body::Venus:     return "Venus";
    case Body::Mars:      return "Mars";
    case Body::Jupiter:   return "Jupiter";
    case Body::Saturn:    return "Saturn";
    case Body::Uranus:    return "Uranus";
    case Body::Neptune:   return "Neptune";
    case Body::Pluto:     return "Pluto";
    case Body::NorthNode: return "North Node";
    case Body::SouthNode: return "South Node";
    }
    return "Body";
}

const char* bodyGlyph(Body b) {
    switch (b) {
    case Body::Sun:       return u8"☉";
    case Body::Moon:      return u8"☽";
    case Body::Mercury:   return u8"☿";
    case Body::Venus:     return u8"♀";
    case Body::Mars:      return u8"♂";
    case Body::Jupiter:   return u8"♃";
    case Body::Saturn:    return u8"♄";
    case Body::Uranus:    return u8"♅";
    case Body::Neptune:   return u8"♆";
    case Body::Pluto:     return u8"♇";
    case Body::NorthNode: return u8"☊";
    case Body::SouthNode: return u8"☋";
    }
    return "?";
}

bool isNode(Body b) { return b == Body::NorthNode || b == Body::SouthNode; }

const std::vector<Body>& planets() {
    static const std::vector<Body> kPlanets = {
        Body::Sun, Body::Moon, Body::Mercury, Body::Venus, Body::Mars,
        Body::Jupiter, Body::Saturn, Body::Uranus, Body::Neptune, Body::Pluto
    };
    return kPlanets;
}

std::vector<Body> chartBodies(bool includeNodes) {
    std::vector<Body> out = planets();
    if (includeNodes) {
        out.push_back(Body::NorthNode);
        out.push_back(Body::SouthNode);
    }
    return out;
}

NodeType parseNodeType(const std::string& s) {
    auto v = toLower(trim(s));
    if (v == "true") return NodeType::True;
    if (v == "mean") return NodeType::Mean;
    throw MalformedInputError("unknown node type: " + s);
}

Center parseCenter(const std::string& s) {
    auto v = toLower(trim(s));
    if (v == "geo" || v == "geocentric") return Center::Geocentric;
    if (v == "helio" || v == "heliocentric") return Center::Heliocentric;
    throw MalformedInputError("unknown center: " + s);
}

} // namespace chartwheel
