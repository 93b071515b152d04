#pragma once

#include <string>
#include <vector>

namespace chartwheel {

enum class Body {
    Sun, Moon, Mercury, Venus, Mars,
    Jupiter, Saturn, Uranus, Neptune, Pluto,
    NorthNode, SouthNode
};

enum class NodeType { True, Mean };
enum class Center { Geocentric, Heliocentric };

const char* bodyName(Body b);
const char* bodyGlyph(Body b);
bool isNode(Body b);

// The ten classical planets, Sun first.
const std::vector<Body>& planets();

// Planets followed by the node pair when requested.
std::vector<Body> chartBodies(bool includeNodes);

NodeType parseNodeType(const std::string& s);
Center parseCenter(const std::string& s);

} // namespace chartwheel
