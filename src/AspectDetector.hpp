#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Bodies.hpp"

namespace chartwheel {

// Aspect settings
struct AspectDefinition {
    std::string name;
    std::string glyph;
    double angle;          // exact angle in degrees, 0..180
    double orb;            // allowed deviation in degrees
    std::uint32_t color;   // 0xAARRGGBB for drawing
    float width;           // line width
    bool enabled;          // disabled entries keep their slot but never match
};

struct AspectHit {
    std::size_t first{};     // indices into the input sequences, first < second
    std::size_t second{};
    Body firstBody{};
    Body secondBody{};
    std::size_t definition{};  // index into the table
    double separation{};       // 0..180
    double deviation{};        // separation - angle
};

// Conjunction, Sextile, Square, Trine, Opposition; orb 6 each.
std::vector<AspectDefinition> defaultAspects();

// Copy of the table with every orb set to defaultOrb, then the leading entries
// overridden from a comma list such as "8,5,6,6,8". Blank items are dropped
// before the list is applied; unparseable or negative items throw.
std::vector<AspectDefinition> withOrbs(std::vector<AspectDefinition> table, double defaultOrb,
                                       const std::string& orbList);

// First definition (in table order) within orb, or -1.
int matchAspect(const std::vector<AspectDefinition>& table, double separation);

std::vector<AspectHit> detectAspects(const std::vector<Body>& bodies, const std::vector<double>& longitudes,
                                     const std::vector<AspectDefinition>& table);

// n x n symmetric labels ("<glyph><deviation>°"), empty where no aspect.
std::vector<std::vector<std::string>> aspectGrid(std::size_t n, const std::vector<AspectHit>& hits,
                                                 const std::vector<AspectDefinition>& table);

} // namespace chartwheel
