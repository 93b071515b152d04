#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ChartEngine.hpp"
#include "PolarProjector.hpp"

namespace chartwheel {

// Concentric radii of the wheel layers, in the renderer's units.
struct WheelLayout {
    double size{560.0};
    double outerRadius{};   // sector boundaries
    double signRadius{};    // sign glyphs
    double bodyRadius{};    // body markers
    double aspectRadius{};  // aspect line endpoints

    static WheelLayout forSize(double size);
    Point center() const { return { size / 2.0, size / 2.0 }; }
};

struct Segment {
    Point from;
    Point to;
};

struct WheelLabel {
    Point at;
    std::string text;
};

struct BodyMarker {
    Body body{};
    double longitude{};
    Point at;
    std::string glyph;
};

struct HouseSpoke {
    int house{};        // 1..12
    double longitude{};
    Segment line;
};

struct AspectLine {
    std::size_t hit{};  // index into ChartSnapshot::aspects
    std::string name;
    std::uint32_t color{};
    float width{};
    Segment line;
};

struct WheelGeometry {
    WheelLayout layout;
    std::string title;
    std::vector<Segment> sectors;       // 12 sign boundaries, center to rim
    std::vector<WheelLabel> signs;      // glyph at the middle of each sign
    std::vector<HouseSpoke> houses;     // empty when the chart has no houses
    std::vector<BodyMarker> bodies;
    std::vector<AspectLine> aspects;
};

WheelGeometry buildWheel(const ChartSnapshot& chart, const WheelLayout& layout);

} // namespace chartwheel
