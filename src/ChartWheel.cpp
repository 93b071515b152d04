#include "ChartWheel.hpp"

#include "Angles.hpp"

namespace chartwheel {

WheelLayout WheelLayout::forSize(double size) {
    WheelLayout L;
    L.size = size;
    L.outerRadius = size / 2.0 - 12.0;
    L.signRadius = L.outerRadius - 26.0;
    L.bodyRadius = L.outerRadius - 60.0;
    L.aspectRadius = L.outerRadius - 90.0;
    return L;
}

WheelGeometry buildWheel(const ChartSnapshot& chart, const WheelLayout& layout) {
    WheelGeometry W;
    W.layout = layout;
    W.title = std::string("Chart - ") + (chart.zodiac == ZodiacMode::Tropical ? "Tropical" : "Sidereal ("
        + std::string(siderealFrameName(chart.frame)) + ")");

    const Point C = layout.center();

    // zodiac slices (12 * 30°)
    for (int i = 0; i < 12; ++i) {
        double a = i * 30.0;
        W.sectors.push_back({ C, project(C, layout.outerRadius, a) });
        W.signs.push_back({ project(C, layout.signRadius, a + 15.0), SIGN_GLYPHS[i] });
    }

    if (chart.houses) {
        for (int h = 0; h < 12; ++h) {
            double lon = chart.houses->cusps[h];
            W.houses.push_back({ h + 1, lon, { C, project(C, layout.outerRadius, lon) } });
        }
    }

    const auto longs = chart.longitudes();
    for (std::size_t i = 0; i < chart.bodies.size(); ++i) {
        Body b = chart.bodies[i].body;
        W.bodies.push_back({ b, longs[i], project(C, layout.bodyRadius, longs[i]), bodyGlyph(b) });
    }

    for (std::size_t k = 0; k < chart.aspects.size(); ++k) {
        const auto& hit = chart.aspects[k];
        const auto& def = chart.aspectTable.at(hit.definition);
        AspectLine line;
        line.hit = k;
        line.name = def.name;
        line.color = def.color;
        line.width = def.width;
        line.line = { project(C, layout.aspectRadius, longs.at(hit.first)),
                      project(C, layout.aspectRadius, longs.at(hit.second)) };
        W.aspects.push_back(line);
    }
    return W;
}

} // namespace chartwheel
