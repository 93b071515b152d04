#include "AspectDetector.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "Angles.hpp"
#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

namespace {

// palette for aspects, 0xAARRGGBB
constexpr std::uint32_t A_COL_CONJ = 0xBEE6E6E6;
constexpr std::uint32_t A_COL_SXT  = 0xAA78C8FF;
constexpr std::uint32_t A_COL_SQR  = 0xB4FF7878;
constexpr std::uint32_t A_COL_TRI  = 0xA08CEBA0;
constexpr std::uint32_t A_COL_OPP  = 0xAFE6BE5A;

double parseOrb(const std::string& text) {
    std::size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &pos);
    }
    catch (const std::exception&) {
        throw MalformedInputError("orb is not a number: '" + text + "'");
    }
    if (pos != text.size() || !std::isfinite(v) || v < 0.0)
        throw MalformedInputError("invalid orb: '" + text + "'");
    return v;
}

} // namespace

std::vector<AspectDefinition> defaultAspects() {
    return {
        { "Conjunction", u8"☌",   0.0, 6.0, A_COL_CONJ, 2.2f, true },
        { "Sextile",     u8"✶",  60.0, 6.0, A_COL_SXT,  1.8f, true },
        { "Square",      u8"□",  90.0, 6.0, A_COL_SQR,  1.9f, true },
        { "Trine",       u8"△", 120.0, 6.0, A_COL_TRI,  1.9f, true },
        { "Opposition",  u8"☍", 180.0, 6.0, A_COL_OPP,  2.0f, true },
    };
}

std::vector<AspectDefinition> withOrbs(std::vector<AspectDefinition> table, double defaultOrb,
                                       const std::string& orbList) {
    if (!std::isfinite(defaultOrb) || defaultOrb < 0.0) {
        std::ostringstream os;
        os << "invalid default orb: " << defaultOrb;
        throw MalformedInputError(os.str());
    }
    for (auto& A : table) A.orb = defaultOrb;

    std::size_t i = 0;
    for (const auto& item : splitCsv(orbList)) {
        auto part = trim(item);
        if (part.empty()) continue;
        if (i >= table.size()) break;
        table[i++].orb = parseOrb(part);
    }
    return table;
}

int matchAspect(const std::vector<AspectDefinition>& table, double separation) {
    for (std::size_t k = 0; k < table.size(); ++k) {
        const auto& A = table[k];
        if (!A.enabled) continue;
        if (std::fabs(separation - A.angle) <= A.orb) return (int)k;
    }
    return -1;
}

std::vector<AspectHit> detectAspects(const std::vector<Body>& bodies, const std::vector<double>& longitudes,
                                     const std::vector<AspectDefinition>& table) {
    if (bodies.size() != longitudes.size())
        throw std::invalid_argument("detectAspects: bodies and longitudes differ in length");

    std::vector<AspectHit> hits;
    const std::size_t n = longitudes.size();
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            double sep = angularSeparation(longitudes[i], longitudes[j]); // 0..180
            int k = matchAspect(table, sep);
            if (k < 0) continue;
            AspectHit h;
            h.first = i;
            h.second = j;
            h.firstBody = bodies[i];
            h.secondBody = bodies[j];
            h.definition = (std::size_t)k;
            h.separation = sep;
            h.deviation = sep - table[k].angle;
            hits.push_back(h);
        }
    }
    spdlog::debug("aspects: {} hits over {} pairs", hits.size(), n * (n > 0 ? n - 1 : 0) / 2);
    return hits;
}

std::vector<std::vector<std::string>> aspectGrid(std::size_t n, const std::vector<AspectHit>& hits,
                                                 const std::vector<AspectDefinition>& table) {
    std::vector<std::vector<std::string>> grid(n, std::vector<std::string>(n));
    for (const auto& h : hits) {
        if (h.first >= n || h.second >= n || h.definition >= table.size())
            throw std::out_of_range("aspectGrid: hit outside the grid");
        std::ostringstream os;
        os << table[h.definition].glyph << std::showpos << std::fixed << std::setprecision(2) << h.deviation << u8"°";
        grid[h.first][h.second] = os.str();
        grid[h.second][h.first] = os.str();
    }
    return grid;
}

} // namespace chartwheel
