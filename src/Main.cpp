// Main.cpp: chartwheel command line (chart table, wheel geometry, CSV export)

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#endif

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Angles.hpp"
#include "ChartEngine.hpp"
#include "ChartWheel.hpp"
#include "CommandLine.hpp"
#include "Config.hpp"
#include "Logging.hpp"
#include "SwissEphemeris.hpp"

using namespace chartwheel;

namespace {

void printChart(const ChartSnapshot& S, bool asciiDegrees) {
    std::cout << "Local: " << S.time.local.str() << " [" << S.time.zoneLabel << "]\n"
        << "UTC:   " << S.time.utc.str() << "\n"
        << "JD:    " << std::fixed << std::setprecision(5) << S.time.moment.julianDayUT() << "\n"
        << "Ayanamsa (" << siderealFrameName(S.frame) << "): " << std::setprecision(6) << S.ayanamsa << "\n\n";

    std::cout << "Planets (" << (S.center == Center::Geocentric ? "geocentric" : "heliocentric") << "):\n";
    for (const auto& b : S.bodies) {
        std::cout << std::left << std::setw(11) << bodyName(b.body) << std::right
            << std::setw(11) << std::setprecision(6) << b.tropical << "  "
            << std::left << std::setw(28) << fmtLongitude(b.tropical, asciiDegrees)
            << std::right << std::setw(11) << b.sidereal << "  "
            << fmtLongitude(b.sidereal, asciiDegrees)
            << (b.retrograde ? " [R]" : "") << "\n";
    }

    if (S.houses) {
        const auto& H = *S.houses;
        std::cout << "\nHouses (" << houseSystemName(H.system) << "):\n";
        for (int i = 0; i < 12; ++i) {
            std::cout << "House " << std::setw(2) << i + 1 << ": "
                << fmtLongitude(H.cusps[i], asciiDegrees) << "\n";
        }
        std::cout << "\nAscendant: " << fmtLongitude(H.ascendant, asciiDegrees) << "\n";
        std::cout << "Midheaven: " << fmtLongitude(H.midheaven, asciiDegrees) << "\n";
    }

    std::cout << "\nAspects (" << zodiacModeName(S.zodiac) << "):\n";
    if (S.aspects.empty()) std::cout << "  none\n";
    for (const auto& h : S.aspects) {
        const auto& A = S.aspectTable[h.definition];
        std::cout << "  " << std::left << std::setw(11) << bodyName(h.firstBody)
            << std::setw(12) << A.name << std::setw(11) << bodyName(h.secondBody) << std::right
            << std::showpos << std::setprecision(2) << h.deviation << std::noshowpos << "\n";
    }
}

void printWheel(const WheelGeometry& W) {
    std::cout << "\n" << W.title << " (size " << W.layout.size << ")\n" << std::setprecision(1);
    for (std::size_t i = 0; i < W.signs.size(); ++i)
        std::cout << "sign   " << SIGN_NAMES[i] << " " << W.signs[i].at.x << "," << W.signs[i].at.y << "\n";
    for (const auto& h : W.houses)
        std::cout << "house  " << h.house << " " << h.line.to.x << "," << h.line.to.y << "\n";
    for (const auto& b : W.bodies)
        std::cout << "body   " << bodyName(b.body) << " " << b.at.x << "," << b.at.y << "\n";
    for (const auto& a : W.aspects)
        std::cout << "aspect " << a.name << " " << a.line.from.x << "," << a.line.from.y
            << " " << a.line.to.x << "," << a.line.to.y << "\n";
}

void printGrid(const ChartSnapshot& S) {
    auto grid = aspectGrid(S.bodies.size(), S.aspects, S.aspectTable);
    std::cout << "\nAspect grid:\n" << std::setw(12) << "";
    for (const auto& b : S.bodies) std::cout << std::setw(10) << bodyGlyph(b.body);
    std::cout << "\n";
    for (std::size_t i = 0; i < grid.size(); ++i) {
        std::cout << std::left << std::setw(12) << bodyName(S.bodies[i].body) << std::right;
        for (std::size_t j = 0; j < grid[i].size(); ++j)
            std::cout << std::setw(10) << (j < i ? grid[i][j] : std::string());
        std::cout << "\n";
    }
}

int runChart(const EphemerisOracle& ephe, const ChartConfig& cfg, const ChartConfig& fileCfg,
             const bpo::variables_map& vm) {
    auto S = computeChartForDisplay(ephe, chartRequest(cfg, vm), fileCfg.timezone);

    bool ascii = vm.count("ascii") > 0;
    printChart(S, ascii);
    if (vm.count("grid")) printGrid(S);
    if (vm.count("wheel")) printWheel(buildWheel(S, WheelLayout::forSize(560.0)));
    return 0;
}

int runExport(const EphemerisOracle& ephe, const ChartConfig& cfg, const bpo::variables_map& vm) {
    auto rows = exportEphemerisCsv(ephe, exportRequest(cfg, vm), std::cout);
    spdlog::info("exported {} rows", rows);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif

    try {
        initLogging("info");
        bpo::options_description options = commandLineOptions();
        bpo::variables_map vm = parseCommandLine(argc, argv, options);
        if (vm.count("help") || !vm.count("command")) {
            std::cout << "usage: chartwheel chart|export [options]\n" << options << std::endl;
            return vm.count("help") ? 0 : 1;
        }

        ChartConfig fileCfg = vm.count("config") ? loadConfigFile(vm["config"].as<std::string>()) : ChartConfig{};
        ChartConfig cfg = applyOptions(fileCfg, vm);
        setLogLevel(cfg.logLevel);

        SwissEphemeris ephe(cfg.ephemerisPath);
        spdlog::debug("using {}", ephe.name());

        const auto& command = vm["command"].as<std::string>();
        if (command == "chart") return runChart(ephe, cfg, fileCfg, vm);
        if (command == "export") return runExport(ephe, cfg, vm);

        std::cerr << "unknown command: " << command << "\n" << options << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
