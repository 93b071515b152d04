#include "EphemerisExport.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

namespace {

std::chrono::seconds stepLength(ExportStep step) {
    switch (step) {
    case ExportStep::Hour:     return std::chrono::hours{ 1 };
    case ExportStep::SixHours: return std::chrono::hours{ 6 };
    case ExportStep::Day:      return std::chrono::hours{ 24 };
    }
    return std::chrono::hours{ 24 };
}

} // namespace

ExportStep parseExportStep(const std::string& s) {
    auto v = toLower(trim(s));
    if (v == "hour" || v == "1h") return ExportStep::Hour;
    if (v == "6h" || v == "6hour" || v == "6hours") return ExportStep::SixHours;
    if (v == "day" || v == "1d") return ExportStep::Day;
    throw MalformedInputError("unknown export step: " + s);
}

std::vector<Body> exportColumns(const ExportOptions& options) {
    bool nodes = options.includeNodes && options.resolver.center == Center::Geocentric;
    return chartBodies(nodes);
}

std::size_t exportEphemerisCsv(const EphemerisOracle& oracle, const ExportOptions& options, std::ostream& out) {
    const auto start = toSysTime(options.start);
    const auto end = toSysTime(options.end);
    if (end < start)
        throw MalformedInputError("export range ends before it starts: " + options.start.str() + " .. " + options.end.str());

    const auto columns = exportColumns(options);
    const auto step = stepLength(options.step);
    PositionResolver resolver(oracle, options.resolver);

    std::ostringstream csv;
    csv << "timestamp";
    for (Body b : columns) csv << ',' << bodyName(b);
    csv << '\n';

    std::size_t index = 0;
    for (auto t = start; t <= end; t += step, ++index) {
        try {
            auto time = normalizeUtc(t);
            auto rows = resolver.resolve(time.moment, columns);
            csv << time.utc.isoUtc();
            for (const auto& r : rows)
                csv << ',' << std::fixed << std::setprecision(6)
                    << (options.zodiac == ZodiacMode::Tropical ? r.tropical : r.sidereal);
            csv << '\n';
        }
        catch (const ChartError& e) {
            spdlog::error("ephemeris export stopped at step {}: {}", index, e.what());
            throw ExportStepError(index, e.what());
        }
    }

    out << csv.str();
    spdlog::debug("exported {} rows ({} .. {})", index, options.start.str(), options.end.str());
    return index;
}

} // namespace chartwheel
