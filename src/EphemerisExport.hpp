#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "ChartEngine.hpp"

namespace chartwheel {

enum class ExportStep { Hour, SixHours, Day };

ExportStep parseExportStep(const std::string& s);

struct ExportOptions {
    CivilDateTime start;  // UTC
    CivilDateTime end;    // UTC, inclusive
    ExportStep step{ExportStep::Day};
    ResolverOptions resolver;
    ZodiacMode zodiac{ZodiacMode::Tropical};
    bool includeNodes{true};
};

// Column bodies for the options; nodes are left out in the heliocentric frame.
std::vector<Body> exportColumns(const ExportOptions& options);

// Writes "timestamp,<bodies...>" and one row per step to out, returning the
// row count. Nothing is written if any step fails; the failure is rethrown as
// ExportStepError carrying the step index.
std::size_t exportEphemerisCsv(const EphemerisOracle& oracle, const ExportOptions& options, std::ostream& out);

} // namespace chartwheel
