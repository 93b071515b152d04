#pragma once

#include <string>

#include <boost/program_options.hpp>

#include "ChartEngine.hpp"
#include "Config.hpp"
#include "EphemerisExport.hpp"

namespace chartwheel {

namespace bpo = boost::program_options;

// Options for both commands; the first positional argument is the command.
bpo::options_description commandLineOptions();

// Throws MalformedInputError on unknown options or values of the wrong type.
bpo::variables_map parseCommandLine(int argc, const char* const argv[], const bpo::options_description& options);

// Config defaults first, then the command line.
ChartConfig applyOptions(ChartConfig config, const bpo::variables_map& vm);

ChartRequest chartRequest(const ChartConfig& config, const bpo::variables_map& vm);
ExportOptions exportRequest(const ChartConfig& config, const bpo::variables_map& vm);

// computeChart for printing. An unknown zone falls back to fallbackZone and a
// house system with no solution at the location leaves houses out; both are
// logged as warnings. Every other error propagates.
ChartSnapshot computeChartForDisplay(const EphemerisOracle& oracle, ChartRequest request,
                                     const std::string& fallbackZone);

} // namespace chartwheel
