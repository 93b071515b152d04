#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "Bodies.hpp"

namespace chartwheel {

// Base of every failure the engine reports.
struct ChartError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Civil date/time text that does not parse or is out of calendar range.
struct MalformedInputError : ChartError {
    using ChartError::ChartError;
};

struct UnknownTimezoneError : ChartError {
    explicit UnknownTimezoneError(const std::string& tzid)
        : ChartError("unknown timezone: " + tzid), zone(tzid) {}
    std::string zone;
};

// The ephemeris could not compute a body at the requested time.
struct EphemerisRangeError : ChartError {
    EphemerisRangeError(Body b, const std::string& detail)
        : ChartError(std::string("ephemeris failed for ") + bodyName(b) + ": " + detail), body(b) {}
    explicit EphemerisRangeError(const std::string& detail)
        : ChartError("ephemeris failed: " + detail) {}
    std::optional<Body> body;  // empty for ayanamsa failures
};

struct InvalidCoordinateError : ChartError {
    using ChartError::ChartError;
};

struct HouseSystemDegenerateError : ChartError {
    using ChartError::ChartError;
};

// Node points requested in the heliocentric frame.
struct UnsupportedFrameError : ChartError {
    using ChartError::ChartError;
};

struct ConfigError : ChartError {
    using ChartError::ChartError;
};

// One step of a batch export failed; the batch stops there.
struct ExportStepError : ChartError {
    ExportStepError(std::size_t stepIndex, const std::string& cause)
        : ChartError("export failed at step " + std::to_string(stepIndex) + ": " + cause), step(stepIndex) {}
    std::size_t step;
};

} // namespace chartwheel
