#pragma once

#include <cmath>
#include <string>

namespace chartwheel {

constexpr double kPi = 3.14159265358979323846;

inline double norm360(double x) { double y = std::fmod(x, 360.0); if (y < 0) y += 360.0; return y >= 360.0 ? 0.0 : y; }
inline double deg2rad(double deg) { return deg * kPi / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / kPi; }

// Shortest arc between two longitudes, 0..180.
inline double angularSeparation(double a, double b) {
    double d = std::fmod(std::fabs(a - b), 360.0);
    return d <= 180.0 ? d : 360.0 - d;
}

struct DMS { int deg; int min; double sec; };
DMS toDMS(double degrees);

extern const char* const SIGN_NAMES[12];
extern const char* const SIGN_GLYPHS[12];

int signIndex(double lon);

// "Cancer 10° 04' 12.34\"", degrees within the sign.
std::string fmtLongitude(double lon, bool asciiDegrees = false);

// "10°04'12\" Cancer", whole seconds with carry into minutes and degrees.
std::string fmtZodiac(double lon, bool asciiDegrees = false);

} // namespace chartwheel
