#pragma once

namespace chartwheel {

struct Point {
    double x{};
    double y{};
};

// Screen coordinates, y growing downward. Longitude 0 sits at 9 o'clock and
// longitudes increase clockwise, for every layer of the wheel.
Point project(const Point& center, double radius, double longitude);

// Inverse of project: the longitude of the ray from center through p, [0, 360).
double longitudeAt(const Point& center, const Point& p);

} // namespace chartwheel
