#include "PolarProjector.hpp"

#include <cmath>

#include "Angles.hpp"

namespace chartwheel {

Point project(const Point& center, double radius, double longitude) {
    double a = deg2rad(180.0 - longitude);
    return { center.x + radius * std::cos(a), center.y - radius * std::sin(a) };
}

double longitudeAt(const Point& center, const Point& p) {
    double a = std::atan2(center.y - p.y, p.x - center.x);
    return norm360(180.0 - rad2deg(a));
}

} // namespace chartwheel
