#include "sightline/intersect.hpp"

#include <cmath>

namespace sl {

std::vector<double> intersect_params(const Circle& circle, const Segment& segment, RayBounds bounds) {
    if (circle.r < 0.0) {
        throw InvalidGeometry("circle radius must be non-negative");
    }

    const Vec2 d = segment.p1 - segment.p0;
    const Vec2 m = segment.p0 - circle.center;
    const double a = length_sq(d);
    if (a == 0.0) {
        throw InvalidGeometry("segment endpoints coincide");
    }
    const double b = 2.0 * dot(d, m);
    const double c = length_sq(m) - circle.r * circle.r;
    const double disc = b * b - 4.0 * a * c;

    std::vector<double> roots;
    if (disc < 0.0) return roots;

    if (disc == 0.0) {
        const double t = -b / (2.0 * a);
        if (bounds.admits(t)) roots.push_back(t);
        return roots;
    }

    const double s = std::sqrt(disc);
    const double t0 = (-b - s) / (2.0 * a);
    const double t1 = (-b + s) / (2.0 * a);
    if (bounds.admits(t0)) roots.push_back(t0);
    if (bounds.admits(t1)) roots.push_back(t1);
    return roots;
}

std::vector<Vec2> intersect(const Circle& circle, const Segment& segment, RayBounds bounds) {
    const auto roots = intersect_params(circle, segment, bounds);
    std::vector<Vec2> points;
    points.reserve(roots.size());
    for (const double t : roots) {
        points.push_back(segment.at(t));
    }
    return points;
}

} // namespace sl
