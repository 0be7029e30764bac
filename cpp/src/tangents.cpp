#include "sightline/tangents.hpp"

#include "sightline/config.hpp"

#include <algorithm>
#include <cmath>

namespace sl {

std::vector<Segment> tangents(const Circle& a, const Circle& b) {
    if (a.r < 0.0 || b.r < 0.0) {
        throw InvalidGeometry("circle radius must be non-negative");
    }

    std::vector<Segment> out;
    const Vec2 delta = b.center - a.center;
    const double d_sq = length_sq(delta);
    const double dr = a.r - b.r;
    if (d_sq <= dr * dr + kTangencyEpsilon * std::max(d_sq, dr * dr)) return out;

    const double d = std::sqrt(d_sq);
    const Vec2 v{delta.x / d, delta.y / d};

    out.reserve(4);
    for (const double sign1 : {1.0, -1.0}) {
        const double c = (a.r - sign1 * b.r) / d;
        if (c * c > 1.0 + kTangencyEpsilon) continue;
        const double h = std::sqrt(std::max(0.0, 1.0 - c * c));

        for (const double sign2 : {1.0, -1.0}) {
            const Vec2 n{v.x * c - sign2 * h * v.y, v.y * c + sign2 * h * v.x};
            out.push_back({a.center + a.r * n, b.center + (sign1 * b.r) * n});
        }
    }
    return out;
}

} // namespace sl
