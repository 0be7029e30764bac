#include "sightline/field.hpp"

#include "sightline/tangents.hpp"

#include <algorithm>
#include <stdexcept>

namespace sl {
namespace {

bool point_inside_quad(const Quad& quad, Vec2 p) {
    bool inside = false;
    for (std::size_t i = 0, j = quad.size() - 1; i < quad.size(); j = i++) {
        const Vec2 a = quad[i];
        const Vec2 b = quad[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const double x_at = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_at) inside = !inside;
        }
    }
    return inside;
}

double distance_sq_to_edge(Vec2 p, Vec2 a, Vec2 b) {
    const Vec2 ab = b - a;
    const double len_sq = length_sq(ab);
    if (len_sq == 0.0) return length_sq(p - a);
    const double t = std::clamp(dot(p - a, ab) / len_sq, 0.0, 1.0);
    return length_sq(p - (a + t * ab));
}

} // namespace

std::vector<Circle> generate_obstacles(DeterministicRng& rng, const FieldSpec& spec) {
    if (spec.count < 0 || spec.min_radius < 0 || spec.max_radius < spec.min_radius) {
        throw std::invalid_argument("invalid obstacle field spec");
    }

    std::vector<Circle> obstacles;
    obstacles.reserve(static_cast<std::size_t>(spec.count));
    for (int i = 0; i < spec.count; ++i) {
        Circle c{};
        c.center.x = rng.uniform_int(0, static_cast<int>(spec.width));
        c.center.y = rng.uniform_int(0, static_cast<int>(spec.height));
        c.r = rng.uniform_int(spec.min_radius, spec.max_radius);
        obstacles.push_back(c);
    }
    return obstacles;
}

std::optional<Quad> tangent_corridor(const Circle& source, const Circle& target) {
    const auto lines = tangents(source, target);
    if (lines.size() < 2) return std::nullopt;
    const Segment& upper = lines[kExternalTangents[0]];
    const Segment& lower = lines[kExternalTangents[1]];
    return Quad{upper.p0, lower.p0, lower.p1, upper.p1};
}

bool circle_overlaps_quad(const Quad& quad, const Circle& circle) {
    if (point_inside_quad(quad, circle.center)) return true;
    const double r_sq = circle.r * circle.r;
    for (std::size_t i = 0; i < quad.size(); ++i) {
        const Vec2 a = quad[i];
        const Vec2 b = quad[(i + 1) % quad.size()];
        if (distance_sq_to_edge(circle.center, a, b) <= r_sq) return true;
    }
    return false;
}

} // namespace sl
