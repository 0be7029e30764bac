#include "sightline/visibility.hpp"

#include "sightline/tangents.hpp"

namespace sl {
namespace {

// First obstacle containing `point`, or inside which a zero-length tangent lies.
std::optional<Hit> point_hit(Vec2 point, const std::vector<Circle>& obstacles) {
    for (std::size_t i = 0; i < obstacles.size(); ++i) {
        const Circle& o = obstacles[i];
        if (length_sq(point - o.center) <= o.r * o.r) {
            return Hit{point, 0.0, i, o};
        }
    }
    return std::nullopt;
}

std::optional<Hit> probe(const Segment& tangent, const std::vector<Circle>& obstacles,
                         const VisibilityOptions& options) {
    if (length_sq(tangent.p1 - tangent.p0) == 0.0) {
        return point_hit(tangent.p0, obstacles);
    }
    if (options.extent == OcclusionExtent::Ray) {
        return first_hit(tangent, obstacles, options.ranking);
    }
    // A tangent starting inside an obstacle has no crossing in [0, 1] when it also ends inside.
    if (auto inside = point_hit(tangent.p0, obstacles)) return inside;
    return first_hit_within(tangent, obstacles, options.ranking);
}

std::vector<Segment> candidate_lines(const Circle& target, const Circle& source) {
    // Point-to-point: every tangent family collapses onto the same line.
    if (source.r == 0.0 && target.r == 0.0) {
        if (length_sq(target.center - source.center) == 0.0) return {};
        return {Segment{source.center, target.center}};
    }
    return tangents(source, target);
}

} // namespace

bool is_visible(const Circle& target, const Circle& source, const std::vector<Circle>& obstacles,
                const VisibilityOptions& options) {
    for (const auto& line : candidate_lines(target, source)) {
        if (probe(line, obstacles, options).has_value()) return false;
    }
    return true;
}

std::vector<TangentVisibility> visible_tangents(const Circle& target, const Circle& source,
                                                const std::vector<Circle>& obstacles,
                                                const VisibilityOptions& options) {
    std::vector<TangentVisibility> out;
    for (const auto& line : tangents(source, target)) {
        out.push_back({line, probe(line, obstacles, options)});
    }
    return out;
}

} // namespace sl
