#include "sightline/occlusion.hpp"

#include "sightline/intersect.hpp"

#include <cmath>

namespace sl {
namespace {

double rank_key(const Segment& ray, Vec2 point, double t, HitRanking ranking) {
    if (ranking == HitRanking::AxisX) return std::abs(point.x - ray.p0.x);
    return t;
}

} // namespace

std::optional<Hit> first_hit_bounded(const Segment& segment, const std::vector<Circle>& obstacles, RayBounds bounds,
                                     HitRanking ranking) {
    std::optional<Hit> best;
    double best_key = 0.0;

    for (std::size_t i = 0; i < obstacles.size(); ++i) {
        const Circle& obstacle = obstacles[i];
        for (const double t : intersect_params(obstacle, segment, bounds)) {
            const Vec2 point = segment.at(t);
            const double key = rank_key(segment, point, t, ranking);
            // Strict comparison: ties keep the earlier obstacle.
            if (!best.has_value() || key < best_key) {
                best = Hit{point, t, i, obstacle};
                best_key = key;
            }
        }
    }
    return best;
}

std::optional<Hit> first_hit(const Segment& ray, const std::vector<Circle>& obstacles, HitRanking ranking) {
    return first_hit_bounded(ray, obstacles, kRay, ranking);
}

std::optional<Hit> first_hit_within(const Segment& segment, const std::vector<Circle>& obstacles, HitRanking ranking) {
    return first_hit_bounded(segment, obstacles, kSegment, ranking);
}

} // namespace sl
