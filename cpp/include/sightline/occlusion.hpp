#pragma once

#include "geometry.hpp"

#include <optional>
#include <vector>

namespace sl {

enum class HitRanking {
    // Smaller line parameter t is nearer.
    Parametric,
    // Smaller |point.x - ray.p0.x| is nearer. Only meaningful for rays that are not near-vertical.
    AxisX
};

// Nearest obstacle crossing of the semi-infinite ray p0 -> p1 and beyond.
std::optional<Hit> first_hit(const Segment& ray, const std::vector<Circle>& obstacles,
                             HitRanking ranking = HitRanking::Parametric);

// As first_hit(), but the scan stops at p1.
std::optional<Hit> first_hit_within(const Segment& segment, const std::vector<Circle>& obstacles,
                                    HitRanking ranking = HitRanking::Parametric);

// Shared implementation with explicit bounds.
std::optional<Hit> first_hit_bounded(const Segment& segment, const std::vector<Circle>& obstacles, RayBounds bounds,
                                     HitRanking ranking);

} // namespace sl
