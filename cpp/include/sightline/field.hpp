#pragma once

#include "geometry.hpp"
#include "rng.hpp"

#include <array>
#include <optional>
#include <vector>

namespace sl {

struct FieldSpec {
    int count = 0;
    double width = 0.0;
    double height = 0.0;
    int min_radius = 0;
    int max_radius = 0;
};

// Integer centers inside [0, width] x [0, height], integer radii in [min_radius, max_radius].
std::vector<Circle> generate_obstacles(DeterministicRng& rng, const FieldSpec& spec);

using Quad = std::array<Vec2, 4>;

// Quadrilateral bounded by the two external tangents from `source` to `target`.
std::optional<Quad> tangent_corridor(const Circle& source, const Circle& target);

bool circle_overlaps_quad(const Quad& quad, const Circle& circle);

} // namespace sl
