#pragma once

#include "geometry.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace sl {

// Positions of each family in the result of tangents(). The external pair is
// present whenever any tangent exists; the internal pair is absent when the
// circles overlap.
constexpr std::array<std::size_t, 2> kExternalTangents{0, 1};
constexpr std::array<std::size_t, 2> kInternalTangents{2, 3};

// Up to four bitangents, each starting on `a` and ending on `b`, in
// (sign1, sign2) order (+,+), (+,-), (-,+), (-,-). Empty when one circle
// contains the other or they are concentric.
std::vector<Segment> tangents(const Circle& a, const Circle& b);

} // namespace sl
