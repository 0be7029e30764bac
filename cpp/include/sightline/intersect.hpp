#pragma once

#include "geometry.hpp"

#include <vector>

namespace sl {

// Points where the line through `segment` crosses `circle`, restricted by `bounds`.
// Returned in ascending t. Throws InvalidGeometry for a zero-length segment.
std::vector<Vec2> intersect(const Circle& circle, const Segment& segment, RayBounds bounds = kSegment);

// Same roots as intersect(), as line parameters instead of points.
std::vector<double> intersect_params(const Circle& circle, const Segment& segment, RayBounds bounds = kSegment);

} // namespace sl
