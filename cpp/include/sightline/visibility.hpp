#pragma once

#include "geometry.hpp"
#include "occlusion.hpp"

#include <optional>
#include <vector>

namespace sl {

enum class OcclusionExtent {
    // Tangents are tested only between source and target.
    Segment,
    // Tangents are scanned past the target; obstacles behind it also block.
    Ray
};

struct VisibilityOptions {
    OcclusionExtent extent = OcclusionExtent::Segment;
    HitRanking ranking = HitRanking::Parametric;
};

struct TangentVisibility {
    Segment tangent{};
    std::optional<Hit> hit;
};

// True iff no source-to-target tangent is blocked by an obstacle. Nested or
// concentric circles have no tangents and are reported visible.
bool is_visible(const Circle& target, const Circle& source, const std::vector<Circle>& obstacles,
                const VisibilityOptions& options = {});

// Every tangent from source to target with its nearest blocking hit.
std::vector<TangentVisibility> visible_tangents(const Circle& target, const Circle& source,
                                                const std::vector<Circle>& obstacles,
                                                const VisibilityOptions& options = {});

} // namespace sl
