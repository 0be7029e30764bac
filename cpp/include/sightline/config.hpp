#pragma once

#include <cstdint>

namespace sl {

// Relative tangency tolerance. Circles report no tangents when
// d^2 <= (rA - rB)^2 + eps * max(d^2, (rA - rB)^2), and a tangent family is
// kept while c^2 <= 1 + eps. Both tests are scale independent.
constexpr double kTangencyEpsilon = 1e-9;

constexpr int kTargetFps = 60;
constexpr int kWindowWidth = 800;
constexpr int kWindowHeight = 600;

constexpr int kDefaultObstacleCount = 10;
constexpr int kObstacleMinRadius = 10;
constexpr int kObstacleMaxRadius = 100;

constexpr double kTargetX = 200.0;
constexpr double kTargetY = 200.0;
constexpr double kTargetRadius = 100.0;

constexpr double kSourceRadiusStep = 10.0;
constexpr double kSourceMinRadius = 10.0;
constexpr double kSourceMaxRadius = 200.0;
constexpr double kSourceDefaultRadius = 100.0;

constexpr int kDefaultSweepFrames = 360;
constexpr uint64_t kDefaultSeed = 1337;

} // namespace sl
