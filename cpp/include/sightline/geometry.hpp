#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sl {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(double s, Vec2 v) { return {s * v.x, s * v.y}; }

inline double dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }
inline double length_sq(Vec2 v) { return dot(v, v); }

// Radius 0 stands for a point location.
struct Circle {
    Vec2 center{};
    double r = 0.0;
};

struct Segment {
    Vec2 p0{};
    Vec2 p1{};

    Vec2 at(double t) const { return p0 + t * (p1 - p0); }
};

// Restricts the line parameter t: lower_bounded means t >= 0, upper_bounded means t <= 1.
struct RayBounds {
    bool lower_bounded = true;
    bool upper_bounded = true;

    bool admits(double t) const { return (!lower_bounded || t >= 0.0) && (!upper_bounded || t <= 1.0); }
};

constexpr RayBounds kLine{false, false};
constexpr RayBounds kRay{true, false};
constexpr RayBounds kSegment{true, true};

struct Hit {
    Vec2 point{};
    double t = 0.0;
    std::size_t obstacle_index = 0;
    Circle obstacle{};
};

class InvalidGeometry : public std::runtime_error {
  public:
    explicit InvalidGeometry(const std::string& what) : std::runtime_error(what) {}
};

} // namespace sl
