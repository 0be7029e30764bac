#include <gtest/gtest.h>

#include <cmath>
#include <utility>
#include <vector>

#include "sightline/tangents.hpp"

namespace sl {
namespace {

constexpr double kTol = 1e-9;

double Distance(Vec2 a, Vec2 b) { return std::sqrt(length_sq(a - b)); }

void ExpectEndpointsOnCircles(const std::vector<Segment>& lines, const Circle& a, const Circle& b) {
    for (const Segment& s : lines) {
        EXPECT_NEAR(a.r, Distance(s.p0, a.center), 1e-7);
        EXPECT_NEAR(b.r, Distance(s.p1, b.center), 1e-7);
    }
}

TEST(TangentsTest, EqualCirclesSideBySide) {
    const Circle a{{0.0, 0.0}, 5.0};
    const Circle b{{20.0, 0.0}, 5.0};

    const std::vector<Segment> lines = tangents(a, b);
    ASSERT_EQ(4u, lines.size());

    // External pair runs along y = +5 and y = -5.
    const Segment& upper = lines[kExternalTangents[0]];
    const Segment& lower = lines[kExternalTangents[1]];
    EXPECT_NEAR(0.0, upper.p0.x, kTol);
    EXPECT_NEAR(5.0, upper.p0.y, kTol);
    EXPECT_NEAR(20.0, upper.p1.x, kTol);
    EXPECT_NEAR(5.0, upper.p1.y, kTol);
    EXPECT_NEAR(0.0, lower.p0.x, kTol);
    EXPECT_NEAR(-5.0, lower.p0.y, kTol);
    EXPECT_NEAR(20.0, lower.p1.x, kTol);
    EXPECT_NEAR(-5.0, lower.p1.y, kTol);

    // Internal pair crosses at the midpoint.
    for (const std::size_t index : kInternalTangents) {
        const Segment& s = lines[index];
        const Vec2 mid{(s.p0.x + s.p1.x) * 0.5, (s.p0.y + s.p1.y) * 0.5};
        EXPECT_NEAR(10.0, mid.x, kTol);
        EXPECT_NEAR(0.0, mid.y, kTol);
    }
    EXPECT_NEAR(2.5, lines[2].p0.x, kTol);
    EXPECT_NEAR(17.5, lines[2].p1.x, kTol);
    EXPECT_NEAR(-lines[2].p0.y, lines[3].p0.y, kTol);
}

TEST(TangentsTest, EndpointsLieOnTheirCircles) {
    const std::vector<std::pair<Circle, Circle>> pairs = {
        {{{0.0, 0.0}, 5.0}, {{20.0, 0.0}, 5.0}},
        {{{-3.0, 7.0}, 2.0}, {{40.0, -11.0}, 9.5}},
        {{{100.0, 100.0}, 30.0}, {{0.0, 0.0}, 1.0}},
        {{{0.0, 0.0}, 0.0}, {{10.0, 0.0}, 5.0}},
    };
    for (const auto& pair : pairs) {
        const std::vector<Segment> lines = tangents(pair.first, pair.second);
        ASSERT_EQ(4u, lines.size());
        ExpectEndpointsOnCircles(lines, pair.first, pair.second);
    }
}

TEST(TangentsTest, TangentIsPerpendicularToRadius) {
    const Circle a{{-3.0, 7.0}, 2.0};
    const Circle b{{40.0, -11.0}, 9.5};

    for (const Segment& s : tangents(a, b)) {
        const Vec2 dir = s.p1 - s.p0;
        EXPECT_NEAR(0.0, dot(dir, s.p0 - a.center), 1e-6);
        EXPECT_NEAR(0.0, dot(dir, s.p1 - b.center), 1e-6);
    }
}

TEST(TangentsTest, NestedCirclesHaveNoTangents) {
    EXPECT_TRUE(tangents({{0.0, 0.0}, 10.0}, {{2.0, 0.0}, 3.0}).empty());
    EXPECT_TRUE(tangents({{2.0, 0.0}, 3.0}, {{0.0, 0.0}, 10.0}).empty());
}

TEST(TangentsTest, ConcentricCirclesHaveNoTangents) {
    EXPECT_TRUE(tangents({{4.0, 4.0}, 5.0}, {{4.0, 4.0}, 5.0}).empty());
    EXPECT_TRUE(tangents({{4.0, 4.0}, 5.0}, {{4.0, 4.0}, 1.0}).empty());
    EXPECT_TRUE(tangents({{4.0, 4.0}, 0.0}, {{4.0, 4.0}, 0.0}).empty());
}

TEST(TangentsTest, InternallyTouchingCirclesHaveNoTangents) {
    // d == rA - rB exactly.
    EXPECT_TRUE(tangents({{0.0, 0.0}, 10.0}, {{7.0, 0.0}, 3.0}).empty());
}

TEST(TangentsTest, OverlappingCirclesKeepOnlyExternalPair) {
    const Circle a{{0.0, 0.0}, 5.0};
    const Circle b{{6.0, 0.0}, 5.0};

    const std::vector<Segment> lines = tangents(a, b);
    ASSERT_EQ(2u, lines.size());
    ExpectEndpointsOnCircles(lines, a, b);
    EXPECT_NEAR(5.0, lines[0].p0.y, kTol);
    EXPECT_NEAR(-5.0, lines[1].p0.y, kTol);
}

TEST(TangentsTest, ExternallyTouchingCirclesCollapseInternalPair) {
    const Circle a{{0.0, 0.0}, 5.0};
    const Circle b{{10.0, 0.0}, 5.0};

    const std::vector<Segment> lines = tangents(a, b);
    ASSERT_EQ(4u, lines.size());
    for (const std::size_t index : kInternalTangents) {
        EXPECT_NEAR(5.0, lines[index].p0.x, kTol);
        EXPECT_NEAR(0.0, lines[index].p0.y, kTol);
        EXPECT_NEAR(5.0, lines[index].p1.x, kTol);
        EXPECT_NEAR(0.0, lines[index].p1.y, kTol);
    }
}

TEST(TangentsTest, PointCirclesGiveTheConnectingLine) {
    const Circle a{{1.0, 2.0}, 0.0};
    const Circle b{{11.0, -3.0}, 0.0};

    const std::vector<Segment> lines = tangents(a, b);
    ASSERT_EQ(4u, lines.size());
    for (const Segment& s : lines) {
        EXPECT_NEAR(1.0, s.p0.x, kTol);
        EXPECT_NEAR(2.0, s.p0.y, kTol);
        EXPECT_NEAR(11.0, s.p1.x, kTol);
        EXPECT_NEAR(-3.0, s.p1.y, kTol);
    }
}

TEST(TangentsTest, ToleranceScalesWithCircleSize) {
    const Circle a{{0.0, 0.0}, 1e-5};
    const Circle b{{3e-5, 0.0}, 1e-5};

    const std::vector<Segment> lines = tangents(a, b);
    ASSERT_EQ(4u, lines.size());
    for (const Segment& s : lines) {
        EXPECT_NEAR(a.r, Distance(s.p0, a.center), 1e-12);
        EXPECT_NEAR(b.r, Distance(s.p1, b.center), 1e-12);
    }

    // Internal tangency at a large scale still reports no tangents.
    EXPECT_TRUE(tangents({{0.0, 0.0}, 1e6}, {{7e5, 0.0}, 3e5}).empty());
}

TEST(TangentsTest, NegativeRadiusThrows) {
    EXPECT_THROW(tangents({{0.0, 0.0}, -1.0}, {{10.0, 0.0}, 1.0}), InvalidGeometry);
}

TEST(TangentsTest, RepeatedCallsAreIdentical) {
    const Circle a{{-3.0, 7.0}, 2.0};
    const Circle b{{40.0, -11.0}, 9.5};

    const std::vector<Segment> first = tangents(a, b);
    const std::vector<Segment> second = tangents(a, b);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].p0.x, second[i].p0.x);
        EXPECT_EQ(first[i].p0.y, second[i].p0.y);
        EXPECT_EQ(first[i].p1.x, second[i].p1.x);
        EXPECT_EQ(first[i].p1.y, second[i].p1.y);
    }
}

} // namespace
} // namespace sl
