/**
 * @file test_great_circle_segment.cpp
 * @brief Unit tests for Geometry/GreatCircleSegment.h
 */

#include <SphereGeom/Geometry/GreatCircleSegment.h>
#include <SphereGeom/Core/Exception.h>
#include <SphereGeom/Platform/Random.h>
#include <gtest/gtest.h>

#include <cmath>

using namespace Sphere::Geom;

namespace {

bool VectorNear(const CartesianVector& a, const CartesianVector& b, double tol = 1e-12) {
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol && std::abs(a.z - b.z) < tol;
}

const SphereCoordinate kNorthPole(0.0, 0.0);
const SphereCoordinate kSouthPole(PI, 0.0);
const SphereCoordinate kFront(HALF_PI, 0.0);        // (0, 0, 1)
const SphereCoordinate kRight(HALF_PI, HALF_PI);    // (1, 0, 0)
const SphereCoordinate kBack(HALF_PI, PI);          // (0, 0, -1)

} // anonymous namespace

// =============================================================================
// Length
// =============================================================================

TEST(GreatCircleSegmentTest, QuarterArcLength) {
    GreatCircleSegment arc(kFront, kRight);
    EXPECT_NEAR(arc.Length(), HALF_PI, 1e-12);
    EXPECT_NEAR(GreatCircleSegment(kNorthPole, kFront).Length(), HALF_PI, 1e-12);
}

TEST(GreatCircleSegmentTest, ZeroAndHalfLength) {
    EXPECT_NEAR(GreatCircleSegment::CalculateArcLength(kFront, kFront), 0.0, 1e-12);
    EXPECT_NEAR(GreatCircleSegment::CalculateArcLength(kFront, kBack), PI, 1e-7);
    EXPECT_NEAR(GreatCircleSegment::CalculateArcLength(kNorthPole, kSouthPole), PI, 1e-7);
}

TEST(GreatCircleSegmentTest, ArcLengthOfVectors) {
    double len = GreatCircleSegment::CalculateArcLength(CartesianVector(0.0, 0.0, 1.0),
                                                        CartesianVector(1.0, 0.0, 0.0));
    EXPECT_NEAR(len, HALF_PI, 1e-12);
}

TEST(GreatCircleSegmentTest, Accessors) {
    GreatCircleSegment arc(kFront, kRight);
    EXPECT_TRUE(arc.Start() == kFront);
    EXPECT_TRUE(arc.End() == kRight);
    EXPECT_TRUE(VectorNear(arc.BaseCircle().Normal(), {0.0, 1.0, 0.0}));
}

class GreatCircleSegmentRandomTest : public ::testing::Test {
protected:
    void SetUp() override {
        Platform::SetRandomSeed(1234);
    }
};

TEST_F(GreatCircleSegmentRandomTest, LengthIsSymmetricAndBounded) {
    for (int i = 0; i < 500; ++i) {
        SphereCoordinate a = Platform::RandomSphereCoordinate();
        SphereCoordinate b = Platform::RandomSphereCoordinate();
        double ab = GreatCircleSegment::CalculateArcLength(a, b);
        double ba = GreatCircleSegment::CalculateArcLength(b, a);

        EXPECT_NEAR(ab, ba, 1e-12);
        EXPECT_GE(ab, 0.0);
        EXPECT_LE(ab, PI);
        // Same as the angle between the unit vectors
        double dot = Clamp(a.ToCartesian().DotProduct(b.ToCartesian()), -1.0, 1.0);
        EXPECT_NEAR(ab, std::acos(dot), 1e-6);
    }
}

TEST_F(GreatCircleSegmentRandomTest, MidpointSplitsArc) {
    for (int i = 0; i < 500; ++i) {
        SphereCoordinate a = Platform::RandomSphereCoordinate();
        SphereCoordinate b = Platform::RandomSphereCoordinate();
        GreatCircleSegment arc(a, b);
        if (arc.Length() < 1e-3 || arc.Length() > PI - 1e-3) continue;

        CartesianVector mid = arc.Midpoint();
        double toStart = GreatCircleSegment::CalculateArcLength(a.ToCartesian(), mid);
        double toEnd = GreatCircleSegment::CalculateArcLength(b.ToCartesian(), mid);
        EXPECT_NEAR(toStart, arc.Length() / 2.0, 1e-9);
        EXPECT_NEAR(toEnd, arc.Length() / 2.0, 1e-9);
        EXPECT_TRUE(arc.IsOnArc(mid));
    }
}

TEST_F(GreatCircleSegmentRandomTest, TriangleConsistency) {
    auto& rng = Platform::Random::Instance();
    for (int i = 0; i < 300; ++i) {
        SphereCoordinate a = Platform::RandomSphereCoordinate();
        SphereCoordinate b = Platform::RandomSphereCoordinate();
        GreatCircleSegment arc(a, b);
        if (arc.Length() < 1e-3 || arc.Length() > PI - 1e-3) continue;

        // Point on the arc: normalized blend of the endpoints
        double t = rng.Double(0.05, 0.95);
        CartesianVector onArc = (a.ToCartesian() * (1.0 - t) + b.ToCartesian() * t).AsUnitVector();
        double sum = GreatCircleSegment::CalculateArcLength(a.ToCartesian(), onArc) +
                     GreatCircleSegment::CalculateArcLength(onArc, b.ToCartesian());
        EXPECT_NEAR(sum, arc.Length(), 1e-9);
        EXPECT_TRUE(arc.IsOnArc(onArc));

        // Pushed off the base circle
        CartesianVector offArc = (onArc + arc.BaseCircle().Normal() * 0.01).AsUnitVector();
        double offSum = GreatCircleSegment::CalculateArcLength(a.ToCartesian(), offArc) +
                        GreatCircleSegment::CalculateArcLength(offArc, b.ToCartesian());
        EXPECT_GT(offSum, arc.Length());
        EXPECT_FALSE(arc.IsOnArc(offArc));
    }
}

// =============================================================================
// Explicit Base Circle
// =============================================================================

TEST(GreatCircleSegmentTest, ExplicitBaseCircle) {
    GreatCircle equator(CartesianVector(0.0, 1.0, 0.0));
    GreatCircleSegment arc(equator, kFront, kRight);
    EXPECT_NEAR(arc.Length(), HALF_PI, 1e-12);
    EXPECT_TRUE(arc.BaseCircle().Normal() == CartesianVector(0.0, 1.0, 0.0));
}

TEST(GreatCircleSegmentTest, EndpointOffBaseCircleThrows) {
    GreatCircle equator(CartesianVector(0.0, 1.0, 0.0));
    EXPECT_THROW(GreatCircleSegment(equator, kFront, SphereCoordinate(1.0, 0.0)),
                 InvalidArgumentException);
    EXPECT_THROW(GreatCircleSegment(equator, kNorthPole, kFront), InvalidArgumentException);
}

TEST(GreatCircleSegmentTest, DegenerateBaseCircleThrows) {
    GreatCircle degenerate(kFront, kFront);
    EXPECT_THROW(GreatCircleSegment(degenerate, kFront, kFront), InvalidArgumentException);
}

TEST(GreatCircleSegmentTest, AntipodalArcOnExplicitCircle) {
    // Meridian plane x = 0, pole to pole through +Z
    GreatCircle meridian(CartesianVector(1.0, 0.0, 0.0));
    GreatCircleSegment arc(meridian, kNorthPole, kSouthPole);

    EXPECT_NEAR(arc.Length(), PI, 1e-7);
    EXPECT_TRUE(VectorNear(arc.Midpoint(), {0.0, 0.0, 1.0}));

    EXPECT_TRUE(arc.IsOnArc(kFront));
    EXPECT_TRUE(arc.IsOnArc(kBack));
    // Equidistant from both poles but off the meridian
    EXPECT_FALSE(arc.IsOnArc(kRight));
}

// =============================================================================
// Midpoint / IsOnArc
// =============================================================================

TEST(GreatCircleSegmentTest, MidpointOfQuarterArc) {
    GreatCircleSegment arc(kFront, kRight);
    double h = std::sqrt(2.0) / 2.0;
    EXPECT_TRUE(VectorNear(arc.Midpoint(), {h, 0.0, h}));
}

TEST(GreatCircleSegmentTest, MidpointAcrossSeam) {
    // phi wraps from 7*PI/4 to PI/4 through phi = 0
    GreatCircleSegment arc(SphereCoordinate(HALF_PI, 1.75 * PI), SphereCoordinate(HALF_PI, QUARTER_PI));
    EXPECT_TRUE(VectorNear(arc.Midpoint(), {0.0, 0.0, 1.0}));
}

TEST(GreatCircleSegmentTest, IsOnArc) {
    GreatCircleSegment arc(kFront, kRight);

    EXPECT_TRUE(arc.IsOnArc(kFront));
    EXPECT_TRUE(arc.IsOnArc(kRight));
    EXPECT_TRUE(arc.IsOnArc(SphereCoordinate(HALF_PI, 0.3)));

    // On the base circle, outside the arc
    EXPECT_FALSE(arc.IsOnArc(kBack));
    EXPECT_FALSE(arc.IsOnArc(SphereCoordinate(HALF_PI, 1.75 * PI)));
    // Off the base circle
    EXPECT_FALSE(arc.IsOnArc(kNorthPole));
}

TEST(GreatCircleSegmentTest, IsOnArcVectorIsNormalized) {
    GreatCircleSegment arc(kFront, kRight);
    EXPECT_TRUE(arc.IsOnArc(CartesianVector(2.0, 0.0, 2.0)));
}

TEST(GreatCircleSegmentTest, TangentPointsAlongArc) {
    GreatCircleSegment arc(kFront, kRight);
    CartesianVector towardsEnd = kRight.ToCartesian() - kFront.ToCartesian();
    CartesianVector tangent = arc.GetTangentAt(kFront, towardsEnd);
    EXPECT_TRUE(VectorNear(tangent, {1.0, 0.0, 0.0}));

    CartesianVector either = arc.GetTangentAt(kFront);
    EXPECT_NEAR(std::abs(either.x), 1.0, 1e-12);
}

// =============================================================================
// Arc-Arc Intersection
// =============================================================================

TEST(GreatCircleSegmentTest, CrossingArcsIntersect) {
    GreatCircleSegment equatorArc(SphereCoordinate(HALF_PI, 1.75 * PI),
                                  SphereCoordinate(HALF_PI, QUARTER_PI));
    GreatCircleSegment meridianArc(SphereCoordinate(QUARTER_PI, 0.0),
                                   SphereCoordinate(0.75 * PI, 0.0));

    SphereCoordinate hit;
    ASSERT_TRUE(equatorArc.Intersects(meridianArc, hit));
    EXPECT_TRUE(VectorNear(hit.ToCartesian(), {0.0, 0.0, 1.0}, 1e-9));

    SphereCoordinate reverse;
    ASSERT_TRUE(meridianArc.Intersects(equatorArc, reverse));
    EXPECT_TRUE(reverse == hit);
}

TEST(GreatCircleSegmentTest, AntipodeCandidateIsChosen) {
    // Both arcs around (0, 0, -1); n1 x n2 gives (0, 0, 1), so the crossing
    // is its antipode
    GreatCircleSegment equatorArc(SphereCoordinate(HALF_PI, 0.75 * PI),
                                  SphereCoordinate(HALF_PI, 1.25 * PI));
    GreatCircleSegment meridianArc(SphereCoordinate(QUARTER_PI, PI),
                                   SphereCoordinate(0.75 * PI, PI));

    SphereCoordinate hit;
    ASSERT_TRUE(equatorArc.Intersects(meridianArc, hit));
    EXPECT_TRUE(VectorNear(hit.ToCartesian(), {0.0, 0.0, -1.0}, 1e-9));
}

TEST(GreatCircleSegmentTest, DisjointArcsDoNotIntersect) {
    // Same base circles as the crossing case, arcs stop short of the crossing
    GreatCircleSegment equatorArc(SphereCoordinate(HALF_PI, 0.2), SphereCoordinate(HALF_PI, 1.0));
    GreatCircleSegment meridianArc(SphereCoordinate(QUARTER_PI, 0.0),
                                   SphereCoordinate(0.75 * PI, 0.0));

    SphereCoordinate hit(-1.0, -1.0);
    EXPECT_FALSE(equatorArc.Intersects(meridianArc, hit));
    EXPECT_DOUBLE_EQ(hit.theta, -1.0);
}

TEST(GreatCircleSegmentTest, ArcsOnSameCircleDoNotIntersect) {
    GreatCircleSegment a(kFront, kRight);
    GreatCircleSegment b(SphereCoordinate(HALF_PI, 0.2), SphereCoordinate(HALF_PI, 1.2));
    SphereCoordinate hit;
    EXPECT_FALSE(a.Intersects(b, hit));
}

TEST(GreatCircleSegmentTest, ZeroLengthArcDoesNotIntersect) {
    GreatCircleSegment point(kFront, kFront);
    GreatCircleSegment meridianArc(SphereCoordinate(QUARTER_PI, 0.0),
                                   SphereCoordinate(0.75 * PI, 0.0));
    SphereCoordinate hit;
    EXPECT_FALSE(point.Intersects(meridianArc, hit));
    EXPECT_FALSE(meridianArc.Intersects(point, hit));
}

TEST(GreatCircleSegmentTest, SelfIntersectionDoesNotThrow) {
    GreatCircleSegment arc(kFront, kRight);
    SphereCoordinate hit;
    bool found = true;
    EXPECT_NO_THROW(found = arc.Intersects(arc, hit));
    EXPECT_FALSE(found);
}

TEST(GreatCircleSegmentTest, SharedEndpointIntersects) {
    GreatCircleSegment a(kNorthPole, kFront);
    GreatCircleSegment b(kFront, kRight);

    SphereCoordinate hit;
    ASSERT_TRUE(a.Intersects(b, hit));
    EXPECT_TRUE(hit == kFront);
}
