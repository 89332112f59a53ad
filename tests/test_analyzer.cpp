// =====================================================================
//  tests/test_analyzer.cpp -- Segment pair classification
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/connect/analyzer.h>
#include <conduitjoin/geometry/intersections.h>
#include <conduitjoin/geometry/utils.h>

#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <random>

using namespace conduitjoin;
using namespace conduitjoin::connect;
using geometry::Segment;

namespace {

constexpr double EPS = 1e-9;

gp_Vec randomUnit(std::mt19937& rng)
{
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    while (true) {
        gp_Vec v(dist(rng), dist(rng), dist(rng));
        if (v.Magnitude() > 0.1) {
            return v.Normalized();
        }
    }
}

gp_Pnt randomPoint(std::mt19937& rng)
{
    std::uniform_real_distribution<double> dist(-50.0, 50.0);
    return gp_Pnt(dist(rng), dist(rng), dist(rng));
}

bool bitIdentical(double a, double b)
{
    return std::memcmp(&a, &b, sizeof(double)) == 0;
}

}  // namespace

// ---- Parallel -------------------------------------------------------

TEST(AnalyzerTest, ParallelKnownOffset)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(1, 0, 0));
    Segment b(gp_Pnt(0, 5, 0), gp_Pnt(1, 5, 0));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Parallel);
    EXPECT_DOUBLE_EQ(r.classification.offset, 5.0);
    EXPECT_DOUBLE_EQ(r.classification.angleDegrees, 0.0);
}

TEST(AnalyzerTest, AntiParallelKnownOffset)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(10, 0, 0));
    Segment b(gp_Pnt(7, 0, 2), gp_Pnt(-3, 0, 2));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Parallel);
    EXPECT_NEAR(r.classification.offset, 2.0, EPS);

    // Closest pair is b.start and its projection onto A
    EXPECT_NEAR(r.classification.closestPointOnA.Distance(gp_Pnt(7, 0, 0)), 0.0, EPS);
    EXPECT_NEAR(r.classification.closestPointOnB.Distance(gp_Pnt(7, 0, 2)), 0.0, EPS);
}

TEST(AnalyzerTest, ParallelObliqueOffset)
{
    const gp_Vec dir = gp_Vec(1, 2, 2) / 3.0;
    const gp_Vec perp = gp_Vec(2, -1, 0) / std::sqrt(5.0);

    const gp_Pnt p0(1, 1, 1);
    Segment a(p0, p0.Translated(dir * 6.0));
    const gp_Pnt q0 = p0.Translated(perp * 4.0).Translated(dir * 2.5);
    Segment b(q0, q0.Translated(dir * 3.0));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Parallel);
    EXPECT_NEAR(r.classification.offset, 4.0, 1e-9);
}

TEST(AnalyzerTest, CollinearIsParallelWithZeroOffset)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(10, 0, 0));
    Segment b(gp_Pnt(12, 0, 0), gp_Pnt(20, 0, 0));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Parallel);
    EXPECT_NEAR(r.classification.offset, 0.0, EPS);
}

TEST(AnalyzerTest, RandomParallelPairs)
{
    std::mt19937 rng(1234);
    for (int i = 0; i < 200; ++i) {
        const gp_Vec dir = randomUnit(rng);
        gp_Vec n = dir.Crossed(randomUnit(rng));
        if (n.Magnitude() < 0.1) continue;
        n.Normalize();

        const double offset = 0.5 + (i % 20);
        const gp_Pnt p = randomPoint(rng);
        const double sign = (i % 2 == 0) ? 1.0 : -1.0;

        Segment a(p, p.Translated(dir * 5.0));
        const gp_Pnt q = p.Translated(n * offset).Translated(dir * (i * 0.37));
        Segment b(q, q.Translated(dir * (3.0 * sign)));

        AnalysisResult r = analyze(a, b);
        ASSERT_TRUE(r.success);
        EXPECT_EQ(r.classification.relationship, Relationship::Parallel);
        EXPECT_NEAR(r.classification.offset, offset, 1e-6);
    }
}

// ---- Intersecting ---------------------------------------------------

TEST(AnalyzerTest, PerpendicularIntersecting)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 0, 0), gp_Pnt(5, 5, 0));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Intersecting);
    EXPECT_NEAR(r.classification.offset, 0.0, EPS);
    EXPECT_NEAR(r.classification.closestPointOnA.Distance(gp_Pnt(5, 0, 0)), 0.0, EPS);
    EXPECT_NEAR(r.classification.angleDegrees, 90.0, EPS);
}

TEST(AnalyzerTest, IntersectionBeyondSegmentBounds)
{
    // Lines meet at (2,2,2) which lies on neither segment
    Segment a(gp_Pnt(-4, -4, -4), gp_Pnt(-1, -1, -1));
    Segment b(gp_Pnt(10, 2, -6), gp_Pnt(6, 2, -2));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Intersecting);
    EXPECT_NEAR(r.classification.closestPointOnA.Distance(gp_Pnt(2, 2, 2)), 0.0, 1e-9);
    EXPECT_NEAR(r.classification.closestPointOnB.Distance(gp_Pnt(2, 2, 2)), 0.0, 1e-9);
}

TEST(AnalyzerTest, RandomIntersectingPairs)
{
    std::mt19937 rng(42);
    for (int i = 0; i < 200; ++i) {
        const gp_Pnt p = randomPoint(rng);
        const gp_Vec u = randomUnit(rng);
        const gp_Vec v = randomUnit(rng);
        if (u.Crossed(v).Magnitude() < 0.05) continue;

        Segment a(p.Translated(u * 2.0), p.Translated(u * 9.0));
        Segment b(p.Translated(v * -7.0), p.Translated(v * -1.0));

        AnalysisResult r = analyze(a, b);
        ASSERT_TRUE(r.success);
        const Classification& c = r.classification;
        EXPECT_EQ(c.relationship, Relationship::Intersecting);
        EXPECT_LE(c.closestPointOnA.Distance(c.closestPointOnB), geometry::DEFAULT_TOLERANCE);

        // The reported point lies on both infinite lines
        EXPECT_LT(geometry::pointToInfiniteLineDistance(c.closestPointOnA, a.start, a.end), 1e-6);
        EXPECT_LT(geometry::pointToInfiniteLineDistance(c.closestPointOnA, b.start, b.end), 1e-6);
        EXPECT_LT(c.closestPointOnA.Distance(p), 1e-6);
    }
}

TEST(AnalyzerTest, OffsetAtToleranceIsIntersecting)
{
    Segment a(gp_Pnt(-1, 0, 0), gp_Pnt(1, 0, 0));
    Segment b(gp_Pnt(0, -1, 0.5), gp_Pnt(0, 1, 0.5));

    AnalysisResult r = analyze(a, b, 0.5);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.classification.relationship, Relationship::Intersecting);

    AnalysisResult strict = analyze(a, b, 0.4999);
    ASSERT_TRUE(strict.success);
    EXPECT_EQ(strict.classification.relationship, Relationship::Skew);
}

// ---- Skew -----------------------------------------------------------

TEST(AnalyzerTest, SkewKnownDistance)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 3, 0), gp_Pnt(5, 3, 5));

    AnalysisResult r = analyze(a, b);
    ASSERT_TRUE(r.success);
    const Classification& c = r.classification;
    EXPECT_EQ(c.relationship, Relationship::Skew);
    EXPECT_NEAR(c.offset, 3.0, EPS);
    EXPECT_NEAR(c.closestPointOnA.Distance(gp_Pnt(5, 0, 0)), 0.0, EPS);
    EXPECT_NEAR(c.closestPointOnB.Distance(gp_Pnt(5, 3, 0)), 0.0, EPS);
    EXPECT_NEAR(c.parameterA, 5.0, EPS);
    EXPECT_NEAR(c.parameterB, 0.0, EPS);
    EXPECT_NEAR(c.angleDegrees, 90.0, EPS);
}

TEST(AnalyzerTest, RandomSkewPairs)
{
    std::mt19937 rng(7);
    for (int i = 0; i < 200; ++i) {
        const gp_Vec u = randomUnit(rng);
        const gp_Vec v = randomUnit(rng);
        gp_Vec n = u.Crossed(v);
        if (n.Magnitude() < 0.05) continue;
        n.Normalize();

        const double h = 0.25 + (i % 10);
        const gp_Pnt p = randomPoint(rng);
        const gp_Pnt q = p.Translated(n * h);

        Segment a(p.Translated(u * -3.0), p.Translated(u * 4.0));
        Segment b(q.Translated(v * 1.0), q.Translated(v * 6.0));

        AnalysisResult r = analyze(a, b);
        ASSERT_TRUE(r.success);
        EXPECT_EQ(r.classification.relationship, Relationship::Skew);
        EXPECT_GT(r.classification.offset, geometry::DEFAULT_TOLERANCE);
        EXPECT_NEAR(r.classification.offset, h, 1e-6);
    }
}

// ---- Errors ---------------------------------------------------------

TEST(AnalyzerTest, ZeroLengthSegmentIsDegenerate)
{
    Segment a(gp_Pnt(1, 1, 1), gp_Pnt(1, 1, 1));
    Segment b(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));

    AnalysisResult r = analyze(a, b);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectError::DegenerateSegment);

    AnalysisResult swapped = analyze(b, a);
    EXPECT_FALSE(swapped.success);
    EXPECT_EQ(swapped.error, ConnectError::DegenerateSegment);
}

TEST(AnalyzerTest, ShorterThanToleranceIsDegenerate)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(0.5, 0, 0));
    Segment b(gp_Pnt(0, 1, 0), gp_Pnt(0, 2, 0));

    EXPECT_TRUE(analyze(a, b, 0.1).success);
    EXPECT_EQ(analyze(a, b, 1.0).error, ConnectError::DegenerateSegment);
}

TEST(AnalyzerTest, ZeroLengthIsDegenerateAtZeroTolerance)
{
    Segment point(gp_Pnt(1, 1, 1), gp_Pnt(1, 1, 1));
    Segment b(gp_Pnt(0, 0, 0), gp_Pnt(1, 0, 0));

    AnalysisResult r = analyze(point, b, 0.0);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectError::DegenerateSegment);

    EXPECT_EQ(analyze(b, point, 0.0).error, ConnectError::DegenerateSegment);

    // A real segment is still accepted with an exact tolerance
    Segment c(gp_Pnt(0, 0, 0), gp_Pnt(0, 1, 0));
    AnalysisResult exact = analyze(b, c, 0.0);
    ASSERT_TRUE(exact.success);
    EXPECT_EQ(exact.classification.relationship, Relationship::Intersecting);
}

TEST(AnalyzerTest, InvalidToleranceIsRejected)
{
    Segment point(gp_Pnt(1, 1, 1), gp_Pnt(1, 1, 1));
    Segment b(gp_Pnt(0, 0, 0), gp_Pnt(1, 0, 0));

    for (double tol : {-1e-3, std::nan(""), HUGE_VAL}) {
        AnalysisResult r = analyze(point, b, tol);
        EXPECT_FALSE(r.success) << tol;
        EXPECT_EQ(r.error, ConnectError::InvalidTolerance) << tol;
    }

    EXPECT_EQ(analyze(b, b.reversed(), geometry::DEFAULT_TOLERANCE, -1.0).error,
              ConnectError::InvalidTolerance);
}

TEST(AnalyzerTest, UnstableSolveIsReported)
{
    // With the parallel test disabled, exactly parallel lines reach the
    // closest-point solve and must not divide by zero
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(1, 0, 0));
    Segment b(gp_Pnt(0, 1, 0), gp_Pnt(1, 1, 0));

    AnalysisResult r = analyze(a, b, geometry::DEFAULT_TOLERANCE, 0.0);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ConnectError::NumericallyUnstable);
    EXPECT_FALSE(r.errorMessage.isEmpty());
}

// ---- Purity ---------------------------------------------------------

TEST(AnalyzerTest, RepeatedCallsAreBitIdentical)
{
    Segment a(gp_Pnt(0.1, 0.2, 0.3), gp_Pnt(4.7, -1.3, 2.2));
    Segment b(gp_Pnt(-3.3, 5.1, 0.9), gp_Pnt(2.4, 1.8, -6.6));

    AnalysisResult first = analyze(a, b);
    for (int i = 0; i < 10; ++i) {
        AnalysisResult again = analyze(a, b);
        ASSERT_EQ(again.success, first.success);
        EXPECT_EQ(again.classification.relationship, first.classification.relationship);
        EXPECT_TRUE(bitIdentical(again.classification.offset, first.classification.offset));
        EXPECT_TRUE(bitIdentical(again.classification.closestPointOnA.X(), first.classification.closestPointOnA.X()));
        EXPECT_TRUE(bitIdentical(again.classification.closestPointOnA.Y(), first.classification.closestPointOnA.Y()));
        EXPECT_TRUE(bitIdentical(again.classification.closestPointOnA.Z(), first.classification.closestPointOnA.Z()));
        EXPECT_TRUE(bitIdentical(again.classification.closestPointOnB.X(), first.classification.closestPointOnB.X()));
        EXPECT_TRUE(bitIdentical(again.classification.closestPointOnB.Y(), first.classification.closestPointOnB.Y()));
        EXPECT_TRUE(bitIdentical(again.classification.closestPointOnB.Z(), first.classification.closestPointOnB.Z()));
    }
}
