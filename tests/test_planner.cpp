// =====================================================================
//  tests/test_planner.cpp -- End-to-end connect scenarios
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/connect/planner.h>

#include <gtest/gtest.h>

#include <random>

using namespace conduitjoin;
using connect::ConnectError;
using connect::ConnectionOutcome;
using connect::Relationship;
using connect::StrategyKind;
using geometry::Segment;

namespace {

constexpr double EPS = 1e-9;

bool near(const gp_Pnt& a, const gp_Pnt& b, double eps = 1e-6)
{
    return a.Distance(b) <= eps;
}

}  // namespace

TEST(PlannerTest, ParallelOffsetScenario)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(10, 0, 0));
    Segment b(gp_Pnt(0, 2, 0), gp_Pnt(10, 2, 0));

    ConnectionOutcome out = connect::connect(a, b, gp_Pnt(10, 0, 0), gp_Pnt(10, 2, 0));
    ASSERT_TRUE(out.success) << out.errorMessage.toStdString();

    EXPECT_EQ(out.classification.relationship, Relationship::Parallel);
    EXPECT_NEAR(out.classification.offset, 2.0, EPS);
    EXPECT_EQ(out.strategy, StrategyKind::ParallelOffset);
    EXPECT_EQ(out.strategyName(), QStringLiteral("ParallelOffset"));

    ASSERT_EQ(out.plan.intermediates.size(), 1);
    EXPECT_TRUE(near(out.plan.intermediates[0].start, gp_Pnt(10, 0, 0)));
    EXPECT_TRUE(near(out.plan.intermediates[0].end, gp_Pnt(10, 2, 0)));
    EXPECT_EQ(out.plan.joints.size(), 2);
}

TEST(PlannerTest, IntersectingScenario)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 0, 0), gp_Pnt(5, 5, 0));

    ConnectionOutcome out = connect::connect(a, b, gp_Pnt(5, 0, 0), gp_Pnt(5, 0, 0));
    ASSERT_TRUE(out.success);

    EXPECT_EQ(out.classification.relationship, Relationship::Intersecting);
    EXPECT_NEAR(out.classification.offset, 0.0, EPS);
    EXPECT_EQ(out.strategy, StrategyKind::DirectJoin);
    EXPECT_TRUE(out.plan.intermediates.isEmpty());
    ASSERT_EQ(out.plan.joints.size(), 1);
    EXPECT_TRUE(near(out.plan.joints[0].location, gp_Pnt(5, 0, 0)));
}

TEST(PlannerTest, SkewScenario)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 3, 0), gp_Pnt(5, 3, 5));

    ConnectionOutcome out = connect::connect(a, b, gp_Pnt(5, 0, 0), gp_Pnt(5, 3, 0));
    ASSERT_TRUE(out.success);

    EXPECT_EQ(out.classification.relationship, Relationship::Skew);
    EXPECT_NEAR(out.classification.offset, 3.0, EPS);
    EXPECT_EQ(out.strategy, StrategyKind::SkewKick);
    ASSERT_EQ(out.plan.intermediates.size(), 1);
    EXPECT_NEAR(out.plan.intermediates[0].length(), 3.0, EPS);
    EXPECT_EQ(out.plan.joints.size(), 2);
}

TEST(PlannerTest, DegenerateInputNeverClassifies)
{
    Segment a(gp_Pnt(2, 2, 2), gp_Pnt(2, 2, 2));
    Segment b(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));

    ConnectionOutcome out = connect::connect(a, b, a.end, b.end);
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error, ConnectError::DegenerateSegment);
    EXPECT_TRUE(out.plan.joints.isEmpty());
}

TEST(PlannerTest, SelectorOverload)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 5, 0), gp_Pnt(5, 0, 0));

    // Both segments are open at their end point
    ConnectionOutcome out = connect::connect(a, b,
        [](const Segment& s) { return s.end; });
    ASSERT_TRUE(out.success);
    EXPECT_EQ(out.strategy, StrategyKind::DirectJoin);
    EXPECT_EQ(out.plan.updateA.end, geometry::SegmentEnd::End);
    EXPECT_EQ(out.plan.updateB.end, geometry::SegmentEnd::End);
}

TEST(PlannerTest, MissingSelectorFails)
{
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 5, 0), gp_Pnt(5, 0, 0));

    ConnectionOutcome out = connect::connect(a, b, connect::FreeEndSelector());
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error, ConnectError::AmbiguousEndpoint);
}

TEST(PlannerTest, CustomTolerances)
{
    // Lines pass 0.01 apart: skew at the default tolerance, intersecting
    // at a looser one
    Segment a(gp_Pnt(0, 0, 0), gp_Pnt(5, 0, 0));
    Segment b(gp_Pnt(5, 0.01, -5), gp_Pnt(5, 0.01, 5));
    // Free end of B at its top
    const gp_Pnt freeB(5, 0.01, 5);

    ConnectionOutcome strict = connect::connect(a, b, a.end, freeB);
    ASSERT_TRUE(strict.success);
    EXPECT_EQ(strict.strategy, StrategyKind::SkewKick);

    connect::ConnectOptions loose;
    loose.tolerance = 0.05;
    ConnectionOutcome relaxed = connect::connect(a, b, a.end, freeB, loose);
    ASSERT_TRUE(relaxed.success);
    EXPECT_EQ(relaxed.strategy, StrategyKind::DirectJoin);
}

TEST(PlannerTest, NeverInapplicableForAnalyzedPairs)
{
    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> coord(-20.0, 20.0);
    std::uniform_int_distribution<int> kind(0, 3);

    auto randomPoint = [&]() { return gp_Pnt(coord(rng), coord(rng), coord(rng)); };

    for (int i = 0; i < 500; ++i) {
        Segment a(randomPoint(), randomPoint());
        Segment b;

        // Mix generic pairs with constructed parallel, collinear and
        // intersecting ones
        switch (kind(rng)) {
        case 0:
            b = Segment(randomPoint(), randomPoint());
            break;
        case 1: {
            const gp_Vec shift(coord(rng), coord(rng), coord(rng));
            b = Segment(a.start.Translated(shift), a.end.Translated(shift));
            break;
        }
        case 2:
            b = Segment(a.pointAt(1.5), a.pointAt(2.5));
            break;
        default:
            b = Segment(a.pointAt(0.5 + coord(rng) / 10.0), randomPoint());
            break;
        }

        ConnectionOutcome out = connect::connect(a, b, a.end, b.start);
        EXPECT_NE(out.error, ConnectError::InapplicableStrategy)
            << "pair " << i << ": " << out.errorMessage.toStdString();
        if (out.success) {
            EXPECT_LE(out.plan.intermediates.size(), 2);
            EXPECT_GE(out.plan.joints.size(), 1);
        }
    }
}
