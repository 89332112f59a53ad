// =====================================================================
//  src/libconduitjoin/conduitjoin/connect/strategy.h -- Connection strategies
// =====================================================================
//
//  The closed set of ways two segments can be joined.  Each strategy
//  turns a Classification plus the caller's free ends into a
//  ConnectionPlan.  Plans are values; nothing here touches a host model.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CONNECT_STRATEGY_H
#define CONDUITJOIN_CONNECT_STRATEGY_H

#include "types.h"

#include <optional>

namespace conduitjoin {
namespace connect {

// =====================================================================
//  Selection
// =====================================================================

/// Pick the strategy for a classification.
///   Intersecting            -> DirectJoin
///   Parallel, offset >  tol -> ParallelOffset
///   Parallel, offset <= tol -> DirectJoin (collinear)
///   Skew                    -> SkewKick
CONDUITJOIN_EXPORT StrategyKind selectStrategy(
    const Classification& classification,
    double tolerance = geometry::DEFAULT_TOLERANCE);

/// True if the strategy can handle the classification
CONDUITJOIN_EXPORT bool canApply(
    StrategyKind kind,
    const Classification& classification,
    double tolerance = geometry::DEFAULT_TOLERANCE);

// =====================================================================
//  Free End Resolution
// =====================================================================

/// Decide which endpoint of a segment is being replaced.
///
/// The endpoint nearer freeEndPoint wins.  When freeEndPoint is
/// equidistant from both (within tolerance) the endpoint nearer target
/// is replaced and the farther one retained.  Returns nullopt when that
/// is a tie as well.
CONDUITJOIN_EXPORT std::optional<SegmentEnd> resolveFreeEnd(
    const Segment& segment,
    const gp_Pnt& freeEndPoint,
    const gp_Pnt& target,
    double tolerance = geometry::DEFAULT_TOLERANCE);

// =====================================================================
//  Planning
// =====================================================================

/// Build the connection plan for one strategy
/// @param kind Strategy to run
/// @param a, b Original segments
/// @param classification Result of analyze(a, b)
/// @param freeEndA, freeEndB Open endpoints chosen by the host
/// @param tolerance Minimum length of every resulting segment
/// @param angularTolerance Used to tell couplings from elbows
/// @return InapplicableStrategy if canApply() is false,
///         AmbiguousEndpoint if a free end cannot be resolved,
///         DegenerateSegment if any resulting segment is too short
CONDUITJOIN_EXPORT PlanResult plan(
    StrategyKind kind,
    const Segment& a, const Segment& b,
    const Classification& classification,
    const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
    double tolerance = geometry::DEFAULT_TOLERANCE,
    double angularTolerance = geometry::ANGULAR_TOLERANCE);

}  // namespace connect
}  // namespace conduitjoin

#endif  // CONDUITJOIN_CONNECT_STRATEGY_H
