// =====================================================================
//  src/libconduitjoin/conduitjoin/connect/types.h -- Connection value types
// =====================================================================
//
//  Values passed between the pair analyzer, the connection strategies
//  and the planner.  All of them are transient: they are computed for
//  one connect operation and never refer back to host objects.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CONNECT_TYPES_H
#define CONDUITJOIN_CONNECT_TYPES_H

#include "../geometry/types.h"

#include <QString>
#include <QVector>

namespace conduitjoin {
namespace connect {

using geometry::Segment;
using geometry::SegmentEnd;

// =====================================================================
//  Errors
// =====================================================================

/// Failure kinds reported by analyze / plan / connect
enum class ConnectError {
    None,
    DegenerateSegment,     ///< A segment is (or would become) shorter than tolerance
    NumericallyUnstable,   ///< Closest-point denominator underflow
    AmbiguousEndpoint,     ///< Free end cannot be told apart from the fixed end
    InapplicableStrategy,  ///< Strategy invoked with a mismatched classification
    InvalidTolerance,      ///< Tolerance is negative, NaN or infinite
    HostError              ///< Host model rejected the request (unknown id, no open end, ...)
};

/// Stable identifier for an error, e.g. "DegenerateSegment"
CONDUITJOIN_EXPORT QString errorName(ConnectError error);

// =====================================================================
//  Classification
// =====================================================================

/// Relationship between the infinite lines through two segments
enum class Relationship {
    Parallel,
    Intersecting,
    Skew
};

CONDUITJOIN_EXPORT QString relationshipName(Relationship relationship);

/// Result of pairwise analysis
struct Classification {
    Relationship relationship = Relationship::Parallel;

    /// Perpendicular separation (Parallel), minimum line distance (Skew),
    /// or the residual gap below tolerance (Intersecting)
    double offset = 0.0;

    gp_Pnt closestPointOnA;
    gp_Pnt closestPointOnB;

    double parameterA = 0.0;    ///< Distance along A's direction from a.start
    double parameterB = 0.0;    ///< Distance along B's direction from b.start
    double angleDegrees = 0.0;  ///< Acute angle between the lines [0, 90]
};

/// Result of SegmentPairAnalyzer::analyze
struct AnalysisResult {
    bool success = false;
    Classification classification;
    ConnectError error = ConnectError::None;
    QString errorMessage;
};

// =====================================================================
//  Strategies
// =====================================================================

/// Closed set of connection strategies
enum class StrategyKind {
    DirectJoin,       ///< Trim/extend both free ends to a shared point
    ParallelOffset,   ///< Perpendicular jog between parallel runs
    SkewKick          ///< Bridge along the common perpendicular of skew runs
};

/// "DirectJoin", "ParallelOffset" or "SkewKick"
CONDUITJOIN_EXPORT QString strategyName(StrategyKind kind);

// =====================================================================
//  Connection Plan
// =====================================================================

/// Which segment of a plan an end reference points at
enum class PlanSegment {
    A,
    B,
    Intermediate
};

/// Reference to one end of a segment taking part in a plan.
/// index selects the intermediate segment and is 0 for A and B.
struct SegmentEndRef {
    PlanSegment segment = PlanSegment::A;
    int index = 0;
    SegmentEnd end = SegmentEnd::End;

    bool operator==(const SegmentEndRef& other) const {
        return segment == other.segment && index == other.index && end == other.end;
    }
    bool operator!=(const SegmentEndRef& other) const { return !(*this == other); }
};

/// Kind of fitting the host should place at a joint
enum class FittingKind {
    Coupling,   ///< Runs continue straight through the joint
    Elbow       ///< Runs change direction at the joint
};

CONDUITJOIN_EXPORT QString fittingName(FittingKind kind);

/// A location plus the two segment ends joined there
struct JointPoint {
    gp_Pnt location;
    SegmentEndRef first;
    SegmentEndRef second;
    double bendAngleDegrees = 0.0;   ///< Deflection between the runs [0, 180]
    FittingKind fitting = FittingKind::Elbow;
};

/// Replacement of one original segment's free end
struct EndpointUpdate {
    SegmentEnd end = SegmentEnd::End;   ///< Endpoint being replaced
    gp_Pnt position;                    ///< Where it moves to
};

/// Geometry needed to join two segments
struct CONDUITJOIN_EXPORT ConnectionPlan {
    EndpointUpdate updateA;
    EndpointUpdate updateB;
    QVector<Segment> intermediates;   ///< 0..2, ordered from the A side to the B side
    QVector<JointPoint> joints;       ///< Ordered from the A side to the B side

    /// Original segment A with its free end replaced
    Segment updatedA(const Segment& a) const;

    /// Original segment B with its free end replaced
    Segment updatedB(const Segment& b) const;
};

/// Result of a strategy's plan()
struct PlanResult {
    bool success = false;
    ConnectionPlan plan;
    ConnectError error = ConnectError::None;
    QString errorMessage;
};

// =====================================================================
//  Planner
// =====================================================================

/// Tolerances used by a connect operation
struct ConnectOptions {
    double tolerance = geometry::DEFAULT_TOLERANCE;
    double angularTolerance = geometry::ANGULAR_TOLERANCE;
};

/// Result of ConnectionPlanner::connect
struct ConnectionOutcome {
    bool success = false;
    StrategyKind strategy = StrategyKind::DirectJoin;
    Classification classification;
    ConnectionPlan plan;
    ConnectError error = ConnectError::None;
    QString errorMessage;

    /// strategyName(strategy), for diagnostics
    QString strategyName() const { return connect::strategyName(strategy); }
};

}  // namespace connect
}  // namespace conduitjoin

#endif  // CONDUITJOIN_CONNECT_TYPES_H
