// =====================================================================
//  src/libconduitjoin/connect/types.cpp -- Connection value types
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/connect/types.h>

namespace conduitjoin {
namespace connect {

QString errorName(ConnectError error)
{
    switch (error) {
    case ConnectError::None:                 return QStringLiteral("None");
    case ConnectError::DegenerateSegment:    return QStringLiteral("DegenerateSegment");
    case ConnectError::NumericallyUnstable:  return QStringLiteral("NumericallyUnstable");
    case ConnectError::AmbiguousEndpoint:    return QStringLiteral("AmbiguousEndpoint");
    case ConnectError::InapplicableStrategy: return QStringLiteral("InapplicableStrategy");
    case ConnectError::InvalidTolerance:     return QStringLiteral("InvalidTolerance");
    case ConnectError::HostError:            return QStringLiteral("HostError");
    }
    return QStringLiteral("Unknown");
}

QString relationshipName(Relationship relationship)
{
    switch (relationship) {
    case Relationship::Parallel:     return QStringLiteral("Parallel");
    case Relationship::Intersecting: return QStringLiteral("Intersecting");
    case Relationship::Skew:         return QStringLiteral("Skew");
    }
    return QStringLiteral("Unknown");
}

QString strategyName(StrategyKind kind)
{
    switch (kind) {
    case StrategyKind::DirectJoin:     return QStringLiteral("DirectJoin");
    case StrategyKind::ParallelOffset: return QStringLiteral("ParallelOffset");
    case StrategyKind::SkewKick:       return QStringLiteral("SkewKick");
    }
    return QStringLiteral("Unknown");
}

QString fittingName(FittingKind kind)
{
    switch (kind) {
    case FittingKind::Coupling: return QStringLiteral("coupling");
    case FittingKind::Elbow:    return QStringLiteral("elbow");
    }
    return QStringLiteral("unknown");
}

// =====================================================================
//  ConnectionPlan Implementation
// =====================================================================

Segment ConnectionPlan::updatedA(const Segment& a) const
{
    return a.withEndpoint(updateA.end, updateA.position);
}

Segment ConnectionPlan::updatedB(const Segment& b) const
{
    return b.withEndpoint(updateB.end, updateB.position);
}

}  // namespace connect
}  // namespace conduitjoin
