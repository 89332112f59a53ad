// =====================================================================
//  src/libconduitjoin/connect/strategy.cpp -- Connection strategies
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/connect/strategy.h>
#include <conduitjoin/geometry/intersections.h>
#include <conduitjoin/geometry/utils.h>

#include <QLoggingCategory>

namespace conduitjoin {
namespace connect {

Q_LOGGING_CATEGORY(logStrategy, "conduitjoin.connect.strategy")

using namespace geometry;

// =====================================================================
//  Selection
// =====================================================================

StrategyKind selectStrategy(const Classification& classification, double tolerance)
{
    switch (classification.relationship) {
    case Relationship::Intersecting:
        return StrategyKind::DirectJoin;
    case Relationship::Parallel:
        return classification.offset > tolerance ? StrategyKind::ParallelOffset
                                                 : StrategyKind::DirectJoin;
    case Relationship::Skew:
        return StrategyKind::SkewKick;
    }
    return StrategyKind::DirectJoin;
}

bool canApply(StrategyKind kind, const Classification& classification, double tolerance)
{
    const Relationship rel = classification.relationship;

    switch (kind) {
    case StrategyKind::DirectJoin:
        return rel == Relationship::Intersecting ||
               (rel == Relationship::Parallel && classification.offset <= tolerance);
    case StrategyKind::ParallelOffset:
        return rel == Relationship::Parallel && classification.offset > tolerance;
    case StrategyKind::SkewKick:
        return rel == Relationship::Skew;
    }
    return false;
}

// =====================================================================
//  Free End Resolution
// =====================================================================

std::optional<SegmentEnd> resolveFreeEnd(
    const Segment& segment,
    const gp_Pnt& freeEndPoint,
    const gp_Pnt& target,
    double tolerance)
{
    const double dStart = freeEndPoint.Distance(segment.start);
    const double dEnd = freeEndPoint.Distance(segment.end);

    if (qAbs(dStart - dEnd) > tolerance) {
        return dStart < dEnd ? SegmentEnd::Start : SegmentEnd::End;
    }

    // Free end point is in the middle; replace whichever end is nearer
    // the joint so the far end stays fixed
    const double tStart = target.Distance(segment.start);
    const double tEnd = target.Distance(segment.end);

    if (qAbs(tStart - tEnd) > tolerance) {
        return tStart < tEnd ? SegmentEnd::Start : SegmentEnd::End;
    }

    return std::nullopt;
}

// =====================================================================
//  Plan Helpers
// =====================================================================

namespace {

PlanResult failure(ConnectError error, const QString& message)
{
    PlanResult result;
    result.error = error;
    result.errorMessage = message;
    qCDebug(logStrategy) << "plan:failed" << errorName(error) << message;
    return result;
}

PlanResult ambiguous(const char* which)
{
    return failure(ConnectError::AmbiguousEndpoint,
        QStringLiteral("Cannot tell which end of segment %1 is free: "
                       "both endpoints are equidistant from the free end "
                       "and from the joint.").arg(QLatin1String(which)));
}

/// Check a resulting segment against the tolerance.  Returns false and
/// fills result when it is too short.
bool checkLength(const Segment& segment, const QString& label,
                 double tolerance, PlanResult& result)
{
    const double minLength = minimumLength(tolerance);
    if (segment.length() >= minLength) {
        return true;
    }
    result = failure(ConnectError::DegenerateSegment,
        QStringLiteral("%1 would be %2 long, shorter than the tolerance %3.")
            .arg(label).arg(segment.length()).arg(minLength));
    return false;
}

SegmentEndRef ref(PlanSegment segment, SegmentEnd end, int index = 0)
{
    SegmentEndRef r;
    r.segment = segment;
    r.index = index;
    r.end = end;
    return r;
}

/// Joint between two runs.  incoming points into the joint along the
/// first run, outgoing points away from it along the second.
JointPoint makeJoint(const gp_Pnt& location,
                     const SegmentEndRef& first, const SegmentEndRef& second,
                     const gp_Vec& incoming, const gp_Vec& outgoing,
                     double angularTolerance)
{
    JointPoint joint;
    joint.location = location;
    joint.first = first;
    joint.second = second;
    joint.bendAngleDegrees = angleBetween(incoming, outgoing);

    const gp_Vec in = normalize(incoming);
    const gp_Vec out = normalize(outgoing);
    const bool straight = length(cross(in, out)) < angularTolerance && dot(in, out) > 0.0;
    joint.fitting = straight ? FittingKind::Coupling : FittingKind::Elbow;

    return joint;
}

/// Shared tail of ParallelOffset and SkewKick: A's free end moves to pA,
/// B's to pB and one intermediate bridges them.
PlanResult planBridge(const Segment& a, SegmentEnd endA, const gp_Pnt& pA,
                      const Segment& b, SegmentEnd endB, const gp_Pnt& pB,
                      double tolerance, double angularTolerance)
{
    PlanResult result;
    ConnectionPlan& p = result.plan;

    p.updateA.end = endA;
    p.updateA.position = pA;
    p.updateB.end = endB;
    p.updateB.position = pB;

    const Segment newA = p.updatedA(a);
    const Segment newB = p.updatedB(b);
    const Segment bridge(pA, pB);

    if (!checkLength(newA, QStringLiteral("Segment A"), tolerance, result) ||
        !checkLength(newB, QStringLiteral("Segment B"), tolerance, result) ||
        !checkLength(bridge, QStringLiteral("The connecting segment"), tolerance, result)) {
        return result;
    }

    p.intermediates.append(bridge);

    const gp_Pnt fixedA = a.point(opposite(endA));
    const gp_Pnt fixedB = b.point(opposite(endB));

    p.joints.append(makeJoint(pA,
        ref(PlanSegment::A, endA),
        ref(PlanSegment::Intermediate, SegmentEnd::Start),
        gp_Vec(fixedA, pA), bridge.vector(), angularTolerance));
    p.joints.append(makeJoint(pB,
        ref(PlanSegment::Intermediate, SegmentEnd::End),
        ref(PlanSegment::B, endB),
        bridge.vector(), gp_Vec(pB, fixedB), angularTolerance));

    result.success = true;
    return result;
}

// =====================================================================
//  Strategies
// =====================================================================

PlanResult planDirectJoin(const Segment& a, const Segment& b,
                          const Classification& c,
                          const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
                          double tolerance, double angularTolerance)
{
    std::optional<SegmentEnd> endA;
    std::optional<SegmentEnd> endB;
    gp_Pnt joint;

    if (c.relationship == Relationship::Intersecting) {
        joint = midpoint(c.closestPointOnA, c.closestPointOnB);
        endA = resolveFreeEnd(a, freeEndA, joint, tolerance);
        endB = resolveFreeEnd(b, freeEndB, joint, tolerance);
    } else {
        // Collinear: meet halfway between the two free ends
        endA = resolveFreeEnd(a, freeEndA, b.midpoint(), tolerance);
        endB = resolveFreeEnd(b, freeEndB, a.midpoint(), tolerance);
        if (endA && endB) {
            const gp_Pnt mid = midpoint(a.point(*endA), b.point(*endB));
            joint = closestPointOnInfiniteLine(mid, a.start, a.direction());
        }
    }

    if (!endA) return ambiguous("A");
    if (!endB) return ambiguous("B");

    PlanResult result;
    ConnectionPlan& p = result.plan;

    p.updateA.end = *endA;
    p.updateA.position = joint;
    p.updateB.end = *endB;
    p.updateB.position = joint;

    if (!checkLength(p.updatedA(a), QStringLiteral("Segment A"), tolerance, result) ||
        !checkLength(p.updatedB(b), QStringLiteral("Segment B"), tolerance, result)) {
        return result;
    }

    const gp_Pnt fixedA = a.point(opposite(*endA));
    const gp_Pnt fixedB = b.point(opposite(*endB));

    p.joints.append(makeJoint(joint,
        ref(PlanSegment::A, *endA), ref(PlanSegment::B, *endB),
        gp_Vec(fixedA, joint), gp_Vec(joint, fixedB), angularTolerance));

    result.success = true;
    return result;
}

PlanResult planParallelOffset(const Segment& a, const Segment& b,
                              const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
                              double tolerance, double angularTolerance)
{
    // B keeps its free end; the jog starts from A's line opposite it
    const gp_Pnt towardsA = closestPointOnInfiniteLine(freeEndA, b.start, b.direction());
    const std::optional<SegmentEnd> endB = resolveFreeEnd(b, freeEndB, towardsA, tolerance);
    if (!endB) return ambiguous("B");

    const gp_Pnt pB = b.point(*endB);
    const gp_Pnt pA = closestPointOnInfiniteLine(pB, a.start, a.direction());

    const std::optional<SegmentEnd> endA = resolveFreeEnd(a, freeEndA, pA, tolerance);
    if (!endA) return ambiguous("A");

    return planBridge(a, *endA, pA, b, *endB, pB, tolerance, angularTolerance);
}

PlanResult planSkewKick(const Segment& a, const Segment& b,
                        const Classification& c,
                        const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
                        double tolerance, double angularTolerance)
{
    const std::optional<SegmentEnd> endA =
        resolveFreeEnd(a, freeEndA, c.closestPointOnA, tolerance);
    if (!endA) return ambiguous("A");

    const std::optional<SegmentEnd> endB =
        resolveFreeEnd(b, freeEndB, c.closestPointOnB, tolerance);
    if (!endB) return ambiguous("B");

    return planBridge(a, *endA, c.closestPointOnA, b, *endB, c.closestPointOnB,
                      tolerance, angularTolerance);
}

}  // anonymous namespace

// =====================================================================
//  Planning
// =====================================================================

PlanResult plan(
    StrategyKind kind,
    const Segment& a, const Segment& b,
    const Classification& classification,
    const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
    double tolerance, double angularTolerance)
{
    if (!isValidTolerance(tolerance) || !isValidTolerance(angularTolerance)) {
        return failure(ConnectError::InvalidTolerance,
            QStringLiteral("Tolerances must be finite and non-negative (got %1, angular %2).")
                .arg(tolerance).arg(angularTolerance));
    }
    if (a.isDegenerate(tolerance) || b.isDegenerate(tolerance)) {
        return failure(ConnectError::DegenerateSegment,
            QStringLiteral("Input segment is shorter than the tolerance %1.")
                .arg(minimumLength(tolerance)));
    }
    if (!canApply(kind, classification, tolerance)) {
        return failure(ConnectError::InapplicableStrategy,
            QStringLiteral("%1 cannot connect a %2 pair with offset %3.")
                .arg(strategyName(kind),
                     relationshipName(classification.relationship))
                .arg(classification.offset));
    }

    PlanResult result;
    switch (kind) {
    case StrategyKind::DirectJoin:
        result = planDirectJoin(a, b, classification, freeEndA, freeEndB,
                                tolerance, angularTolerance);
        break;
    case StrategyKind::ParallelOffset:
        result = planParallelOffset(a, b, freeEndA, freeEndB,
                                    tolerance, angularTolerance);
        break;
    case StrategyKind::SkewKick:
        result = planSkewKick(a, b, classification, freeEndA, freeEndB,
                              tolerance, angularTolerance);
        break;
    }

    if (result.success) {
        qCDebug(logStrategy) << "plan:done" << strategyName(kind)
                             << "intermediates=" << result.plan.intermediates.size()
                             << "joints=" << result.plan.joints.size();
    }
    return result;
}

}  // namespace connect
}  // namespace conduitjoin
