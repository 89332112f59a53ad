// =====================================================================
//  src/libconduitjoin/connect/analyzer.cpp -- Segment pair analysis
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/connect/analyzer.h>
#include <conduitjoin/geometry/intersections.h>
#include <conduitjoin/geometry/utils.h>

#include <QLoggingCategory>

namespace conduitjoin {
namespace connect {

Q_LOGGING_CATEGORY(logAnalyzer, "conduitjoin.connect.analyzer")

using namespace geometry;

AnalysisResult analyze(
    const Segment& a, const Segment& b,
    double tolerance, double angularTolerance)
{
    AnalysisResult result;

    if (!isValidTolerance(tolerance) || !isValidTolerance(angularTolerance)) {
        result.error = ConnectError::InvalidTolerance;
        result.errorMessage = QStringLiteral(
            "Tolerances must be finite and non-negative (got %1, angular %2).")
            .arg(tolerance).arg(angularTolerance);
        qCWarning(logAnalyzer) << "analyze:invalid-tolerance" << tolerance
                               << angularTolerance;
        return result;
    }

    const double minLength = minimumLength(tolerance);
    if (a.length() < minLength || b.length() < minLength) {
        result.error = ConnectError::DegenerateSegment;
        result.errorMessage = QStringLiteral(
            "Segment %1 is shorter than the tolerance (%2 < %3).")
            .arg(a.length() < minLength ? QStringLiteral("A") : QStringLiteral("B"))
            .arg(qMin(a.length(), b.length()))
            .arg(minLength);
        qCDebug(logAnalyzer) << "analyze:degenerate" << "lengthA=" << a.length()
                             << "lengthB=" << b.length();
        return result;
    }

    const gp_Vec dirA = a.direction();
    const gp_Vec dirB = b.direction();

    Classification& c = result.classification;
    c.angleDegrees = lineAngle(dirA, dirB);

    if (directionsParallel(dirA, dirB, angularTolerance)) {
        // Parallel or anti-parallel.  Every point of B is the same
        // distance from line A, so measure from b.start.
        c.relationship = Relationship::Parallel;
        c.offset = pointToInfiniteLineDistance(b.start, a.start, a.end);
        c.closestPointOnA = closestPointOnInfiniteLine(b.start, a.start, dirA);
        c.closestPointOnB = b.start;
        c.parameterA = dot(gp_Vec(a.start, b.start), dirA);
        c.parameterB = 0.0;
        c.angleDegrees = 0.0;

        result.success = true;
        qCDebug(logAnalyzer) << "analyze:parallel" << "offset=" << c.offset;
        return result;
    }

    const LineLineApproach approach = closestApproach(a.start, dirA, b.start, dirB);
    if (approach.parallel) {
        result.error = ConnectError::NumericallyUnstable;
        result.errorMessage = QStringLiteral(
            "Closest-point solve is ill-conditioned (denominator %1).")
            .arg(approach.denominator);
        qCWarning(logAnalyzer) << "analyze:unstable"
                               << "crossMag=" << length(cross(dirA, dirB))
                               << "denominator=" << approach.denominator;
        return result;
    }

    c.closestPointOnA = approach.pointOnFirst;
    c.closestPointOnB = approach.pointOnSecond;
    c.parameterA = approach.s;
    c.parameterB = approach.t;
    c.offset = approach.distance;

    // Ties at the boundary take the simpler connection
    c.relationship = (c.offset <= tolerance) ? Relationship::Intersecting
                                             : Relationship::Skew;

    result.success = true;
    qCDebug(logAnalyzer) << "analyze:done"
                         << "relationship=" << relationshipName(c.relationship)
                         << "offset=" << c.offset
                         << "angle=" << c.angleDegrees;
    return result;
}

}  // namespace connect
}  // namespace conduitjoin
