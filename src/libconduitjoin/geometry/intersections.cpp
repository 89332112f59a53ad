// =====================================================================
//  src/libconduitjoin/geometry/intersections.cpp -- Line intersection functions
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/geometry/intersections.h>
#include <conduitjoin/geometry/utils.h>

#include <QtGlobal>

namespace conduitjoin {
namespace geometry {

// =====================================================================
//  Line-Line Closest Approach
// =====================================================================

LineLineApproach closestApproach(
    const gp_Pnt& p1, const gp_Vec& d1,
    const gp_Pnt& p2, const gp_Vec& d2)
{
    LineLineApproach result;

    // Vector from p2 to p1
    gp_Vec w(p2, p1);

    double a = dot(d1, d1);
    double b = dot(d1, d2);
    double c = dot(d2, d2);
    double d = dot(d1, w);
    double e = dot(d2, w);

    result.denominator = a * c - b * b;

    // Scale-free check, so callers may pass unnormalized directions
    if (qAbs(result.denominator) <= DENOMINATOR_EPSILON * a * c) {
        result.parallel = true;
        return result;
    }

    result.s = (b * e - c * d) / result.denominator;
    result.t = (a * e - b * d) / result.denominator;

    result.pointOnFirst = p1.Translated(d1 * result.s);
    result.pointOnSecond = p2.Translated(d2 * result.t);
    result.distance = result.pointOnFirst.Distance(result.pointOnSecond);

    return result;
}

// =====================================================================
//  Distance Functions
// =====================================================================

double pointToInfiniteLineDistance(
    const gp_Pnt& point,
    const gp_Pnt& linePoint1, const gp_Pnt& linePoint2)
{
    gp_Vec d(linePoint1, linePoint2);
    if (length(d) < VECTOR_EPSILON) {
        return point.Distance(linePoint1);
    }

    return point.Distance(closestPointOnInfiniteLine(point, linePoint1, d));
}

}  // namespace geometry
}  // namespace conduitjoin
