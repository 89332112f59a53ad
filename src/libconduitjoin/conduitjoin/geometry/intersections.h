// =====================================================================
//  src/libconduitjoin/conduitjoin/geometry/intersections.h -- Line intersection functions
// =====================================================================
//
//  Closest-approach and distance functions for infinite 3D lines.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_GEOMETRY_INTERSECTIONS_H
#define CONDUITJOIN_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace conduitjoin {
namespace geometry {

// =====================================================================
//  Intersection Results
// =====================================================================

/// Closest approach of two infinite lines p1 + s*d1 and p2 + t*d2
struct LineLineApproach {
    bool parallel = false;       ///< Denominator too small to solve
    double denominator = 0.0;    ///< (d1.d1)(d2.d2) - (d1.d2)^2
    double s = 0.0;              ///< Parameter on first line (in units of d1)
    double t = 0.0;              ///< Parameter on second line (in units of d2)
    gp_Pnt pointOnFirst;         ///< p1 + s*d1
    gp_Pnt pointOnSecond;        ///< p2 + t*d2
    double distance = 0.0;       ///< |pointOnFirst - pointOnSecond|
};

// =====================================================================
//  Line-Line Closest Approach
// =====================================================================

/// Solve the closest points between two infinite lines
/// @param p1, d1 Point and direction of the first line
/// @param p2, d2 Point and direction of the second line
/// @return Approach result.  When the denominator is below
///         DENOMINATOR_EPSILON * |d1|^2 * |d2|^2 the lines are reported
///         parallel and no division is performed.
CONDUITJOIN_EXPORT LineLineApproach closestApproach(
    const gp_Pnt& p1, const gp_Vec& d1,
    const gp_Pnt& p2, const gp_Vec& d2);

// =====================================================================
//  Distance Functions
// =====================================================================

/// Distance from a point to an infinite line
CONDUITJOIN_EXPORT double pointToInfiniteLineDistance(
    const gp_Pnt& point,
    const gp_Pnt& linePoint1, const gp_Pnt& linePoint2);

}  // namespace geometry
}  // namespace conduitjoin

#endif  // CONDUITJOIN_GEOMETRY_INTERSECTIONS_H
