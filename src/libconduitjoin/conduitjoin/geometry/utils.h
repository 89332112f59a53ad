// =====================================================================
//  src/libconduitjoin/conduitjoin/geometry/utils.h -- Geometry utility functions
// =====================================================================
//
//  Vector, angle and line helpers on OCCT points and vectors.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_GEOMETRY_UTILS_H
#define CONDUITJOIN_GEOMETRY_UTILS_H

#include "types.h"

namespace conduitjoin {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

/// Compute the dot product of two vectors
CONDUITJOIN_EXPORT double dot(const gp_Vec& a, const gp_Vec& b);

/// Compute the cross product of two vectors
CONDUITJOIN_EXPORT gp_Vec cross(const gp_Vec& a, const gp_Vec& b);

/// Compute the length of a vector
CONDUITJOIN_EXPORT double length(const gp_Vec& v);

/// Normalize a vector to unit length.
/// Returns the zero vector when v is shorter than VECTOR_EPSILON.
CONDUITJOIN_EXPORT gp_Vec normalize(const gp_Vec& v);

/// Linear interpolation between two points
CONDUITJOIN_EXPORT gp_Pnt lerp(const gp_Pnt& a, const gp_Pnt& b, double t);

/// Midpoint of two points
CONDUITJOIN_EXPORT gp_Pnt midpoint(const gp_Pnt& a, const gp_Pnt& b);

// =====================================================================
//  Angle Operations
// =====================================================================

/// Angle between two vectors in degrees, in [0, 180]
/// Returns 0 if either vector is degenerate.
CONDUITJOIN_EXPORT double angleBetween(const gp_Vec& a, const gp_Vec& b);

/// Angle between the lines carrying two vectors in degrees, in [0, 90]
CONDUITJOIN_EXPORT double lineAngle(const gp_Vec& a, const gp_Vec& b);

/// Check if two directions are parallel or anti-parallel:
/// |cross(normalize(a), normalize(b))| < angularTolerance
CONDUITJOIN_EXPORT bool directionsParallel(
    const gp_Vec& a, const gp_Vec& b,
    double angularTolerance = ANGULAR_TOLERANCE);

// =====================================================================
//  Line Operations
// =====================================================================

/// Foot of the perpendicular from point onto the infinite line through
/// origin with the given direction (need not be unit length)
CONDUITJOIN_EXPORT gp_Pnt closestPointOnInfiniteLine(
    const gp_Pnt& point,
    const gp_Pnt& origin, const gp_Vec& direction);

}  // namespace geometry
}  // namespace conduitjoin

#endif  // CONDUITJOIN_GEOMETRY_UTILS_H
