// =====================================================================
//  src/libconduitjoin/geometry/utils.cpp -- Geometry utility functions
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/geometry/utils.h>

#include <QtMath>

namespace conduitjoin {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

double dot(const gp_Vec& a, const gp_Vec& b)
{
    return a.Dot(b);
}

gp_Vec cross(const gp_Vec& a, const gp_Vec& b)
{
    return a.Crossed(b);
}

double length(const gp_Vec& v)
{
    return v.Magnitude();
}

gp_Vec normalize(const gp_Vec& v)
{
    double len = length(v);
    if (len < VECTOR_EPSILON) {
        return gp_Vec(0.0, 0.0, 0.0);
    }
    return v / len;
}

gp_Pnt lerp(const gp_Pnt& a, const gp_Pnt& b, double t)
{
    return gp_Pnt(
        a.X() + t * (b.X() - a.X()),
        a.Y() + t * (b.Y() - a.Y()),
        a.Z() + t * (b.Z() - a.Z())
    );
}

gp_Pnt midpoint(const gp_Pnt& a, const gp_Pnt& b)
{
    return lerp(a, b, 0.5);
}

// =====================================================================
//  Angle Operations
// =====================================================================

double angleBetween(const gp_Vec& a, const gp_Vec& b)
{
    double lenA = length(a);
    double lenB = length(b);

    if (lenA < VECTOR_EPSILON || lenB < VECTOR_EPSILON) {
        return 0.0;
    }

    // atan2 of |a x b| and a.b stays accurate near 0 and 180 degrees
    double sinPart = length(cross(a, b));
    double cosPart = dot(a, b);
    return qRadiansToDegrees(qAtan2(sinPart, cosPart));
}

double lineAngle(const gp_Vec& a, const gp_Vec& b)
{
    double angle = angleBetween(a, b);
    return angle > 90.0 ? 180.0 - angle : angle;
}

bool directionsParallel(const gp_Vec& a, const gp_Vec& b, double angularTolerance)
{
    return length(cross(normalize(a), normalize(b))) < angularTolerance;
}

// =====================================================================
//  Line Operations
// =====================================================================

gp_Pnt closestPointOnInfiniteLine(
    const gp_Pnt& point,
    const gp_Pnt& origin, const gp_Vec& direction)
{
    gp_Vec unit = normalize(direction);
    double along = dot(gp_Vec(origin, point), unit);
    return origin.Translated(unit * along);
}

}  // namespace geometry
}  // namespace conduitjoin
