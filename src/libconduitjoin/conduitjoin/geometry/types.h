// =====================================================================
//  src/libconduitjoin/conduitjoin/geometry/types.h -- Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout libconduitjoin.
//  Points and vectors are OCCT gp_Pnt / gp_Vec values; a Segment is a
//  straight conduit centerline between two points.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_GEOMETRY_TYPES_H
#define CONDUITJOIN_GEOMETRY_TYPES_H

#include "../core.h"

#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>

#include <QString>

namespace conduitjoin {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default linear tolerance for geometric comparisons (model units)
constexpr double DEFAULT_TOLERANCE = 1e-3;

/// Default tolerance on |cross(dirA, dirB)| below which two unit
/// directions are treated as parallel
constexpr double ANGULAR_TOLERANCE = 1e-6;

/// Relative floor for the closest-approach denominator
constexpr double DENOMINATOR_EPSILON = 1e-14;

/// Vectors shorter than this cannot be normalized
constexpr double VECTOR_EPSILON = 1e-12;

/// Shortest length that counts as a segment at the given tolerance.
/// Never below VECTOR_EPSILON, so a zero tolerance still rejects
/// zero-length input.
CONDUITJOIN_EXPORT double minimumLength(double tolerance);

/// True for a finite, non-negative tolerance
CONDUITJOIN_EXPORT bool isValidTolerance(double tolerance);

// =====================================================================
//  Segment
// =====================================================================

/// One of the two endpoints of a segment
enum class SegmentEnd {
    Start,
    End
};

/// The other endpoint
CONDUITJOIN_EXPORT SegmentEnd opposite(SegmentEnd end);

/// "start" / "end"
CONDUITJOIN_EXPORT QString segmentEndName(SegmentEnd end);

/// Straight segment between two points.  Value type; operations that
/// change an endpoint return a new Segment.
struct CONDUITJOIN_EXPORT Segment {
    gp_Pnt start;
    gp_Pnt end;

    Segment() = default;
    Segment(const gp_Pnt& startPoint, const gp_Pnt& endPoint);

    /// end - start
    gp_Vec vector() const;

    double length() const;

    /// Unit direction from start to end (zero vector if degenerate)
    gp_Vec direction() const;

    /// True if shorter than tolerance
    bool isDegenerate(double tolerance = DEFAULT_TOLERANCE) const;

    /// Get one of the endpoints
    gp_Pnt point(SegmentEnd which) const;

    gp_Pnt midpoint() const;

    /// Get point at parameter t (0 = start, 1 = end)
    gp_Pnt pointAt(double t) const;

    /// Copy with one endpoint moved
    Segment withEndpoint(SegmentEnd which, const gp_Pnt& position) const;

    /// Copy with start and end swapped
    Segment reversed() const;
};

}  // namespace geometry
}  // namespace conduitjoin

#endif  // CONDUITJOIN_GEOMETRY_TYPES_H
