// =====================================================================
//  src/libconduitjoin/geometry/types.cpp -- Basic geometry types implementation
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/geometry/types.h>
#include <conduitjoin/geometry/utils.h>

#include <cmath>

namespace conduitjoin {
namespace geometry {

double minimumLength(double tolerance)
{
    return tolerance > VECTOR_EPSILON ? tolerance : VECTOR_EPSILON;
}

bool isValidTolerance(double tolerance)
{
    return std::isfinite(tolerance) && tolerance >= 0.0;
}

SegmentEnd opposite(SegmentEnd end)
{
    return end == SegmentEnd::Start ? SegmentEnd::End : SegmentEnd::Start;
}

QString segmentEndName(SegmentEnd end)
{
    return end == SegmentEnd::Start ? QStringLiteral("start") : QStringLiteral("end");
}

// =====================================================================
//  Segment Implementation
// =====================================================================

Segment::Segment(const gp_Pnt& startPoint, const gp_Pnt& endPoint)
    : start(startPoint)
    , end(endPoint)
{
}

gp_Vec Segment::vector() const
{
    return gp_Vec(start, end);
}

double Segment::length() const
{
    return start.Distance(end);
}

gp_Vec Segment::direction() const
{
    return normalize(vector());
}

bool Segment::isDegenerate(double tolerance) const
{
    return length() < minimumLength(tolerance);
}

gp_Pnt Segment::point(SegmentEnd which) const
{
    return which == SegmentEnd::Start ? start : end;
}

gp_Pnt Segment::midpoint() const
{
    return geometry::midpoint(start, end);
}

gp_Pnt Segment::pointAt(double t) const
{
    return lerp(start, end, t);
}

Segment Segment::withEndpoint(SegmentEnd which, const gp_Pnt& position) const
{
    Segment result = *this;
    if (which == SegmentEnd::Start) {
        result.start = position;
    } else {
        result.end = position;
    }
    return result;
}

Segment Segment::reversed() const
{
    return Segment(end, start);
}

}  // namespace geometry
}  // namespace conduitjoin
