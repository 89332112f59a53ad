// =====================================================================
//  src/libconduitjoin/conduitjoin/connect/analyzer.h -- Segment pair analysis
// =====================================================================
//
//  Classifies the relationship between the infinite lines through two
//  segments as Parallel, Intersecting or Skew and computes the offset
//  and nearest-approach points.  Segment bounds are ignored: free ends
//  may be trimmed or extended anywhere along their line.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CONNECT_ANALYZER_H
#define CONDUITJOIN_CONNECT_ANALYZER_H

#include "types.h"

namespace conduitjoin {
namespace connect {

/// Classify two segments
/// @param a, b Segments to compare
/// @param tolerance Linear tolerance.  Segments shorter than this fail
///        with DegenerateSegment; non-parallel lines whose closest points
///        are within it (inclusive) are Intersecting.
/// @param angularTolerance Lines with |cross(dirA, dirB)| below this are
///        Parallel
/// @return Classification on success.  Pure function: identical inputs
///         give bit-identical results.
CONDUITJOIN_EXPORT AnalysisResult analyze(
    const Segment& a, const Segment& b,
    double tolerance = geometry::DEFAULT_TOLERANCE,
    double angularTolerance = geometry::ANGULAR_TOLERANCE);

}  // namespace connect
}  // namespace conduitjoin

#endif  // CONDUITJOIN_CONNECT_ANALYZER_H
