// =====================================================================
//  src/libconduitjoin/conduitjoin/connect/planner.h -- Connection planner
// =====================================================================
//
//  Entry point of the geometry core: analyze a pair, pick the matching
//  strategy and return its plan.  The planner never mutates anything;
//  the host applies the returned plan inside its own transaction.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CONNECT_PLANNER_H
#define CONDUITJOIN_CONNECT_PLANNER_H

#include "types.h"

#include <functional>

namespace conduitjoin {
namespace connect {

/// Supplies the open endpoint of a segment.  The host knows which end
/// is structurally unconnected; geometry alone cannot tell.
using FreeEndSelector = std::function<gp_Pnt(const Segment&)>;

/// Connect two segments whose free ends are already known
CONDUITJOIN_EXPORT ConnectionOutcome connect(
    const Segment& a, const Segment& b,
    const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
    const ConnectOptions& options = ConnectOptions());

/// Connect two segments, asking the selector for each free end
CONDUITJOIN_EXPORT ConnectionOutcome connect(
    const Segment& a, const Segment& b,
    const FreeEndSelector& freeEndSelector,
    const ConnectOptions& options = ConnectOptions());

}  // namespace connect
}  // namespace conduitjoin

#endif  // CONDUITJOIN_CONNECT_PLANNER_H
