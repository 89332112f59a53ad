// =====================================================================
//  src/libconduitjoin/connect/planner.cpp -- Connection planner
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/connect/planner.h>
#include <conduitjoin/connect/analyzer.h>
#include <conduitjoin/connect/strategy.h>

#include <QLoggingCategory>

namespace conduitjoin {
namespace connect {

Q_LOGGING_CATEGORY(logPlanner, "conduitjoin.connect.planner")

ConnectionOutcome connect(
    const Segment& a, const Segment& b,
    const gp_Pnt& freeEndA, const gp_Pnt& freeEndB,
    const ConnectOptions& options)
{
    ConnectionOutcome outcome;

    const AnalysisResult analysis = analyze(a, b, options.tolerance,
                                            options.angularTolerance);
    if (!analysis.success) {
        outcome.error = analysis.error;
        outcome.errorMessage = analysis.errorMessage;
        qCInfo(logPlanner) << "connect: analysis failed:" << outcome.errorMessage;
        return outcome;
    }

    outcome.classification = analysis.classification;
    outcome.strategy = selectStrategy(outcome.classification, options.tolerance);

    const PlanResult planned = plan(outcome.strategy, a, b, outcome.classification,
                                    freeEndA, freeEndB,
                                    options.tolerance, options.angularTolerance);
    if (!planned.success) {
        outcome.error = planned.error;
        outcome.errorMessage = planned.errorMessage;
        qCInfo(logPlanner) << "connect:" << outcome.strategyName()
                           << "failed:" << outcome.errorMessage;
        return outcome;
    }

    outcome.plan = planned.plan;
    outcome.success = true;

    qCDebug(logPlanner) << "connect:"
                        << relationshipName(outcome.classification.relationship)
                        << "->" << outcome.strategyName();
    return outcome;
}

ConnectionOutcome connect(
    const Segment& a, const Segment& b,
    const FreeEndSelector& freeEndSelector,
    const ConnectOptions& options)
{
    if (!freeEndSelector) {
        ConnectionOutcome outcome;
        outcome.error = ConnectError::AmbiguousEndpoint;
        outcome.errorMessage = QStringLiteral("No free-end selector given.");
        return outcome;
    }

    return connect(a, b, freeEndSelector(a), freeEndSelector(b), options);
}

}  // namespace connect
}  // namespace conduitjoin
