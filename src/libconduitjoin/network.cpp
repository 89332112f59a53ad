// =====================================================================
//  src/libconduitjoin/network.cpp -- Conduit network model
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/network.h>
#include <conduitjoin/connect/planner.h>
#include <conduitjoin/geometry/utils.h>

#include <QLoggingCategory>

namespace conduitjoin {

Q_LOGGING_CATEGORY(logNetwork, "conduitjoin.network")

using geometry::Segment;
using geometry::SegmentEnd;

Network::Network() = default;
Network::~Network() = default;

// ---- Conduits -------------------------------------------------------

int Network::addConduit(const Segment& segment, const QString& name,
                        QString* errorMsg)
{
    if (segment.isDegenerate()) {
        if (errorMsg) *errorMsg = QStringLiteral("Conduit has zero length");
        return 0;
    }

    State next = m_state;
    const int id = next.nextConduitId++;

    Conduit c;
    c.id = id;
    c.name = name.isEmpty() ? uniqueName(next, QStringLiteral("C%1").arg(id)) : name;
    c.segment = segment;

    for (const Conduit& existing : next.conduits) {
        if (existing.name == c.name) {
            if (errorMsg) *errorMsg = QStringLiteral("Name already in use: ") + c.name;
            return 0;
        }
    }

    next.conduits.append(c);
    commit(next);

    qCDebug(logNetwork) << "addConduit:" << id << c.name << "length=" << segment.length();
    return id;
}

bool Network::removeConduit(int id)
{
    if (!conduit(id)) {
        return false;
    }

    State next = m_state;

    for (int i = next.conduits.size() - 1; i >= 0; --i) {
        if (next.conduits[i].id == id) {
            next.conduits.remove(i);
        }
    }
    for (int i = next.joints.size() - 1; i >= 0; --i) {
        if (next.joints[i].involves(id)) {
            next.joints.remove(i);
        }
    }
    for (int i = next.connections.size() - 1; i >= 0; --i) {
        const Connection& conn = next.connections[i];
        if (conn.conduitA == id || conn.conduitB == id ||
            conn.intermediateIds.contains(id)) {
            next.connections.remove(i);
        }
    }

    commit(next);
    qCDebug(logNetwork) << "removeConduit:" << id;
    return true;
}

const Conduit* Network::conduit(int id) const
{
    for (const Conduit& c : m_state.conduits) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

const Conduit* Network::conduitByName(const QString& name) const
{
    for (const Conduit& c : m_state.conduits) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

const QVector<Conduit>& Network::conduits() const       { return m_state.conduits; }
const QVector<Joint>& Network::joints() const           { return m_state.joints; }
const QVector<Connection>& Network::connections() const { return m_state.connections; }
bool Network::isEmpty() const                           { return m_state.conduits.isEmpty(); }

QVector<Joint> Network::jointsOf(int conduitId) const
{
    QVector<Joint> result;
    for (const Joint& j : m_state.joints) {
        if (j.involves(conduitId)) {
            result.append(j);
        }
    }
    return result;
}

// ---- Host collaborators ---------------------------------------------

std::optional<Segment> Network::segment(int id) const
{
    if (const Conduit* c = conduit(id)) {
        return c->segment;
    }
    return std::nullopt;
}

bool Network::isEndConnected(int id, SegmentEnd end) const
{
    const ConduitEndRef ref{id, end};
    for (const Joint& j : m_state.joints) {
        if (j.first == ref || j.second == ref) {
            return true;
        }
    }
    return false;
}

std::optional<gp_Pnt> Network::freeEnd(int id, const gp_Pnt& towards) const
{
    const Conduit* c = conduit(id);
    if (!c) {
        return std::nullopt;
    }

    const bool startOpen = !isEndConnected(id, SegmentEnd::Start);
    const bool endOpen = !isEndConnected(id, SegmentEnd::End);

    if (startOpen && !endOpen) return c->segment.start;
    if (endOpen && !startOpen) return c->segment.end;
    if (!startOpen && !endOpen) return std::nullopt;

    const double dStart = towards.Distance(c->segment.start);
    const double dEnd = towards.Distance(c->segment.end);
    if (qAbs(dStart - dEnd) <= geometry::VECTOR_EPSILON) {
        // Let the planner decide from the joint location
        return c->segment.midpoint();
    }
    return dStart < dEnd ? c->segment.start : c->segment.end;
}

// ---- Connect --------------------------------------------------------

connect::ConnectionOutcome Network::connect(
    int idA, int idB, const connect::ConnectOptions& options)
{
    connect::ConnectionOutcome outcome;
    outcome.error = connect::ConnectError::HostError;

    const Conduit* a = conduit(idA);
    const Conduit* b = conduit(idB);
    if (!a || !b) {
        outcome.errorMessage = QStringLiteral("Unknown conduit id %1")
                                   .arg(a ? idB : idA);
        return outcome;
    }
    if (idA == idB) {
        outcome.errorMessage = QStringLiteral("Cannot connect %1 to itself").arg(a->name);
        return outcome;
    }

    if (const Connection* existing = findConnection(idA, idB)) {
        qCDebug(logNetwork) << "connect:" << a->name << b->name << "already connected";
        return existing->outcome;
    }

    const std::optional<gp_Pnt> freeA = freeEnd(idA, b->segment.midpoint());
    if (!freeA) {
        outcome.errorMessage = QStringLiteral("%1 has no open end").arg(a->name);
        return outcome;
    }
    const std::optional<gp_Pnt> freeB = freeEnd(idB, a->segment.midpoint());
    if (!freeB) {
        outcome.errorMessage = QStringLiteral("%1 has no open end").arg(b->name);
        return outcome;
    }

    outcome = connect::connect(a->segment, b->segment, *freeA, *freeB, options);
    if (!outcome.success) {
        qCInfo(logNetwork) << "connect:" << a->name << b->name
                           << connect::errorName(outcome.error);
        return outcome;
    }

    QString err;
    if (!applyPlan(idA, idB, outcome.plan, options.tolerance, &err)) {
        outcome.success = false;
        outcome.error = connect::ConnectError::HostError;
        outcome.errorMessage = err;
        return outcome;
    }

    // applyPlan recorded the connection without the analysis; fill it in
    m_state.connections.last().outcome = outcome;
    return outcome;
}

bool Network::applyPlan(int idA, int idB, const connect::ConnectionPlan& plan,
                        double tolerance, QString* errorMsg)
{
    const Conduit* a = conduit(idA);
    const Conduit* b = conduit(idB);
    if (!a || !b || idA == idB) {
        if (errorMsg) *errorMsg = QStringLiteral("Plan refers to unknown conduits");
        return false;
    }

    if (findConnection(idA, idB)) {
        return true;
    }

    // ---- Validate ----

    if (isEndConnected(idA, plan.updateA.end)) {
        if (errorMsg) *errorMsg = QStringLiteral("%1 %2 is already connected")
                                      .arg(a->name, geometry::segmentEndName(plan.updateA.end));
        return false;
    }
    if (isEndConnected(idB, plan.updateB.end)) {
        if (errorMsg) *errorMsg = QStringLiteral("%1 %2 is already connected")
                                      .arg(b->name, geometry::segmentEndName(plan.updateB.end));
        return false;
    }

    const Segment newA = plan.updatedA(a->segment);
    const Segment newB = plan.updatedB(b->segment);
    if (newA.isDegenerate(tolerance) || newB.isDegenerate(tolerance)) {
        if (errorMsg) *errorMsg = QStringLiteral("Plan collapses %1 or %2")
                                      .arg(a->name, b->name);
        return false;
    }
    for (const Segment& s : plan.intermediates) {
        if (s.isDegenerate(tolerance)) {
            if (errorMsg) *errorMsg = QStringLiteral("Plan contains a zero-length segment");
            return false;
        }
    }

    auto validRef = [&plan](const connect::SegmentEndRef& r) {
        switch (r.segment) {
        case connect::PlanSegment::A:
            return r.end == plan.updateA.end;
        case connect::PlanSegment::B:
            return r.end == plan.updateB.end;
        case connect::PlanSegment::Intermediate:
            return r.index >= 0 && r.index < plan.intermediates.size();
        }
        return false;
    };
    for (const connect::JointPoint& jp : plan.joints) {
        if (!validRef(jp.first) || !validRef(jp.second)) {
            if (errorMsg) *errorMsg = QStringLiteral("Plan joint refers to a fixed or missing end");
            return false;
        }
    }

    // ---- Commit on a copy ----

    State next = m_state;

    for (Conduit& c : next.conduits) {
        if (c.id == idA) c.segment = newA;
        else if (c.id == idB) c.segment = newB;
    }

    Connection record;
    record.conduitA = idA;
    record.conduitB = idB;
    record.outcome.success = true;
    record.outcome.plan = plan;

    for (int i = 0; i < plan.intermediates.size(); ++i) {
        Conduit c;
        c.id = next.nextConduitId++;
        c.name = uniqueName(next, QStringLiteral("%1-%2.%3")
                                      .arg(a->name, b->name).arg(i + 1));
        c.segment = plan.intermediates[i];
        next.conduits.append(c);
        record.intermediateIds.append(c.id);
    }

    auto toConduitEnd = [&](const connect::SegmentEndRef& r) {
        ConduitEndRef ref;
        ref.end = r.end;
        switch (r.segment) {
        case connect::PlanSegment::A:            ref.conduitId = idA; break;
        case connect::PlanSegment::B:            ref.conduitId = idB; break;
        case connect::PlanSegment::Intermediate: ref.conduitId = record.intermediateIds[r.index]; break;
        }
        return ref;
    };

    for (const connect::JointPoint& jp : plan.joints) {
        Joint j;
        j.id = next.nextJointId++;
        j.first = toConduitEnd(jp.first);
        j.second = toConduitEnd(jp.second);
        j.location = jp.location;
        j.bendAngleDegrees = jp.bendAngleDegrees;
        j.fitting = jp.fitting;
        next.joints.append(j);
        record.jointIds.append(j.id);
    }

    const QString nameA = a->name;
    const QString nameB = b->name;

    next.connections.append(record);
    commit(next);

    qCInfo(logNetwork) << "applyPlan:" << nameA << nameB
                       << "intermediates=" << plan.intermediates.size()
                       << "joints=" << plan.joints.size();
    return true;
}

// ---- Undo / state ---------------------------------------------------

bool Network::undo()
{
    if (m_undoStack.isEmpty()) {
        return false;
    }
    m_state = m_undoStack.takeLast();
    m_modified = true;
    qCDebug(logNetwork) << "undo:" << m_undoStack.size() << "steps left";
    return true;
}

bool Network::canUndo() const     { return !m_undoStack.isEmpty(); }
bool Network::isModified() const  { return m_modified; }
void Network::setModified(bool modified) { m_modified = modified; }

void Network::clear()
{
    State next;
    next.nextConduitId = m_state.nextConduitId;
    next.nextJointId = m_state.nextJointId;
    commit(next);
}

// ---- Private --------------------------------------------------------

void Network::commit(const State& next)
{
    m_undoStack.append(m_state);
    while (m_undoStack.size() > MaxUndoDepth) {
        m_undoStack.removeFirst();
    }
    m_state = next;
    m_modified = true;
}

const Connection* Network::findConnection(int idA, int idB) const
{
    for (const Connection& c : m_state.connections) {
        if (c.joins(idA, idB)) return &c;
    }
    return nullptr;
}

QString Network::uniqueName(const State& state, const QString& base) const
{
    auto taken = [&state](const QString& name) {
        for (const Conduit& c : state.conduits) {
            if (c.name == name) return true;
        }
        return false;
    };

    if (!taken(base)) {
        return base;
    }
    for (int n = 2; ; ++n) {
        const QString candidate = QStringLiteral("%1_%2").arg(base).arg(n);
        if (!taken(candidate)) return candidate;
    }
}

}  // namespace conduitjoin
