// =====================================================================
//  src/libconduitjoin/conduitjoin/network.h -- Conduit network model
// =====================================================================
//
//  A Network holds named conduit centerlines and the joints recorded
//  between their ends.  It is the host side of a connect operation:
//  it resolves conduit ids to segments, knows which ends are still
//  open, and applies connection plans all-or-nothing.
//
//  Not thread-safe; callers serialise access.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_NETWORK_H
#define CONDUITJOIN_NETWORK_H

#include "core.h"
#include "connect/types.h"

#include <QString>
#include <QVector>

#include <optional>

namespace conduitjoin {

/// A straight run of conduit
struct Conduit {
    int id = 0;
    QString name;
    geometry::Segment segment;
};

/// One end of a conduit in the network
struct ConduitEndRef {
    int conduitId = 0;
    geometry::SegmentEnd end = geometry::SegmentEnd::End;

    bool operator==(const ConduitEndRef& other) const {
        return conduitId == other.conduitId && end == other.end;
    }
    bool operator!=(const ConduitEndRef& other) const { return !(*this == other); }
};

/// A fitting location joining two conduit ends
struct Joint {
    int id = 0;
    ConduitEndRef first;
    ConduitEndRef second;
    gp_Pnt location;
    double bendAngleDegrees = 0.0;
    connect::FittingKind fitting = connect::FittingKind::Elbow;

    bool involves(int conduitId) const {
        return first.conduitId == conduitId || second.conduitId == conduitId;
    }
};

/// Record of one applied connect operation
struct Connection {
    int conduitA = 0;
    int conduitB = 0;
    QVector<int> intermediateIds;   ///< Conduits created for the plan
    QVector<int> jointIds;
    connect::ConnectionOutcome outcome;

    bool joins(int idA, int idB) const {
        return (conduitA == idA && conduitB == idB) ||
               (conduitA == idB && conduitB == idA);
    }
};

class CONDUITJOIN_EXPORT Network {
public:
    /// Undo snapshots kept.  The oldest is dropped past this depth.
    static constexpr int MaxUndoDepth = 100;

    Network();
    ~Network();

    // ---- Conduits ---------------------------------------------------

    /// Add a conduit.  An empty name becomes "C<id>".
    /// Returns the new id (ids start at 1 and are never reused), or 0
    /// if the segment is degenerate or the name is already taken.
    int addConduit(const geometry::Segment& segment,
                   const QString& name = QString(),
                   QString* errorMsg = nullptr);

    /// Remove a conduit together with every joint on it.
    /// Returns false if the id is unknown.
    bool removeConduit(int id);

    /// Look up a conduit, or nullptr
    const Conduit* conduit(int id) const;
    const Conduit* conduitByName(const QString& name) const;

    const QVector<Conduit>& conduits() const;
    const QVector<Joint>& joints() const;
    const QVector<Connection>& connections() const;

    /// Joints attached to either end of a conduit
    QVector<Joint> jointsOf(int conduitId) const;

    bool isEmpty() const;

    // ---- Host collaborators -----------------------------------------

    /// Segment source: centerline of a conduit
    std::optional<geometry::Segment> segment(int id) const;

    /// True if a joint is recorded on this end
    bool isEndConnected(int id, geometry::SegmentEnd end) const;

    /// Free-end selector.  Returns the open end of the conduit.  When
    /// both ends are open the one nearer towards is returned, or the
    /// conduit midpoint if they are equally near.  nullopt if the
    /// conduit is unknown or both ends are taken.
    std::optional<gp_Pnt> freeEnd(int id, const gp_Pnt& towards) const;

    // ---- Connect ----------------------------------------------------

    /// Plan and apply a connection between two conduits.
    /// Connecting a pair that is already connected returns the recorded
    /// outcome and changes nothing.
    connect::ConnectionOutcome connect(
        int idA, int idB,
        const connect::ConnectOptions& options = connect::ConnectOptions());

    /// Plan applier.  Updates both conduits, creates the intermediate
    /// conduits (named "<A>-<B>.<n>") and records the joints.  Either
    /// the whole plan is applied or nothing changes.
    bool applyPlan(int idA, int idB,
                   const connect::ConnectionPlan& plan,
                   double tolerance = geometry::DEFAULT_TOLERANCE,
                   QString* errorMsg = nullptr);

    // ---- Undo / state -----------------------------------------------

    /// Revert the last successful modification.  Returns false if
    /// there is nothing to undo.
    bool undo();
    bool canUndo() const;

    /// True after any change since construction or the last
    /// setModified(false) (the CLI clears it on export).
    bool isModified() const;
    void setModified(bool modified = true);

    /// Remove all conduits and joints.  Can be undone.
    void clear();

private:
    struct State {
        QVector<Conduit> conduits;
        QVector<Joint> joints;
        QVector<Connection> connections;
        int nextConduitId = 1;
        int nextJointId = 1;
    };

    void commit(const State& next);
    const Connection* findConnection(int idA, int idB) const;
    QString uniqueName(const State& state, const QString& base) const;

    State           m_state;
    QVector<State>  m_undoStack;
    bool            m_modified = false;
};

}  // namespace conduitjoin

#endif  // CONDUITJOIN_NETWORK_H
