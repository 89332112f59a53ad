// =====================================================================
//  src/libconduitjoin/conduitjoin/centerline_io.h -- Centerline BREP I/O
// =====================================================================
//
//  Writes conduit centerlines as a compound of straight edges in the
//  OpenCASCADE BREP format, and reads such files back.
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CENTERLINE_IO_H
#define CONDUITJOIN_CENTERLINE_IO_H

#include "core.h"
#include "geometry/types.h"

#include <TopoDS_Shape.hxx>

#include <QString>
#include <QVector>

namespace conduitjoin {

class Network;

namespace centerline_io {

/// Build one edge per segment and wrap them in a compound.
/// Returns a null shape if segments is empty or an edge cannot be built.
CONDUITJOIN_EXPORT TopoDS_Shape makeCenterlineCompound(
    const QVector<geometry::Segment>& segments,
    QString* errorMsg = nullptr);

/// Write segments to a BREP file.
/// Returns true on success.  Sets errorMsg on failure.
CONDUITJOIN_EXPORT bool writeCenterlines(
    const QString& path,
    const QVector<geometry::Segment>& segments,
    QString* errorMsg = nullptr);

/// Write every conduit of a network to a BREP file.
CONDUITJOIN_EXPORT bool writeCenterlines(
    const QString& path,
    const Network& network,
    QString* errorMsg = nullptr);

/// Read the straight edges of a BREP file back as segments.
/// Non-linear edges are skipped.  On failure, returns an empty list and
/// sets errorMsg if non-null.
CONDUITJOIN_EXPORT QVector<geometry::Segment> readCenterlines(
    const QString& path,
    QString* errorMsg = nullptr);

}  // namespace centerline_io
}  // namespace conduitjoin

#endif  // CONDUITJOIN_CENTERLINE_IO_H
