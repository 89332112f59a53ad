// =====================================================================
//  src/libconduitjoin/centerline_io.cpp -- Centerline BREP I/O
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/centerline_io.h>
#include <conduitjoin/network.h>

#include <BRep_Builder.hxx>
#include <BRep_Tool.hxx>
#include <BRepAdaptor_Curve.hxx>
#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepTools.hxx>
#include <GeomAbs_CurveType.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Compound.hxx>
#include <TopoDS_Edge.hxx>
#include <TopoDS_Vertex.hxx>

#include <QFile>
#include <QLoggingCategory>

namespace conduitjoin {
namespace centerline_io {

Q_LOGGING_CATEGORY(logCenterlineIo, "conduitjoin.io")

TopoDS_Shape makeCenterlineCompound(const QVector<geometry::Segment>& segments,
                                    QString* errorMsg)
{
    if (segments.isEmpty()) {
        if (errorMsg) *errorMsg = QStringLiteral("No conduits to write");
        return TopoDS_Shape();
    }

    BRep_Builder builder;
    TopoDS_Compound compound;
    builder.MakeCompound(compound);

    for (int i = 0; i < segments.size(); ++i) {
        BRepBuilderAPI_MakeEdge edgeMaker(segments[i].start, segments[i].end);
        if (!edgeMaker.IsDone()) {
            if (errorMsg) *errorMsg = QStringLiteral("Cannot build an edge for segment %1").arg(i + 1);
            return TopoDS_Shape();
        }
        builder.Add(compound, edgeMaker.Edge());
    }

    return compound;
}

bool writeCenterlines(const QString& path,
                      const QVector<geometry::Segment>& segments,
                      QString* errorMsg)
{
    TopoDS_Shape shape = makeCenterlineCompound(segments, errorMsg);
    if (shape.IsNull()) {
        return false;
    }

    std::string stdPath = path.toStdString();
    if (!BRepTools::Write(shape, stdPath.c_str())) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write BREP file: ") + path;
        return false;
    }

    qCInfo(logCenterlineIo) << "wrote" << segments.size() << "centerlines to" << path;
    return true;
}

bool writeCenterlines(const QString& path, const Network& network,
                      QString* errorMsg)
{
    QVector<geometry::Segment> segments;
    segments.reserve(network.conduits().size());
    for (const Conduit& c : network.conduits()) {
        segments.append(c.segment);
    }
    return writeCenterlines(path, segments, errorMsg);
}

QVector<geometry::Segment> readCenterlines(const QString& path, QString* errorMsg)
{
    QVector<geometry::Segment> result;

    if (!QFile::exists(path)) {
        if (errorMsg) *errorMsg = QStringLiteral("File not found: ") + path;
        return result;
    }

    BRep_Builder builder;
    TopoDS_Shape shape;

    std::string stdPath = path.toStdString();
    if (!BRepTools::Read(shape, stdPath.c_str(), builder)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read BREP file: ") + path;
        return result;
    }

    int skipped = 0;
    for (TopExp_Explorer exp(shape, TopAbs_EDGE); exp.More(); exp.Next()) {
        const TopoDS_Edge& edge = TopoDS::Edge(exp.Current());

        BRepAdaptor_Curve curve(edge);
        if (curve.GetType() != GeomAbs_Line) {
            ++skipped;
            continue;
        }

        TopoDS_Vertex first;
        TopoDS_Vertex last;
        TopExp::Vertices(edge, first, last, Standard_True);
        if (first.IsNull() || last.IsNull()) {
            ++skipped;
            continue;
        }

        result.append(geometry::Segment(BRep_Tool::Pnt(first), BRep_Tool::Pnt(last)));
    }

    if (skipped > 0) {
        qCWarning(logCenterlineIo) << "skipped" << skipped << "non-linear edges in" << path;
    }
    if (result.isEmpty() && errorMsg) {
        *errorMsg = QStringLiteral("No straight edges in ") + path;
    }

    return result;
}

}  // namespace centerline_io
}  // namespace conduitjoin
