// =====================================================================
//  src/conduitjoin/cli/cliengine.cpp -- Command dispatch engine
// =====================================================================

#include "cliengine.h"
#include "clihistory.h"

#include <conduitjoin/core.h>
#include <conduitjoin/centerline_io.h>
#include <conduitjoin/connect/analyzer.h>
#include <conduitjoin/connect/strategy.h>

#include <QFileInfo>
#include <QRegularExpression>

namespace conduitjoin {

// ---- Parsing helpers ------------------------------------------------

QStringList tokenizeLine(const QString& line)
{
    return line.split(QRegularExpression(QStringLiteral("\\s+")),
                      Qt::SkipEmptyParts);
}

bool parsePoint(const QString& text, gp_Pnt* point)
{
    const QStringList parts = text.split(QLatin1Char(','));
    if (parts.size() != 3) {
        return false;
    }

    double xyz[3];
    for (int i = 0; i < 3; ++i) {
        bool ok = false;
        xyz[i] = parts[i].trimmed().toDouble(&ok);
        if (!ok) return false;
    }

    if (point) point->SetCoord(xyz[0], xyz[1], xyz[2]);
    return true;
}

static QString formatNumber(double v)
{
    if (qAbs(v) < 1e-12) v = 0.0;   // no "-0"
    return QString::number(v, 'g', 8);
}

QString formatPoint(const gp_Pnt& p)
{
    return QStringLiteral("(%1, %2, %3)")
        .arg(formatNumber(p.X()), formatNumber(p.Y()), formatNumber(p.Z()));
}

static CliResult fail(const QString& message)
{
    CliResult r;
    r.exitCode = 1;
    r.error = message;
    return r;
}

// ---- Engine ---------------------------------------------------------

CliEngine::CliEngine(CliHistory& history, const connect::ConnectOptions& options)
    : m_history(history)
    , m_options(options)
{
}

CliEngine::~CliEngine() = default;

QStringList CliEngine::commandNames() const
{
    return {
        QStringLiteral("help"),
        QStringLiteral("version"),
        QStringLiteral("conduit"),
        QStringLiteral("remove"),
        QStringLiteral("list"),
        QStringLiteral("joints"),
        QStringLiteral("analyze"),
        QStringLiteral("connect"),
        QStringLiteral("undo"),
        QStringLiteral("tolerance"),
        QStringLiteral("export"),
        QStringLiteral("import"),
        QStringLiteral("history"),
        QStringLiteral("exit"),
        QStringLiteral("quit"),
    };
}

QString CliEngine::buildPrompt() const
{
    return QStringLiteral("conduitjoin[%1]> ").arg(m_network.conduits().size());
}

const Network& CliEngine::network() const                 { return m_network; }
const connect::ConnectOptions& CliEngine::options() const { return m_options; }

// ---- Main dispatch --------------------------------------------------

CliResult CliEngine::execute(const QString& line)
{
    const QStringList tokens = tokenizeLine(line);

    if (tokens.isEmpty()) return {};

    const QString cmd = tokens.first().toLower();
    const QStringList args = tokens.mid(1);

    if (cmd == QLatin1String("exit") ||
        cmd == QLatin1String("quit")) {
        CliResult r;
        r.requestExit = true;
        return r;
    }

    if (cmd == QLatin1String("help"))      return cmdHelp();
    if (cmd == QLatin1String("version"))   return cmdVersion();
    if (cmd == QLatin1String("conduit"))   return cmdConduit(args);
    if (cmd == QLatin1String("remove"))    return cmdRemove(args);
    if (cmd == QLatin1String("list"))      return cmdList();
    if (cmd == QLatin1String("joints"))    return cmdJoints();
    if (cmd == QLatin1String("analyze"))   return cmdAnalyze(args);
    if (cmd == QLatin1String("connect"))   return cmdConnect(args);
    if (cmd == QLatin1String("undo"))      return cmdUndo();
    if (cmd == QLatin1String("tolerance")) return cmdTolerance(args);
    if (cmd == QLatin1String("export"))    return cmdExport(args);
    if (cmd == QLatin1String("import"))    return cmdImport(args);
    if (cmd == QLatin1String("history"))   return cmdHistory(args);

    return fail(QStringLiteral("Unknown command: ") + cmd +
                QStringLiteral("\nType 'help' for available commands."));
}

// ---- Individual commands --------------------------------------------

CliResult CliEngine::cmdHelp() const
{
    CliResult r;
    r.output = QStringLiteral(
        "Available commands:\n"
        "\n"
        "Network:\n"
        "  conduit <name> <x,y,z> to <x,y,z>   Add a straight conduit\n"
        "  remove <name>                       Remove a conduit and its joints\n"
        "  list                                List conduits\n"
        "  joints                              List joints\n"
        "  undo                                Undo the last change\n"
        "\n"
        "Connecting:\n"
        "  analyze <a> <b>                     Classify a pair without changing it\n"
        "  connect <a> <b>                     Join the open ends of two conduits\n"
        "  tolerance [value]                   Show or set the linear tolerance\n"
        "\n"
        "Files:\n"
        "  export <file>                       Write centerlines to BREP (.brep added if no extension)\n"
        "  import <file>                       Add the straight edges of a BREP file as conduits\n"
        "\n"
        "Other:\n"
        "  help                                Show this help message\n"
        "  version                             Show version\n"
        "  history                             Show command history\n"
        "  history session                     Show network commands of this session\n"
        "  history save <file>                 Save them as a script for --script\n"
        "  history clear                       Clear command history\n"
        "  history max <n>                     Set max history lines (current: %1)\n"
        "  exit, quit                          Leave")
        .arg(m_history.maxLines());
    return r;
}

CliResult CliEngine::cmdVersion() const
{
    CliResult r;
    r.output = QStringLiteral("ConduitJoin ") +
               QString::fromLatin1(conduitjoin::version());
    return r;
}

CliResult CliEngine::cmdConduit(const QStringList& args)
{
    static const QString usage = QStringLiteral(
        "Usage: conduit <name> <x,y,z> to <x,y,z>\n"
        "\n"
        "Example:\n"
        "  conduit A 0,0,0 to 10,0,0");

    // "to" is optional
    QStringList parts = args;
    if (parts.size() == 4 && parts[2].toLower() == QLatin1String("to")) {
        parts.removeAt(2);
    }
    if (parts.size() != 3) {
        return fail(usage);
    }

    gp_Pnt start;
    gp_Pnt end;
    if (!parsePoint(parts[1], &start) || !parsePoint(parts[2], &end)) {
        return fail(QStringLiteral("Invalid coordinates. Use format: x,y,z (e.g., 10,0,0)"));
    }

    QString err;
    const int id = m_network.addConduit(geometry::Segment(start, end), parts[0], &err);
    if (id == 0) {
        return fail(QStringLiteral("Error: ") + err);
    }

    CliResult r;
    r.output = QStringLiteral("Added %1: %2 -> %3")
                   .arg(parts[0], formatPoint(start), formatPoint(end));
    return r;
}

CliResult CliEngine::cmdRemove(const QStringList& args)
{
    if (args.size() != 1) {
        return fail(QStringLiteral("Usage: remove <name>"));
    }

    const Conduit* c = m_network.conduitByName(args[0]);
    if (!c) {
        return fail(QStringLiteral("No such conduit: ") + args[0]);
    }

    const int jointCount = m_network.jointsOf(c->id).size();
    m_network.removeConduit(c->id);

    CliResult r;
    r.output = QStringLiteral("Removed ") + args[0];
    if (jointCount > 0) {
        r.output += QStringLiteral(" and %1 joint(s)").arg(jointCount);
    }
    return r;
}

CliResult CliEngine::cmdList() const
{
    CliResult r;
    const QVector<Conduit>& conduits = m_network.conduits();
    if (conduits.isEmpty()) {
        r.output = QStringLiteral("No conduits.");
        return r;
    }

    QStringList lines;
    for (const Conduit& c : conduits) {
        lines << QStringLiteral("  %1  %2 -> %3  length %4")
                     .arg(c.name, formatPoint(c.segment.start),
                          formatPoint(c.segment.end),
                          formatNumber(c.segment.length()));
    }
    r.output = lines.join(QLatin1Char('\n'));
    return r;
}

QString CliEngine::describeEnd(const ConduitEndRef& ref) const
{
    const Conduit* c = m_network.conduit(ref.conduitId);
    const QString name = c ? c->name : QStringLiteral("#%1").arg(ref.conduitId);
    return name + QLatin1Char(' ') + geometry::segmentEndName(ref.end);
}

CliResult CliEngine::cmdJoints() const
{
    CliResult r;
    const QVector<Joint>& joints = m_network.joints();
    if (joints.isEmpty()) {
        r.output = QStringLiteral("No joints.");
        return r;
    }

    QStringList lines;
    for (const Joint& j : joints) {
        lines << QStringLiteral("  J%1  %2 <-> %3  at %4  %5 %6 deg")
                     .arg(j.id)
                     .arg(describeEnd(j.first), describeEnd(j.second),
                          formatPoint(j.location),
                          connect::fittingName(j.fitting),
                          formatNumber(j.bendAngleDegrees));
    }
    r.output = lines.join(QLatin1Char('\n'));
    return r;
}

bool CliEngine::lookupPair(const QStringList& args, const char* usage,
                           const Conduit** a, const Conduit** b, CliResult& r) const
{
    if (args.size() != 2) {
        r = fail(QString::fromLatin1(usage));
        return false;
    }

    *a = m_network.conduitByName(args[0]);
    *b = m_network.conduitByName(args[1]);
    if (!*a || !*b) {
        r = fail(QStringLiteral("No such conduit: ") + (*a ? args[1] : args[0]));
        return false;
    }
    return true;
}

CliResult CliEngine::cmdAnalyze(const QStringList& args) const
{
    CliResult r;
    const Conduit* a = nullptr;
    const Conduit* b = nullptr;
    if (!lookupPair(args, "Usage: analyze <a> <b>", &a, &b, r)) {
        return r;
    }

    const connect::AnalysisResult analysis = connect::analyze(
        a->segment, b->segment, m_options.tolerance, m_options.angularTolerance);
    if (!analysis.success) {
        return fail(QStringLiteral("Error: %1: %2")
                        .arg(connect::errorName(analysis.error), analysis.errorMessage));
    }

    const connect::Classification& c = analysis.classification;
    const connect::StrategyKind kind = connect::selectStrategy(c, m_options.tolerance);

    r.output = QStringLiteral(
        "Relationship: %1\n"
        "Offset:       %2\n"
        "Angle:        %3 deg\n"
        "Closest on %4: %5\n"
        "Closest on %6: %7\n"
        "Strategy:     %8")
        .arg(connect::relationshipName(c.relationship),
             formatNumber(c.offset), formatNumber(c.angleDegrees),
             a->name, formatPoint(c.closestPointOnA),
             b->name, formatPoint(c.closestPointOnB),
             connect::strategyName(kind));
    return r;
}

CliResult CliEngine::cmdConnect(const QStringList& args)
{
    CliResult r;
    const Conduit* a = nullptr;
    const Conduit* b = nullptr;
    if (!lookupPair(args, "Usage: connect <a> <b>", &a, &b, r)) {
        return r;
    }

    const int idA = a->id;
    const int idB = b->id;
    const QString nameA = a->name;
    const QString nameB = b->name;
    const int conduitsBefore = m_network.conduits().size();

    const connect::ConnectionOutcome outcome = m_network.connect(idA, idB, m_options);
    if (!outcome.success) {
        return fail(QStringLiteral("Error: %1: %2")
                        .arg(connect::errorName(outcome.error), outcome.errorMessage));
    }

    QStringList lines;
    lines << QStringLiteral("Connected %1 and %2 with %3 (%4, offset %5)")
                 .arg(nameA, nameB, outcome.strategyName(),
                      connect::relationshipName(outcome.classification.relationship),
                      formatNumber(outcome.classification.offset));

    for (int id : {idA, idB}) {
        if (const Conduit* c = m_network.conduit(id)) {
            lines << QStringLiteral("  %1: %2 -> %3")
                         .arg(c->name, formatPoint(c->segment.start),
                              formatPoint(c->segment.end));
        }
    }

    const QVector<Conduit>& conduits = m_network.conduits();
    for (int i = conduitsBefore; i < conduits.size(); ++i) {
        lines << QStringLiteral("  + %1: %2 -> %3")
                     .arg(conduits[i].name, formatPoint(conduits[i].segment.start),
                          formatPoint(conduits[i].segment.end));
    }

    for (const connect::JointPoint& jp : outcome.plan.joints) {
        lines << QStringLiteral("  joint at %1: %2 %3 deg")
                     .arg(formatPoint(jp.location), connect::fittingName(jp.fitting),
                          formatNumber(jp.bendAngleDegrees));
    }

    r.output = lines.join(QLatin1Char('\n'));
    return r;
}

CliResult CliEngine::cmdUndo()
{
    if (!m_network.canUndo()) {
        return fail(QStringLiteral("Nothing to undo."));
    }
    m_network.undo();
    CliResult r;
    r.output = QStringLiteral("Undone.");
    return r;
}

CliResult CliEngine::cmdTolerance(const QStringList& args)
{
    CliResult r;

    if (args.isEmpty()) {
        r.output = QStringLiteral("Tolerance: %1 (angular %2)")
                       .arg(formatNumber(m_options.tolerance),
                            formatNumber(m_options.angularTolerance));
        return r;
    }

    bool ok = false;
    const double value = args.first().toDouble(&ok);
    if (args.size() != 1 || !ok || !(value > 0.0)) {
        return fail(QStringLiteral("Error: tolerance must be a positive number."));
    }

    m_options.tolerance = value;
    r.output = QStringLiteral("Tolerance set to %1.").arg(formatNumber(value));
    return r;
}

CliResult CliEngine::cmdExport(const QStringList& args)
{
    if (args.isEmpty()) {
        return fail(QStringLiteral("Usage: export <filename>"));
    }

    QString path = args.join(QStringLiteral(" "));

    if (QFileInfo(path).suffix().isEmpty())
        path += QStringLiteral(".brep");

    QString err;
    if (!centerline_io::writeCenterlines(path, m_network, &err)) {
        return fail(QStringLiteral("Error: ") + err);
    }
    m_network.setModified(false);

    CliResult r;
    r.output = QStringLiteral("Exported %1 centerline(s) to %2")
                   .arg(m_network.conduits().size()).arg(path);
    return r;
}

CliResult CliEngine::cmdImport(const QStringList& args)
{
    if (args.isEmpty()) {
        return fail(QStringLiteral("Usage: import <filename>"));
    }

    const QString path = args.join(QStringLiteral(" "));

    QString err;
    const QVector<geometry::Segment> segments = centerline_io::readCenterlines(path, &err);
    if (segments.isEmpty()) {
        return fail(QStringLiteral("Error: ") + err);
    }

    int added = 0;
    QStringList skipped;
    for (const geometry::Segment& segment : segments) {
        QString addErr;
        if (m_network.addConduit(segment, QString(), &addErr) != 0) {
            ++added;
        } else {
            skipped.append(addErr);
        }
    }

    CliResult r;
    r.output = QStringLiteral("Imported %1 conduit(s) from %2").arg(added).arg(path);
    if (!skipped.isEmpty()) {
        r.output += QStringLiteral("\nSkipped %1 edge(s): ").arg(skipped.size())
                    + skipped.join(QStringLiteral("; "));
    }
    return r;
}

CliResult CliEngine::cmdHistory(const QStringList& args)
{
    CliResult r;

    if (args.isEmpty()) {
        const auto& entries = m_history.entries();
        if (entries.isEmpty()) {
            r.output = QStringLiteral("History is empty.");
            return r;
        }

        QString text;
        const int width = QString::number(entries.size()).length();
        for (int i = 0; i < entries.size(); ++i) {
            text += QStringLiteral("  ") +
                    QString::number(i + 1).rightJustified(width, QLatin1Char(' ')) +
                    QStringLiteral("  ") + entries[i] +
                    QStringLiteral("\n");
        }
        text += QStringLiteral("(%1 of %2 max)")
                    .arg(entries.size()).arg(m_history.maxLines());
        r.output = text;
        return r;
    }

    const QString subcmd = args.first().toLower();

    if (subcmd == QLatin1String("clear")) {
        m_history.clear();
        r.output = QStringLiteral("History cleared.");
        return r;
    }

    if (subcmd == QLatin1String("session")) {
        const QStringList commands = m_history.replayableCommands();
        if (commands.isEmpty()) {
            r.output = QStringLiteral("No network commands in this session.");
            return r;
        }
        r.output = commands.join(QLatin1Char('\n'));
        return r;
    }

    if (subcmd == QLatin1String("save") && args.size() >= 2) {
        const QString path = args.mid(1).join(QStringLiteral(" "));
        QString err;
        if (!m_history.writeScript(path, &err)) {
            return fail(QStringLiteral("Error: ") + err);
        }
        r.output = QStringLiteral("Saved %1 command(s) to %2")
                       .arg(m_history.replayableCommands().size()).arg(path);
        return r;
    }

    if (subcmd == QLatin1String("max") && args.size() >= 2) {
        bool ok = false;
        const int newMax = args[1].toInt(&ok);
        if (!ok || newMax < 1) {
            return fail(QStringLiteral("Error: max must be a positive integer."));
        }
        m_history.setMaxLines(newMax);
        r.output = QStringLiteral("History max set to %1 lines.").arg(newMax);
        return r;
    }

    return fail(QStringLiteral("Usage: history [session | save <file> | clear | max <n>]"));
}

}  // namespace conduitjoin
