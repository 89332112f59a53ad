// =====================================================================
//  src/conduitjoin/cli/clihistory.cpp -- REPL command log
// =====================================================================

#include "clihistory.h"
#include "cliengine.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>

namespace conduitjoin {

Q_LOGGING_CATEGORY(logCli, "conduitjoin.cli")

static const char* HistoryFileName = "cli_history";
static const char* AppDirName      = "ConduitJoin";

CliHistory::CliHistory(int maxLines)
    : m_maxLines(maxLines < 1 ? DefaultMaxLines : maxLines)
{
}

int CliHistory::maxLines() const { return m_maxLines; }

void CliHistory::setMaxLines(int maxLines)
{
    m_maxLines = (maxLines < 1) ? 1 : maxLines;
    trim();
}

const QStringList& CliHistory::entries() const { return m_entries; }
int CliHistory::count() const { return m_entries.size(); }

QStringList CliHistory::sessionEntries() const
{
    return m_entries.mid(m_sessionStart);
}

bool CliHistory::isReplayable(const QString& command)
{
    const QStringList tokens = tokenizeLine(command);
    if (tokens.isEmpty()) return false;

    const QString word = tokens.first().toLower();
    if (word == QLatin1String("tolerance")) {
        // Showing the tolerance changes nothing
        return tokens.size() > 1;
    }
    return word == QLatin1String("conduit")
        || word == QLatin1String("remove")
        || word == QLatin1String("connect")
        || word == QLatin1String("import")
        || word == QLatin1String("undo");
}

QStringList CliHistory::replayableCommands() const
{
    QStringList commands;
    for (const QString& entry : sessionEntries()) {
        if (isReplayable(entry)) commands.append(entry);
    }
    return commands;
}

void CliHistory::append(const QString& command)
{
    const QString trimmed = command.trimmed();
    if (trimmed.isEmpty()) return;

    // A repeated undo is two undos, keep it
    if (!m_entries.isEmpty() && m_entries.last() == trimmed
        && m_entries.size() > m_sessionStart
        && trimmed.compare(QLatin1String("undo"), Qt::CaseInsensitive) != 0) {
        return;
    }

    m_entries.append(trimmed);
    trim();
}

void CliHistory::clear()
{
    m_entries.clear();
    m_sessionStart = 0;
}

QString CliHistory::filePath() const
{
    if (!m_filePath.isEmpty()) {
        return m_filePath;
    }

    const QString configDir = QStandardPaths::writableLocation(
        QStandardPaths::GenericConfigLocation);

    return configDir + QDir::separator()
           + QLatin1String(AppDirName)
           + QDir::separator()
           + QLatin1String(HistoryFileName);
}

void CliHistory::setFilePath(const QString& path)
{
    m_filePath = path;
}

bool CliHistory::load()
{
    QFile file(filePath());

    m_entries.clear();
    m_sessionStart = 0;

    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(logCli) << "Cannot read history" << file.fileName()
                          << file.errorString();
        return false;
    }

    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (!line.isEmpty()) {
            m_entries.append(line);
        }
    }

    trim();
    m_sessionStart = m_entries.size();
    return true;
}

static bool writeLines(const QString& path, const QStringList& header,
                       const QStringList& lines, QString* errorMsg)
{
    QDir dir = QFileInfo(path).absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorMsg)
            *errorMsg = QStringLiteral("Cannot create directory %1").arg(dir.path());
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text
                   | QIODevice::Truncate)) {
        if (errorMsg)
            *errorMsg = QStringLiteral("Cannot write %1: %2")
                            .arg(path, file.errorString());
        return false;
    }

    QTextStream out(&file);
    for (const QString& line : header) out << line << '\n';
    for (const QString& line : lines)  out << line << '\n';
    return true;
}

bool CliHistory::save() const
{
    QString err;
    if (!writeLines(filePath(), QStringList(), m_entries, &err)) {
        qCWarning(logCli) << "History not saved:" << err;
        return false;
    }
    return true;
}

bool CliHistory::writeScript(const QString& path, QString* errorMsg) const
{
    const QStringList header = {
        QStringLiteral("# ConduitJoin session script"),
        QStringLiteral("# Replay with: conduitjoin-cli --script <file>"),
    };
    return writeLines(path, header, replayableCommands(), errorMsg);
}

void CliHistory::trim()
{
    while (m_entries.size() > m_maxLines) {
        m_entries.removeFirst();
        if (m_sessionStart > 0) --m_sessionStart;
    }
}

}  // namespace conduitjoin
