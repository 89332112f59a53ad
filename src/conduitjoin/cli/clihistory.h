// =====================================================================
//  src/conduitjoin/cli/clihistory.h -- REPL command log
// =====================================================================
//
//  Commands entered at the prompt.  Entries from earlier runs are loaded
//  from ~/.config/ConduitJoin/cli_history (QStandardPaths generic config
//  location on other platforms); entries from the current run form the
//  session, whose network-changing commands can be written back out as
//  a script for --script.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CLIHISTORY_H
#define CONDUITJOIN_CLIHISTORY_H

#include <QString>
#include <QStringList>

namespace conduitjoin {

class CliHistory {
public:
    static constexpr int DefaultMaxLines = 500;

    explicit CliHistory(int maxLines = DefaultMaxLines);

    int maxLines() const;
    void setMaxLines(int maxLines);

    /// All entries, oldest first.
    const QStringList& entries() const;
    int count() const;

    /// Entries added since load(), oldest first
    QStringList sessionEntries() const;

    /// Session entries that change the network or its tolerance
    /// (conduit, remove, connect, import, undo, tolerance <value>).  Replaying
    /// them in order rebuilds the network of this session.
    QStringList replayableCommands() const;

    /// Record a command.  Blank lines and repeats of the last entry
    /// are skipped.
    void append(const QString& command);

    void clear();

    /// Replace the entries with the file contents and start a new
    /// session.  A missing file is not an error.
    bool load();
    bool save() const;

    /// Write replayableCommands() as a script.  errorMsg is filled on
    /// failure.
    bool writeScript(const QString& path, QString* errorMsg = nullptr) const;

    QString filePath() const;
    void setFilePath(const QString& path);

    /// True for the command words replayableCommands() keeps
    static bool isReplayable(const QString& command);

private:
    void trim();

    QStringList m_entries;
    int         m_sessionStart = 0;
    int         m_maxLines;
    QString     m_filePath;
};

}  // namespace conduitjoin

#endif  // CONDUITJOIN_CLIHISTORY_H
