// =====================================================================
//  src/conduitjoin/cli/cliengine.h -- Command dispatch engine
// =====================================================================
//
//  Parses and executes REPL and script commands against an in-memory
//  conduit Network.  All output is returned as QString rather than
//  printed, so callers decide where it goes.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CLIENGINE_H
#define CONDUITJOIN_CLIENGINE_H

#include <conduitjoin/network.h>

#include <QString>
#include <QStringList>

namespace conduitjoin {

class CliHistory;

/// Result of executing a command.
struct CliResult {
    int     exitCode = 0;         ///< 0 = success, non-zero = error
    QString output;               ///< Normal output text
    QString error;                ///< Error output text (if any)
    bool    requestExit = false;  ///< True if exit/quit was entered
};

/// Split a command line on whitespace
QStringList tokenizeLine(const QString& line);

/// Parse "x,y,z".  Returns false on anything else.
bool parsePoint(const QString& text, gp_Pnt* point);

/// "(x, y, z)" with short number formatting
QString formatPoint(const gp_Pnt& p);

class CliEngine {
public:
    explicit CliEngine(CliHistory& history,
                       const connect::ConnectOptions& options = connect::ConnectOptions());
    ~CliEngine();

    /// Execute a single command line.
    CliResult execute(const QString& line);

    /// Known command names
    QStringList commandNames() const;

    QString buildPrompt() const;

    const Network& network() const;
    const connect::ConnectOptions& options() const;

private:
    CliResult cmdHelp() const;
    CliResult cmdVersion() const;
    CliResult cmdConduit(const QStringList& args);
    CliResult cmdRemove(const QStringList& args);
    CliResult cmdList() const;
    CliResult cmdJoints() const;
    CliResult cmdAnalyze(const QStringList& args) const;
    CliResult cmdConnect(const QStringList& args);
    CliResult cmdUndo();
    CliResult cmdTolerance(const QStringList& args);
    CliResult cmdExport(const QStringList& args);
    CliResult cmdImport(const QStringList& args);
    CliResult cmdHistory(const QStringList& args);

    /// Look up two conduits by name, or fill r with an error
    bool lookupPair(const QStringList& args, const char* usage,
                    const Conduit** a, const Conduit** b, CliResult& r) const;

    QString describeEnd(const ConduitEndRef& ref) const;

    CliHistory&              m_history;
    Network                  m_network;
    connect::ConnectOptions  m_options;
};

}  // namespace conduitjoin

#endif  // CONDUITJOIN_CLIENGINE_H
