// =====================================================================
//  src/conduitjoin/cli/climode.h -- Command-line mode
// =====================================================================
//
//  Script runner and interactive REPL on top of CliEngine.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CLIMODE_H
#define CONDUITJOIN_CLIMODE_H

#include <QString>

#include "clihistory.h"
#include "cliengine.h"

namespace conduitjoin {

class CliMode {
public:
    /// historyPath overrides the per-user history file when not empty
    explicit CliMode(const connect::ConnectOptions& options = connect::ConnectOptions(),
                     const QString& historyPath = QString());
    ~CliMode();

    /// Run a command script ("-" or empty reads stdin).  With checkOnly
    /// only command names are validated.
    /// Returns 0 on success, 1 on the first failing command.
    int runScript(const QString& scriptPath, bool checkOnly = false);

    /// Run the interactive REPL.
    /// Returns 0 on normal exit.
    int runInteractive();

private:
    CliHistory  m_history;
    CliEngine   m_engine;
};

}  // namespace conduitjoin

#endif  // CONDUITJOIN_CLIMODE_H
