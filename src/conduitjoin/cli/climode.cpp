// =====================================================================
//  src/conduitjoin/cli/climode.cpp -- Command-line mode
// =====================================================================

#include "climode.h"

#include <conduitjoin/core.h>

#include <QFile>
#include <QTextStream>

#include <iostream>

namespace conduitjoin {

CliMode::CliMode(const connect::ConnectOptions& options, const QString& historyPath)
    : m_engine(m_history, options)
{
    if (!historyPath.isEmpty()) {
        m_history.setFilePath(historyPath);
    }
    m_history.load();
}

CliMode::~CliMode()
{
    m_history.save();
}

// ---- Script ---------------------------------------------------------

int CliMode::runScript(const QString& scriptPath, bool checkOnly)
{
    const bool readFromStdin = scriptPath.isEmpty() || scriptPath == QLatin1String("-");

    QFile file;
    QTextStream in;

    if (readFromStdin) {
        if (!file.open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
            std::cerr << "Error: Could not open stdin for reading."
                      << std::endl;
            return 1;
        }
        in.setDevice(&file);
        std::cerr << "Reading script from stdin..." << std::endl;
    } else {
        file.setFileName(scriptPath);

        if (!file.exists()) {
            std::cerr << "Error: Script file not found: "
                      << scriptPath.toStdString() << std::endl;
            return 1;
        }

        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            std::cerr << "Error: Could not open script file: "
                      << file.errorString().toStdString() << std::endl;
            return 1;
        }
        in.setDevice(&file);

        std::cout << (checkOnly ? "Checking script: " : "Running script: ")
                  << scriptPath.toStdString() << std::endl;
    }

    int lineNum = 0;
    int commandCount = 0;
    int errorCount = 0;
    const QStringList validCmds = m_engine.commandNames();

    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        lineNum++;

        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        commandCount++;

        if (checkOnly) {
            const QStringList tokens = tokenizeLine(line);
            const QString cmd = tokens.first().toLower();

            if (!validCmds.contains(cmd)) {
                std::cerr << "[" << lineNum << "] ERROR: Unknown command '"
                          << cmd.toStdString() << "'" << std::endl;
                errorCount++;
            } else {
                std::cout << "[" << lineNum << "] OK: "
                          << line.toStdString() << std::endl;
            }
            continue;
        }

        const CliResult result = m_engine.execute(line);

        if (!result.output.isEmpty()) {
            std::cout << "[" << lineNum << "] "
                      << result.output.toStdString() << std::endl;
        }

        if (result.exitCode != 0) {
            std::cerr << "Error at line " << lineNum << ": "
                      << result.error.toStdString() << std::endl;
            return 1;
        }

        if (result.requestExit) {
            break;
        }
    }

    if (checkOnly) {
        if (errorCount > 0) {
            std::cerr << "\nSyntax check failed: " << errorCount
                      << " error(s) in " << commandCount << " command(s)"
                      << std::endl;
            return 1;
        }
        std::cout << "\nSyntax check passed: " << commandCount
                  << " command(s) OK" << std::endl;
        return 0;
    }

    std::cout << "\nScript completed: " << commandCount
              << " command(s) executed." << std::endl;
    return 0;
}

// ---- Interactive REPL -----------------------------------------------

int CliMode::runInteractive()
{
    std::cout << "ConduitJoin " << conduitjoin::version()
              << " -- Command-Line Mode" << std::endl;
    std::cout << "Type 'help' for available commands, "
                 "or 'exit' to quit." << std::endl;
    std::cout << "History: " << m_history.count() << " entries loaded from "
              << m_history.filePath().toStdString() << std::endl;
    std::cout << std::endl;

    QTextStream in(stdin);

    while (true) {
        std::cout << m_engine.buildPrompt().toStdString() << std::flush;

        const QString line = in.readLine();
        if (line.isNull()) {
            // EOF
            std::cout << std::endl;
            break;
        }

        const QString cmd = line.trimmed();
        if (cmd.isEmpty()) continue;

        m_history.append(cmd);

        const CliResult result = m_engine.execute(cmd);

        if (!result.output.isEmpty()) {
            std::cout << result.output.toStdString() << std::endl;
        }
        if (!result.error.isEmpty()) {
            std::cerr << result.error.toStdString() << std::endl;
        }
        if (result.requestExit) {
            break;
        }
    }

    if (m_engine.network().isModified() && !m_engine.network().isEmpty()) {
        std::cout << "Note: the network has changes that were not exported. "
                     "'history save <file>' keeps them as a script."
                  << std::endl;
    }

    m_history.save();
    return 0;
}

}  // namespace conduitjoin
