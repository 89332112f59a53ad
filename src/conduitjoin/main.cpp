// =====================================================================
//  src/conduitjoin/main.cpp -- ConduitJoin command-line entry point
// =====================================================================
//
//  Determines the startup mode:
//
//    1. --check <file>   Syntax-check a command script
//    2. --script <file>  Run a command script ("-" reads stdin)
//    3. otherwise        Interactive REPL
//
//  Tolerances come from settings.h (flag > env > config > default).
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conduitjoin/core.h>

#include "cli/climode.h"
#include "settings.h"

#include <QCoreApplication>

#include <iostream>

// ---- Helper: parse command-line flags --------------------------------

struct StartupFlags {
    bool script  = false;
    bool check   = false;
    bool help    = false;
    bool version = false;
    QString scriptPath;
    QString tolerance;          // --tolerance <value>
    QString angularTolerance;   // --angular-tolerance <value>
    QStringList unknown;
};

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == QLatin1String("--script") && i + 1 < argc) {
            flags.script     = true;
            flags.scriptPath = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--check") && i + 1 < argc) {
            flags.check      = true;
            flags.scriptPath = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--tolerance") && i + 1 < argc) {
            flags.tolerance = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--angular-tolerance") && i + 1 < argc) {
            flags.angularTolerance = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--help") || arg == QLatin1String("-h")) {
            flags.help = true;
        }
        else if (arg == QLatin1String("--version")) {
            flags.version = true;
        }
        else {
            flags.unknown.append(arg);
        }
    }

    return flags;
}

static void printUsage()
{
    std::cout <<
        "Usage: conduitjoin-cli [options]\n"
        "\n"
        "  --script <file|->            Run a command script\n"
        "  --check <file>               Check script syntax without running it\n"
        "  --tolerance <value>          Linear tolerance (default 0.001)\n"
        "  --angular-tolerance <value>  Parallel test tolerance (default 1e-06)\n"
        "  --version                    Print version and exit\n"
        "  --help                       Print this help and exit\n"
        "\n"
        "Without --script or --check an interactive prompt is started.\n"
        "Set CONDUITJOIN_LOG_DEBUG=1 for debug logging.\n";
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    StartupFlags flags = parseFlags(argc, argv);

    if (flags.help) {
        printUsage();
        return 0;
    }
    if (!flags.unknown.isEmpty()) {
        std::cerr << "Unknown argument: " << flags.unknown.first().toStdString()
                  << std::endl;
        printUsage();
        return 2;
    }

    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ConduitJoin"));
    app.setApplicationVersion(QString::fromLatin1(conduitjoin::version()));
    app.setOrganizationName(QStringLiteral("ConduitJoin"));

    if (flags.version) {
        std::cout << "ConduitJoin " << conduitjoin::version() << std::endl;
        return 0;
    }

    if (!conduitjoin::initialize()) {
        std::cerr << "Fatal: failed to initialize the ConduitJoin core library."
                  << std::endl;
        return 1;
    }

    conduitjoin::ResolvedSettings settings =
        conduitjoin::resolveSettings(flags.tolerance, flags.angularTolerance);
    for (const QString& warning : settings.warnings) {
        std::cerr << "Warning: " << warning.toStdString() << std::endl;
    }

    int result = 0;
    {
        conduitjoin::CliMode cli(settings.options);

        if (flags.check) {
            result = cli.runScript(flags.scriptPath, true);
        } else if (flags.script) {
            result = cli.runScript(flags.scriptPath);
        } else {
            result = cli.runInteractive();
        }
    }

    conduitjoin::shutdown();
    return result;
}
