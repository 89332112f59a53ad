// =====================================================================
//  src/libconduitjoin/core.cpp -- Library initialization
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "conduitjoin/core.h"

#include <QLoggingCategory>
#include <QString>
#include <QStringList>

// OCCT kernel headers
#include <Standard_Version.hxx>

namespace conduitjoin {

Q_LOGGING_CATEGORY(logCore, "conduitjoin.core")

static bool s_initialized = false;

static bool isEnabledFlag(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("1") || normalized == QLatin1String("true") ||
           normalized == QLatin1String("yes") || normalized == QLatin1String("on");
}

const char* version()
{
    return "0.1.0";
}

bool initialize()
{
    if (s_initialized) {
        return true;
    }

    // Library categories stay quiet at debug level unless asked for.
    const bool debugLogging = isEnabledFlag(qEnvironmentVariable("CONDUITJOIN_LOG_DEBUG"));

    const QString verbose = debugLogging ? QStringLiteral("true") : QStringLiteral("false");
    QStringList rules;
    rules << QStringLiteral("conduitjoin.*.warning=true");
    rules << QStringLiteral("conduitjoin.*.info=%1").arg(verbose);
    rules << QStringLiteral("conduitjoin.*.debug=%1").arg(verbose);
    QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));

    qCDebug(logCore) << "initialize" << "version=" << version()
                     << "occt=" << OCC_VERSION_COMPLETE;

    s_initialized = true;
    return true;
}

void shutdown()
{
    if (!s_initialized) {
        return;
    }

    qCDebug(logCore) << "shutdown";
    s_initialized = false;
}

}  // namespace conduitjoin
