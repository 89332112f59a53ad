// =====================================================================
//  src/conduitjoin/settings.h -- Tolerance configuration
// =====================================================================
//
//  Resolves the connect tolerances from, in order of priority:
//
//    1. --tolerance / --angular-tolerance flags
//    2. CONDUITJOIN_TOLERANCE / CONDUITJOIN_ANGULAR_TOLERANCE
//    3. User config (~/.config/ConduitJoin/conduitjoin.conf,
//       keys connect/tolerance and connect/angularTolerance)
//    4. Built-in defaults
//
//  Invalid values at any level are reported and skipped.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_SETTINGS_H
#define CONDUITJOIN_SETTINGS_H

#include <conduitjoin/connect/types.h>

#include <QString>
#include <QStringList>

namespace conduitjoin {

struct ResolvedSettings {
    connect::ConnectOptions options;
    QString toleranceSource;         ///< "flag", "environment", "config" or "default"
    QString angularToleranceSource;
    QStringList warnings;
};

/// Default user config file path
QString userConfigPath();

/// Parse a tolerance.  Accepts finite values > 0.
bool parseTolerance(const QString& text, double* value);

/// Resolve both tolerances.  Empty flag strings mean "not given".
ResolvedSettings resolveSettings(const QString& toleranceFlag,
                                 const QString& angularToleranceFlag,
                                 const QString& configPath = userConfigPath());

}  // namespace conduitjoin

#endif  // CONDUITJOIN_SETTINGS_H
