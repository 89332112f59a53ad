// =====================================================================
//  src/conduitjoin/settings.cpp -- Tolerance configuration
// =====================================================================
//
//  Each tolerance is taken from the first source that holds a valid
//  value (flag, environment, INI config, default).  An invalid value is
//  reported as a warning and the next source is tried.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "settings.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include <cmath>
#include <memory>
#include <cstdlib>

namespace conduitjoin {

QString userConfigPath()
{
    return QDir::homePath() +
        QStringLiteral("/.config/ConduitJoin/conduitjoin.conf");
}

bool parseTolerance(const QString& text, double* value)
{
    bool ok = false;
    const double v = text.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(v) || v <= 0.0) {
        return false;
    }
    if (value) *value = v;
    return true;
}

namespace {

/// Walk one value down the priority chain
void resolveOne(const QString& flagValue, const char* envName,
                const QSettings* config, const QString& configKey,
                const QString& label,
                double* target, QString* source, QStringList* warnings)
{
    double v = 0.0;

    // 1. Command-line flag
    if (!flagValue.isEmpty()) {
        if (parseTolerance(flagValue, &v)) {
            *target = v;
            *source = QStringLiteral("flag");
            return;
        }
        warnings->append(QStringLiteral("Ignoring invalid %1 flag: %2")
                             .arg(label, flagValue));
    }

    // 2. Environment variable
    const char* env = std::getenv(envName);
    if (env && env[0] != '\0') {
        const QString envValue = QString::fromLocal8Bit(env);
        if (parseTolerance(envValue, &v)) {
            *target = v;
            *source = QStringLiteral("environment");
            return;
        }
        warnings->append(QStringLiteral("Ignoring invalid %1=%2")
                             .arg(QLatin1String(envName), envValue));
    }

    // 3. User config file
    if (config && config->contains(configKey)) {
        const QString cfgValue = config->value(configKey).toString();
        if (parseTolerance(cfgValue, &v)) {
            *target = v;
            *source = QStringLiteral("config");
            return;
        }
        warnings->append(QStringLiteral("Ignoring invalid %1 in %2: %3")
                             .arg(configKey, config->fileName(), cfgValue));
    }

    // 4. Built-in default (already in *target)
    *source = QStringLiteral("default");
}

}  // anonymous namespace

ResolvedSettings resolveSettings(const QString& toleranceFlag,
                                 const QString& angularToleranceFlag,
                                 const QString& configPath)
{
    ResolvedSettings result;

    std::unique_ptr<QSettings> config;
    if (!configPath.isEmpty() && QFileInfo::exists(configPath)) {
        config = std::make_unique<QSettings>(configPath, QSettings::IniFormat);
    }

    resolveOne(toleranceFlag, "CONDUITJOIN_TOLERANCE",
               config.get(), QStringLiteral("connect/tolerance"),
               QStringLiteral("--tolerance"),
               &result.options.tolerance, &result.toleranceSource,
               &result.warnings);

    resolveOne(angularToleranceFlag, "CONDUITJOIN_ANGULAR_TOLERANCE",
               config.get(), QStringLiteral("connect/angularTolerance"),
               QStringLiteral("--angular-tolerance"),
               &result.options.angularTolerance, &result.angularToleranceSource,
               &result.warnings);

    return result;
}

}  // namespace conduitjoin
