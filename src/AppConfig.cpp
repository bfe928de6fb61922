#include "AppConfig.h"

#include <QDir>
#include <QFile>
#include <QSettings>
#include <QStandardPaths>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(appConfig, "config")

static Decimal readDecimal(const QSettings &settings, const QString &key, const Decimal &fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    Decimal value;
    if (!tryParseDecimal(settings.value(key).toString(), value)) {
        qWarning(appConfig) << "AppConfig: Invalid decimal for" << key << "- using default";
        return fallback;
    }
    return value;
}

static int readInt(const QSettings &settings, const QString &key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok) {
        qWarning(appConfig) << "AppConfig: Invalid integer for" << key << "- using default";
        return fallback;
    }
    return value;
}

AppConfig AppConfig::defaults()
{
    AppConfig config;
    config.databasePath = defaultDatabasePath();
    return config;
}

QString AppConfig::defaultConfigPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/kitchencost.ini";
}

QString AppConfig::defaultDatabasePath()
{
    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir;
    if (!dir.exists(dataPath)) {
        dir.mkpath(dataPath);
    }
    return dataPath + "/kitchencost.db";
}

AppConfig AppConfig::load(const QString &path)
{
    AppConfig config = defaults();

    if (path.isEmpty() || !QFile::exists(path)) {
        qInfo(appConfig) << "AppConfig: No config file at" << path << "- using defaults";
        return config;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning(appConfig) << "AppConfig: Cannot read" << path << "- using defaults";
        return config;
    }

    config.databasePath = settings.value("database/path", config.databasePath).toString();
    config.busyTimeoutMs = readInt(settings, "database/busy_timeout_ms", config.busyTimeoutMs);

    config.maxRecipeDepth = readInt(settings, "costing/max_recipe_depth", config.maxRecipeDepth);

    config.minMarginPercent = readDecimal(settings, "profitability/min_margin_percent", config.minMarginPercent);
    config.maxFoodCostPercent = readDecimal(settings, "profitability/max_food_cost_percent", config.maxFoodCostPercent);

    config.expiringSoonDays = readInt(settings, "expiry/expiring_soon_days", config.expiringSoonDays);

    const QString ties = settings.value("menu/quadrant_ties", "high").toString().trimmed().toLower();
    if (ties == "low") {
        config.quadrantTies = QuadrantTieRule::FavorLow;
    } else if (ties != "high") {
        qWarning(appConfig) << "AppConfig: Unknown menu/quadrant_ties" << ties << "- using 'high'";
    }
    config.abcAShare = readDecimal(settings, "menu/abc_a_share", config.abcAShare);
    config.abcBShare = readDecimal(settings, "menu/abc_b_share", config.abcBShare);

    config.loggingRules = settings.value("logging/rules").toString();

    qInfo(appConfig) << "AppConfig: Loaded" << path;
    return config;
}

bool AppConfig::validate(QString *error) const
{
    QString message;
    if (databasePath.trimmed().isEmpty()) {
        message = "database/path is empty";
    } else if (busyTimeoutMs < 0) {
        message = "database/busy_timeout_ms must not be negative";
    } else if (maxRecipeDepth <= 0) {
        message = "costing/max_recipe_depth must be positive";
    } else if (minMarginPercent < 0 || minMarginPercent > 100) {
        message = "profitability/min_margin_percent must be within 0..100";
    } else if (maxFoodCostPercent < 0 || maxFoodCostPercent > 100) {
        message = "profitability/max_food_cost_percent must be within 0..100";
    } else if (expiringSoonDays < 0) {
        message = "expiry/expiring_soon_days must not be negative";
    } else if (abcAShare <= 0 || abcAShare > abcBShare || abcBShare > 1) {
        message = "menu/abc_a_share and menu/abc_b_share must satisfy 0 < A <= B <= 1";
    }

    if (message.isEmpty()) {
        return true;
    }
    if (error) {
        *error = message;
    }
    return false;
}
