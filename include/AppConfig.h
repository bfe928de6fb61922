#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>

#include "DecimalUtils.h"

/**
 * @brief Правило для блюд, попавших ровно на среднее значение
 */
enum class QuadrantTieRule {
    FavorHigh,
    FavorLow
};

/**
 * @brief Настройки приложения (INI через QSettings)
 *
 * Все ключи необязательны, при отсутствии берутся значения по умолчанию.
 */
struct AppConfig {
    QString databasePath;
    int busyTimeoutMs = 5000;

    int maxRecipeDepth = 32;

    Decimal minMarginPercent = 60;
    Decimal maxFoodCostPercent = 35;

    int expiringSoonDays = 2;

    QuadrantTieRule quadrantTies = QuadrantTieRule::FavorHigh;
    Decimal abcAShare = Decimal("0.80");
    Decimal abcBShare = Decimal("0.95");

    QString loggingRules;

    bool validate(QString *error) const;

    static AppConfig defaults();
    static AppConfig load(const QString &path);

    static QString defaultConfigPath();
    static QString defaultDatabasePath();
};

#endif // APPCONFIG_H
