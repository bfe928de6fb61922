// Configuration loading tests

#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "AppConfig.h"

TEST(AppConfigTest, MissingFileGivesDefaults) {
    const AppConfig config = AppConfig::load("/nonexistent/kitchencost.ini");
    EXPECT_FALSE(config.databasePath.isEmpty());
    EXPECT_EQ(config.maxRecipeDepth, 32);
    EXPECT_EQ(config.minMarginPercent, Decimal(60));
    EXPECT_EQ(config.maxFoodCostPercent, Decimal(35));
    EXPECT_EQ(config.quadrantTies, QuadrantTieRule::FavorHigh);
    EXPECT_TRUE(config.validate(nullptr));
}

TEST(AppConfigTest, ReadsIniValues) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("kitchencost.ini");
    {
        QSettings settings(path, QSettings::IniFormat);
        settings.setValue("database/path", dir.filePath("kitchen.db"));
        settings.setValue("database/busy_timeout_ms", 2500);
        settings.setValue("costing/max_recipe_depth", 8);
        settings.setValue("profitability/min_margin_percent", "62.5");
        settings.setValue("profitability/max_food_cost_percent", "30");
        settings.setValue("expiry/expiring_soon_days", 3);
        settings.setValue("menu/quadrant_ties", "low");
        settings.setValue("menu/abc_a_share", "0.7");
        settings.setValue("menu/abc_b_share", "0.9");
        settings.sync();
        ASSERT_EQ(settings.status(), QSettings::NoError);
    }

    const AppConfig config = AppConfig::load(path);
    EXPECT_EQ(config.databasePath, dir.filePath("kitchen.db"));
    EXPECT_EQ(config.busyTimeoutMs, 2500);
    EXPECT_EQ(config.maxRecipeDepth, 8);
    EXPECT_EQ(config.minMarginPercent, Decimal("62.5"));
    EXPECT_EQ(config.maxFoodCostPercent, Decimal(30));
    EXPECT_EQ(config.expiringSoonDays, 3);
    EXPECT_EQ(config.quadrantTies, QuadrantTieRule::FavorLow);
    EXPECT_EQ(config.abcAShare, Decimal("0.7"));
    EXPECT_EQ(config.abcBShare, Decimal("0.9"));
    EXPECT_TRUE(config.validate(nullptr));
}

TEST(AppConfigTest, InvalidValuesFallBackOrFailValidation) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("bad.ini");
    {
        QSettings settings(path, QSettings::IniFormat);
        settings.setValue("costing/max_recipe_depth", "deep");
        settings.setValue("menu/abc_a_share", "0.99");
        settings.setValue("menu/abc_b_share", "0.9");
        settings.sync();
    }

    const AppConfig config = AppConfig::load(path);
    EXPECT_EQ(config.maxRecipeDepth, 32);

    QString error;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_TRUE(error.contains("abc"));
}
