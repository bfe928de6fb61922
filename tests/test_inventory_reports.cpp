// Inventory report tests: stock summary, losses, alerts, health score

#include <gtest/gtest.h>

#include "TestDatabase.h"

namespace {

class InventoryReportTest : public KitchenTest {
  protected:
    void SetUp() override {
        KitchenTest::SetUp();
        m_milk = createIngredient("Milk", "l", Decimal(5));
        m_rice = createIngredient("Rice");
        ASSERT_GT(m_milk, 0);
        ASSERT_GT(m_rice, 0);
    }

    int m_milk = 0;
    int m_rice = 0;
};

}  // namespace

TEST_F(InventoryReportTest, StockSummary_WeightedAverage) {
    receive(m_rice, Decimal(10), 100, utcAt(2024, 1, 1), utcAt(2024, 6, 1));
    receive(m_rice, Decimal(10), 200, utcAt(2024, 1, 2), utcAt(2024, 6, 1));
    const int archived = receive(m_milk, Decimal(2), 90, utcAt(2024, 1, 3), utcAt(2024, 1, 20));
    ASSERT_TRUE(m_ledger->archiveBatch(kTenant, archived).isOk());

    const QList<StockLine> lines = m_reports->stockSummary(kTenant);
    ASSERT_EQ(lines.size(), 1);
    EXPECT_EQ(lines[0].ingredientName, "Rice");
    EXPECT_EQ(lines[0].activeBatches, 2);
    EXPECT_EQ(lines[0].totalRemaining, Decimal(20));
    EXPECT_EQ(lines[0].averageUnitCostCents, Decimal(150));
    EXPECT_EQ(lines[0].stockValueCents, 3000);
}

TEST_F(InventoryReportTest, LossReport_ComparesExpiredToPurchases) {
    receive(m_milk, Decimal(4), 250, utcAt(2024, 1, 2), utcAt(2024, 1, 5));
    receive(m_rice, Decimal(10), 100, utcAt(2024, 1, 3), utcAt(2024, 6, 1));
    ASSERT_EQ(m_ledger->processExpirations(kTenant).affected, 1);

    const LossReport report = m_reports->lossReport(kTenant, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    ASSERT_EQ(report.lines.size(), 1);
    EXPECT_EQ(report.lines[0].ingredientName, "Milk");
    EXPECT_EQ(report.lines[0].quantity, Decimal(4));
    EXPECT_EQ(report.totalLossCents, 1000);
    EXPECT_EQ(report.totalPurchasesCents, 2000);
    EXPECT_EQ(report.wastePercent, Decimal(50));

    const LossReport before = m_reports->lossReport(kTenant, utcAt(2023, 12, 1), utcAt(2024, 1, 1));
    EXPECT_TRUE(before.lines.isEmpty());
    EXPECT_EQ(before.wastePercent, Decimal(0));
}

TEST_F(InventoryReportTest, Alerts_ExpiryOrderedBySeverity) {
    receive(m_rice, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 1, 12));    // soon
    receive(m_rice, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 1, 9));     // expired
    receive(m_rice, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 1, 10, 20)); // today
    receive(m_rice, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 3, 1));     // fresh

    const InventoryAlerts alerts = m_reports->alerts(kTenant);
    ASSERT_EQ(alerts.expiry.size(), 3);
    EXPECT_EQ(alerts.expiry[0].status, ExpirationStatus::Expired);
    EXPECT_EQ(alerts.expiry[1].status, ExpirationStatus::ExpiresToday);
    EXPECT_EQ(alerts.expiry[2].status, ExpirationStatus::ExpiringSoon);
}

TEST_F(InventoryReportTest, Alerts_LowAndZeroStock) {
    receive(m_milk, Decimal(3), 90, utcAt(2024, 1, 1), utcAt(2024, 3, 1));
    receive(m_rice, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 3, 1));
    ASSERT_TRUE(m_ledger->consume(kTenant, m_rice, Decimal(1), manualReference()).isOk());

    const InventoryAlerts alerts = m_reports->alerts(kTenant);
    ASSERT_EQ(alerts.stock.size(), 2);

    int lowCount = 0;
    int outCount = 0;
    for (const auto &alert : alerts.stock) {
        if (alert.isOutOfStock()) {
            ++outCount;
            EXPECT_EQ(alert.ingredientId, m_rice);
        } else {
            ++lowCount;
            EXPECT_EQ(alert.ingredientId, m_milk);
            EXPECT_EQ(alert.threshold, Decimal(5));
        }
    }
    EXPECT_EQ(lowCount, 1);
    EXPECT_EQ(outCount, 1);
    EXPECT_EQ(alerts.healthScore, 100 - 15 - 25);
    EXPECT_EQ(alerts.healthLabel, "Warning");
}

TEST_F(InventoryReportTest, Alerts_HealthyStore) {
    receive(m_milk, Decimal(10), 90, utcAt(2024, 1, 1), utcAt(2024, 3, 1));
    const InventoryAlerts alerts = m_reports->alerts(kTenant);
    EXPECT_TRUE(alerts.expiry.isEmpty());
    EXPECT_TRUE(alerts.stock.isEmpty());
    EXPECT_EQ(alerts.healthScore, 100);
    EXPECT_EQ(alerts.healthLabel, "Excellent");
}

TEST(InventoryHealthTest, ScoreIsFlooredAtZero) {
    InventoryAlerts alerts;
    for (ExpirationStatus status : {ExpirationStatus::Expired, ExpirationStatus::ExpiresToday,
                                    ExpirationStatus::ExpiringSoon}) {
        ExpiryAlert alert;
        alert.status = status;
        alerts.expiry.append(alert);
    }
    StockAlert low;
    low.totalRemaining = 1;
    low.threshold = 2;
    StockAlert out;
    alerts.stock.append(low);
    alerts.stock.append(out);

    EXPECT_EQ(InventoryReportService::healthScore(alerts), 0);
    EXPECT_EQ(InventoryReportService::healthLabel(0), "Critical");
    EXPECT_EQ(InventoryReportService::healthLabel(75), "Good");
}
