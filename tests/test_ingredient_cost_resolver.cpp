// Ingredient cost resolver tests

#include <gtest/gtest.h>

#include "TestDatabase.h"

namespace {

class CostResolverTest : public KitchenTest {
  protected:
    void SetUp() override {
        KitchenTest::SetUp();
        m_butter = createIngredient("Butter");
        ASSERT_GT(m_butter, 0);
    }

    int m_butter = 0;
};

}  // namespace

TEST_F(CostResolverTest, NoActiveBatches_NoStockAvailable) {
    const CostResolution cost = m_resolver->resolveCost(kTenant, m_butter, Decimal(1));
    EXPECT_EQ(cost.error.code, CostingErrorCode::NoStockAvailable);
    EXPECT_TRUE(cost.error.message.contains("Butter"));
    EXPECT_EQ(cost.costCents, 0);
}

TEST_F(CostResolverTest, ArchivedOnlyStock_NoStockAvailable) {
    const int b = receive(m_butter, Decimal(2), 700, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    ASSERT_TRUE(m_ledger->archiveBatch(kTenant, b).isOk());

    EXPECT_EQ(m_resolver->resolveCost(kTenant, m_butter, Decimal(1)).error.code,
              CostingErrorCode::NoStockAvailable);
}

TEST_F(CostResolverTest, FollowsFifoWithoutChangingStock) {
    const int first = receive(m_butter, Decimal(6), 100, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    const int second = receive(m_butter, Decimal(6), 150, utcAt(2024, 1, 2), utcAt(2024, 2, 1));

    const CostResolution cost = m_resolver->resolveCost(kTenant, m_butter, Decimal(10));
    ASSERT_TRUE(cost.isOk());
    EXPECT_EQ(cost.costCents, 1200);
    EXPECT_TRUE(cost.coveredByStock);
    ASSERT_EQ(cost.draws.size(), 2);

    EXPECT_EQ(batch(first).remainingQuantity, Decimal(6));
    EXPECT_EQ(batch(second).remainingQuantity, Decimal(6));
    EXPECT_EQ(m_ledger->movements(kTenant, first).size(), 1);
}

TEST_F(CostResolverTest, RepeatedReadsGiveSameAnswer) {
    receive(m_butter, Decimal("2.5"), 333, utcAt(2024, 1, 1), utcAt(2024, 2, 1));

    const CostResolution a = m_resolver->resolveCost(kTenant, m_butter, Decimal("1.5"));
    const CostResolution b = m_resolver->resolveCost(kTenant, m_butter, Decimal("1.5"));
    ASSERT_TRUE(a.isOk());
    EXPECT_EQ(a.exactCostCents, b.exactCostCents);
    EXPECT_EQ(a.costCents, 500);  // 499.5 rounds half up
}

TEST_F(CostResolverTest, ShortfallPricedAtLatestBatch) {
    receive(m_butter, Decimal(2), 100, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    receive(m_butter, Decimal(1), 300, utcAt(2024, 1, 3), utcAt(2024, 2, 1));

    const CostResolution cost = m_resolver->resolveCost(kTenant, m_butter, Decimal(5));
    ASSERT_TRUE(cost.isOk());
    EXPECT_FALSE(cost.coveredByStock);
    EXPECT_EQ(cost.shortfall, Decimal(2));
    // 2 x 100 + 1 x 300 + 2 x 300
    EXPECT_EQ(cost.costCents, 1100);
}

TEST_F(CostResolverTest, RejectsNonPositiveQuantity) {
    receive(m_butter, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    EXPECT_EQ(m_resolver->resolveCost(kTenant, m_butter, Decimal(0)).error.code,
              CostingErrorCode::InvalidQuantity);
}

TEST_F(CostResolverTest, TenantsAreIsolated) {
    receive(m_butter, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 2, 1), kOtherTenant);
    EXPECT_EQ(m_resolver->resolveCost(kTenant, m_butter, Decimal(1)).error.code,
              CostingErrorCode::NoStockAvailable);
    EXPECT_TRUE(m_resolver->resolveCost(kOtherTenant, m_butter, Decimal(1)).isOk());
}
