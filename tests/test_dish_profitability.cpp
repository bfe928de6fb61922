// Dish profitability tests

#include <gtest/gtest.h>

#include "TestDatabase.h"

TEST(DishProfitabilityEvaluateTest, SoupAtThresholdBoundary) {
    const DishFinancials soup = DishProfitabilityCalculator::evaluate(1000, 350, ProfitThresholds());
    ASSERT_TRUE(soup.isOk());
    EXPECT_EQ(soup.profitCents, 650);
    EXPECT_EQ(soup.profitMarginPercent, Decimal(65));
    EXPECT_EQ(soup.foodCostPercent, Decimal(35));
    // Food cost exactly at 35% is not "above" the threshold
    EXPECT_FALSE(soup.hasWarning(ProfitWarning::HighFoodCost));
    EXPECT_FALSE(soup.hasWarning(ProfitWarning::LowMargin));
}

TEST(DishProfitabilityEvaluateTest, MarginAndFoodCostSumToHundred) {
    const qint64 costs[] = {1, 333, 999, 1234, 4999};
    for (qint64 cost : costs) {
        const DishFinancials f = DishProfitabilityCalculator::evaluate(1000, cost, ProfitThresholds());
        ASSERT_TRUE(f.isOk());
        EXPECT_EQ(f.profitMarginPercent + f.foodCostPercent, Decimal(100)) << "cost " << cost;
    }
}

TEST(DishProfitabilityEvaluateTest, WarningsFire) {
    const DishFinancials f = DishProfitabilityCalculator::evaluate(1000, 500, ProfitThresholds());
    EXPECT_TRUE(f.hasWarning(ProfitWarning::LowMargin));
    EXPECT_TRUE(f.hasWarning(ProfitWarning::HighFoodCost));
    EXPECT_EQ(profitWarningToString(ProfitWarning::LowMargin), "LowMarginWarning");
    EXPECT_EQ(profitWarningToString(ProfitWarning::HighFoodCost), "HighFoodCostWarning");
}

TEST(DishProfitabilityEvaluateTest, ThresholdsAreConfigurable) {
    ProfitThresholds strict;
    strict.minMarginPercent = 70;
    strict.maxFoodCostPercent = 30;

    const DishFinancials f = DishProfitabilityCalculator::evaluate(1000, 320, strict);
    EXPECT_TRUE(f.hasWarning(ProfitWarning::LowMargin));
    EXPECT_TRUE(f.hasWarning(ProfitWarning::HighFoodCost));
}

TEST(DishProfitabilityEvaluateTest, CostAbovePriceGivesNegativeMargin) {
    const DishFinancials f = DishProfitabilityCalculator::evaluate(500, 800, ProfitThresholds());
    ASSERT_TRUE(f.isOk());
    EXPECT_EQ(f.profitCents, -300);
    EXPECT_EQ(f.profitMarginPercent, Decimal(-60));
}

TEST(DishProfitabilityEvaluateTest, RejectsNonPositivePrice) {
    EXPECT_EQ(DishProfitabilityCalculator::evaluate(0, 100, ProfitThresholds()).error.code,
              CostingErrorCode::InvalidPrice);
}

namespace {

class DishProfitabilityTest : public KitchenTest {
  protected:
    void SetUp() override {
        KitchenTest::SetUp();
        m_carrot = createIngredient("Carrot");
        receive(m_carrot, Decimal(10), 175, utcAt(2024, 1, 1), utcAt(2024, 2, 1));

        m_soupRecipe = createRecipe("Soup", 4);
        addIngredient(m_soupRecipe, m_carrot, Decimal(2));
    }

    int m_carrot = 0;
    int m_soupRecipe = 0;
};

}  // namespace

TEST_F(DishProfitabilityTest, Analyze_UsesRecipeTotalCost) {
    const int soup = createDish(m_soupRecipe, "Soup", 1000);

    const DishFinancials f = m_profitability->analyze(kTenant, soup);
    ASSERT_TRUE(f.isOk()) << f.error.toString().toStdString();
    EXPECT_EQ(f.dishName, "Soup");
    EXPECT_EQ(f.recipeCostCents, 350);
    EXPECT_EQ(f.profitCents, 650);
    EXPECT_EQ(f.profitMarginPercent, Decimal(65));
    EXPECT_TRUE(f.warnings.isEmpty());
}

TEST_F(DishProfitabilityTest, Analyze_FollowsPriceChanges) {
    const int soup = createDish(m_soupRecipe, "Soup", 1000);
    ASSERT_TRUE(m_catalog->updateDishPrice(kTenant, soup, 700).isOk());

    const DishFinancials f = m_profitability->analyze(kTenant, soup);
    ASSERT_TRUE(f.isOk());
    EXPECT_EQ(f.profitCents, 350);
    EXPECT_EQ(f.profitMarginPercent, Decimal(50));
    EXPECT_TRUE(f.hasWarning(ProfitWarning::LowMargin));
    EXPECT_TRUE(f.hasWarning(ProfitWarning::HighFoodCost));
}

TEST_F(DishProfitabilityTest, Analyze_PropagatesCostErrors) {
    const int truffle = createIngredient("Truffle");
    const int recipe = createRecipe("Truffle pasta");
    addIngredient(recipe, truffle, Decimal("0.02"));
    const int dish = createDish(recipe, "Truffle pasta", 2500);

    const DishFinancials f = m_profitability->analyze(kTenant, dish);
    EXPECT_EQ(f.error.code, CostingErrorCode::NoStockAvailable);
    EXPECT_EQ(f.sellingPriceCents, 2500);
}

TEST_F(DishProfitabilityTest, Analyze_UnknownDish) {
    EXPECT_EQ(m_profitability->analyze(kTenant, 777).error.code, CostingErrorCode::NotFound);
}
