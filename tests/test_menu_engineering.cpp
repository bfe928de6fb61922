// Menu engineering classifier tests: quadrants, ABC ranking, period aggregation

#include <gtest/gtest.h>

#include "TestDatabase.h"

namespace {

DishPerformance performance(int id, const char *margin, int volume, qint64 revenueCents)
{
    DishPerformance p;
    p.dishId = id;
    p.dishName = QString("Dish %1").arg(id);
    p.profitMarginPercent = Decimal(margin);
    p.salesVolume = volume;
    p.totalRevenueCents = revenueCents;
    return p;
}

const DishPerformance *findDish(const QList<DishPerformance> &dishes, int id)
{
    for (const auto &dish : dishes) {
        if (dish.dishId == id) return &dish;
    }
    return nullptr;
}

}  // namespace

// --- Quadrants ---

TEST(MenuQuadrantTest, TwoStarsOneDogOnePuzzle) {
    QList<DishPerformance> dishes = {
        performance(1, "70", 100, 0),
        performance(2, "65", 90, 0),
        performance(3, "40", 10, 0),
        performance(4, "75", 20, 0),
    };

    const MenuMatrixSummary summary =
        MenuEngineeringClassifier::assignQuadrants(dishes, QuadrantTieRule::FavorHigh);

    EXPECT_EQ(summary.averageMarginPercent, Decimal("62.5"));
    EXPECT_EQ(summary.averagePopularity, Decimal(55));
    EXPECT_EQ(dishes[0].category, MenuCategory::Star);
    EXPECT_EQ(dishes[1].category, MenuCategory::Star);
    EXPECT_EQ(dishes[2].category, MenuCategory::Dog);
    EXPECT_EQ(dishes[3].category, MenuCategory::Puzzle);
    EXPECT_EQ(summary.starCount, 2);
    EXPECT_EQ(summary.dogCount, 1);
    EXPECT_EQ(summary.puzzleCount, 1);
    EXPECT_EQ(summary.plowhorseCount, 0);
}

TEST(MenuQuadrantTest, PlowhorseIsPopularWithLowMargin) {
    QList<DishPerformance> dishes = {
        performance(1, "30", 100, 0),
        performance(2, "70", 10, 0),
    };

    MenuEngineeringClassifier::assignQuadrants(dishes, QuadrantTieRule::FavorHigh);
    EXPECT_EQ(dishes[0].category, MenuCategory::Plowhorse);
    EXPECT_EQ(dishes[1].category, MenuCategory::Puzzle);
}

TEST(MenuQuadrantTest, TiesFollowConfiguredRule) {
    QList<DishPerformance> high = {performance(1, "50", 10, 0), performance(2, "50", 10, 0)};
    QList<DishPerformance> low = high;

    MenuEngineeringClassifier::assignQuadrants(high, QuadrantTieRule::FavorHigh);
    MenuEngineeringClassifier::assignQuadrants(low, QuadrantTieRule::FavorLow);

    EXPECT_EQ(high[0].category, MenuCategory::Star);
    EXPECT_EQ(high[1].category, MenuCategory::Star);
    EXPECT_EQ(low[0].category, MenuCategory::Dog);
    EXPECT_EQ(low[1].category, MenuCategory::Dog);
}

TEST(MenuQuadrantTest, EmptyMenu) {
    QList<DishPerformance> dishes;
    const MenuMatrixSummary summary =
        MenuEngineeringClassifier::assignQuadrants(dishes, QuadrantTieRule::FavorHigh);
    EXPECT_EQ(summary.dishCount, 0);
    EXPECT_EQ(summary.averageMarginPercent, Decimal(0));
}

// --- ABC ---

TEST(MenuAbcTest, CumulativeRevenueShares) {
    QList<DishPerformance> dishes = {
        performance(1, "0", 1, 500),
        performance(2, "0", 1, 5000),
        performance(3, "0", 1, 1500),
        performance(4, "0", 1, 3000),
    };

    MenuEngineeringClassifier::assignAbcClasses(dishes, Decimal("0.80"), Decimal("0.95"));

    ASSERT_EQ(dishes.size(), 4);
    EXPECT_EQ(dishes[0].dishId, 2);
    EXPECT_EQ(dishes[1].dishId, 4);
    EXPECT_EQ(dishes[2].dishId, 3);
    EXPECT_EQ(dishes[3].dishId, 1);

    // 50%, 80%, 95%, 100%: boundaries are inclusive
    EXPECT_EQ(dishes[0].abcClass, AbcClass::A);
    EXPECT_EQ(dishes[1].abcClass, AbcClass::A);
    EXPECT_EQ(dishes[2].abcClass, AbcClass::B);
    EXPECT_EQ(dishes[3].abcClass, AbcClass::C);
    EXPECT_EQ(dishes[1].cumulativeSharePercent, Decimal(80));
    EXPECT_EQ(dishes[3].revenueSharePercent, Decimal(5));
}

TEST(MenuAbcTest, EqualRevenueOrderedById) {
    QList<DishPerformance> dishes = {performance(9, "0", 1, 100), performance(3, "0", 1, 100)};
    MenuEngineeringClassifier::assignAbcClasses(dishes, Decimal("0.80"), Decimal("0.95"));
    EXPECT_EQ(dishes[0].dishId, 3);
    EXPECT_EQ(dishes[1].dishId, 9);
}

TEST(MenuStrategyTest, KeyedByCategoryAndClass) {
    EXPECT_FALSE(menuStrategy(MenuCategory::Star, AbcClass::A).isEmpty());
    EXPECT_NE(menuStrategy(MenuCategory::Star, AbcClass::A), menuStrategy(MenuCategory::Dog, AbcClass::C));
    EXPECT_EQ(menuCategoryToString(MenuCategory::Plowhorse), "Plowhorse");
    EXPECT_EQ(abcClassToString(AbcClass::B), "B");
}

// --- Classification over stored sales ---

namespace {

class MenuClassifierTest : public KitchenTest {
  protected:
    void SetUp() override {
        KitchenTest::SetUp();
        m_base = createIngredient("Base");
        receive(m_base, Decimal(100), 100, utcAt(2024, 1, 1), utcAt(2024, 3, 1));
    }

    int dishCosting(const QString &name, const Decimal &baseQuantity, qint64 priceCents) {
        const int recipe = createRecipe(name);
        addIngredient(recipe, m_base, baseQuantity);
        return createDish(recipe, name, priceCents);
    }

    void sell(int dishId, int quantity, const QDateTime &at, qint64 priceCents, qint64 costCents) {
        DishSale sale;
        sale.tenantId = kTenant;
        sale.dishId = dishId;
        sale.quantity = quantity;
        sale.unitSellingPriceCents = priceCents;
        sale.unitRecipeCostCents = costCents;
        sale.soldAt = at;
        ASSERT_GT(m_dishRepo->recordSale(sale), 0);
    }

    int m_base = 0;
};

}  // namespace

TEST_F(MenuClassifierTest, ClassifiesDishesSoldInPeriod) {
    const int burger = dishCosting("Burger", Decimal(3), 1000);    // margin 70
    const int pasta = dishCosting("Pasta", Decimal("3.5"), 1000);  // margin 65
    const int salad = dishCosting("Salad", Decimal(6), 1000);      // margin 40
    const int tartare = dishCosting("Tartare", Decimal("2.5"), 1000);  // margin 75

    sell(burger, 100, utcAt(2024, 1, 5), 1000, 300);
    sell(pasta, 90, utcAt(2024, 1, 6), 1000, 350);
    sell(salad, 10, utcAt(2024, 1, 7), 1000, 600);
    sell(tartare, 20, utcAt(2024, 1, 8), 1000, 250);
    // Outside the period
    sell(salad, 500, utcAt(2024, 2, 1), 1000, 600);

    const MenuAnalysis analysis = m_classifier->classify(kTenant, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    ASSERT_TRUE(analysis.isOk()) << analysis.error.toString().toStdString();
    ASSERT_EQ(analysis.dishes.size(), 4);

    EXPECT_EQ(findDish(analysis.dishes, burger)->category, MenuCategory::Star);
    EXPECT_EQ(findDish(analysis.dishes, pasta)->category, MenuCategory::Star);
    EXPECT_EQ(findDish(analysis.dishes, salad)->category, MenuCategory::Dog);
    EXPECT_EQ(findDish(analysis.dishes, tartare)->category, MenuCategory::Puzzle);

    // Ordered by revenue: 100000, 90000, 20000, 10000 of 220000
    EXPECT_EQ(analysis.dishes[0].dishId, burger);
    EXPECT_EQ(analysis.dishes[0].abcClass, AbcClass::A);
    EXPECT_EQ(analysis.dishes[1].abcClass, AbcClass::B);
    EXPECT_EQ(analysis.dishes[2].abcClass, AbcClass::C);
    EXPECT_EQ(analysis.dishes[3].abcClass, AbcClass::C);

    EXPECT_EQ(analysis.summary.totalRevenueCents, 220000);
    EXPECT_EQ(findDish(analysis.dishes, burger)->totalProfitCents, 70000);
    EXPECT_FALSE(findDish(analysis.dishes, burger)->strategy.isEmpty());
}

TEST_F(MenuClassifierTest, SkipsInactiveAndUnsoldDishes) {
    const int sold = dishCosting("Sold", Decimal(3), 1000);
    const int unsold = dishCosting("Unsold", Decimal(3), 1000);
    const int retired = dishCosting("Retired", Decimal(3), 1000);

    sell(sold, 5, utcAt(2024, 1, 5), 1000, 300);
    sell(retired, 5, utcAt(2024, 1, 5), 1000, 300);
    ASSERT_TRUE(m_catalog->setDishActive(kTenant, retired, false).isOk());

    const MenuAnalysis analysis = m_classifier->classify(kTenant, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    ASSERT_TRUE(analysis.isOk());
    ASSERT_EQ(analysis.dishes.size(), 1);
    EXPECT_EQ(analysis.dishes[0].dishId, sold);
    EXPECT_EQ(findDish(analysis.dishes, unsold), nullptr);
}

TEST_F(MenuClassifierTest, FallsBackToSalesMarginWithoutStock) {
    const int caviar = createIngredient("Caviar");
    const int recipe = createRecipe("Blini");
    addIngredient(recipe, caviar, Decimal("0.05"));
    const int blini = createDish(recipe, "Blini", 2000);

    sell(blini, 4, utcAt(2024, 1, 5), 2000, 1200);

    const MenuAnalysis analysis = m_classifier->classify(kTenant, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    ASSERT_TRUE(analysis.isOk());
    ASSERT_EQ(analysis.dishes.size(), 1);
    EXPECT_TRUE(analysis.dishes[0].marginFromSales);
    EXPECT_EQ(analysis.dishes[0].profitMarginPercent, Decimal(40));
}

TEST_F(MenuClassifierTest, RejectsEmptyPeriod) {
    const MenuAnalysis analysis = m_classifier->classify(kTenant, utcAt(2024, 2, 1), utcAt(2024, 1, 1));
    EXPECT_EQ(analysis.error.code, CostingErrorCode::InvalidDate);
}

TEST_F(MenuClassifierTest, NoSalesGivesEmptyMatrix) {
    dishCosting("Idle", Decimal(1), 1000);
    const MenuAnalysis analysis = m_classifier->classify(kTenant, utcAt(2024, 1, 1), utcAt(2024, 2, 1));
    ASSERT_TRUE(analysis.isOk());
    EXPECT_TRUE(analysis.dishes.isEmpty());
    EXPECT_EQ(analysis.summary.dishCount, 0);
}
