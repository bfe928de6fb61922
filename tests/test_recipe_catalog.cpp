// Recipe catalog tests: validation of recipes, components and dishes

#include <gtest/gtest.h>

#include "TestDatabase.h"

namespace {

class RecipeCatalogTest : public KitchenTest {
  protected:
    void SetUp() override {
        KitchenTest::SetUp();
        m_onion = createIngredient("Onion");
        ASSERT_GT(m_onion, 0);
    }

    int m_onion = 0;
};

}  // namespace

TEST_F(RecipeCatalogTest, CreateRecipe_Validates) {
    EXPECT_EQ(m_catalog->createRecipe(kTenant, "  ", 1, RecipeType::Final).error.code,
              CostingErrorCode::InvalidReference);
    EXPECT_EQ(m_catalog->createRecipe(kTenant, "Broth", 0, RecipeType::Final).error.code,
              CostingErrorCode::InvalidQuantity);

    const CatalogResult ok = m_catalog->createRecipe(kTenant, "Broth", 6, RecipeType::Preparation, "Simmer");
    ASSERT_TRUE(ok.isOk());

    const Recipe stored = m_recipeRepo->findById(kTenant, ok.id);
    EXPECT_EQ(stored.name, "Broth");
    EXPECT_EQ(stored.servings, 6);
    EXPECT_EQ(stored.type, RecipeType::Preparation);
}

TEST_F(RecipeCatalogTest, AddIngredient_DefaultsUnitAndChecksReferences) {
    const int soup = createRecipe("Onion soup");

    ASSERT_TRUE(m_catalog->addIngredient(kTenant, soup, m_onion, Decimal("0.75")).isOk());
    const Recipe stored = m_recipeRepo->findById(kTenant, soup);
    ASSERT_EQ(stored.ingredients.size(), 1);
    EXPECT_EQ(stored.ingredients[0].unit, "kg");
    EXPECT_EQ(stored.ingredients[0].quantity, Decimal("0.75"));

    EXPECT_EQ(m_catalog->addIngredient(kTenant, soup, 9999, Decimal(1)).error.code, CostingErrorCode::NotFound);
    EXPECT_EQ(m_catalog->addIngredient(kTenant, soup, m_onion, Decimal(0)).error.code,
              CostingErrorCode::InvalidQuantity);
    EXPECT_EQ(m_catalog->addIngredient(kOtherTenant, soup, m_onion, Decimal(1)).error.code,
              CostingErrorCode::NotFound);
}

TEST_F(RecipeCatalogTest, AddComponent_RejectsSelfReference) {
    const int a = createRecipe("A");
    EXPECT_EQ(m_catalog->addComponent(kTenant, a, a, Decimal(1)).error.code,
              CostingErrorCode::CircularRecipeReference);
}

TEST_F(RecipeCatalogTest, AddComponent_RejectsIndirectCycle) {
    const int a = createRecipe("A", 1, RecipeType::Preparation);
    const int b = createRecipe("B", 1, RecipeType::Preparation);
    const int c = createRecipe("C", 1, RecipeType::Preparation);

    ASSERT_TRUE(m_catalog->addComponent(kTenant, a, b, Decimal(1)).isOk());
    ASSERT_TRUE(m_catalog->addComponent(kTenant, b, c, Decimal(1)).isOk());

    const CatalogResult closing = m_catalog->addComponent(kTenant, c, a, Decimal(1));
    EXPECT_EQ(closing.error.code, CostingErrorCode::CircularRecipeReference);
    EXPECT_TRUE(closing.error.message.contains("C -> A -> B -> C")) << closing.error.message.toStdString();
    EXPECT_TRUE(m_recipeRepo->findById(kTenant, c).components.isEmpty());
}

TEST_F(RecipeCatalogTest, AddComponent_RejectsOtherTenantAndDuplicates) {
    const int mine = createRecipe("Mine");
    const int base = createRecipe("Base", 1, RecipeType::Preparation);
    const int theirs = createRecipe("Theirs", 1, RecipeType::Preparation, kOtherTenant);

    EXPECT_EQ(m_catalog->addComponent(kTenant, mine, theirs, Decimal(1)).error.code,
              CostingErrorCode::InvalidReference);

    ASSERT_TRUE(m_catalog->addComponent(kTenant, mine, base, Decimal("0.5")).isOk());
    EXPECT_EQ(m_catalog->addComponent(kTenant, mine, base, Decimal("0.5")).error.code,
              CostingErrorCode::InvalidReference);
}

TEST_F(RecipeCatalogTest, RemoveLines) {
    const int soup = createRecipe("Soup");
    const int base = createRecipe("Base", 1, RecipeType::Preparation);
    addIngredient(soup, m_onion, Decimal(1));
    ASSERT_TRUE(m_catalog->addComponent(kTenant, soup, base, Decimal(1)).isOk());

    EXPECT_TRUE(m_catalog->removeIngredient(kTenant, soup, m_onion).isOk());
    EXPECT_TRUE(m_catalog->removeComponent(kTenant, soup, base).isOk());
    EXPECT_EQ(m_catalog->removeIngredient(kTenant, soup, m_onion).error.code, CostingErrorCode::NotFound);

    const Recipe stored = m_recipeRepo->findById(kTenant, soup);
    EXPECT_TRUE(stored.ingredients.isEmpty());
    EXPECT_TRUE(stored.components.isEmpty());
}

TEST_F(RecipeCatalogTest, CreateDish_RequiresFinalRecipeOfSameTenant) {
    const int prep = createRecipe("Dough", 1, RecipeType::Preparation);
    const int pizza = createRecipe("Pizza");
    const int foreign = createRecipe("Foreign", 1, RecipeType::Final, kOtherTenant);

    EXPECT_EQ(m_catalog->createDish(kTenant, prep, "Dough", 500).error.code, CostingErrorCode::InvalidReference);
    EXPECT_EQ(m_catalog->createDish(kTenant, foreign, "Foreign", 500).error.code,
              CostingErrorCode::InvalidReference);
    EXPECT_EQ(m_catalog->createDish(kTenant, pizza, "Pizza", 0).error.code, CostingErrorCode::InvalidPrice);

    const CatalogResult dish = m_catalog->createDish(kTenant, pizza, "Pizza", 1200);
    ASSERT_TRUE(dish.isOk());
    EXPECT_EQ(m_dishRepo->findById(kTenant, dish.id).sellingPriceCents, 1200);
    EXPECT_FALSE(m_dishRepo->findById(kOtherTenant, dish.id).isValid());
}

TEST_F(RecipeCatalogTest, DishPriceAndActivity) {
    const int pizza = createRecipe("Pizza");
    const int dish = createDish(pizza, "Pizza", 1200);

    EXPECT_EQ(m_catalog->updateDishPrice(kTenant, dish, -5).error.code, CostingErrorCode::InvalidPrice);
    ASSERT_TRUE(m_catalog->updateDishPrice(kTenant, dish, 1350).isOk());
    ASSERT_TRUE(m_catalog->setDishActive(kTenant, dish, false).isOk());

    const Dish stored = m_dishRepo->findById(kTenant, dish);
    EXPECT_EQ(stored.sellingPriceCents, 1350);
    EXPECT_FALSE(stored.isActive);
    EXPECT_TRUE(m_dishRepo->findAll(kTenant, true).isEmpty());
    EXPECT_EQ(m_dishRepo->findAll(kTenant, false).size(), 1);
}
