// Schema migration and demo data tests

#include <gtest/gtest.h>

#include <QSqlQuery>

#include "TestDatabase.h"

namespace {

class MigrationTest : public KitchenTest {};

}  // namespace

TEST_F(MigrationTest, CreatesAllTables) {
    MigrationRunner runner(m_db);
    for (const char *table : {"ingredients", "inventory_batches", "inventory_movements", "recipes",
                              "recipe_ingredients", "recipe_components", "dishes", "dish_sales"}) {
        EXPECT_TRUE(runner.tableExists(table)) << table;
    }
}

TEST_F(MigrationTest, RunningTwiceIsHarmless) {
    const int flour = createIngredient("Flour");
    receive(flour, Decimal(1), 100, utcAt(2024, 1, 1), utcAt(2024, 2, 1));

    MigrationRunner runner(m_db);
    ASSERT_TRUE(runner.runMigrations());
    EXPECT_EQ(m_ledger->batches(kTenant, flour).size(), 1);
}

TEST_F(MigrationTest, SchemaRejectsInvalidRows) {
    const int flour = createIngredient("Flour");
    QSqlQuery query(m_db);

    EXPECT_FALSE(query.exec(QString(
        "INSERT INTO inventory_batches (tenant_id, ingredient_id, unit_cost_cents, initial_quantity, "
        "remaining_quantity, received_at, expires_at, status) "
        "VALUES (1, %1, 0, '1', '1', '2024-01-01T00:00:00.000Z', '2024-02-01T00:00:00.000Z', 'active')")
        .arg(flour)));

    EXPECT_FALSE(query.exec(QString(
        "INSERT INTO inventory_batches (tenant_id, ingredient_id, unit_cost_cents, initial_quantity, "
        "remaining_quantity, received_at, expires_at, status) "
        "VALUES (1, %1, 100, '1', '1', '2024-01-01T00:00:00.000Z', '2024-02-01T00:00:00.000Z', 'spoiled')")
        .arg(flour)));

    const int recipe = createRecipe("Bread");
    EXPECT_FALSE(query.exec(QString(
        "INSERT INTO recipe_components (recipe_id, component_recipe_id, quantity) VALUES (%1, %1, '1')")
        .arg(recipe)));
}

TEST_F(MigrationTest, DemoDataIsCostable) {
    MigrationRunner runner(m_db);
    ASSERT_TRUE(runner.loadDemoData());
    // Second call leaves existing data alone
    ASSERT_TRUE(runner.loadDemoData());

    EXPECT_EQ(m_ingredientRepo->findAll().size(), 7);

    // Mash: 1.2 x 80 + 0.3 x 110 + 0.05 x 1200 = 189
    const RecipeCost mash = m_engine->calculateCost(kTenant, 1);
    ASSERT_TRUE(mash.isOk()) << mash.error.toString().toStdString();
    EXPECT_EQ(mash.totalCostCents, 189);

    // Stew: 0.8 x 1500 + 0.2 x 120 + 0.3 x 90 + 0.5 x 189 = 1345.5
    const RecipeCost stew = m_engine->calculateCost(kTenant, 2);
    ASSERT_TRUE(stew.isOk());
    EXPECT_EQ(stew.totalCostCents, 1346);

    // Every demo batch has its receipt movement
    for (const auto &b : m_ledger->batches(kTenant)) {
        const QList<InventoryMovement> movements = m_ledger->movements(kTenant, b.id);
        ASSERT_EQ(movements.size(), 1);
        EXPECT_EQ(movements[0].quantityDelta, b.initialQuantity);
    }
}
