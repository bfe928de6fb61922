#ifndef TESTDATABASE_H
#define TESTDATABASE_H

#include <gtest/gtest.h>

#include <QDate>
#include <QDateTime>
#include <QSqlDatabase>
#include <QTime>
#include <QTimeZone>

#include <memory>

#include "Clock.h"
#include "DbManager.h"
#include "DecimalUtils.h"
#include "DishProfitabilityCalculator.h"
#include "IngredientCostResolver.h"
#include "InventoryLedger.h"
#include "InventoryReportService.h"
#include "LedgerLockRegistry.h"
#include "MenuEngineeringClassifier.h"
#include "MigrationRunner.h"
#include "RecipeCatalogService.h"
#include "RecipeCostEngine.h"
#include "SaleService.h"
#include "repositories/BatchRepository.h"
#include "repositories/DishRepository.h"
#include "repositories/IngredientRepository.h"
#include "repositories/RecipeRepository.h"

inline QDateTime utcAt(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), QTimeZone::utc());
}

inline Decimal dec(const char *text)
{
    return Decimal(text);
}

// Fixture: in-memory DB with schema, repositories and services on a fixed clock
class KitchenTest : public ::testing::Test {
  protected:
    static constexpr int kTenant = 1;
    static constexpr int kOtherTenant = 2;

    void SetUp() override {
        static int connectionCounter = 0;
        m_connectionName = QString("kitchencost_test_%1").arg(++connectionCounter);

        m_db = DbManager::openConnection(":memory:", m_connectionName);
        ASSERT_TRUE(m_db.isOpen());

        MigrationRunner runner(m_db);
        ASSERT_TRUE(runner.runMigrations());

        m_clock = std::make_unique<FixedClock>(utcAt(2024, 1, 10, 12));
        m_locks = std::make_unique<LedgerLockRegistry>();

        m_ingredientRepo = std::make_unique<IngredientRepository>(m_db);
        m_batchRepo = std::make_unique<BatchRepository>(m_db);
        m_recipeRepo = std::make_unique<RecipeRepository>(m_db);
        m_dishRepo = std::make_unique<DishRepository>(m_db);

        m_ledger = std::make_unique<InventoryLedger>(m_batchRepo.get(), m_ingredientRepo.get(),
                                                     m_locks.get(), m_clock.get());
        m_resolver = std::make_unique<IngredientCostResolver>(m_batchRepo.get(), m_ingredientRepo.get());
        m_engine = std::make_unique<RecipeCostEngine>(m_recipeRepo.get(), m_resolver.get());
        m_profitability = std::make_unique<DishProfitabilityCalculator>(m_dishRepo.get(), m_engine.get());
        m_classifier = std::make_unique<MenuEngineeringClassifier>(m_dishRepo.get(), m_profitability.get());
        m_catalog = std::make_unique<RecipeCatalogService>(m_recipeRepo.get(), m_ingredientRepo.get(),
                                                           m_dishRepo.get());
        m_sales = std::make_unique<SaleService>(m_dishRepo.get(), m_engine.get(), m_ledger.get(), m_clock.get());
        m_reports = std::make_unique<InventoryReportService>(m_batchRepo.get(), m_ingredientRepo.get(),
                                                             m_clock.get());
    }

    void TearDown() override {
        m_reports.reset();
        m_sales.reset();
        m_catalog.reset();
        m_classifier.reset();
        m_profitability.reset();
        m_engine.reset();
        m_resolver.reset();
        m_ledger.reset();
        m_dishRepo.reset();
        m_recipeRepo.reset();
        m_batchRepo.reset();
        m_ingredientRepo.reset();

        m_db = QSqlDatabase();
        DbManager::closeConnection(m_connectionName);
    }

    int createIngredient(const QString &name, const QString &unit = "kg", const Decimal &minStock = 0) {
        Ingredient ingredient;
        ingredient.name = name;
        ingredient.unit = unit;
        ingredient.minStockThreshold = minStock;
        return m_ingredientRepo->create(ingredient);
    }

    // Receive a batch and return its id (0 on failure)
    int receive(int ingredientId, const Decimal &quantity, qint64 unitCostCents,
                const QDateTime &receivedAt, const QDateTime &expiresAt, int tenantId = kTenant) {
        const ReceiveResult result = m_ledger->receive(tenantId, ingredientId, quantity, unitCostCents,
                                                       receivedAt, expiresAt);
        EXPECT_TRUE(result.isOk()) << result.error.toString().toStdString();
        return result.batchId;
    }

    int createRecipe(const QString &name, int servings = 1, RecipeType type = RecipeType::Final,
                     int tenantId = kTenant) {
        const CatalogResult result = m_catalog->createRecipe(tenantId, name, servings, type);
        EXPECT_TRUE(result.isOk()) << result.error.toString().toStdString();
        return result.id;
    }

    void addIngredient(int recipeId, int ingredientId, const Decimal &quantity, int tenantId = kTenant) {
        const CatalogResult result = m_catalog->addIngredient(tenantId, recipeId, ingredientId, quantity);
        EXPECT_TRUE(result.isOk()) << result.error.toString().toStdString();
    }

    int createDish(int recipeId, const QString &name, qint64 priceCents, int tenantId = kTenant) {
        const CatalogResult result = m_catalog->createDish(tenantId, recipeId, name, priceCents);
        EXPECT_TRUE(result.isOk()) << result.error.toString().toStdString();
        return result.id;
    }

    InventoryBatch batch(int batchId, int tenantId = kTenant) {
        return m_batchRepo->findBatchById(tenantId, batchId);
    }

    ConsumptionReference manualReference() const {
        ConsumptionReference reference;
        reference.type = MovementType::OutSale;
        reference.referenceType = "manual";
        reference.referenceId = "test";
        return reference;
    }

    QString m_connectionName;
    QSqlDatabase m_db;

    std::unique_ptr<FixedClock> m_clock;
    std::unique_ptr<LedgerLockRegistry> m_locks;

    std::unique_ptr<IngredientRepository> m_ingredientRepo;
    std::unique_ptr<BatchRepository> m_batchRepo;
    std::unique_ptr<RecipeRepository> m_recipeRepo;
    std::unique_ptr<DishRepository> m_dishRepo;

    std::unique_ptr<InventoryLedger> m_ledger;
    std::unique_ptr<IngredientCostResolver> m_resolver;
    std::unique_ptr<RecipeCostEngine> m_engine;
    std::unique_ptr<DishProfitabilityCalculator> m_profitability;
    std::unique_ptr<MenuEngineeringClassifier> m_classifier;
    std::unique_ptr<RecipeCatalogService> m_catalog;
    std::unique_ptr<SaleService> m_sales;
    std::unique_ptr<InventoryReportService> m_reports;
};

#endif // TESTDATABASE_H
