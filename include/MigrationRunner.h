#ifndef MIGRATIONRUNNER_H
#define MIGRATIONRUNNER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

class MigrationRunner : public QObject
{
    Q_OBJECT

public:
    explicit MigrationRunner(QSqlDatabase db, QObject *parent = nullptr);

    bool runMigrations();

    bool tableExists(const QString &tableName);

    /**
     * @brief Демонстрационные данные для тенанта 1 (повторный вызов ничего не делает)
     */
    bool loadDemoData();

private:
    QSqlDatabase m_db;

    bool createAllTables();

    bool createIngredientsTable();
    bool createInventoryBatchesTable();
    bool createInventoryMovementsTable();
    bool createRecipesTable();
    bool createRecipeIngredientsTable();
    bool createRecipeComponentsTable();
    bool createDishesTable();
    bool createDishSalesTable();

    bool createIndexes();
    bool createLedgerTriggers();

    bool upgradeSchema();

    bool executeQuery(const QString &sql, const QString &errorContext = "");
};

#endif // MIGRATIONRUNNER_H
