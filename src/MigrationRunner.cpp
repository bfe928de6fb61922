#include "MigrationRunner.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QLoggingCategory>
#include <QStringList>

Q_LOGGING_CATEGORY(migration, "migration")

MigrationRunner::MigrationRunner(QSqlDatabase db, QObject *parent)
    : QObject(parent)
    , m_db(db)
{
}

static bool columnExists(QSqlDatabase& db, const QString& tableName, const QString& columnName)
{
    QSqlQuery q(db);
    q.prepare(QString("PRAGMA table_info(%1)").arg(tableName));
    if (!q.exec()) return false;

    while (q.next()) {
        const QString name = q.value("name").toString();
        if (name.compare(columnName, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

bool MigrationRunner::runMigrations()
{
    if (!m_db.isOpen()) {
        qCritical(migration) << "MigrationRunner: Database is not open";
        return false;
    }

    if (!m_db.transaction()) {
        qCritical(migration) << "MigrationRunner: Cannot start transaction:" << m_db.lastError().text();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Starting migrations...";

    const QStringList requiredTables = {
        "ingredients",
        "inventory_batches",
        "inventory_movements",
        "recipes",
        "recipe_ingredients",
        "recipe_components",
        "dishes",
        "dish_sales"
    };

    bool needsMigration = false;
    for (const QString &tableName : requiredTables) {
        if (!tableExists(tableName)) {
            needsMigration = true;
            qInfo(migration) << "MigrationRunner: Table" << tableName << "does not exist, migration needed";
            break;
        }
    }

    if (needsMigration && !createAllTables()) {
        qCritical(migration) << "MigrationRunner: Failed to create tables";
        m_db.rollback();
        return false;
    }

    if (!upgradeSchema()) {
        qCritical(migration) << "MigrationRunner: Failed to upgrade schema";
        m_db.rollback();
        return false;
    }

    if (!createIndexes()) {
        qCritical(migration) << "MigrationRunner: Failed to create indexes";
        m_db.rollback();
        return false;
    }

    if (!createLedgerTriggers()) {
        qCritical(migration) << "MigrationRunner: Failed to create ledger triggers";
        m_db.rollback();
        return false;
    }

    if (!m_db.commit()) {
        qCritical(migration) << "MigrationRunner: Cannot commit transaction:" << m_db.lastError().text();
        m_db.rollback();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Migrations completed successfully";
    return true;
}

bool MigrationRunner::tableExists(const QString &tableName)
{
    QSqlQuery query(m_db);
    query.prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    query.addBindValue(tableName);

    if (!query.exec()) {
        qWarning(migration) << "MigrationRunner: Cannot check table existence:" << query.lastError().text();
        return false;
    }

    return query.next();
}

bool MigrationRunner::createAllTables()
{
    return createIngredientsTable() &&
           createInventoryBatchesTable() &&
           createInventoryMovementsTable() &&
           createRecipesTable() &&
           createRecipeIngredientsTable() &&
           createRecipeComponentsTable() &&
           createDishesTable() &&
           createDishSalesTable();
}

bool MigrationRunner::createIngredientsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS ingredients (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            unit TEXT NOT NULL DEFAULT 'kg',
            category TEXT,
            shelf_life_days INTEGER NOT NULL DEFAULT 0 CHECK(shelf_life_days >= 0),
            allergens TEXT NOT NULL DEFAULT '',
            min_stock_threshold TEXT NOT NULL DEFAULT '0',
            is_active INTEGER NOT NULL DEFAULT 1 CHECK(is_active IN (0, 1)),
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
        )
    )";

    return executeQuery(sql, "createIngredientsTable");
}

bool MigrationRunner::createInventoryBatchesTable()
{
    // Количества хранятся текстом: SQLite REAL - это double
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS inventory_batches (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tenant_id INTEGER NOT NULL CHECK(tenant_id > 0),
            ingredient_id INTEGER NOT NULL,
            unit_cost_cents INTEGER NOT NULL CHECK(unit_cost_cents > 0),
            initial_quantity TEXT NOT NULL,
            remaining_quantity TEXT NOT NULL,
            received_at TEXT NOT NULL,
            expires_at TEXT NOT NULL,
            supplier TEXT,
            invoice_number TEXT,
            status TEXT NOT NULL DEFAULT 'active' CHECK(status IN ('active', 'exhausted', 'archived')),
            version INTEGER NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            FOREIGN KEY (ingredient_id) REFERENCES ingredients(id)
        )
    )";

    return executeQuery(sql, "createInventoryBatchesTable");
}

bool MigrationRunner::createInventoryMovementsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS inventory_movements (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tenant_id INTEGER NOT NULL CHECK(tenant_id > 0),
            batch_id INTEGER NOT NULL,
            type TEXT NOT NULL CHECK(type IN ('IN', 'OUT_SALE', 'OUT_EXPIRE', 'ADJUSTMENT')),
            quantity_delta TEXT NOT NULL,
            unit_cost_cents INTEGER NOT NULL,
            total_cost_cents INTEGER NOT NULL,
            reference_type TEXT,
            reference_id TEXT,
            reason TEXT,
            created_at TEXT NOT NULL,
            FOREIGN KEY (batch_id) REFERENCES inventory_batches(id)
        )
    )";

    return executeQuery(sql, "createInventoryMovementsTable");
}

bool MigrationRunner::createRecipesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS recipes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tenant_id INTEGER NOT NULL CHECK(tenant_id > 0),
            name TEXT NOT NULL,
            servings INTEGER NOT NULL CHECK(servings > 0),
            recipe_type TEXT NOT NULL DEFAULT 'final' CHECK(recipe_type IN ('preparation', 'final')),
            instructions TEXT,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            UNIQUE(tenant_id, name)
        )
    )";

    return executeQuery(sql, "createRecipesTable");
}

bool MigrationRunner::createRecipeIngredientsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS recipe_ingredients (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            recipe_id INTEGER NOT NULL,
            ingredient_id INTEGER NOT NULL,
            quantity TEXT NOT NULL,
            unit TEXT NOT NULL DEFAULT 'kg',
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            FOREIGN KEY (recipe_id) REFERENCES recipes(id) ON DELETE CASCADE,
            FOREIGN KEY (ingredient_id) REFERENCES ingredients(id)
        )
    )";

    return executeQuery(sql, "createRecipeIngredientsTable");
}

bool MigrationRunner::createRecipeComponentsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS recipe_components (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            recipe_id INTEGER NOT NULL,
            component_recipe_id INTEGER NOT NULL,
            quantity TEXT NOT NULL,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            FOREIGN KEY (recipe_id) REFERENCES recipes(id) ON DELETE CASCADE,
            FOREIGN KEY (component_recipe_id) REFERENCES recipes(id),
            CHECK(recipe_id <> component_recipe_id),
            UNIQUE(recipe_id, component_recipe_id)
        )
    )";

    return executeQuery(sql, "createRecipeComponentsTable");
}

bool MigrationRunner::createDishesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS dishes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tenant_id INTEGER NOT NULL CHECK(tenant_id > 0),
            recipe_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            description TEXT,
            selling_price_cents INTEGER NOT NULL CHECK(selling_price_cents > 0),
            is_active INTEGER NOT NULL DEFAULT 1 CHECK(is_active IN (0, 1)),
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            FOREIGN KEY (recipe_id) REFERENCES recipes(id)
        )
    )";

    return executeQuery(sql, "createDishesTable");
}

bool MigrationRunner::createDishSalesTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS dish_sales (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tenant_id INTEGER NOT NULL CHECK(tenant_id > 0),
            dish_id INTEGER NOT NULL,
            quantity INTEGER NOT NULL CHECK(quantity > 0),
            unit_selling_price_cents INTEGER NOT NULL,
            unit_recipe_cost_cents INTEGER NOT NULL,
            sold_at TEXT NOT NULL,
            reference_id TEXT,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
            FOREIGN KEY (dish_id) REFERENCES dishes(id)
        )
    )";

    return executeQuery(sql, "createDishSalesTable");
}

bool MigrationRunner::upgradeSchema()
{
    if (!columnExists(m_db, "inventory_batches", "version")) {
        qInfo(migration) << "MigrationRunner: Adding inventory_batches.version column...";

        if (!executeQuery(
                "ALTER TABLE inventory_batches ADD COLUMN version INTEGER NOT NULL DEFAULT 0",
                "alter inventory_batches add version"
            )) {
            return false;
        }
    }

    if (!columnExists(m_db, "ingredients", "min_stock_threshold")) {
        qInfo(migration) << "MigrationRunner: Adding ingredients.min_stock_threshold column...";

        if (!executeQuery(
                "ALTER TABLE ingredients ADD COLUMN min_stock_threshold TEXT NOT NULL DEFAULT '0'",
                "alter ingredients add min_stock_threshold"
            )) {
            return false;
        }
    }

    if (!columnExists(m_db, "dish_sales", "reference_id")) {
        qInfo(migration) << "MigrationRunner: Adding dish_sales.reference_id column...";

        if (!executeQuery(
                "ALTER TABLE dish_sales ADD COLUMN reference_id TEXT",
                "alter dish_sales add reference_id"
            )) {
            return false;
        }
    }

    return true;
}

bool MigrationRunner::createIndexes()
{
    bool success = true;

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_batches_fifo "
        "ON inventory_batches(tenant_id, ingredient_id, status, received_at)",
        "createIndexes: batches_fifo"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_batches_expires ON inventory_batches(tenant_id, expires_at)",
        "createIndexes: batches_expires"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_batch ON inventory_movements(batch_id)",
        "createIndexes: movements_batch"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_type_date "
        "ON inventory_movements(tenant_id, type, created_at)",
        "createIndexes: movements_type_date"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_reference "
        "ON inventory_movements(reference_type, reference_id)",
        "createIndexes: movements_reference"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_recipes_tenant ON recipes(tenant_id)",
        "createIndexes: recipes_tenant"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_recipe_ingredients_recipe ON recipe_ingredients(recipe_id)",
        "createIndexes: recipe_ingredients_recipe"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_recipe_components_recipe ON recipe_components(recipe_id)",
        "createIndexes: recipe_components_recipe"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_dishes_tenant ON dishes(tenant_id, is_active)",
        "createIndexes: dishes_tenant"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_dish_sales_period ON dish_sales(tenant_id, sold_at)",
        "createIndexes: dish_sales_period"
    );

    return success;
}

bool MigrationRunner::createLedgerTriggers()
{
    bool success = true;

    // Журнал движений только дополняется, партии не удаляются
    success &= executeQuery(R"(
        CREATE TRIGGER IF NOT EXISTS trg_movements_no_update
        BEFORE UPDATE ON inventory_movements
        BEGIN
            SELECT RAISE(ABORT, 'inventory_movements is append-only');
        END
    )", "createLedgerTriggers: movements_no_update");

    success &= executeQuery(R"(
        CREATE TRIGGER IF NOT EXISTS trg_movements_no_delete
        BEFORE DELETE ON inventory_movements
        BEGIN
            SELECT RAISE(ABORT, 'inventory_movements is append-only');
        END
    )", "createLedgerTriggers: movements_no_delete");

    success &= executeQuery(R"(
        CREATE TRIGGER IF NOT EXISTS trg_batches_no_delete
        BEFORE DELETE ON inventory_batches
        BEGIN
            SELECT RAISE(ABORT, 'inventory_batches are never deleted');
        END
    )", "createLedgerTriggers: batches_no_delete");

    return success;
}

bool MigrationRunner::executeQuery(const QString &sql, const QString &errorContext)
{
    QSqlQuery query(m_db);

    if (!query.exec(sql)) {
        QString context = errorContext.isEmpty() ? "executeQuery" : errorContext;
        qCritical(migration) << "MigrationRunner:" << context << "- SQL error:" << query.lastError().text();
        qCritical(migration) << "MigrationRunner:" << context << "- SQL:" << sql;
        return false;
    }

    return true;
}

bool MigrationRunner::loadDemoData()
{
    QSqlQuery checkQuery(m_db);
    checkQuery.prepare("SELECT COUNT(*) FROM ingredients");
    if (!checkQuery.exec()) {
        qWarning(migration) << "MigrationRunner: Cannot check demo data:" << checkQuery.lastError().text();
        return false;
    }
    if (checkQuery.next() && checkQuery.value(0).toInt() > 0) {
        qInfo(migration) << "MigrationRunner: Demo data already exists, skipping";
        return true;
    }

    qInfo(migration) << "MigrationRunner: Loading demo data...";

    const QStringList statements = {
        R"(INSERT INTO ingredients (name, unit, category, shelf_life_days, allergens, min_stock_threshold) VALUES
('Flour', 'kg', 'Grains', 180, 'gluten', '5'),
('Potato', 'kg', 'Vegetables', 30, '', '10'),
('Onion', 'kg', 'Vegetables', 30, '', '3'),
('Carrot', 'kg', 'Vegetables', 21, '', '3'),
('Milk', 'l', 'Dairy', 5, 'lactose', '4'),
('Butter', 'kg', 'Dairy', 30, 'lactose', '1'),
('Beef', 'kg', 'Meat', 4, '', '2'))",

        R"(INSERT INTO inventory_batches (tenant_id, ingredient_id, unit_cost_cents, initial_quantity,
                               remaining_quantity, received_at, expires_at, supplier, status) VALUES
(1, 1, 200, '10', '10', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-10 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+170 days'), 'Mill Co', 'active'),
(1, 1, 250, '5', '5', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-6 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+174 days'), 'Mill Co', 'active'),
(1, 2, 80, '25', '25', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-3 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+27 days'), 'Farm Fresh', 'active'),
(1, 3, 120, '8', '8', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-3 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+27 days'), 'Farm Fresh', 'active'),
(1, 4, 90, '6', '6', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-3 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+18 days'), 'Farm Fresh', 'active'),
(1, 5, 110, '12', '12', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-2 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+1 days'), 'Dairy Land', 'active'),
(1, 6, 1200, '2', '2', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-2 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+28 days'), 'Dairy Land', 'active'),
(1, 7, 1500, '4', '4', strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '-1 days'), strftime('%Y-%m-%dT%H:%M:%fZ', 'now', '+3 days'), 'Butcher', 'active'))",

        R"(INSERT INTO inventory_movements (tenant_id, batch_id, type, quantity_delta, unit_cost_cents,
                                 total_cost_cents, reference_type, reason, created_at)
SELECT tenant_id, id, 'IN', initial_quantity, unit_cost_cents,
       CAST(ROUND(CAST(initial_quantity AS REAL) * unit_cost_cents) AS INTEGER),
       'receipt', 'demo data', received_at
FROM inventory_batches)",

        R"(INSERT INTO recipes (tenant_id, name, servings, recipe_type, instructions) VALUES
(1, 'Mashed potatoes', 4, 'preparation', 'Boil potatoes, mash with milk and butter'),
(1, 'Beef stew', 4, 'final', 'Brown beef, add vegetables, simmer'),
(1, 'Potato soup', 6, 'final', 'Simmer vegetables, blend'))",

        R"(INSERT INTO recipe_ingredients (recipe_id, ingredient_id, quantity, unit) VALUES
(1, 2, '1.2', 'kg'),
(1, 5, '0.3', 'l'),
(1, 6, '0.05', 'kg'),
(2, 7, '0.8', 'kg'),
(2, 3, '0.2', 'kg'),
(2, 4, '0.3', 'kg'),
(3, 2, '1', 'kg'),
(3, 3, '0.3', 'kg'),
(3, 5, '0.5', 'l'))",

        R"(INSERT INTO recipe_components (recipe_id, component_recipe_id, quantity) VALUES
(2, 1, '0.5'))",

        R"(INSERT INTO dishes (tenant_id, recipe_id, name, description, selling_price_cents) VALUES
(1, 2, 'Beef stew with mash', 'Served with mashed potatoes', 1450),
(1, 3, 'Potato soup', 'Creamy potato soup', 650))"
    };

    for (const QString &statement : statements) {
        if (!executeQuery(statement, "loadDemoData")) {
            qWarning(migration) << "MigrationRunner: Failed to execute demo data statement";
            return false;
        }
    }

    return true;
}
