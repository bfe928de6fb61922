#include "repositories/IngredientRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(ingredientRepo, "repository.ingredient")

IngredientRepository::IngredientRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(ingredientRepo) << "IngredientRepository: Database is not open";
    }
}

int IngredientRepository::create(const Ingredient &ingredient)
{
    if (ingredient.name.trimmed().isEmpty()) {
        qWarning(ingredientRepo) << "IngredientRepository::create: Ingredient name is empty";
        return -1;
    }

    QSqlQuery query(m_db);
    query.prepare(R"(
        INSERT INTO ingredients (name, unit, category, shelf_life_days, allergens, min_stock_threshold, is_active)
        VALUES (:name, :unit, :category, :shelf_life, :allergens, :min_stock, :is_active)
    )");

    query.bindValue(":name", ingredient.name.trimmed());
    query.bindValue(":unit", ingredient.unit);
    query.bindValue(":category", ingredient.category);
    query.bindValue(":shelf_life", ingredient.shelfLifeDays);
    query.bindValue(":allergens", ingredient.allergens.join(','));
    query.bindValue(":min_stock", decimalToStorageString(ingredient.minStockThreshold));
    query.bindValue(":is_active", ingredient.isActive ? 1 : 0);

    if (!executeQuery(query, "create")) {
        return -1;
    }

    int newId = query.lastInsertId().toInt();
    qInfo(ingredientRepo) << "IngredientRepository::create: Created ingredient with id" << newId;
    return newId;
}

Ingredient IngredientRepository::findById(int id)
{
    if (id <= 0) {
        return Ingredient();
    }

    QSqlQuery query(m_db);
    query.prepare("SELECT id, name, unit, category, shelf_life_days, allergens, min_stock_threshold, "
                  "is_active, created_at FROM ingredients WHERE id = :id");
    query.bindValue(":id", id);

    if (!executeQuery(query, "findById")) {
        return Ingredient();
    }

    if (!query.next()) {
        qDebug(ingredientRepo) << "IngredientRepository::findById: Ingredient with id" << id << "not found";
        return Ingredient();
    }

    return ingredientFromQuery(query);
}

QList<Ingredient> IngredientRepository::findAll()
{
    QList<Ingredient> ingredients;

    QSqlQuery query(m_db);
    query.prepare("SELECT id, name, unit, category, shelf_life_days, allergens, min_stock_threshold, "
                  "is_active, created_at FROM ingredients ORDER BY name");

    if (!executeQuery(query, "findAll")) {
        return ingredients;
    }

    while (query.next()) {
        ingredients.append(ingredientFromQuery(query));
    }

    qDebug(ingredientRepo) << "IngredientRepository::findAll: Found" << ingredients.size() << "ingredients";
    return ingredients;
}

bool IngredientRepository::exists(int id)
{
    if (id <= 0) {
        return false;
    }

    QSqlQuery query(m_db);
    query.prepare("SELECT 1 FROM ingredients WHERE id = :id");
    query.bindValue(":id", id);

    if (!executeQuery(query, "exists")) {
        return false;
    }

    return query.next();
}

Ingredient IngredientRepository::ingredientFromQuery(const QSqlQuery &query) const
{
    Ingredient ingredient;
    ingredient.id = query.value("id").toInt();
    ingredient.name = query.value("name").toString();
    ingredient.unit = query.value("unit").toString();
    ingredient.category = query.value("category").toString();
    ingredient.shelfLifeDays = query.value("shelf_life_days").toInt();
    ingredient.allergens = query.value("allergens").toString().split(',', Qt::SkipEmptyParts);
    ingredient.minStockThreshold = decimalFromVariant(query.value("min_stock_threshold"));
    ingredient.isActive = query.value("is_active").toInt() == 1;
    ingredient.createdAt = query.value("created_at").toString();
    return ingredient;
}

bool IngredientRepository::executeQuery(QSqlQuery &query, const QString &context) const
{
    if (!query.exec()) {
        qCritical(ingredientRepo) << "IngredientRepository::" << context << "- SQL error:" << query.lastError().text();
        qCritical(ingredientRepo) << "IngredientRepository::" << context << "- SQL:" << query.executedQuery();
        return false;
    }
    return true;
}
