#include "repositories/RecipeRepository.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(recipeRepo, "repository.recipe")

RecipeRepository::RecipeRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(recipeRepo) << "RecipeRepository: Database is not open";
    }
}

bool RecipeRepository::executeQuery(QSqlQuery &q, const QString &context) const
{
    if (!q.exec()) {
        qCritical(recipeRepo) << "RecipeRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(recipeRepo) << "RecipeRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

Recipe RecipeRepository::recipeFromQuery(const QSqlQuery &q) const
{
    Recipe r;
    r.id = q.value("id").toInt();
    r.tenantId = q.value("tenant_id").toInt();
    r.name = q.value("name").toString();
    r.servings = q.value("servings").toInt();
    r.type = recipeTypeFromString(q.value("recipe_type").toString());
    r.instructions = q.value("instructions").toString();
    r.createdAt = q.value("created_at").toString();
    return r;
}

int RecipeRepository::create(const Recipe &recipe)
{
    if (recipe.tenantId <= 0 || recipe.name.trimmed().isEmpty()) {
        qWarning(recipeRepo) << "RecipeRepository::create: tenant or name missing";
        return -1;
    }
    if (recipe.servings <= 0) {
        qWarning(recipeRepo) << "RecipeRepository::create: servings must be positive";
        return -1;
    }

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO recipes (tenant_id, name, servings, recipe_type, instructions)
        VALUES (:tenant, :name, :servings, :type, :instructions)
    )");
    q.bindValue(":tenant", recipe.tenantId);
    q.bindValue(":name", recipe.name.trimmed());
    q.bindValue(":servings", recipe.servings);
    q.bindValue(":type", recipeTypeToString(recipe.type));
    q.bindValue(":instructions", recipe.instructions.isEmpty() ? QVariant() : QVariant(recipe.instructions));

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    qInfo(recipeRepo) << "RecipeRepository::create: Created recipe" << recipe.name << "with id" << id;
    return id > 0 ? id : -1;
}

bool RecipeRepository::loadLines(Recipe &recipe)
{
    QSqlQuery li(m_db);
    li.prepare(R"(
        SELECT id, recipe_id, ingredient_id, quantity, unit
        FROM recipe_ingredients
        WHERE recipe_id = :recipe
        ORDER BY id
    )");
    li.bindValue(":recipe", recipe.id);
    if (!executeQuery(li, "loadLines: ingredients")) return false;

    while (li.next()) {
        RecipeIngredient line;
        line.id = li.value("id").toInt();
        line.recipeId = li.value("recipe_id").toInt();
        line.ingredientId = li.value("ingredient_id").toInt();
        line.quantity = decimalFromVariant(li.value("quantity"));
        line.unit = li.value("unit").toString();
        recipe.ingredients.append(line);
    }

    QSqlQuery co(m_db);
    co.prepare(R"(
        SELECT id, recipe_id, component_recipe_id, quantity
        FROM recipe_components
        WHERE recipe_id = :recipe
        ORDER BY id
    )");
    co.bindValue(":recipe", recipe.id);
    if (!executeQuery(co, "loadLines: components")) return false;

    while (co.next()) {
        RecipeComponent component;
        component.id = co.value("id").toInt();
        component.recipeId = co.value("recipe_id").toInt();
        component.componentRecipeId = co.value("component_recipe_id").toInt();
        component.quantity = decimalFromVariant(co.value("quantity"));
        recipe.components.append(component);
    }
    return true;
}

Recipe RecipeRepository::findById(int tenantId, int id)
{
    if (tenantId <= 0 || id <= 0) return Recipe();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, tenant_id, name, servings, recipe_type, instructions, created_at
        FROM recipes
        WHERE id = :id AND tenant_id = :tenant
    )");
    q.bindValue(":id", id);
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "findById")) return Recipe();
    if (!q.next()) return Recipe();

    Recipe recipe = recipeFromQuery(q);
    if (!loadLines(recipe)) return Recipe();
    return recipe;
}

QList<Recipe> RecipeRepository::findAll(int tenantId)
{
    QList<Recipe> res;
    if (tenantId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, tenant_id, name, servings, recipe_type, instructions, created_at
        FROM recipes
        WHERE tenant_id = :tenant
        ORDER BY name
    )");
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "findAll")) return res;
    while (q.next()) res.append(recipeFromQuery(q));

    for (auto &recipe : res) {
        if (!loadLines(recipe)) return QList<Recipe>();
    }
    return res;
}

int RecipeRepository::addIngredient(const RecipeIngredient &line)
{
    if (line.recipeId <= 0 || line.ingredientId <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO recipe_ingredients (recipe_id, ingredient_id, quantity, unit)
        VALUES (:recipe, :ingredient, :qty, :unit)
    )");
    q.bindValue(":recipe", line.recipeId);
    q.bindValue(":ingredient", line.ingredientId);
    q.bindValue(":qty", decimalToStorageString(line.quantity));
    q.bindValue(":unit", line.unit);

    if (!executeQuery(q, "addIngredient")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

int RecipeRepository::addComponent(const RecipeComponent &component)
{
    if (component.recipeId <= 0 || component.componentRecipeId <= 0) return -1;
    if (component.recipeId == component.componentRecipeId) {
        qWarning(recipeRepo) << "RecipeRepository::addComponent: recipe" << component.recipeId
                             << "cannot include itself";
        return -1;
    }

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO recipe_components (recipe_id, component_recipe_id, quantity)
        VALUES (:recipe, :component, :qty)
    )");
    q.bindValue(":recipe", component.recipeId);
    q.bindValue(":component", component.componentRecipeId);
    q.bindValue(":qty", decimalToStorageString(component.quantity));

    if (!executeQuery(q, "addComponent")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

bool RecipeRepository::removeIngredient(int recipeId, int ingredientId)
{
    QSqlQuery q(m_db);
    q.prepare("DELETE FROM recipe_ingredients WHERE recipe_id = :recipe AND ingredient_id = :ingredient");
    q.bindValue(":recipe", recipeId);
    q.bindValue(":ingredient", ingredientId);

    if (!executeQuery(q, "removeIngredient")) return false;
    return q.numRowsAffected() > 0;
}

bool RecipeRepository::removeComponent(int recipeId, int componentRecipeId)
{
    QSqlQuery q(m_db);
    q.prepare("DELETE FROM recipe_components WHERE recipe_id = :recipe AND component_recipe_id = :component");
    q.bindValue(":recipe", recipeId);
    q.bindValue(":component", componentRecipeId);

    if (!executeQuery(q, "removeComponent")) return false;
    return q.numRowsAffected() > 0;
}
