#include "RecipeCatalogService.h"

#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(catalogService, "service.catalog")

RecipeCatalogService::RecipeCatalogService(
    IRecipeRepository* recipeRepo,
    IIngredientRepository* ingredientRepo,
    IDishRepository* dishRepo,
    int maxDepth,
    QObject *parent
)
    : QObject(parent)
    , m_recipeRepo(recipeRepo)
    , m_ingredientRepo(ingredientRepo)
    , m_dishRepo(dishRepo)
    , m_maxDepth(maxDepth)
{
}

static CatalogResult failed(CostingErrorCode code, const QString &message)
{
    CatalogResult result;
    result.error = CostingError::make(code, message);
    qWarning(catalogService) << "RecipeCatalogService:" << result.error.toString();
    return result;
}

CatalogResult RecipeCatalogService::createRecipe(int tenantId, const QString &name, int servings, RecipeType type,
                                                 const QString &instructions)
{
    if (tenantId <= 0) {
        return failed(CostingErrorCode::InvalidReference, "Tenant id is required");
    }
    if (name.trimmed().isEmpty()) {
        return failed(CostingErrorCode::InvalidReference, "Recipe name is empty");
    }
    if (servings <= 0) {
        return failed(CostingErrorCode::InvalidQuantity,
            QString("Servings must be positive, got %1").arg(servings));
    }

    Recipe recipe;
    recipe.tenantId = tenantId;
    recipe.name = name.trimmed();
    recipe.servings = servings;
    recipe.type = type;
    recipe.instructions = instructions;

    CatalogResult result;
    result.id = m_recipeRepo->create(recipe);
    if (result.id <= 0) {
        return failed(CostingErrorCode::StorageFailure,
            QString("Cannot create recipe %1 (duplicate name?)").arg(recipe.name));
    }

    qInfo(catalogService) << "RecipeCatalogService::createRecipe:" << recipe.name << "id" << result.id
                          << recipeTypeToString(type);
    return result;
}

CatalogResult RecipeCatalogService::addIngredient(int tenantId, int recipeId, int ingredientId,
                                                  const Decimal &quantity, const QString &unit)
{
    if (!isPositiveQuantity(quantity)) {
        return failed(CostingErrorCode::InvalidQuantity,
            QString("Ingredient quantity must be positive, got %1").arg(decimalToStorageString(quantity)));
    }

    const Recipe recipe = m_recipeRepo->findById(tenantId, recipeId);
    if (!recipe.isValid()) {
        return failed(CostingErrorCode::NotFound, QString("Recipe %1 not found").arg(recipeId));
    }

    const Ingredient ingredient = m_ingredientRepo->findById(ingredientId);
    if (!ingredient.isValid()) {
        return failed(CostingErrorCode::NotFound, QString("Ingredient %1 not found").arg(ingredientId));
    }

    RecipeIngredient line;
    line.recipeId = recipe.id;
    line.ingredientId = ingredient.id;
    line.quantity = quantity;
    line.unit = unit.isEmpty() ? ingredient.unit : unit;

    CatalogResult result;
    result.id = m_recipeRepo->addIngredient(line);
    if (result.id <= 0) {
        return failed(CostingErrorCode::StorageFailure,
            QString("Cannot add %1 to recipe %2").arg(ingredient.name, recipe.name));
    }
    return result;
}

bool RecipeCatalogService::findPath(int tenantId, int fromRecipeId, int targetRecipeId, int depth,
                                    QStringList &path) const
{
    if (depth > m_maxDepth) {
        return false;
    }

    const Recipe recipe = m_recipeRepo->findById(tenantId, fromRecipeId);
    if (!recipe.isValid()) {
        return false;
    }

    path.append(recipe.name);
    if (recipe.id == targetRecipeId) {
        return true;
    }

    for (const auto &component : recipe.components) {
        if (findPath(tenantId, component.componentRecipeId, targetRecipeId, depth + 1, path)) {
            return true;
        }
    }

    path.removeLast();
    return false;
}

CatalogResult RecipeCatalogService::addComponent(int tenantId, int recipeId, int componentRecipeId,
                                                 const Decimal &fraction)
{
    if (!isPositiveQuantity(fraction)) {
        return failed(CostingErrorCode::InvalidQuantity,
            QString("Component fraction must be positive, got %1").arg(decimalToStorageString(fraction)));
    }

    const Recipe recipe = m_recipeRepo->findById(tenantId, recipeId);
    if (!recipe.isValid()) {
        return failed(CostingErrorCode::NotFound, QString("Recipe %1 not found").arg(recipeId));
    }

    if (recipeId == componentRecipeId) {
        return failed(CostingErrorCode::CircularRecipeReference,
            QString("Recipe %1 cannot contain itself").arg(recipe.name));
    }

    const Recipe component = m_recipeRepo->findById(tenantId, componentRecipeId);
    if (!component.isValid()) {
        return failed(CostingErrorCode::InvalidReference,
            QString("Component recipe %1 does not belong to this tenant").arg(componentRecipeId));
    }

    for (const auto &existing : recipe.components) {
        if (existing.componentRecipeId == componentRecipeId) {
            return failed(CostingErrorCode::InvalidReference,
                QString("Recipe %1 already contains %2").arg(recipe.name, component.name));
        }
    }

    QStringList path;
    if (findPath(tenantId, componentRecipeId, recipeId, 1, path)) {
        path.prepend(recipe.name);
        return failed(CostingErrorCode::CircularRecipeReference,
            QString("Circular recipe reference: %1").arg(path.join(" -> ")));
    }

    RecipeComponent line;
    line.recipeId = recipe.id;
    line.componentRecipeId = component.id;
    line.quantity = fraction;

    CatalogResult result;
    result.id = m_recipeRepo->addComponent(line);
    if (result.id <= 0) {
        return failed(CostingErrorCode::StorageFailure,
            QString("Cannot add %1 to recipe %2").arg(component.name, recipe.name));
    }
    return result;
}

CatalogResult RecipeCatalogService::removeIngredient(int tenantId, int recipeId, int ingredientId)
{
    const Recipe recipe = m_recipeRepo->findById(tenantId, recipeId);
    if (!recipe.isValid()) {
        return failed(CostingErrorCode::NotFound, QString("Recipe %1 not found").arg(recipeId));
    }
    if (!m_recipeRepo->removeIngredient(recipe.id, ingredientId)) {
        return failed(CostingErrorCode::NotFound,
            QString("Recipe %1 has no ingredient %2").arg(recipe.name).arg(ingredientId));
    }

    CatalogResult result;
    result.id = recipe.id;
    return result;
}

CatalogResult RecipeCatalogService::removeComponent(int tenantId, int recipeId, int componentRecipeId)
{
    const Recipe recipe = m_recipeRepo->findById(tenantId, recipeId);
    if (!recipe.isValid()) {
        return failed(CostingErrorCode::NotFound, QString("Recipe %1 not found").arg(recipeId));
    }
    if (!m_recipeRepo->removeComponent(recipe.id, componentRecipeId)) {
        return failed(CostingErrorCode::NotFound,
            QString("Recipe %1 has no component %2").arg(recipe.name).arg(componentRecipeId));
    }

    CatalogResult result;
    result.id = recipe.id;
    return result;
}

CatalogResult RecipeCatalogService::createDish(int tenantId, int recipeId, const QString &name,
                                               qint64 sellingPriceCents, const QString &description)
{
    if (sellingPriceCents <= 0) {
        return failed(CostingErrorCode::InvalidPrice,
            QString("Selling price must be positive, got %1 cents").arg(sellingPriceCents));
    }
    if (name.trimmed().isEmpty()) {
        return failed(CostingErrorCode::InvalidReference, "Dish name is empty");
    }

    const Recipe recipe = m_recipeRepo->findById(tenantId, recipeId);
    if (!recipe.isValid()) {
        return failed(CostingErrorCode::InvalidReference,
            QString("Recipe %1 does not belong to this tenant").arg(recipeId));
    }
    if (recipe.type != RecipeType::Final) {
        return failed(CostingErrorCode::InvalidReference,
            QString("Recipe %1 is a preparation and cannot be sold as a dish").arg(recipe.name));
    }

    Dish dish;
    dish.tenantId = tenantId;
    dish.recipeId = recipe.id;
    dish.name = name.trimmed();
    dish.description = description;
    dish.sellingPriceCents = sellingPriceCents;
    dish.isActive = true;

    CatalogResult result;
    result.id = m_dishRepo->create(dish);
    if (result.id <= 0) {
        return failed(CostingErrorCode::StorageFailure, QString("Cannot create dish %1").arg(dish.name));
    }

    qInfo(catalogService) << "RecipeCatalogService::createDish:" << dish.name << "id" << result.id
                          << "price" << sellingPriceCents;
    return result;
}

CatalogResult RecipeCatalogService::updateDishPrice(int tenantId, int dishId, qint64 sellingPriceCents)
{
    if (sellingPriceCents <= 0) {
        return failed(CostingErrorCode::InvalidPrice,
            QString("Selling price must be positive, got %1 cents").arg(sellingPriceCents));
    }

    Dish dish = m_dishRepo->findById(tenantId, dishId);
    if (!dish.isValid()) {
        return failed(CostingErrorCode::NotFound, QString("Dish %1 not found").arg(dishId));
    }

    dish.sellingPriceCents = sellingPriceCents;
    if (!m_dishRepo->update(dish)) {
        return failed(CostingErrorCode::StorageFailure, QString("Cannot update dish %1").arg(dish.name));
    }

    CatalogResult result;
    result.id = dish.id;
    return result;
}

CatalogResult RecipeCatalogService::setDishActive(int tenantId, int dishId, bool active)
{
    if (!m_dishRepo->setActive(tenantId, dishId, active)) {
        return failed(CostingErrorCode::NotFound, QString("Dish %1 not found").arg(dishId));
    }

    CatalogResult result;
    result.id = dishId;
    qInfo(catalogService) << "RecipeCatalogService::setDishActive: dish" << dishId << "active" << active;
    return result;
}
