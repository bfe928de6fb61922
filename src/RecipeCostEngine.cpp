#include "RecipeCostEngine.h"

#include <QDebug>
#include <QHash>
#include <QLoggingCategory>
#include <QStringList>

Q_LOGGING_CATEGORY(recipeCosting, "service.recipe_costing")

struct RecipeCostEngine::Subtotal {
    QString name;
    int servings = 1;
    Decimal exactCents = 0;
    QMap<int, IngredientCostLine> lines;
    bool coveredByStock = true;
};

struct RecipeCostEngine::TraversalContext {
    int tenantId = 0;
    QList<int> stack;
    QStringList names;
    QHash<int, Subtotal> memo;
};

static void mergeLine(QMap<int, IngredientCostLine> &lines, const IngredientCostLine &line, const Decimal &factor)
{
    IngredientCostLine &target = lines[line.ingredientId];
    target.ingredientId = line.ingredientId;
    target.quantity += line.quantity * factor;
    target.exactCostCents += line.exactCostCents * factor;
    target.coveredByStock = target.coveredByStock && line.coveredByStock;
}

RecipeCostEngine::RecipeCostEngine(
    IRecipeRepository* recipeRepo,
    const IngredientCostResolver* resolver,
    int maxDepth,
    QObject *parent
)
    : QObject(parent)
    , m_recipeRepo(recipeRepo)
    , m_resolver(resolver)
    , m_maxDepth(maxDepth)
{
}

RecipeCost RecipeCostEngine::calculateCost(int tenantId, int recipeId) const
{
    RecipeCost result;
    result.recipeId = recipeId;

    TraversalContext context;
    context.tenantId = tenantId;

    Subtotal total;
    result.error = costRecipe(context, recipeId, 1, total);
    if (result.error.isError()) {
        qWarning(recipeCosting) << "RecipeCostEngine::calculateCost: recipe" << recipeId << "-"
                                << result.error.toString();
        return result;
    }

    result.recipeName = total.name;
    result.servings = total.servings;
    result.exactTotalCents = total.exactCents;
    result.totalCostCents = roundHalfUp(total.exactCents);
    result.costPerServingCents = roundHalfUp(total.exactCents / total.servings);
    result.breakdown = total.lines.values();
    result.coveredByStock = total.coveredByStock;

    qDebug(recipeCosting) << "RecipeCostEngine::calculateCost:" << total.name
                          << "total" << result.totalCostCents << "per serving" << result.costPerServingCents;
    return result;
}

RecipeRequirements RecipeCostEngine::requirements(int tenantId, int recipeId, const Decimal &multiplier) const
{
    RecipeRequirements result;

    if (!isPositiveQuantity(multiplier)) {
        result.error = CostingError::make(CostingErrorCode::InvalidQuantity,
            QString("Recipe multiplier must be positive, got %1").arg(decimalToStorageString(multiplier)));
        return result;
    }

    TraversalContext context;
    context.tenantId = tenantId;
    result.error = collectRequirements(context, recipeId, 1, multiplier, result.quantities);
    if (result.error.isError()) {
        result.quantities.clear();
    }
    return result;
}

CostingError RecipeCostEngine::enterRecipe(TraversalContext &context, int recipeId, int depth) const
{
    const int index = context.stack.indexOf(recipeId);
    if (index >= 0) {
        QStringList chain = context.names.mid(index);
        chain.append(context.names.at(index));
        return CostingError::make(CostingErrorCode::CircularRecipeReference,
            QString("Circular recipe reference: %1").arg(chain.join(" -> ")));
    }

    if (depth > m_maxDepth) {
        return CostingError::make(CostingErrorCode::RecursionDepthExceeded,
            QString("Recipe nesting exceeds %1 levels: %2")
                .arg(m_maxDepth).arg(context.names.join(" -> ")));
    }

    return CostingError();
}

CostingError RecipeCostEngine::costRecipe(TraversalContext &context, int recipeId, int depth, Subtotal &out) const
{
    const CostingError entryError = enterRecipe(context, recipeId, depth);
    if (entryError.isError()) {
        return entryError;
    }

    const auto cached = context.memo.constFind(recipeId);
    if (cached != context.memo.constEnd()) {
        out = cached.value();
        return CostingError();
    }

    const Recipe recipe = m_recipeRepo->findById(context.tenantId, recipeId);
    if (!recipe.isValid()) {
        return CostingError::make(CostingErrorCode::NotFound,
            QString("Recipe %1 not found").arg(recipeId));
    }

    Subtotal subtotal;
    subtotal.name = recipe.name;
    subtotal.servings = recipe.servings > 0 ? recipe.servings : 1;

    for (const auto &line : recipe.ingredients) {
        const CostResolution cost = m_resolver->resolveCost(context.tenantId, line.ingredientId, line.quantity);
        if (!cost.isOk()) {
            CostingError error = cost.error;
            error.message = QString("%1 (in recipe %2)").arg(error.message, recipe.name);
            return error;
        }

        IngredientCostLine costLine;
        costLine.ingredientId = line.ingredientId;
        costLine.quantity = line.quantity;
        costLine.exactCostCents = cost.exactCostCents;
        costLine.coveredByStock = cost.coveredByStock;
        mergeLine(subtotal.lines, costLine, Decimal(1));

        subtotal.exactCents += cost.exactCostCents;
        subtotal.coveredByStock = subtotal.coveredByStock && cost.coveredByStock;
    }

    context.stack.append(recipe.id);
    context.names.append(recipe.name);

    for (const auto &component : recipe.components) {
        if (!isPositiveQuantity(component.quantity)) {
            return CostingError::make(CostingErrorCode::InvalidQuantity,
                QString("Component fraction in recipe %1 must be positive").arg(recipe.name));
        }

        Subtotal child;
        const CostingError error = costRecipe(context, component.componentRecipeId, depth + 1, child);
        if (error.isError()) {
            return error;
        }

        subtotal.exactCents += component.quantity * child.exactCents;
        subtotal.coveredByStock = subtotal.coveredByStock && child.coveredByStock;
        for (const auto &childLine : child.lines) {
            mergeLine(subtotal.lines, childLine, component.quantity);
        }
    }

    context.stack.removeLast();
    context.names.removeLast();

    context.memo.insert(recipe.id, subtotal);
    out = subtotal;
    return CostingError();
}

CostingError RecipeCostEngine::collectRequirements(TraversalContext &context, int recipeId, int depth,
                                                   const Decimal &multiplier, QMap<int, Decimal> &out) const
{
    const CostingError entryError = enterRecipe(context, recipeId, depth);
    if (entryError.isError()) {
        return entryError;
    }

    const Recipe recipe = m_recipeRepo->findById(context.tenantId, recipeId);
    if (!recipe.isValid()) {
        return CostingError::make(CostingErrorCode::NotFound,
            QString("Recipe %1 not found").arg(recipeId));
    }

    for (const auto &line : recipe.ingredients) {
        out[line.ingredientId] += line.quantity * multiplier;
    }

    context.stack.append(recipe.id);
    context.names.append(recipe.name);

    for (const auto &component : recipe.components) {
        if (!isPositiveQuantity(component.quantity)) {
            return CostingError::make(CostingErrorCode::InvalidQuantity,
                QString("Component fraction in recipe %1 must be positive").arg(recipe.name));
        }

        const CostingError error = collectRequirements(context, component.componentRecipeId, depth + 1,
                                                       multiplier * component.quantity, out);
        if (error.isError()) {
            return error;
        }
    }

    context.stack.removeLast();
    context.names.removeLast();
    return CostingError();
}
