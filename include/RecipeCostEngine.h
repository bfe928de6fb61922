#ifndef RECIPECOSTENGINE_H
#define RECIPECOSTENGINE_H

#include <QObject>
#include <QList>
#include <QMap>
#include <QString>

#include "CostingError.h"
#include "DecimalUtils.h"
#include "IngredientCostResolver.h"
#include "repositories/IRecipeRepository.h"

/**
 * @brief Вклад одного сырьевого ингредиента в стоимость рецепта (с учётом вложенных рецептов)
 */
struct IngredientCostLine {
    int ingredientId = 0;
    Decimal quantity = 0;
    Decimal exactCostCents = 0;
    bool coveredByStock = true;
};

struct RecipeCost {
    CostingError error;
    int recipeId = 0;
    QString recipeName;
    int servings = 1;

    Decimal exactTotalCents = 0;
    qint64 totalCostCents = 0;
    qint64 costPerServingCents = 0;

    QList<IngredientCostLine> breakdown;
    bool coveredByStock = true;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Сырьё, необходимое для приготовления рецепта, по ингредиентам
 */
struct RecipeRequirements {
    CostingError error;
    QMap<int, Decimal> quantities;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Рекурсивная калькуляция рецептов с полуфабрикатами
 *
 * Стоимость = сумма стоимостей ингредиентов + доля * стоимость каждого
 * вложенного рецепта. Промежуточные суммы не округляются, округление
 * выполняется один раз (половина вверх). Результаты вложенных рецептов
 * кешируются только в пределах одного вызова.
 */
class RecipeCostEngine : public QObject
{
    Q_OBJECT

public:
    explicit RecipeCostEngine(
        IRecipeRepository* recipeRepo,
        const IngredientCostResolver* resolver,
        int maxDepth = 32,
        QObject *parent = nullptr
    );

    RecipeCost calculateCost(int tenantId, int recipeId) const;

    /**
     * @brief Развернуть рецепт в сырьё, умноженное на multiplier
     */
    RecipeRequirements requirements(int tenantId, int recipeId, const Decimal &multiplier) const;

    int maxDepth() const { return m_maxDepth; }

private:
    struct Subtotal;
    struct TraversalContext;

    CostingError enterRecipe(TraversalContext &context, int recipeId, int depth) const;

    CostingError costRecipe(TraversalContext &context, int recipeId, int depth, Subtotal &out) const;

    CostingError collectRequirements(TraversalContext &context, int recipeId, int depth,
                                     const Decimal &multiplier, QMap<int, Decimal> &out) const;

private:
    IRecipeRepository* m_recipeRepo;
    const IngredientCostResolver* m_resolver;
    int m_maxDepth;
};

#endif // RECIPECOSTENGINE_H
