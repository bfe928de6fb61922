#include "IngredientCostResolver.h"

#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(costResolver, "service.cost_resolver")

IngredientCostResolver::IngredientCostResolver(
    IBatchRepository* batchRepo,
    IIngredientRepository* ingredientRepo,
    QObject *parent
)
    : QObject(parent)
    , m_batchRepo(batchRepo)
    , m_ingredientRepo(ingredientRepo)
{
}

CostResolution IngredientCostResolver::resolveCost(int tenantId, int ingredientId, const Decimal &quantity) const
{
    CostResolution result;
    result.ingredientId = ingredientId;
    result.quantity = quantity;

    if (!isPositiveQuantity(quantity)) {
        result.error = CostingError::make(CostingErrorCode::InvalidQuantity,
            QString("Quantity of ingredient %1 must be positive, got %2")
                .arg(ingredientId).arg(decimalToStorageString(quantity)));
        return result;
    }

    const QList<InventoryBatch> active = m_batchRepo->findActiveBatches(tenantId, ingredientId);
    if (active.isEmpty()) {
        const Ingredient ingredient = m_ingredientRepo->findById(ingredientId);
        const QString label = ingredient.isValid() ? ingredient.name : QString("ingredient #%1").arg(ingredientId);
        result.error = CostingError::make(CostingErrorCode::NoStockAvailable,
            QString("No stock available for %1, cost is unknown").arg(label));
        qDebug(costResolver) << "IngredientCostResolver::resolveCost:" << result.error.message;
        return result;
    }

    const FifoPlan plan = planFifoDraw(active, quantity);
    result.draws = plan.draws;
    result.exactCostCents = plan.exactCostCents;

    if (!plan.isCovered()) {
        // Недостачу оцениваем по последней закупочной цене
        const qint64 latestUnitCost = active.last().unitCostCents;
        result.exactCostCents += plan.shortfall * decimalFromCents(latestUnitCost);
        result.coveredByStock = false;
        result.shortfall = plan.shortfall;
        qDebug(costResolver) << "IngredientCostResolver::resolveCost: ingredient" << ingredientId
                             << "short by" << decimalToStorageString(plan.shortfall)
                             << "- priced at" << latestUnitCost << "cents";
    }

    result.costCents = roundHalfUp(result.exactCostCents);
    return result;
}
