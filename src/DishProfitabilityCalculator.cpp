#include "DishProfitabilityCalculator.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QStringList>

Q_LOGGING_CATEGORY(dishProfitability, "service.dish_profitability")

QString profitWarningToString(ProfitWarning warning)
{
    switch (warning) {
        case ProfitWarning::LowMargin:    return "LowMarginWarning";
        case ProfitWarning::HighFoodCost: return "HighFoodCostWarning";
    }
    return QString();
}

DishProfitabilityCalculator::DishProfitabilityCalculator(
    IDishRepository* dishRepo,
    const RecipeCostEngine* costEngine,
    const ProfitThresholds &thresholds,
    QObject *parent
)
    : QObject(parent)
    , m_dishRepo(dishRepo)
    , m_costEngine(costEngine)
    , m_thresholds(thresholds)
{
}

DishFinancials DishProfitabilityCalculator::evaluate(qint64 sellingPriceCents, qint64 recipeCostCents,
                                                     const ProfitThresholds &thresholds)
{
    DishFinancials result;

    if (sellingPriceCents <= 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidPrice,
            QString("Selling price must be positive, got %1 cents").arg(sellingPriceCents));
        return result;
    }
    if (recipeCostCents < 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidPrice,
            QString("Recipe cost must not be negative, got %1 cents").arg(recipeCostCents));
        return result;
    }

    result.sellingPriceCents = sellingPriceCents;
    result.recipeCostCents = recipeCostCents;
    result.profitCents = sellingPriceCents - recipeCostCents;

    result.foodCostPercent = Decimal(100) * decimalFromCents(recipeCostCents) / decimalFromCents(sellingPriceCents);
    result.profitMarginPercent = Decimal(100) - result.foodCostPercent;

    if (result.profitMarginPercent < thresholds.minMarginPercent) {
        result.warnings.append(ProfitWarning::LowMargin);
    }
    if (result.foodCostPercent > thresholds.maxFoodCostPercent) {
        result.warnings.append(ProfitWarning::HighFoodCost);
    }

    return result;
}

DishFinancials DishProfitabilityCalculator::analyze(int tenantId, int dishId) const
{
    const Dish dish = m_dishRepo->findById(tenantId, dishId);
    if (!dish.isValid()) {
        DishFinancials missing;
        missing.dishId = dishId;
        missing.error = CostingError::make(CostingErrorCode::NotFound,
            QString("Dish %1 not found").arg(dishId));
        return missing;
    }

    const RecipeCost cost = m_costEngine->calculateCost(tenantId, dish.recipeId);
    if (!cost.isOk()) {
        DishFinancials failed;
        failed.dishId = dish.id;
        failed.dishName = dish.name;
        failed.sellingPriceCents = dish.sellingPriceCents;
        failed.error = cost.error;
        return failed;
    }

    DishFinancials result = evaluate(dish.sellingPriceCents, cost.totalCostCents, m_thresholds);
    result.dishId = dish.id;
    result.dishName = dish.name;
    result.coveredByStock = cost.coveredByStock;

    if (result.isOk() && !result.warnings.isEmpty()) {
        QStringList names;
        for (ProfitWarning warning : result.warnings) {
            names.append(profitWarningToString(warning));
        }
        qInfo(dishProfitability) << "DishProfitabilityCalculator::analyze:" << dish.name
                                 << "margin" << decimalToString(result.profitMarginPercent)
                                 << "food cost" << decimalToString(result.foodCostPercent)
                                 << names.join(", ");
    }
    return result;
}
