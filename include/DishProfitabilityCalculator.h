#ifndef DISHPROFITABILITYCALCULATOR_H
#define DISHPROFITABILITYCALCULATOR_H

#include <QObject>
#include <QList>
#include <QString>

#include "CostingError.h"
#include "DecimalUtils.h"
#include "RecipeCostEngine.h"
#include "repositories/IDishRepository.h"

enum class ProfitWarning {
    LowMargin,
    HighFoodCost
};

QString profitWarningToString(ProfitWarning warning);

/**
 * @brief Пороги предупреждений: маржа ниже minMarginPercent, фудкост выше maxFoodCostPercent
 */
struct ProfitThresholds {
    Decimal minMarginPercent = 60;
    Decimal maxFoodCostPercent = 35;
};

struct DishFinancials {
    CostingError error;
    int dishId = 0;
    QString dishName;

    qint64 sellingPriceCents = 0;
    qint64 recipeCostCents = 0;
    qint64 profitCents = 0;

    Decimal profitMarginPercent = 0;
    Decimal foodCostPercent = 0;

    QList<ProfitWarning> warnings;
    bool coveredByStock = true;

    bool isOk() const { return !error.isError(); }
    bool hasWarning(ProfitWarning warning) const { return warnings.contains(warning); }
};

class DishProfitabilityCalculator : public QObject
{
    Q_OBJECT

public:
    explicit DishProfitabilityCalculator(
        IDishRepository* dishRepo,
        const RecipeCostEngine* costEngine,
        const ProfitThresholds &thresholds = ProfitThresholds(),
        QObject *parent = nullptr
    );

    /**
     * @brief Финансовые показатели блюда по текущей себестоимости рецепта
     */
    DishFinancials analyze(int tenantId, int dishId) const;

    /**
     * @brief Показатели по цене и себестоимости
     *
     * Маржа считается как 100 - фудкост, поэтому их сумма всегда ровно 100.
     */
    static DishFinancials evaluate(qint64 sellingPriceCents, qint64 recipeCostCents,
                                   const ProfitThresholds &thresholds);

    const ProfitThresholds &thresholds() const { return m_thresholds; }

private:
    IDishRepository* m_dishRepo;
    const RecipeCostEngine* m_costEngine;
    ProfitThresholds m_thresholds;
};

#endif // DISHPROFITABILITYCALCULATOR_H
