#ifndef INGREDIENTCOSTRESOLVER_H
#define INGREDIENTCOSTRESOLVER_H

#include <QObject>
#include <QList>

#include "CostingError.h"
#include "DecimalUtils.h"
#include "FifoDraw.h"
#include "repositories/IBatchRepository.h"
#include "repositories/IIngredientRepository.h"

struct CostResolution {
    CostingError error;
    int ingredientId = 0;
    Decimal quantity = 0;
    QList<BatchDraw> draws;
    Decimal exactCostCents = 0;
    qint64 costCents = 0;

    /**
     * @brief false, если остатков не хватило и недостача оценена по цене последней партии
     */
    bool coveredByStock = true;
    Decimal shortfall = 0;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Оценка стоимости ингредиента по активным партиям
 *
 * Та же раскладка по FIFO, что и при списании, но без изменения остатков
 * и без блокировок.
 */
class IngredientCostResolver : public QObject
{
    Q_OBJECT

public:
    explicit IngredientCostResolver(
        IBatchRepository* batchRepo,
        IIngredientRepository* ingredientRepo,
        QObject *parent = nullptr
    );

    /**
     * @brief Стоимость quantity ингредиента для тенанта
     *
     * NoStockAvailable, если у тенанта нет активных партий ингредиента с остатком.
     */
    CostResolution resolveCost(int tenantId, int ingredientId, const Decimal &quantity) const;

private:
    IBatchRepository* m_batchRepo;
    IIngredientRepository* m_ingredientRepo;
};

#endif // INGREDIENTCOSTRESOLVER_H
