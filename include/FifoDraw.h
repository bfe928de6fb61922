#ifndef FIFODRAW_H
#define FIFODRAW_H

#include <QList>

#include "DecimalUtils.h"
#include "repositories/IBatchRepository.h"

/**
 * @brief Сколько взято из одной партии и по какой цене
 */
struct BatchDraw {
    int batchId = 0;
    Decimal quantity = 0;
    qint64 unitCostCents = 0;

    Decimal costCents() const { return quantity * decimalFromCents(unitCostCents); }
};

/**
 * @brief План списания по FIFO
 *
 * exactCostCents не округляется: округление выполняет вызывающая сторона один раз.
 */
struct FifoPlan {
    QList<BatchDraw> draws;
    Decimal drawnQuantity = 0;
    Decimal shortfall = 0;
    Decimal exactCostCents = 0;

    bool isCovered() const { return shortfall == 0; }
};

/**
 * @brief Разложить quantity по партиям, которые уже отсортированы в порядке FIFO
 *
 * Партии без остатка и неактивные пропускаются. Сами партии не изменяются.
 */
FifoPlan planFifoDraw(const QList<InventoryBatch> &batches, const Decimal &quantity);

#endif // FIFODRAW_H
