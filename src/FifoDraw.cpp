#include "FifoDraw.h"

FifoPlan planFifoDraw(const QList<InventoryBatch> &batches, const Decimal &quantity)
{
    FifoPlan plan;
    Decimal needed = quantity;

    for (const auto &batch : batches) {
        if (needed <= 0) break;
        if (!batch.hasStock()) continue;

        BatchDraw draw;
        draw.batchId = batch.id;
        draw.quantity = minDecimal(needed, batch.remainingQuantity);
        draw.unitCostCents = batch.unitCostCents;

        plan.drawnQuantity += draw.quantity;
        plan.exactCostCents += draw.costCents();
        needed -= draw.quantity;
        plan.draws.append(draw);
    }

    plan.shortfall = needed > 0 ? needed : Decimal(0);
    return plan;
}
