// FIFO draw planning tests

#include <gtest/gtest.h>

#include "FifoDraw.h"

namespace {

InventoryBatch makeBatch(int id, const char *remaining, qint64 unitCostCents,
                         BatchStatus status = BatchStatus::Active)
{
    InventoryBatch batch;
    batch.id = id;
    batch.tenantId = 1;
    batch.ingredientId = 1;
    batch.unitCostCents = unitCostCents;
    batch.initialQuantity = Decimal(remaining);
    batch.remainingQuantity = Decimal(remaining);
    batch.status = status;
    return batch;
}

}  // namespace

TEST(FifoDrawTest, SplitsAcrossBatchesInOrder) {
    const QList<InventoryBatch> batches = {makeBatch(1, "6", 100), makeBatch(2, "10", 150)};

    const FifoPlan plan = planFifoDraw(batches, Decimal(10));

    ASSERT_TRUE(plan.isCovered());
    ASSERT_EQ(plan.draws.size(), 2);
    EXPECT_EQ(plan.draws[0].batchId, 1);
    EXPECT_EQ(plan.draws[0].quantity, Decimal(6));
    EXPECT_EQ(plan.draws[1].batchId, 2);
    EXPECT_EQ(plan.draws[1].quantity, Decimal(4));
    // 6 x 100 + 4 x 150, not an average of the two prices
    EXPECT_EQ(plan.exactCostCents, Decimal(1200));
}

TEST(FifoDrawTest, StopsAtFirstBatchWhenItCovers) {
    const QList<InventoryBatch> batches = {makeBatch(1, "10", 200), makeBatch(2, "5", 250)};

    const FifoPlan plan = planFifoDraw(batches, Decimal("2.5"));

    ASSERT_EQ(plan.draws.size(), 1);
    EXPECT_EQ(plan.draws[0].batchId, 1);
    EXPECT_EQ(plan.exactCostCents, Decimal(500));
    EXPECT_EQ(plan.drawnQuantity, Decimal("2.5"));
}

TEST(FifoDrawTest, ReportsShortfall) {
    const QList<InventoryBatch> batches = {makeBatch(1, "3", 100), makeBatch(2, "2", 100)};

    const FifoPlan plan = planFifoDraw(batches, Decimal(8));

    EXPECT_FALSE(plan.isCovered());
    EXPECT_EQ(plan.drawnQuantity, Decimal(5));
    EXPECT_EQ(plan.shortfall, Decimal(3));
}

TEST(FifoDrawTest, SkipsEmptyAndInactiveBatches) {
    const QList<InventoryBatch> batches = {
        makeBatch(1, "0", 100),
        makeBatch(2, "5", 120, BatchStatus::Archived),
        makeBatch(3, "4", 130),
    };

    const FifoPlan plan = planFifoDraw(batches, Decimal(1));

    ASSERT_EQ(plan.draws.size(), 1);
    EXPECT_EQ(plan.draws[0].batchId, 3);
    EXPECT_EQ(plan.exactCostCents, Decimal(130));
}

TEST(FifoDrawTest, FractionalQuantitiesStayExact) {
    const QList<InventoryBatch> batches = {makeBatch(1, "0.1", 333), makeBatch(2, "1", 333)};

    const FifoPlan plan = planFifoDraw(batches, Decimal("0.3"));

    ASSERT_TRUE(plan.isCovered());
    EXPECT_EQ(plan.drawnQuantity, Decimal("0.3"));
    EXPECT_EQ(plan.exactCostCents, Decimal("99.9"));
    EXPECT_EQ(roundHalfUp(plan.exactCostCents), 100);
}
