#ifndef BATCHREPOSITORY_H
#define BATCHREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IBatchRepository.h"

class BatchRepository : public IBatchRepository
{
public:
    explicit BatchRepository(QSqlDatabase db);

    bool beginTransaction() override;
    bool commit() override;
    void rollback() override;

    int createBatch(const InventoryBatch &batch) override;
    InventoryBatch findBatchById(int tenantId, int batchId) override;
    QList<InventoryBatch> findActiveBatches(int tenantId, int ingredientId) override;
    QList<InventoryBatch> findBatchesByIngredient(int tenantId, int ingredientId) override;
    QList<InventoryBatch> findBatchesByTenant(int tenantId) override;
    QList<InventoryBatch> findExpiredActiveBatches(int tenantId, const QDateTime &now) override;
    bool updateBatchStock(const InventoryBatch &batch, int expectedVersion) override;
    bool updateBatchStatus(int tenantId, int batchId, BatchStatus status) override;

    int createMovement(const InventoryMovement &movement) override;
    QList<InventoryMovement> findMovementsByBatch(int tenantId, int batchId) override;
    QList<InventoryMovement> findMovementsByType(int tenantId, MovementType type,
                                                 const QDateTime &from, const QDateTime &to) override;

private:
    InventoryBatch batchFromQuery(const QSqlQuery &q) const;
    InventoryMovement movementFromQuery(const QSqlQuery &q) const;
    bool executeQuery(QSqlQuery &q, const QString &context) const;
    QList<InventoryBatch> collectBatches(QSqlQuery &q, const QString &context) const;

private:
    QSqlDatabase m_db;
    bool m_inTransaction = false;
};

#endif // BATCHREPOSITORY_H
