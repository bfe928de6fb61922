#include "InventoryLedger.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QMap>

Q_LOGGING_CATEGORY(ledgerService, "service.ledger")

InventoryLedger::InventoryLedger(
    IBatchRepository* batchRepo,
    IIngredientRepository* ingredientRepo,
    LedgerLockRegistry* locks,
    const IClock* clock,
    QObject *parent
)
    : QObject(parent)
    , m_batchRepo(batchRepo)
    , m_ingredientRepo(ingredientRepo)
    , m_locks(locks)
    , m_clock(clock)
{
}

QString InventoryLedger::ingredientLabel(int ingredientId) const
{
    const Ingredient ingredient = m_ingredientRepo->findById(ingredientId);
    if (!ingredient.isValid()) {
        return QString("ingredient #%1").arg(ingredientId);
    }
    return ingredient.name;
}

QString InventoryLedger::ingredientUnit(int ingredientId) const
{
    const Ingredient ingredient = m_ingredientRepo->findById(ingredientId);
    return ingredient.isValid() ? ingredient.unit : QString();
}

ReceiveResult InventoryLedger::receive(int tenantId, int ingredientId, const Decimal &quantity,
                                       qint64 unitCostCents, const QDateTime &receivedAt,
                                       const QDateTime &expiresAt,
                                       const QString &supplier, const QString &invoiceNumber)
{
    ReceiveResult result;

    if (tenantId <= 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidReference, "Tenant id is required");
        return result;
    }
    if (!isPositiveQuantity(quantity)) {
        result.error = CostingError::make(CostingErrorCode::InvalidQuantity,
            QString("Received quantity must be positive, got %1").arg(decimalToStorageString(quantity)));
        return result;
    }
    if (unitCostCents <= 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidPrice,
            QString("Unit cost must be positive, got %1 cents").arg(unitCostCents));
        return result;
    }

    const QDateTime received = receivedAt.isValid() ? receivedAt.toUTC() : m_clock->now();
    if (!expiresAt.isValid()) {
        result.error = CostingError::make(CostingErrorCode::InvalidDate, "Expiry date is mandatory");
        return result;
    }
    if (expiresAt < received) {
        result.error = CostingError::make(CostingErrorCode::InvalidDate,
            QString("Expiry date %1 is before receipt date %2")
                .arg(expiresAt.toUTC().toString(Qt::ISODate), received.toString(Qt::ISODate)));
        return result;
    }

    if (!m_ingredientRepo->exists(ingredientId)) {
        result.error = CostingError::make(CostingErrorCode::NotFound,
            QString("Ingredient %1 does not exist").arg(ingredientId));
        return result;
    }

    InventoryBatch batch;
    batch.tenantId = tenantId;
    batch.ingredientId = ingredientId;
    batch.unitCostCents = unitCostCents;
    batch.initialQuantity = quantity;
    batch.remainingQuantity = quantity;
    batch.receivedAt = received;
    batch.expiresAt = expiresAt.toUTC();
    batch.supplier = supplier;
    batch.invoiceNumber = invoiceNumber;
    batch.status = BatchStatus::Active;

    if (!m_batchRepo->beginTransaction()) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot start ledger transaction");
        return result;
    }

    const int batchId = m_batchRepo->createBatch(batch);
    if (batchId <= 0) {
        m_batchRepo->rollback();
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot store inventory batch");
        return result;
    }

    InventoryMovement movement;
    movement.tenantId = tenantId;
    movement.batchId = batchId;
    movement.type = MovementType::In;
    movement.quantityDelta = quantity;
    movement.unitCostCents = unitCostCents;
    movement.totalCostCents = roundHalfUp(quantity * decimalFromCents(unitCostCents));
    movement.referenceType = "receipt";
    movement.referenceId = invoiceNumber;
    movement.createdAt = received;

    if (m_batchRepo->createMovement(movement) <= 0) {
        m_batchRepo->rollback();
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot store receipt movement");
        return result;
    }

    if (!m_batchRepo->commit()) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot commit receipt");
        return result;
    }

    result.batchId = batchId;
    qInfo(ledgerService) << "InventoryLedger::receive: Batch" << batchId << "ingredient" << ingredientId
                         << "qty" << decimalToStorageString(quantity) << "at" << unitCostCents << "cents";
    return result;
}

ConsumptionResult InventoryLedger::consume(int tenantId, int ingredientId, const Decimal &quantity,
                                           const ConsumptionReference &reference)
{
    ConsumptionRequest request;
    request.ingredientId = ingredientId;
    request.quantity = quantity;

    const MultiConsumptionResult many = consumeMany(tenantId, {request}, reference);
    if (!many.isOk()) {
        ConsumptionResult failed;
        failed.error = many.error;
        failed.ingredientId = ingredientId;
        failed.quantity = quantity;
        return failed;
    }
    return many.lines.first();
}

MultiConsumptionResult InventoryLedger::consumeMany(int tenantId, const QList<ConsumptionRequest> &requests,
                                                    const ConsumptionReference &reference,
                                                    const std::function<CostingError()> &beforeCommit)
{
    MultiConsumptionResult result;

    if (tenantId <= 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidReference, "Tenant id is required");
        return result;
    }
    if (reference.type == MovementType::In) {
        result.error = CostingError::make(CostingErrorCode::InvalidReference,
            "Consumption cannot be recorded as an incoming movement");
        return result;
    }

    QMap<int, Decimal> totals;
    for (const auto &request : requests) {
        if (request.ingredientId <= 0) {
            result.error = CostingError::make(CostingErrorCode::InvalidReference,
                QString("Invalid ingredient id %1").arg(request.ingredientId));
            return result;
        }
        if (!isPositiveQuantity(request.quantity)) {
            result.error = CostingError::make(CostingErrorCode::InvalidQuantity,
                QString("Quantity of %1 must be positive, got %2")
                    .arg(ingredientLabel(request.ingredientId), decimalToStorageString(request.quantity)));
            return result;
        }
        totals[request.ingredientId] += request.quantity;
    }

    if (totals.isEmpty()) {
        result.error = CostingError::make(CostingErrorCode::InvalidQuantity, "Nothing to consume");
        return result;
    }

    LedgerLockRegistry::Guard guard(*m_locks, tenantId, totals.keys());

    if (!m_batchRepo->beginTransaction()) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot start ledger transaction");
        return result;
    }

    // Сначала проверяем все ингредиенты, затем списываем: отказ не оставляет частичных изменений
    QList<QList<InventoryBatch>> batchesByLine;
    QList<FifoPlan> plans;
    for (auto it = totals.constBegin(); it != totals.constEnd(); ++it) {
        const QList<InventoryBatch> active = m_batchRepo->findActiveBatches(tenantId, it.key());
        const FifoPlan plan = planFifoDraw(active, it.value());

        if (!plan.isCovered()) {
            m_batchRepo->rollback();
            const QString unit = ingredientUnit(it.key());
            const QString unitSuffix = unit.isEmpty() ? QString() : " " + unit;
            result.error = CostingError::make(CostingErrorCode::InsufficientStock,
                QString("Insufficient stock for %1: requested %2%5, available %3%5, short by %4%5")
                    .arg(ingredientLabel(it.key()),
                         decimalToStorageString(it.value()),
                         decimalToStorageString(plan.drawnQuantity),
                         decimalToStorageString(plan.shortfall),
                         unitSuffix));
            qWarning(ledgerService) << "InventoryLedger::consumeMany:" << result.error.message;
            return result;
        }

        batchesByLine.append(active);
        plans.append(plan);
    }

    int index = 0;
    for (auto it = totals.constBegin(); it != totals.constEnd(); ++it, ++index) {
        const FifoPlan &plan = plans.at(index);

        for (const auto &draw : plan.draws) {
            InventoryBatch batch;
            for (const auto &candidate : batchesByLine.at(index)) {
                if (candidate.id == draw.batchId) {
                    batch = candidate;
                    break;
                }
            }

            const CostingError error = drainBatch(batch, draw.quantity, reference.type,
                                                  reference.referenceType, reference.referenceId,
                                                  reference.reason);
            if (error.isError()) {
                m_batchRepo->rollback();
                result.error = error;
                qWarning(ledgerService) << "InventoryLedger::consumeMany:" << error.toString();
                return result;
            }
        }

        ConsumptionResult line;
        line.ingredientId = it.key();
        line.quantity = it.value();
        line.draws = plan.draws;
        line.exactCostCents = plan.exactCostCents;
        line.totalCostCents = roundHalfUp(plan.exactCostCents);
        result.lines.append(line);
    }

    if (beforeCommit) {
        const CostingError error = beforeCommit();
        if (error.isError()) {
            m_batchRepo->rollback();
            result.lines.clear();
            result.error = error;
            qWarning(ledgerService) << "InventoryLedger::consumeMany: Rolled back -" << error.toString();
            return result;
        }
    }

    if (!m_batchRepo->commit()) {
        result.lines.clear();
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot commit consumption");
        return result;
    }

    Decimal exactTotal = 0;
    for (const auto &line : result.lines) {
        exactTotal += line.exactCostCents;
    }
    result.totalCostCents = roundHalfUp(exactTotal);

    qInfo(ledgerService) << "InventoryLedger::consumeMany: Consumed" << result.lines.size()
                         << "ingredient(s) for" << reference.referenceType << reference.referenceId
                         << "cost" << result.totalCostCents << "cents";
    return result;
}

CostingError InventoryLedger::drainBatch(InventoryBatch batch, const Decimal &quantity, MovementType type,
                                         const QString &referenceType, const QString &referenceId,
                                         const QString &reason)
{
    if (!batch.isValid()) {
        return CostingError::make(CostingErrorCode::ConcurrentModification,
            "Batch disappeared while consuming");
    }

    const int expectedVersion = batch.version;
    batch.remainingQuantity -= quantity;
    if (batch.remainingQuantity <= 0) {
        batch.remainingQuantity = 0;
        batch.status = BatchStatus::Exhausted;
    }

    if (!m_batchRepo->updateBatchStock(batch, expectedVersion)) {
        return CostingError::make(CostingErrorCode::ConcurrentModification,
            QString("Batch %1 was modified concurrently").arg(batch.id));
    }

    InventoryMovement movement;
    movement.tenantId = batch.tenantId;
    movement.batchId = batch.id;
    movement.type = type;
    movement.quantityDelta = -quantity;
    movement.unitCostCents = batch.unitCostCents;
    movement.totalCostCents = roundHalfUp(quantity * decimalFromCents(batch.unitCostCents));
    movement.referenceType = referenceType;
    movement.referenceId = referenceId;
    movement.reason = reason;
    movement.createdAt = m_clock->now();

    if (m_batchRepo->createMovement(movement) <= 0) {
        return CostingError::make(CostingErrorCode::StorageFailure,
            QString("Cannot store movement for batch %1").arg(batch.id));
    }
    return CostingError();
}

LedgerOperationResult InventoryLedger::processExpirations(int tenantId)
{
    LedgerOperationResult result;
    if (tenantId <= 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidReference, "Tenant id is required");
        return result;
    }

    const QDateTime now = m_clock->now();
    const QList<InventoryBatch> candidates = m_batchRepo->findExpiredActiveBatches(tenantId, now);
    if (candidates.isEmpty()) {
        qDebug(ledgerService) << "InventoryLedger::processExpirations: Nothing expired for tenant" << tenantId;
        return result;
    }

    QList<int> ingredientIds;
    for (const auto &batch : candidates) {
        ingredientIds.append(batch.ingredientId);
    }

    LedgerLockRegistry::Guard guard(*m_locks, tenantId, ingredientIds);

    if (!m_batchRepo->beginTransaction()) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot start ledger transaction");
        return result;
    }

    for (const auto &candidate : candidates) {
        // Перечитываем под блокировкой: партия могла быть израсходована
        const InventoryBatch batch = m_batchRepo->findBatchById(tenantId, candidate.id);
        if (!batch.isValid() || !batch.hasStock() || batch.expiresAt >= now) {
            continue;
        }

        const CostingError error = drainBatch(batch, batch.remainingQuantity, MovementType::OutExpire,
                                              "expiration", QString::number(batch.id), "expired");
        if (error.isError()) {
            m_batchRepo->rollback();
            result.error = error;
            result.affected = 0;
            qWarning(ledgerService) << "InventoryLedger::processExpirations:" << error.toString();
            return result;
        }
        ++result.affected;
    }

    if (!m_batchRepo->commit()) {
        result.affected = 0;
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot commit expirations");
        return result;
    }

    qInfo(ledgerService) << "InventoryLedger::processExpirations: Wrote off" << result.affected
                         << "expired batch(es) for tenant" << tenantId;
    return result;
}

LedgerOperationResult InventoryLedger::writeOff(int tenantId, int batchId, const Decimal &quantity,
                                                const QString &reason)
{
    LedgerOperationResult result;

    if (!isPositiveQuantity(quantity)) {
        result.error = CostingError::make(CostingErrorCode::InvalidQuantity,
            QString("Write-off quantity must be positive, got %1").arg(decimalToStorageString(quantity)));
        return result;
    }

    const InventoryBatch found = m_batchRepo->findBatchById(tenantId, batchId);
    if (!found.isValid()) {
        result.error = CostingError::make(CostingErrorCode::NotFound,
            QString("Batch %1 not found").arg(batchId));
        return result;
    }

    LedgerLockRegistry::Guard guard(*m_locks, tenantId, {found.ingredientId});

    if (!m_batchRepo->beginTransaction()) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot start ledger transaction");
        return result;
    }

    const InventoryBatch batch = m_batchRepo->findBatchById(tenantId, batchId);
    if (!batch.isValid()) {
        m_batchRepo->rollback();
        result.error = CostingError::make(CostingErrorCode::StorageFailure,
            QString("Cannot reload batch %1").arg(batchId));
        return result;
    }
    if (batch.status != BatchStatus::Active) {
        m_batchRepo->rollback();
        result.error = CostingError::make(CostingErrorCode::InvalidReference,
            QString("Batch %1 is %2, only active batches can be written off")
                .arg(batchId).arg(batchStatusToString(batch.status)));
        return result;
    }
    if (quantity > batch.remainingQuantity) {
        m_batchRepo->rollback();
        result.error = CostingError::make(CostingErrorCode::InsufficientStock,
            QString("Cannot write off %1 from batch %2 of %3: only %4 remaining")
                .arg(decimalToStorageString(quantity))
                .arg(batchId)
                .arg(ingredientLabel(batch.ingredientId), decimalToStorageString(batch.remainingQuantity)));
        return result;
    }

    const CostingError error = drainBatch(batch, quantity, MovementType::Adjustment, "adjustment",
                                          QString::number(batchId),
                                          reason.trimmed().isEmpty() ? QString("write-off") : reason.trimmed());
    if (error.isError()) {
        m_batchRepo->rollback();
        result.error = error;
        return result;
    }

    if (!m_batchRepo->commit()) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure, "Cannot commit write-off");
        return result;
    }

    result.affected = 1;
    qInfo(ledgerService) << "InventoryLedger::writeOff: Batch" << batchId << "qty" << decimalToStorageString(quantity)
                         << "reason" << reason;
    return result;
}

LedgerOperationResult InventoryLedger::archiveBatch(int tenantId, int batchId)
{
    LedgerOperationResult result;

    const InventoryBatch batch = m_batchRepo->findBatchById(tenantId, batchId);
    if (!batch.isValid()) {
        result.error = CostingError::make(CostingErrorCode::NotFound,
            QString("Batch %1 not found").arg(batchId));
        return result;
    }
    if (batch.status == BatchStatus::Archived) {
        result.error = CostingError::make(CostingErrorCode::InvalidReference,
            QString("Batch %1 is already archived").arg(batchId));
        return result;
    }

    LedgerLockRegistry::Guard guard(*m_locks, tenantId, {batch.ingredientId});

    if (!m_batchRepo->updateBatchStatus(tenantId, batchId, BatchStatus::Archived)) {
        result.error = CostingError::make(CostingErrorCode::StorageFailure,
            QString("Cannot archive batch %1").arg(batchId));
        return result;
    }

    result.affected = 1;
    qInfo(ledgerService) << "InventoryLedger::archiveBatch: Archived batch" << batchId
                         << "remaining" << decimalToStorageString(batch.remainingQuantity);
    return result;
}

QList<InventoryBatch> InventoryLedger::batches(int tenantId, int ingredientId)
{
    if (ingredientId > 0) {
        return m_batchRepo->findBatchesByIngredient(tenantId, ingredientId);
    }
    return m_batchRepo->findBatchesByTenant(tenantId);
}

QList<InventoryMovement> InventoryLedger::movements(int tenantId, int batchId)
{
    return m_batchRepo->findMovementsByBatch(tenantId, batchId);
}
