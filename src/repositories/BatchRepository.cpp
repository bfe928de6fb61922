#include "repositories/BatchRepository.h"
#include "DateTimeUtils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QSqlDriver>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(batchRepo, "repository.batch")

static const char *kBatchColumns =
    "id, tenant_id, ingredient_id, unit_cost_cents, initial_quantity, remaining_quantity, "
    "received_at, expires_at, supplier, invoice_number, status, version, created_at";

static const char *kMovementColumns =
    "id, tenant_id, batch_id, type, quantity_delta, unit_cost_cents, total_cost_cents, "
    "reference_type, reference_id, reason, created_at";

BatchRepository::BatchRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(batchRepo) << "BatchRepository: Database is not open";
    }
}

bool BatchRepository::executeQuery(QSqlQuery &q, const QString &context) const
{
    if (!q.exec()) {
        qCritical(batchRepo) << "BatchRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(batchRepo) << "BatchRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

bool BatchRepository::beginTransaction()
{
    if (m_inTransaction) {
        qWarning(batchRepo) << "BatchRepository::beginTransaction: transaction already open";
        return false;
    }

    // SQLite: IMMEDIATE берёт блокировку записи сразу, иначе два читателя
    // не смогут поднять блокировку до записи и один получит SQLITE_BUSY.
    if (m_db.driverName() == "QSQLITE") {
        QSqlQuery q(m_db);
        if (!q.exec("BEGIN IMMEDIATE")) {
            qCritical(batchRepo) << "BatchRepository::beginTransaction:" << q.lastError().text();
            return false;
        }
    } else if (!m_db.transaction()) {
        qCritical(batchRepo) << "BatchRepository::beginTransaction:" << m_db.lastError().text();
        return false;
    }

    m_inTransaction = true;
    return true;
}

bool BatchRepository::commit()
{
    if (!m_inTransaction) return false;

    bool ok = false;
    if (m_db.driverName() == "QSQLITE") {
        QSqlQuery q(m_db);
        ok = q.exec("COMMIT");
        if (!ok) {
            qCritical(batchRepo) << "BatchRepository::commit:" << q.lastError().text();
        }
    } else {
        ok = m_db.commit();
        if (!ok) {
            qCritical(batchRepo) << "BatchRepository::commit:" << m_db.lastError().text();
        }
    }

    if (!ok) {
        rollback();
        return false;
    }
    m_inTransaction = false;
    return true;
}

void BatchRepository::rollback()
{
    if (!m_inTransaction) return;

    if (m_db.driverName() == "QSQLITE") {
        QSqlQuery q(m_db);
        if (!q.exec("ROLLBACK")) {
            qCritical(batchRepo) << "BatchRepository::rollback:" << q.lastError().text();
        }
    } else if (!m_db.rollback()) {
        qCritical(batchRepo) << "BatchRepository::rollback:" << m_db.lastError().text();
    }
    m_inTransaction = false;
}

InventoryBatch BatchRepository::batchFromQuery(const QSqlQuery &q) const
{
    InventoryBatch b;
    b.id = q.value("id").toInt();
    b.tenantId = q.value("tenant_id").toInt();
    b.ingredientId = q.value("ingredient_id").toInt();
    b.unitCostCents = q.value("unit_cost_cents").toLongLong();
    b.initialQuantity = decimalFromVariant(q.value("initial_quantity"));
    b.remainingQuantity = decimalFromVariant(q.value("remaining_quantity"));
    b.receivedAt = dateTimeFromDb(q.value("received_at"));
    b.expiresAt = dateTimeFromDb(q.value("expires_at"));
    b.supplier = q.value("supplier").toString();
    b.invoiceNumber = q.value("invoice_number").toString();
    b.status = batchStatusFromString(q.value("status").toString());
    b.version = q.value("version").toInt();
    b.createdAt = q.value("created_at").toString();
    return b;
}

InventoryMovement BatchRepository::movementFromQuery(const QSqlQuery &q) const
{
    InventoryMovement m;
    m.id = q.value("id").toInt();
    m.tenantId = q.value("tenant_id").toInt();
    m.batchId = q.value("batch_id").toInt();
    if (!movementTypeFromString(q.value("type").toString(), m.type)) {
        qWarning(batchRepo) << "BatchRepository: unknown movement type" << q.value("type").toString()
                            << "in movement" << m.id;
    }
    m.quantityDelta = decimalFromVariant(q.value("quantity_delta"));
    m.unitCostCents = q.value("unit_cost_cents").toLongLong();
    m.totalCostCents = q.value("total_cost_cents").toLongLong();
    m.referenceType = q.value("reference_type").toString();
    m.referenceId = q.value("reference_id").toString();
    m.reason = q.value("reason").toString();
    m.createdAt = dateTimeFromDb(q.value("created_at"));
    return m;
}

QList<InventoryBatch> BatchRepository::collectBatches(QSqlQuery &q, const QString &context) const
{
    QList<InventoryBatch> res;
    if (!executeQuery(q, context)) return res;
    while (q.next()) res.append(batchFromQuery(q));
    return res;
}

int BatchRepository::createBatch(const InventoryBatch &batch)
{
    if (batch.tenantId <= 0 || batch.ingredientId <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO inventory_batches (tenant_id, ingredient_id, unit_cost_cents, initial_quantity,
                                       remaining_quantity, received_at, expires_at, supplier,
                                       invoice_number, status, version)
        VALUES (:tenant, :ingredient, :cost, :initial, :remaining, :received, :expires, :supplier,
                :invoice, :status, 0)
    )");
    q.bindValue(":tenant", batch.tenantId);
    q.bindValue(":ingredient", batch.ingredientId);
    q.bindValue(":cost", batch.unitCostCents);
    q.bindValue(":initial", decimalToStorageString(batch.initialQuantity));
    q.bindValue(":remaining", decimalToStorageString(batch.remainingQuantity));
    q.bindValue(":received", dateTimeToDb(batch.receivedAt));
    q.bindValue(":expires", dateTimeToDb(batch.expiresAt));
    q.bindValue(":supplier", batch.supplier.isEmpty() ? QVariant() : QVariant(batch.supplier));
    q.bindValue(":invoice", batch.invoiceNumber.isEmpty() ? QVariant() : QVariant(batch.invoiceNumber));
    q.bindValue(":status", batchStatusToString(batch.status));

    if (!executeQuery(q, "createBatch")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

InventoryBatch BatchRepository::findBatchById(int tenantId, int batchId)
{
    if (tenantId <= 0 || batchId <= 0) return InventoryBatch();

    QSqlQuery q(m_db);
    q.prepare(QString("SELECT %1 FROM inventory_batches WHERE id = :id AND tenant_id = :tenant")
                  .arg(kBatchColumns));
    q.bindValue(":id", batchId);
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "findBatchById")) return InventoryBatch();
    if (!q.next()) return InventoryBatch();

    return batchFromQuery(q);
}

QList<InventoryBatch> BatchRepository::findActiveBatches(int tenantId, int ingredientId)
{
    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT %1
        FROM inventory_batches
        WHERE tenant_id = :tenant
          AND ingredient_id = :ingredient
          AND status = 'active'
        ORDER BY received_at ASC, id ASC
    )").arg(kBatchColumns));
    q.bindValue(":tenant", tenantId);
    q.bindValue(":ingredient", ingredientId);

    // remaining_quantity хранится текстом, поэтому фильтр по остатку делаем здесь
    QList<InventoryBatch> res;
    const QList<InventoryBatch> all = collectBatches(q, "findActiveBatches");
    for (const auto &b : all) {
        if (b.remainingQuantity > 0) res.append(b);
    }
    return res;
}

QList<InventoryBatch> BatchRepository::findBatchesByIngredient(int tenantId, int ingredientId)
{
    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT %1
        FROM inventory_batches
        WHERE tenant_id = :tenant AND ingredient_id = :ingredient
        ORDER BY received_at ASC, id ASC
    )").arg(kBatchColumns));
    q.bindValue(":tenant", tenantId);
    q.bindValue(":ingredient", ingredientId);

    return collectBatches(q, "findBatchesByIngredient");
}

QList<InventoryBatch> BatchRepository::findBatchesByTenant(int tenantId)
{
    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT %1
        FROM inventory_batches
        WHERE tenant_id = :tenant
        ORDER BY ingredient_id ASC, received_at ASC, id ASC
    )").arg(kBatchColumns));
    q.bindValue(":tenant", tenantId);

    return collectBatches(q, "findBatchesByTenant");
}

QList<InventoryBatch> BatchRepository::findExpiredActiveBatches(int tenantId, const QDateTime &now)
{
    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT %1
        FROM inventory_batches
        WHERE tenant_id = :tenant
          AND status = 'active'
          AND expires_at < :now
        ORDER BY expires_at ASC, id ASC
    )").arg(kBatchColumns));
    q.bindValue(":tenant", tenantId);
    q.bindValue(":now", dateTimeToDb(now));

    QList<InventoryBatch> res;
    const QList<InventoryBatch> all = collectBatches(q, "findExpiredActiveBatches");
    for (const auto &b : all) {
        if (b.remainingQuantity > 0) res.append(b);
    }
    return res;
}

bool BatchRepository::updateBatchStock(const InventoryBatch &batch, int expectedVersion)
{
    if (!batch.isValid()) return false;

    QSqlQuery q(m_db);
    q.prepare(R"(
        UPDATE inventory_batches
        SET remaining_quantity = :remaining,
            status = :status,
            version = version + 1,
            updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
        WHERE id = :id
          AND tenant_id = :tenant
          AND version = :version
    )");
    q.bindValue(":remaining", decimalToStorageString(batch.remainingQuantity));
    q.bindValue(":status", batchStatusToString(batch.status));
    q.bindValue(":id", batch.id);
    q.bindValue(":tenant", batch.tenantId);
    q.bindValue(":version", expectedVersion);

    if (!executeQuery(q, "updateBatchStock")) return false;

    if (q.numRowsAffected() != 1) {
        qWarning(batchRepo) << "BatchRepository::updateBatchStock: version conflict on batch" << batch.id
                            << "expected version" << expectedVersion;
        return false;
    }
    return true;
}

bool BatchRepository::updateBatchStatus(int tenantId, int batchId, BatchStatus status)
{
    if (tenantId <= 0 || batchId <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare(R"(
        UPDATE inventory_batches
        SET status = :status,
            version = version + 1,
            updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
        WHERE id = :id AND tenant_id = :tenant
    )");
    q.bindValue(":status", batchStatusToString(status));
    q.bindValue(":id", batchId);
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "updateBatchStatus")) return false;
    return q.numRowsAffected() > 0;
}

int BatchRepository::createMovement(const InventoryMovement &movement)
{
    if (movement.tenantId <= 0 || movement.batchId <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO inventory_movements (tenant_id, batch_id, type, quantity_delta, unit_cost_cents,
                                         total_cost_cents, reference_type, reference_id, reason, created_at)
        VALUES (:tenant, :batch, :type, :qty, :unit_cost, :total_cost, :ref_type, :ref_id, :reason, :created)
    )");
    q.bindValue(":tenant", movement.tenantId);
    q.bindValue(":batch", movement.batchId);
    q.bindValue(":type", movementTypeToString(movement.type));
    q.bindValue(":qty", decimalToStorageString(movement.quantityDelta));
    q.bindValue(":unit_cost", movement.unitCostCents);
    q.bindValue(":total_cost", movement.totalCostCents);
    q.bindValue(":ref_type", movement.referenceType.isEmpty() ? QVariant() : QVariant(movement.referenceType));
    q.bindValue(":ref_id", movement.referenceId.isEmpty() ? QVariant() : QVariant(movement.referenceId));
    q.bindValue(":reason", movement.reason.isEmpty() ? QVariant() : QVariant(movement.reason));
    q.bindValue(":created", dateTimeToDb(movement.createdAt.isValid()
                                             ? movement.createdAt
                                             : QDateTime::currentDateTimeUtc()));

    if (!executeQuery(q, "createMovement")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

QList<InventoryMovement> BatchRepository::findMovementsByBatch(int tenantId, int batchId)
{
    QList<InventoryMovement> res;
    if (tenantId <= 0 || batchId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT %1
        FROM inventory_movements
        WHERE tenant_id = :tenant AND batch_id = :batch
        ORDER BY id
    )").arg(kMovementColumns));
    q.bindValue(":tenant", tenantId);
    q.bindValue(":batch", batchId);

    if (!executeQuery(q, "findMovementsByBatch")) return res;
    while (q.next()) res.append(movementFromQuery(q));
    return res;
}

QList<InventoryMovement> BatchRepository::findMovementsByType(int tenantId, MovementType type,
                                                              const QDateTime &from, const QDateTime &to)
{
    QList<InventoryMovement> res;
    if (tenantId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT %1
        FROM inventory_movements
        WHERE tenant_id = :tenant
          AND type = :type
          AND created_at >= :from
          AND created_at < :to
        ORDER BY created_at, id
    )").arg(kMovementColumns));
    q.bindValue(":tenant", tenantId);
    q.bindValue(":type", movementTypeToString(type));
    q.bindValue(":from", dateTimeToDb(from));
    q.bindValue(":to", dateTimeToDb(to));

    if (!executeQuery(q, "findMovementsByType")) return res;
    while (q.next()) res.append(movementFromQuery(q));
    return res;
}
