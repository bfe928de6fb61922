#ifndef IBATCHREPOSITORY_H
#define IBATCHREPOSITORY_H

#include <QList>
#include <QDate>
#include <QDateTime>
#include <QString>

#include "DecimalUtils.h"

enum class BatchStatus {
    Active,
    Exhausted,
    Archived
};

/**
 * @brief Типы движений. Закрытый набор: каждый switch по нему обязан быть исчерпывающим.
 */
enum class MovementType {
    In,
    OutSale,
    OutExpire,
    Adjustment
};

enum class ExpirationStatus {
    Expired,
    ExpiresToday,
    ExpiringSoon,
    Fresh
};

QString batchStatusToString(BatchStatus status);
BatchStatus batchStatusFromString(const QString &str);

QString movementTypeToString(MovementType type);
bool movementTypeFromString(const QString &str, MovementType &type);
bool isOutgoingMovement(MovementType type);

QString expirationStatusToString(ExpirationStatus status);

/**
 * @brief Классификация срока годности партии относительно "сегодня"
 * @param soonDays сколько дней вперёд считается "скоро истекает"
 */
ExpirationStatus classifyExpiration(const QDateTime &expiresAt, const QDate &today, int soonDays = 2);

/**
 * @brief Партия товара: одно физическое поступление по фиксированной цене
 *
 * Инварианты:
 * - 0 <= remainingQuantity <= initialQuantity
 * - remainingQuantity только уменьшается
 */
struct InventoryBatch {
    int id = 0;
    int tenantId = 0;
    int ingredientId = 0;
    qint64 unitCostCents = 0;
    Decimal initialQuantity = 0;
    Decimal remainingQuantity = 0;
    QDateTime receivedAt;
    QDateTime expiresAt;
    QString supplier;
    QString invoiceNumber;
    BatchStatus status = BatchStatus::Active;
    int version = 0;
    QString createdAt;

    bool isValid() const { return id > 0 && tenantId > 0 && ingredientId > 0; }
    bool hasStock() const { return status == BatchStatus::Active && remainingQuantity > 0; }

    ExpirationStatus expirationStatus(const QDate &today, int soonDays = 2) const
    {
        return classifyExpiration(expiresAt, today, soonDays);
    }
};

/**
 * @brief Запись журнала движений. Только добавление, изменения запрещены триггерами.
 *
 * quantityDelta положительна для In и отрицательна для расходных типов.
 */
struct InventoryMovement {
    int id = 0;
    int tenantId = 0;
    int batchId = 0;
    MovementType type = MovementType::In;
    Decimal quantityDelta = 0;
    qint64 unitCostCents = 0;
    qint64 totalCostCents = 0;
    QString referenceType;
    QString referenceId;
    QString reason;
    QDateTime createdAt;

    bool isValid() const { return id > 0 && tenantId > 0 && batchId > 0; }
};

/**
 * @brief Интерфейс репозитория партий и журнала движений
 *
 * Принципы:
 * - Все запросы фильтруются по tenantId
 * - Партии и движения никогда не удаляются
 * - Остаток партии меняется только через updateBatchStock с проверкой версии
 */
class IBatchRepository
{
public:
    virtual ~IBatchRepository() = default;

    /**
     * @brief Начать транзакцию с немедленной блокировкой на запись
     */
    virtual bool beginTransaction() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    virtual int createBatch(const InventoryBatch &batch) = 0;

    virtual InventoryBatch findBatchById(int tenantId, int batchId) = 0;

    /**
     * @brief Активные партии с остатком в порядке FIFO (received_at, затем id)
     */
    virtual QList<InventoryBatch> findActiveBatches(int tenantId, int ingredientId) = 0;

    virtual QList<InventoryBatch> findBatchesByIngredient(int tenantId, int ingredientId) = 0;

    virtual QList<InventoryBatch> findBatchesByTenant(int tenantId) = 0;

    /**
     * @brief Активные партии с остатком, срок годности которых истёк до now
     */
    virtual QList<InventoryBatch> findExpiredActiveBatches(int tenantId, const QDateTime &now) = 0;

    /**
     * @brief Записать новый остаток и статус, если версия в БД совпадает с expectedVersion
     * @return false при конфликте версий или ошибке SQL
     */
    virtual bool updateBatchStock(const InventoryBatch &batch, int expectedVersion) = 0;

    virtual bool updateBatchStatus(int tenantId, int batchId, BatchStatus status) = 0;

    virtual int createMovement(const InventoryMovement &movement) = 0;

    virtual QList<InventoryMovement> findMovementsByBatch(int tenantId, int batchId) = 0;

    /**
     * @brief Движения заданного типа за полуинтервал [from, to)
     */
    virtual QList<InventoryMovement> findMovementsByType(int tenantId, MovementType type,
                                                         const QDateTime &from, const QDateTime &to) = 0;
};

#endif // IBATCHREPOSITORY_H
