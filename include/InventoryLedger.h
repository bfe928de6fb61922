#ifndef INVENTORYLEDGER_H
#define INVENTORYLEDGER_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QString>

#include <functional>

#include "Clock.h"
#include "CostingError.h"
#include "DecimalUtils.h"
#include "FifoDraw.h"
#include "LedgerLockRegistry.h"
#include "repositories/IBatchRepository.h"
#include "repositories/IIngredientRepository.h"

struct ReceiveResult {
    CostingError error;
    int batchId = 0;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Основание расхода: тип движения и ссылка на документ (например, продажу)
 */
struct ConsumptionReference {
    MovementType type = MovementType::OutSale;
    QString referenceType;
    QString referenceId;
    QString reason;
};

struct ConsumptionRequest {
    int ingredientId = 0;
    Decimal quantity = 0;
};

struct ConsumptionResult {
    CostingError error;
    int ingredientId = 0;
    Decimal quantity = 0;
    QList<BatchDraw> draws;
    Decimal exactCostCents = 0;
    qint64 totalCostCents = 0;

    bool isOk() const { return !error.isError(); }

    /**
     * @brief Средневзвешенная по списанию цена единицы, в копейках
     */
    Decimal weightedUnitCostCents() const
    {
        return quantity > 0 ? Decimal(exactCostCents / quantity) : Decimal(0);
    }
};

struct MultiConsumptionResult {
    CostingError error;
    QList<ConsumptionResult> lines;
    qint64 totalCostCents = 0;

    bool isOk() const { return !error.isError(); }
};

struct LedgerOperationResult {
    CostingError error;
    int affected = 0;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Партионный учёт: поступления, списание по FIFO, просрочка, архив
 *
 * Каждое изменение остатков выполняется под мьютексом (тенант, ингредиент)
 * и внутри одной транзакции БД. Ошибка на любом шаге откатывает всю операцию.
 */
class InventoryLedger : public QObject
{
    Q_OBJECT

public:
    explicit InventoryLedger(
        IBatchRepository* batchRepo,
        IIngredientRepository* ingredientRepo,
        LedgerLockRegistry* locks,
        const IClock* clock,
        QObject *parent = nullptr
    );

    /**
     * @brief Принять партию: создаёт активную партию и движение In
     * @param receivedAt если не задано, берётся текущее время
     */
    ReceiveResult receive(int tenantId, int ingredientId, const Decimal &quantity,
                          qint64 unitCostCents, const QDateTime &receivedAt,
                          const QDateTime &expiresAt,
                          const QString &supplier = QString(),
                          const QString &invoiceNumber = QString());

    /**
     * @brief Списать quantity ингредиента по FIFO
     *
     * При нехватке остатка возвращает InsufficientStock и ничего не меняет.
     */
    ConsumptionResult consume(int tenantId, int ingredientId, const Decimal &quantity,
                              const ConsumptionReference &reference);

    /**
     * @brief Списать несколько ингредиентов в одной транзакции
     *
     * Повторяющиеся ингредиенты суммируются. Строки результата идут по возрастанию id.
     * @param beforeCommit вызывается внутри той же транзакции после списания;
     *        ошибка из него откатывает всё списание
     */
    MultiConsumptionResult consumeMany(int tenantId, const QList<ConsumptionRequest> &requests,
                                       const ConsumptionReference &reference,
                                       const std::function<CostingError()> &beforeCommit = nullptr);

    /**
     * @brief Списать остатки всех просроченных активных партий движением OutExpire
     * @return affected = число списанных партий
     */
    LedgerOperationResult processExpirations(int tenantId);

    /**
     * @brief Корректировка одной партии (бой, порча)
     */
    LedgerOperationResult writeOff(int tenantId, int batchId, const Decimal &quantity,
                                   const QString &reason);

    LedgerOperationResult archiveBatch(int tenantId, int batchId);

    /**
     * @brief Партии тенанта; ingredientId = 0 - все ингредиенты
     */
    QList<InventoryBatch> batches(int tenantId, int ingredientId = 0);

    QList<InventoryMovement> movements(int tenantId, int batchId);

private:
    QString ingredientLabel(int ingredientId) const;
    QString ingredientUnit(int ingredientId) const;

    CostingError drainBatch(InventoryBatch batch, const Decimal &quantity, MovementType type,
                            const QString &referenceType, const QString &referenceId,
                            const QString &reason);

private:
    IBatchRepository* m_batchRepo;
    IIngredientRepository* m_ingredientRepo;
    LedgerLockRegistry* m_locks;
    const IClock* m_clock;
};

#endif // INVENTORYLEDGER_H
