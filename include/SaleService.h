#ifndef SALESERVICE_H
#define SALESERVICE_H

#include <QObject>
#include <QDateTime>
#include <QString>

#include "Clock.h"
#include "CostingError.h"
#include "InventoryLedger.h"
#include "RecipeCostEngine.h"
#include "repositories/IDishRepository.h"

struct SaleResult {
    CostingError error;
    int saleId = 0;
    QString reference;
    int quantity = 0;
    qint64 unitSellingPriceCents = 0;
    qint64 unitRecipeCostCents = 0;

    /**
     * @brief Фактическая себестоимость списанного сырья по FIFO
     */
    qint64 consumedCostCents = 0;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Регистрация продажи блюда
 *
 * Фиксирует текущую себестоимость рецепта, списывает сырьё всего дерева
 * рецептов одной операцией и записывает продажу.
 */
class SaleService : public QObject
{
    Q_OBJECT

public:
    explicit SaleService(
        IDishRepository* dishRepo,
        const RecipeCostEngine* costEngine,
        InventoryLedger* ledger,
        const IClock* clock,
        QObject *parent = nullptr
    );

    /**
     * @brief Продать quantity порций блюда
     * @param soldAt если не задано, берётся текущее время
     *
     * Одна продажа расходует полный выход рецепта блюда.
     */
    SaleResult recordSale(int tenantId, int dishId, int quantity, const QDateTime &soldAt = QDateTime());

private:
    IDishRepository* m_dishRepo;
    const RecipeCostEngine* m_costEngine;
    InventoryLedger* m_ledger;
    const IClock* m_clock;
};

#endif // SALESERVICE_H
