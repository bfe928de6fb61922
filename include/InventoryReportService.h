#ifndef INVENTORYREPORTSERVICE_H
#define INVENTORYREPORTSERVICE_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QString>

#include "Clock.h"
#include "DecimalUtils.h"
#include "repositories/IBatchRepository.h"
#include "repositories/IIngredientRepository.h"

struct StockLine {
    int ingredientId = 0;
    QString ingredientName;
    QString unit;
    int activeBatches = 0;
    Decimal totalRemaining = 0;
    Decimal averageUnitCostCents = 0;
    qint64 stockValueCents = 0;
};

struct LossLine {
    int ingredientId = 0;
    QString ingredientName;
    Decimal quantity = 0;
    qint64 valueCents = 0;
};

struct LossReport {
    QDateTime periodStart;
    QDateTime periodEnd;
    QList<LossLine> lines;
    qint64 totalLossCents = 0;
    qint64 totalPurchasesCents = 0;
    Decimal wastePercent = 0;
};

struct ExpiryAlert {
    int batchId = 0;
    int ingredientId = 0;
    QString ingredientName;
    ExpirationStatus status = ExpirationStatus::Fresh;
    Decimal remainingQuantity = 0;
    QDateTime expiresAt;
};

struct StockAlert {
    int ingredientId = 0;
    QString ingredientName;
    Decimal totalRemaining = 0;
    Decimal threshold = 0;

    bool isOutOfStock() const { return totalRemaining <= 0; }
};

struct InventoryAlerts {
    QList<ExpiryAlert> expiry;
    QList<StockAlert> stock;
    int healthScore = 100;
    QString healthLabel;
};

/**
 * @brief Отчёты по складу: остатки, потери, предупреждения
 */
class InventoryReportService : public QObject
{
    Q_OBJECT

public:
    explicit InventoryReportService(
        IBatchRepository* batchRepo,
        IIngredientRepository* ingredientRepo,
        const IClock* clock,
        int expiringSoonDays = 2,
        QObject *parent = nullptr
    );

    /**
     * @brief Остатки активных партий по ингредиентам
     */
    QList<StockLine> stockSummary(int tenantId) const;

    /**
     * @brief Потери от просрочки за [from, to) относительно закупок за тот же период
     */
    LossReport lossReport(int tenantId, const QDateTime &from, const QDateTime &to) const;

    InventoryAlerts alerts(int tenantId) const;

    /**
     * @brief Оценка состояния склада: 100 минус штрафы за каждый вид проблемы
     */
    static int healthScore(const InventoryAlerts &alerts);
    static QString healthLabel(int score);

    int expiringSoonDays() const { return m_expiringSoonDays; }

private:
    QString ingredientName(int ingredientId) const;

private:
    IBatchRepository* m_batchRepo;
    IIngredientRepository* m_ingredientRepo;
    const IClock* m_clock;
    int m_expiringSoonDays;
};

#endif // INVENTORYREPORTSERVICE_H
