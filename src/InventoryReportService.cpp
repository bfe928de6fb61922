#include "InventoryReportService.h"

#include <QDebug>
#include <QHash>
#include <QLoggingCategory>
#include <QMap>

#include <algorithm>

Q_LOGGING_CATEGORY(inventoryReports, "service.inventory_reports")

InventoryReportService::InventoryReportService(
    IBatchRepository* batchRepo,
    IIngredientRepository* ingredientRepo,
    const IClock* clock,
    int expiringSoonDays,
    QObject *parent
)
    : QObject(parent)
    , m_batchRepo(batchRepo)
    , m_ingredientRepo(ingredientRepo)
    , m_clock(clock)
    , m_expiringSoonDays(expiringSoonDays)
{
}

QString InventoryReportService::ingredientName(int ingredientId) const
{
    const Ingredient ingredient = m_ingredientRepo->findById(ingredientId);
    return ingredient.isValid() ? ingredient.name : QString("ingredient #%1").arg(ingredientId);
}

QList<StockLine> InventoryReportService::stockSummary(int tenantId) const
{
    struct Accumulator {
        int batches = 0;
        Decimal quantity = 0;
        Decimal valueCents = 0;
    };

    QMap<int, Accumulator> byIngredient;
    const QList<InventoryBatch> all = m_batchRepo->findBatchesByTenant(tenantId);
    for (const auto &batch : all) {
        if (!batch.hasStock()) continue;
        Accumulator &acc = byIngredient[batch.ingredientId];
        ++acc.batches;
        acc.quantity += batch.remainingQuantity;
        acc.valueCents += batch.remainingQuantity * decimalFromCents(batch.unitCostCents);
    }

    QList<StockLine> lines;
    for (auto it = byIngredient.constBegin(); it != byIngredient.constEnd(); ++it) {
        const Ingredient ingredient = m_ingredientRepo->findById(it.key());

        StockLine line;
        line.ingredientId = it.key();
        line.ingredientName = ingredient.isValid() ? ingredient.name : QString("ingredient #%1").arg(it.key());
        line.unit = ingredient.unit;
        line.activeBatches = it->batches;
        line.totalRemaining = it->quantity;
        line.averageUnitCostCents = it->quantity > 0 ? Decimal(it->valueCents / it->quantity) : Decimal(0);
        line.stockValueCents = roundHalfUp(it->valueCents);
        lines.append(line);
    }

    std::sort(lines.begin(), lines.end(), [](const StockLine &a, const StockLine &b) {
        return a.ingredientName.compare(b.ingredientName, Qt::CaseInsensitive) < 0;
    });
    return lines;
}

LossReport InventoryReportService::lossReport(int tenantId, const QDateTime &from, const QDateTime &to) const
{
    LossReport report;
    report.periodStart = from;
    report.periodEnd = to;

    QHash<int, int> ingredientByBatch;
    QMap<int, LossLine> byIngredient;

    const QList<InventoryMovement> expired = m_batchRepo->findMovementsByType(tenantId, MovementType::OutExpire, from, to);
    for (const auto &movement : expired) {
        if (!ingredientByBatch.contains(movement.batchId)) {
            const InventoryBatch batch = m_batchRepo->findBatchById(tenantId, movement.batchId);
            if (!batch.isValid()) {
                qWarning(inventoryReports) << "InventoryReportService::lossReport: movement" << movement.id
                                           << "refers to missing batch" << movement.batchId;
                continue;
            }
            ingredientByBatch.insert(batch.id, batch.ingredientId);
        }

        const int ingredientId = ingredientByBatch.value(movement.batchId);
        LossLine &line = byIngredient[ingredientId];
        line.ingredientId = ingredientId;
        line.quantity += -movement.quantityDelta;
        line.valueCents += movement.totalCostCents;
        report.totalLossCents += movement.totalCostCents;
    }

    for (auto it = byIngredient.begin(); it != byIngredient.end(); ++it) {
        it->ingredientName = ingredientName(it.key());
        report.lines.append(it.value());
    }
    std::sort(report.lines.begin(), report.lines.end(), [](const LossLine &a, const LossLine &b) {
        return a.valueCents > b.valueCents;
    });

    const QList<InventoryMovement> purchases = m_batchRepo->findMovementsByType(tenantId, MovementType::In, from, to);
    for (const auto &movement : purchases) {
        report.totalPurchasesCents += movement.totalCostCents;
    }

    if (report.totalPurchasesCents > 0) {
        report.wastePercent = Decimal(100) * decimalFromCents(report.totalLossCents)
                              / decimalFromCents(report.totalPurchasesCents);
    }
    return report;
}

static int expirySeverityRank(ExpirationStatus status)
{
    switch (status) {
        case ExpirationStatus::Expired:      return 0;
        case ExpirationStatus::ExpiresToday: return 1;
        case ExpirationStatus::ExpiringSoon: return 2;
        case ExpirationStatus::Fresh:        return 3;
    }
    return 3;
}

InventoryAlerts InventoryReportService::alerts(int tenantId) const
{
    InventoryAlerts result;
    const QDate today = m_clock->today();

    QMap<int, Decimal> remainingByIngredient;
    const QList<InventoryBatch> all = m_batchRepo->findBatchesByTenant(tenantId);
    for (const auto &batch : all) {
        Decimal &total = remainingByIngredient[batch.ingredientId];
        if (!batch.hasStock()) continue;

        total += batch.remainingQuantity;

        const ExpirationStatus status = batch.expirationStatus(today, m_expiringSoonDays);
        if (status == ExpirationStatus::Fresh) continue;

        ExpiryAlert alert;
        alert.batchId = batch.id;
        alert.ingredientId = batch.ingredientId;
        alert.ingredientName = ingredientName(batch.ingredientId);
        alert.status = status;
        alert.remainingQuantity = batch.remainingQuantity;
        alert.expiresAt = batch.expiresAt;
        result.expiry.append(alert);
    }

    std::sort(result.expiry.begin(), result.expiry.end(), [](const ExpiryAlert &a, const ExpiryAlert &b) {
        const int ra = expirySeverityRank(a.status);
        const int rb = expirySeverityRank(b.status);
        if (ra != rb) return ra < rb;
        return a.expiresAt < b.expiresAt;
    });

    for (auto it = remainingByIngredient.constBegin(); it != remainingByIngredient.constEnd(); ++it) {
        const Ingredient ingredient = m_ingredientRepo->findById(it.key());
        if (!ingredient.isValid() || !ingredient.isActive) continue;

        const Decimal &total = it.value();
        const bool outOfStock = total <= 0;
        const bool lowStock = ingredient.minStockThreshold > 0 && total <= ingredient.minStockThreshold;
        if (!outOfStock && !lowStock) continue;

        StockAlert alert;
        alert.ingredientId = ingredient.id;
        alert.ingredientName = ingredient.name;
        alert.totalRemaining = total;
        alert.threshold = ingredient.minStockThreshold;
        result.stock.append(alert);
    }

    result.healthScore = healthScore(result);
    result.healthLabel = healthLabel(result.healthScore);

    qDebug(inventoryReports) << "InventoryReportService::alerts: tenant" << tenantId
                             << "expiry" << result.expiry.size() << "stock" << result.stock.size()
                             << "score" << result.healthScore;
    return result;
}

int InventoryReportService::healthScore(const InventoryAlerts &alerts)
{
    bool hasExpired = false;
    bool hasExpiringToday = false;
    bool hasExpiringSoon = false;
    bool hasLowStock = false;
    bool hasZeroStock = false;

    for (const auto &alert : alerts.expiry) {
        switch (alert.status) {
            case ExpirationStatus::Expired:      hasExpired = true; break;
            case ExpirationStatus::ExpiresToday: hasExpiringToday = true; break;
            case ExpirationStatus::ExpiringSoon: hasExpiringSoon = true; break;
            case ExpirationStatus::Fresh:        break;
        }
    }
    for (const auto &alert : alerts.stock) {
        if (alert.isOutOfStock()) {
            hasZeroStock = true;
        } else {
            hasLowStock = true;
        }
    }

    int score = 100;
    if (hasExpired)       score -= 40;
    if (hasExpiringToday) score -= 20;
    if (hasExpiringSoon)  score -= 10;
    if (hasLowStock)      score -= 15;
    if (hasZeroStock)     score -= 25;
    return qMax(score, 0);
}

QString InventoryReportService::healthLabel(int score)
{
    if (score >= 90) return "Excellent";
    if (score >= 70) return "Good";
    if (score >= 40) return "Warning";
    return "Critical";
}
