#include "SaleService.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QUuid>

Q_LOGGING_CATEGORY(saleService, "service.sale")

SaleService::SaleService(
    IDishRepository* dishRepo,
    const RecipeCostEngine* costEngine,
    InventoryLedger* ledger,
    const IClock* clock,
    QObject *parent
)
    : QObject(parent)
    , m_dishRepo(dishRepo)
    , m_costEngine(costEngine)
    , m_ledger(ledger)
    , m_clock(clock)
{
}

SaleResult SaleService::recordSale(int tenantId, int dishId, int quantity, const QDateTime &soldAt)
{
    SaleResult result;
    result.quantity = quantity;

    if (quantity <= 0) {
        result.error = CostingError::make(CostingErrorCode::InvalidQuantity,
            QString("Sold quantity must be positive, got %1").arg(quantity));
        return result;
    }

    const Dish dish = m_dishRepo->findById(tenantId, dishId);
    if (!dish.isValid()) {
        result.error = CostingError::make(CostingErrorCode::NotFound, QString("Dish %1 not found").arg(dishId));
        return result;
    }
    if (!dish.isActive) {
        result.error = CostingError::make(CostingErrorCode::InvalidReference,
            QString("Dish %1 is not on the menu").arg(dish.name));
        return result;
    }

    const RecipeCost cost = m_costEngine->calculateCost(tenantId, dish.recipeId);
    if (!cost.isOk()) {
        result.error = cost.error;
        qWarning(saleService) << "SaleService::recordSale: Cannot cost" << dish.name << "-" << cost.error.toString();
        return result;
    }

    const RecipeRequirements needed = m_costEngine->requirements(tenantId, dish.recipeId, Decimal(quantity));
    if (!needed.isOk()) {
        result.error = needed.error;
        return result;
    }

    QList<ConsumptionRequest> requests;
    for (auto it = needed.quantities.constBegin(); it != needed.quantities.constEnd(); ++it) {
        ConsumptionRequest request;
        request.ingredientId = it.key();
        request.quantity = it.value();
        requests.append(request);
    }

    result.reference = QUuid::createUuid().toString(QUuid::WithoutBraces);

    ConsumptionReference reference;
    reference.type = MovementType::OutSale;
    reference.referenceType = "sale";
    reference.referenceId = result.reference;
    reference.reason = QString("%1 x %2").arg(quantity).arg(dish.name);

    DishSale sale;
    sale.tenantId = tenantId;
    sale.dishId = dish.id;
    sale.quantity = quantity;
    sale.unitSellingPriceCents = dish.sellingPriceCents;
    sale.unitRecipeCostCents = cost.totalCostCents;
    sale.soldAt = soldAt.isValid() ? soldAt.toUTC() : m_clock->now();
    sale.reference = result.reference;

    // Строка продажи пишется в транзакции списания: без неё списание откатывается
    auto writeSale = [this, &sale, &result]() {
        result.saleId = m_dishRepo->recordSale(sale);
        if (result.saleId <= 0) {
            return CostingError::make(CostingErrorCode::StorageFailure,
                QString("Cannot write sale %1").arg(sale.reference));
        }
        return CostingError();
    };

    MultiConsumptionResult consumed;
    if (requests.isEmpty()) {
        consumed.error = writeSale();
    } else {
        consumed = m_ledger->consumeMany(tenantId, requests, reference, writeSale);
    }
    if (!consumed.isOk()) {
        result.saleId = 0;
        result.error = consumed.error;
        qWarning(saleService) << "SaleService::recordSale: Cannot sell" << dish.name << "-" << consumed.error.toString();
        return result;
    }

    result.unitSellingPriceCents = sale.unitSellingPriceCents;
    result.unitRecipeCostCents = sale.unitRecipeCostCents;
    result.consumedCostCents = consumed.totalCostCents;

    qInfo(saleService) << "SaleService::recordSale:" << quantity << "x" << dish.name
                       << "sale" << result.saleId << "cost snapshot" << sale.unitRecipeCostCents;
    return result;
}
