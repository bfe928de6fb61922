#ifndef IDISHREPOSITORY_H
#define IDISHREPOSITORY_H

#include <QList>
#include <QString>
#include <QDateTime>

struct Dish {
    int id = 0;
    int tenantId = 0;
    int recipeId = 0;
    QString name;
    QString description;
    qint64 sellingPriceCents = 0;
    bool isActive = true;
    QString createdAt;

    bool isValid() const { return id > 0 && tenantId > 0 && !name.isEmpty(); }
};

/**
 * @brief Продажа блюда. Себестоимость фиксируется на момент продажи.
 */
struct DishSale {
    int id = 0;
    int tenantId = 0;
    int dishId = 0;
    int quantity = 0;
    qint64 unitSellingPriceCents = 0;
    qint64 unitRecipeCostCents = 0;
    QDateTime soldAt;
    QString reference;

    bool isValid() const { return id > 0 && dishId > 0; }
    qint64 revenueCents() const { return unitSellingPriceCents * quantity; }
    qint64 profitCents() const { return (unitSellingPriceCents - unitRecipeCostCents) * quantity; }
};

class IDishRepository
{
public:
    virtual ~IDishRepository() = default;

    virtual int create(const Dish &dish) = 0;
    virtual Dish findById(int tenantId, int id) = 0;
    virtual QList<Dish> findAll(int tenantId, bool activeOnly) = 0;
    virtual bool update(const Dish &dish) = 0;
    virtual bool setActive(int tenantId, int id, bool active) = 0;

    virtual int recordSale(const DishSale &sale) = 0;

    /**
     * @brief Продажи за полуинтервал [from, to)
     */
    virtual QList<DishSale> findSales(int tenantId, const QDateTime &from, const QDateTime &to) = 0;
};

#endif // IDISHREPOSITORY_H
