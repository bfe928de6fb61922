#ifndef DISHREPOSITORY_H
#define DISHREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IDishRepository.h"

class DishRepository : public IDishRepository
{
public:
    explicit DishRepository(QSqlDatabase db);

    int create(const Dish &dish) override;
    Dish findById(int tenantId, int id) override;
    QList<Dish> findAll(int tenantId, bool activeOnly) override;
    bool update(const Dish &dish) override;
    bool setActive(int tenantId, int id, bool active) override;

    int recordSale(const DishSale &sale) override;
    QList<DishSale> findSales(int tenantId, const QDateTime &from, const QDateTime &to) override;

private:
    Dish dishFromQuery(const QSqlQuery &q) const;
    DishSale saleFromQuery(const QSqlQuery &q) const;
    bool executeQuery(QSqlQuery &q, const QString &context) const;

private:
    QSqlDatabase m_db;
};

#endif // DISHREPOSITORY_H
