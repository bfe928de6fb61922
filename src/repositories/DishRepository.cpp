#include "repositories/DishRepository.h"
#include "DateTimeUtils.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(dishRepo, "repository.dish")

DishRepository::DishRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(dishRepo) << "DishRepository: Database is not open";
    }
}

bool DishRepository::executeQuery(QSqlQuery &q, const QString &context) const
{
    if (!q.exec()) {
        qCritical(dishRepo) << "DishRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(dishRepo) << "DishRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

Dish DishRepository::dishFromQuery(const QSqlQuery &q) const
{
    Dish d;
    d.id = q.value("id").toInt();
    d.tenantId = q.value("tenant_id").toInt();
    d.recipeId = q.value("recipe_id").toInt();
    d.name = q.value("name").toString();
    d.description = q.value("description").toString();
    d.sellingPriceCents = q.value("selling_price_cents").toLongLong();
    d.isActive = q.value("is_active").toInt() == 1;
    d.createdAt = q.value("created_at").toString();
    return d;
}

DishSale DishRepository::saleFromQuery(const QSqlQuery &q) const
{
    DishSale s;
    s.id = q.value("id").toInt();
    s.tenantId = q.value("tenant_id").toInt();
    s.dishId = q.value("dish_id").toInt();
    s.quantity = q.value("quantity").toInt();
    s.unitSellingPriceCents = q.value("unit_selling_price_cents").toLongLong();
    s.unitRecipeCostCents = q.value("unit_recipe_cost_cents").toLongLong();
    s.soldAt = dateTimeFromDb(q.value("sold_at"));
    s.reference = q.value("reference_id").toString();
    return s;
}

int DishRepository::create(const Dish &dish)
{
    if (dish.tenantId <= 0 || dish.recipeId <= 0 || dish.name.trimmed().isEmpty()) {
        qWarning(dishRepo) << "DishRepository::create: tenant, recipe or name missing";
        return -1;
    }
    if (dish.sellingPriceCents <= 0) {
        qWarning(dishRepo) << "DishRepository::create: selling price must be positive";
        return -1;
    }

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO dishes (tenant_id, recipe_id, name, description, selling_price_cents, is_active)
        VALUES (:tenant, :recipe, :name, :description, :price, :active)
    )");
    q.bindValue(":tenant", dish.tenantId);
    q.bindValue(":recipe", dish.recipeId);
    q.bindValue(":name", dish.name.trimmed());
    q.bindValue(":description", dish.description.isEmpty() ? QVariant() : QVariant(dish.description));
    q.bindValue(":price", dish.sellingPriceCents);
    q.bindValue(":active", dish.isActive ? 1 : 0);

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    qInfo(dishRepo) << "DishRepository::create: Created dish" << dish.name << "with id" << id;
    return id > 0 ? id : -1;
}

Dish DishRepository::findById(int tenantId, int id)
{
    if (tenantId <= 0 || id <= 0) return Dish();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, tenant_id, recipe_id, name, description, selling_price_cents, is_active, created_at
        FROM dishes
        WHERE id = :id AND tenant_id = :tenant
    )");
    q.bindValue(":id", id);
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "findById")) return Dish();
    if (!q.next()) return Dish();

    return dishFromQuery(q);
}

QList<Dish> DishRepository::findAll(int tenantId, bool activeOnly)
{
    QList<Dish> res;
    if (tenantId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT id, tenant_id, recipe_id, name, description, selling_price_cents, is_active, created_at
        FROM dishes
        WHERE tenant_id = :tenant %1
        ORDER BY name
    )").arg(activeOnly ? "AND is_active = 1" : ""));
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "findAll")) return res;
    while (q.next()) res.append(dishFromQuery(q));
    return res;
}

bool DishRepository::update(const Dish &dish)
{
    if (!dish.isValid() || dish.sellingPriceCents <= 0) {
        qWarning(dishRepo) << "DishRepository::update: Invalid dish (id:" << dish.id << ")";
        return false;
    }

    QSqlQuery q(m_db);
    q.prepare(R"(
        UPDATE dishes
        SET name = :name,
            description = :description,
            selling_price_cents = :price,
            is_active = :active,
            updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
        WHERE id = :id AND tenant_id = :tenant
    )");
    q.bindValue(":name", dish.name.trimmed());
    q.bindValue(":description", dish.description.isEmpty() ? QVariant() : QVariant(dish.description));
    q.bindValue(":price", dish.sellingPriceCents);
    q.bindValue(":active", dish.isActive ? 1 : 0);
    q.bindValue(":id", dish.id);
    q.bindValue(":tenant", dish.tenantId);

    if (!executeQuery(q, "update")) return false;
    return q.numRowsAffected() > 0;
}

bool DishRepository::setActive(int tenantId, int id, bool active)
{
    QSqlQuery q(m_db);
    q.prepare(R"(
        UPDATE dishes
        SET is_active = :active,
            updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
        WHERE id = :id AND tenant_id = :tenant
    )");
    q.bindValue(":active", active ? 1 : 0);
    q.bindValue(":id", id);
    q.bindValue(":tenant", tenantId);

    if (!executeQuery(q, "setActive")) return false;
    return q.numRowsAffected() > 0;
}

int DishRepository::recordSale(const DishSale &sale)
{
    if (sale.tenantId <= 0 || sale.dishId <= 0 || sale.quantity <= 0) return -1;

    QSqlQuery q(m_db);
    q.prepare(R"(
        INSERT INTO dish_sales (tenant_id, dish_id, quantity, unit_selling_price_cents,
                                unit_recipe_cost_cents, sold_at, reference_id)
        VALUES (:tenant, :dish, :qty, :price, :cost, :sold_at, :reference)
    )");
    q.bindValue(":tenant", sale.tenantId);
    q.bindValue(":dish", sale.dishId);
    q.bindValue(":qty", sale.quantity);
    q.bindValue(":price", sale.unitSellingPriceCents);
    q.bindValue(":cost", sale.unitRecipeCostCents);
    q.bindValue(":sold_at", dateTimeToDb(sale.soldAt));
    q.bindValue(":reference", sale.reference.isEmpty() ? QVariant() : QVariant(sale.reference));

    if (!executeQuery(q, "recordSale")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

QList<DishSale> DishRepository::findSales(int tenantId, const QDateTime &from, const QDateTime &to)
{
    QList<DishSale> res;
    if (tenantId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, tenant_id, dish_id, quantity, unit_selling_price_cents, unit_recipe_cost_cents, sold_at,
               reference_id
        FROM dish_sales
        WHERE tenant_id = :tenant
          AND sold_at >= :from
          AND sold_at < :to
        ORDER BY sold_at, id
    )");
    q.bindValue(":tenant", tenantId);
    q.bindValue(":from", dateTimeToDb(from));
    q.bindValue(":to", dateTimeToDb(to));

    if (!executeQuery(q, "findSales")) return res;
    while (q.next()) res.append(saleFromQuery(q));
    return res;
}
