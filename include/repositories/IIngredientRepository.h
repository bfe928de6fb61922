#ifndef IINGREDIENTREPOSITORY_H
#define IINGREDIENTREPOSITORY_H

#include <QList>
#include <QString>
#include <QStringList>

#include "DecimalUtils.h"

/**
 * @brief Справочник ингредиентов (общий для всех арендаторов)
 */
struct Ingredient {
    int id = 0;
    QString name;
    QString unit = "kg";
    QString category;
    int shelfLifeDays = 0;
    QStringList allergens;
    Decimal minStockThreshold = 0;
    bool isActive = true;
    QString createdAt;

    bool isValid() const { return id > 0 && !name.isEmpty(); }
};

class IIngredientRepository
{
public:
    virtual ~IIngredientRepository() = default;

    virtual int create(const Ingredient &ingredient) = 0;

    virtual Ingredient findById(int id) = 0;

    virtual QList<Ingredient> findAll() = 0;

    virtual bool exists(int id) = 0;
};

#endif // IINGREDIENTREPOSITORY_H
