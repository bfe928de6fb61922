#ifndef INGREDIENTREPOSITORY_H
#define INGREDIENTREPOSITORY_H

#include "IIngredientRepository.h"
#include <QSqlDatabase>
#include <QSqlQuery>

class IngredientRepository : public IIngredientRepository
{
public:
    explicit IngredientRepository(QSqlDatabase db);

    int create(const Ingredient &ingredient) override;
    Ingredient findById(int id) override;
    QList<Ingredient> findAll() override;
    bool exists(int id) override;

private:
    QSqlDatabase m_db;

    Ingredient ingredientFromQuery(const QSqlQuery &query) const;

    bool executeQuery(QSqlQuery &query, const QString &context) const;
};

#endif // INGREDIENTREPOSITORY_H
