#ifndef RECIPEREPOSITORY_H
#define RECIPEREPOSITORY_H

#include "IRecipeRepository.h"
#include <QSqlDatabase>
#include <QSqlQuery>

class RecipeRepository : public IRecipeRepository
{
public:
    explicit RecipeRepository(QSqlDatabase db);

    int create(const Recipe &recipe) override;
    Recipe findById(int tenantId, int id) override;
    QList<Recipe> findAll(int tenantId) override;
    int addIngredient(const RecipeIngredient &line) override;
    int addComponent(const RecipeComponent &component) override;
    bool removeIngredient(int recipeId, int ingredientId) override;
    bool removeComponent(int recipeId, int componentRecipeId) override;

private:
    QSqlDatabase m_db;

    Recipe recipeFromQuery(const QSqlQuery &q) const;
    bool loadLines(Recipe &recipe);
    bool executeQuery(QSqlQuery &q, const QString &context) const;
};

#endif // RECIPEREPOSITORY_H
