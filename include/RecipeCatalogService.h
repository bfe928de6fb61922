#ifndef RECIPECATALOGSERVICE_H
#define RECIPECATALOGSERVICE_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "CostingError.h"
#include "DecimalUtils.h"
#include "repositories/IDishRepository.h"
#include "repositories/IIngredientRepository.h"
#include "repositories/IRecipeRepository.h"

struct CatalogResult {
    CostingError error;
    int id = 0;

    bool isOk() const { return !error.isError(); }
};

/**
 * @brief Проверяемое изменение рецептов и блюд
 *
 * Все ссылки проверяются в пределах одного тенанта. Компонент, который
 * замкнул бы граф рецептов в цикл, отклоняется до записи.
 */
class RecipeCatalogService : public QObject
{
    Q_OBJECT

public:
    explicit RecipeCatalogService(
        IRecipeRepository* recipeRepo,
        IIngredientRepository* ingredientRepo,
        IDishRepository* dishRepo,
        int maxDepth = 32,
        QObject *parent = nullptr
    );

    CatalogResult createRecipe(int tenantId, const QString &name, int servings, RecipeType type,
                               const QString &instructions = QString());

    /**
     * @brief Добавить ингредиент; quantity задаётся на весь выход рецепта
     */
    CatalogResult addIngredient(int tenantId, int recipeId, int ingredientId, const Decimal &quantity,
                                const QString &unit = QString());

    /**
     * @brief Добавить полуфабрикат; fraction - доля выхода вложенного рецепта
     */
    CatalogResult addComponent(int tenantId, int recipeId, int componentRecipeId, const Decimal &fraction);

    CatalogResult removeIngredient(int tenantId, int recipeId, int ingredientId);
    CatalogResult removeComponent(int tenantId, int recipeId, int componentRecipeId);

    CatalogResult createDish(int tenantId, int recipeId, const QString &name, qint64 sellingPriceCents,
                             const QString &description = QString());

    CatalogResult updateDishPrice(int tenantId, int dishId, qint64 sellingPriceCents);
    CatalogResult setDishActive(int tenantId, int dishId, bool active);

private:
    /**
     * @brief Достижим ли targetRecipeId из fromRecipeId по компонентам
     * @param path цепочка имён рецептов от fromRecipeId до targetRecipeId
     */
    bool findPath(int tenantId, int fromRecipeId, int targetRecipeId, int depth, QStringList &path) const;

private:
    IRecipeRepository* m_recipeRepo;
    IIngredientRepository* m_ingredientRepo;
    IDishRepository* m_dishRepo;
    int m_maxDepth;
};

#endif // RECIPECATALOGSERVICE_H
