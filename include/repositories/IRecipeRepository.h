#ifndef IRECIPEREPOSITORY_H
#define IRECIPEREPOSITORY_H

#include <QList>
#include <QString>

#include "DecimalUtils.h"

/**
 * @brief Тип рецепта: полуфабрикат или готовое блюдо
 */
enum class RecipeType {
    Preparation,
    Final
};

QString recipeTypeToString(RecipeType type);
RecipeType recipeTypeFromString(const QString &str);

/**
 * @brief Прямое использование ингредиента; количество на весь выход рецепта
 */
struct RecipeIngredient {
    int id = 0;
    int recipeId = 0;
    int ingredientId = 0;
    Decimal quantity = 0;
    QString unit;
};

/**
 * @brief Вложенный рецепт; quantity — доля полного выхода вложенного рецепта
 */
struct RecipeComponent {
    int id = 0;
    int recipeId = 0;
    int componentRecipeId = 0;
    Decimal quantity = 0;
};

struct Recipe {
    int id = 0;
    int tenantId = 0;
    QString name;
    int servings = 1;
    RecipeType type = RecipeType::Final;
    QString instructions;
    QList<RecipeIngredient> ingredients;
    QList<RecipeComponent> components;
    QString createdAt;

    bool isValid() const { return id > 0 && tenantId > 0 && !name.isEmpty(); }
};

class IRecipeRepository
{
public:
    virtual ~IRecipeRepository() = default;

    /**
     * @brief Создать рецепт (только заголовок, без строк)
     * @return ID или -1 при ошибке
     */
    virtual int create(const Recipe &recipe) = 0;

    /**
     * @brief Найти рецепт вместе с ингредиентами и компонентами
     */
    virtual Recipe findById(int tenantId, int id) = 0;

    virtual QList<Recipe> findAll(int tenantId) = 0;

    virtual int addIngredient(const RecipeIngredient &line) = 0;

    virtual int addComponent(const RecipeComponent &component) = 0;

    virtual bool removeIngredient(int recipeId, int ingredientId) = 0;

    virtual bool removeComponent(int recipeId, int componentRecipeId) = 0;
};

#endif // IRECIPEREPOSITORY_H
