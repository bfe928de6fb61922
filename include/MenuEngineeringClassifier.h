#ifndef MENUENGINEERINGCLASSIFIER_H
#define MENUENGINEERINGCLASSIFIER_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <QString>

#include "AppConfig.h"
#include "CostingError.h"
#include "DecimalUtils.h"
#include "DishProfitabilityCalculator.h"
#include "repositories/IDishRepository.h"

/**
 * @brief Квадранты матрицы меню: маржинальность x популярность
 */
enum class MenuCategory {
    Star,
    Plowhorse,
    Puzzle,
    Dog
};

enum class AbcClass {
    A,
    B,
    C
};

QString menuCategoryToString(MenuCategory category);
QString abcClassToString(AbcClass abcClass);

/**
 * @brief Рекомендация по паре (квадрант, ABC-класс)
 */
QString menuStrategy(MenuCategory category, AbcClass abcClass);

struct DishPerformance {
    int dishId = 0;
    QString dishName;

    MenuCategory category = MenuCategory::Dog;
    AbcClass abcClass = AbcClass::C;

    Decimal profitMarginPercent = 0;
    int salesVolume = 0;
    qint64 totalRevenueCents = 0;
    qint64 totalProfitCents = 0;

    Decimal revenueSharePercent = 0;
    Decimal cumulativeSharePercent = 0;

    /**
     * @brief true, если текущую себестоимость посчитать нельзя и маржа взята из продаж
     */
    bool marginFromSales = false;

    QString strategy;
};

struct MenuMatrixSummary {
    int dishCount = 0;
    int starCount = 0;
    int plowhorseCount = 0;
    int puzzleCount = 0;
    int dogCount = 0;

    Decimal averageMarginPercent = 0;
    Decimal averagePopularity = 0;

    qint64 totalRevenueCents = 0;
    qint64 totalProfitCents = 0;
};

struct MenuAnalysis {
    CostingError error;
    QDateTime periodStart;
    QDateTime periodEnd;
    QList<DishPerformance> dishes;
    MenuMatrixSummary summary;

    bool isOk() const { return !error.isError(); }
};

struct MenuClassifierSettings {
    QuadrantTieRule ties = QuadrantTieRule::FavorHigh;
    Decimal abcAShare = Decimal("0.80");
    Decimal abcBShare = Decimal("0.95");
};

class MenuEngineeringClassifier : public QObject
{
    Q_OBJECT

public:
    explicit MenuEngineeringClassifier(
        IDishRepository* dishRepo,
        const DishProfitabilityCalculator* profitability,
        const MenuClassifierSettings &settings = MenuClassifierSettings(),
        QObject *parent = nullptr
    );

    /**
     * @brief Анализ активных блюд, продававшихся в полуинтервале [from, to)
     *
     * Список упорядочен по убыванию выручки.
     */
    MenuAnalysis classify(int tenantId, const QDateTime &from, const QDateTime &to) const;

    /**
     * @brief Разнести блюда по квадрантам относительно средних значений
     * @return сводка со средними и количеством блюд в каждом квадранте
     */
    static MenuMatrixSummary assignQuadrants(QList<DishPerformance> &dishes, QuadrantTieRule ties);

    /**
     * @brief Сортирует по убыванию выручки и проставляет ABC-классы по накопленной доле
     */
    static void assignAbcClasses(QList<DishPerformance> &dishes, const Decimal &aShare, const Decimal &bShare);

private:
    IDishRepository* m_dishRepo;
    const DishProfitabilityCalculator* m_profitability;
    MenuClassifierSettings m_settings;
};

#endif // MENUENGINEERINGCLASSIFIER_H
