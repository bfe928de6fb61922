#include "MenuEngineeringClassifier.h"

#include <QDebug>
#include <QHash>
#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(menuEngineering, "service.menu_engineering")

QString menuCategoryToString(MenuCategory category)
{
    switch (category) {
        case MenuCategory::Star:      return "Star";
        case MenuCategory::Plowhorse: return "Plowhorse";
        case MenuCategory::Puzzle:    return "Puzzle";
        case MenuCategory::Dog:       return "Dog";
    }
    return QString();
}

QString abcClassToString(AbcClass abcClass)
{
    switch (abcClass) {
        case AbcClass::A: return "A";
        case AbcClass::B: return "B";
        case AbcClass::C: return "C";
    }
    return QString();
}

QString menuStrategy(MenuCategory category, AbcClass abcClass)
{
    switch (category) {
        case MenuCategory::Star:
            switch (abcClass) {
                case AbcClass::A: return "Core menu item. Protect and promote: keep quality and price stable, ensure availability.";
                case AbcClass::B: return "Strong performer. Consider a slight price increase (5-10%).";
                case AbcClass::C: return "Anomaly: popular but low revenue. Check portion size and pricing.";
            }
            break;
        case MenuCategory::Plowhorse:
            switch (abcClass) {
                case AbcClass::A: return "High volume, low margin. Reduce portion by 10-15% or raise price by 15-20%.";
                case AbcClass::B: return "Popular but unprofitable. Optimize ingredient costs or find cheaper suppliers.";
                case AbcClass::C: return "Low margin and low revenue. Strong candidate for removal.";
            }
            break;
        case MenuCategory::Puzzle:
            switch (abcClass) {
                case AbcClass::A: return "High margin, needs visibility. Move to the top of the menu and bundle it.";
                case AbcClass::B: return "Profitable but underselling. Improve presentation and staff recommendations.";
                case AbcClass::C: return "High margin but very low sales. Run a short promotion, then remove if nothing changes.";
            }
            break;
        case MenuCategory::Dog:
            switch (abcClass) {
                case AbcClass::A: return "Data anomaly: low profit and low sales should not produce high revenue.";
                case AbcClass::B: return "Unprofitable and unpopular. Remove from the menu.";
                case AbcClass::C: return "Consider removing it from the menu and review why it failed.";
            }
            break;
    }
    return QString();
}

MenuEngineeringClassifier::MenuEngineeringClassifier(
    IDishRepository* dishRepo,
    const DishProfitabilityCalculator* profitability,
    const MenuClassifierSettings &settings,
    QObject *parent
)
    : QObject(parent)
    , m_dishRepo(dishRepo)
    , m_profitability(profitability)
    , m_settings(settings)
{
}

MenuMatrixSummary MenuEngineeringClassifier::assignQuadrants(QList<DishPerformance> &dishes, QuadrantTieRule ties)
{
    MenuMatrixSummary summary;
    summary.dishCount = dishes.size();
    if (dishes.isEmpty()) {
        return summary;
    }

    Decimal marginSum = 0;
    Decimal volumeSum = 0;
    for (const auto &dish : dishes) {
        marginSum += dish.profitMarginPercent;
        volumeSum += Decimal(dish.salesVolume);
        summary.totalRevenueCents += dish.totalRevenueCents;
        summary.totalProfitCents += dish.totalProfitCents;
    }
    summary.averageMarginPercent = marginSum / dishes.size();
    summary.averagePopularity = volumeSum / dishes.size();

    for (auto &dish : dishes) {
        const Decimal volume(dish.salesVolume);
        const bool highMargin = ties == QuadrantTieRule::FavorHigh
            ? dish.profitMarginPercent >= summary.averageMarginPercent
            : dish.profitMarginPercent > summary.averageMarginPercent;
        const bool popular = ties == QuadrantTieRule::FavorHigh
            ? volume >= summary.averagePopularity
            : volume > summary.averagePopularity;

        if (highMargin && popular) {
            dish.category = MenuCategory::Star;
            ++summary.starCount;
        } else if (!highMargin && popular) {
            dish.category = MenuCategory::Plowhorse;
            ++summary.plowhorseCount;
        } else if (highMargin) {
            dish.category = MenuCategory::Puzzle;
            ++summary.puzzleCount;
        } else {
            dish.category = MenuCategory::Dog;
            ++summary.dogCount;
        }
    }

    return summary;
}

void MenuEngineeringClassifier::assignAbcClasses(QList<DishPerformance> &dishes,
                                                 const Decimal &aShare, const Decimal &bShare)
{
    std::stable_sort(dishes.begin(), dishes.end(), [](const DishPerformance &a, const DishPerformance &b) {
        if (a.totalRevenueCents != b.totalRevenueCents) {
            return a.totalRevenueCents > b.totalRevenueCents;
        }
        return a.dishId < b.dishId;
    });

    qint64 totalRevenue = 0;
    for (const auto &dish : dishes) {
        totalRevenue += dish.totalRevenueCents;
    }

    qint64 cumulative = 0;
    for (auto &dish : dishes) {
        cumulative += dish.totalRevenueCents;

        if (totalRevenue <= 0) {
            dish.revenueSharePercent = 0;
            dish.cumulativeSharePercent = 0;
            dish.abcClass = AbcClass::C;
            continue;
        }

        const Decimal share = decimalFromCents(cumulative) / decimalFromCents(totalRevenue);
        dish.revenueSharePercent = Decimal(100) * decimalFromCents(dish.totalRevenueCents) / decimalFromCents(totalRevenue);
        dish.cumulativeSharePercent = Decimal(100) * share;

        if (share <= aShare) {
            dish.abcClass = AbcClass::A;
        } else if (share <= bShare) {
            dish.abcClass = AbcClass::B;
        } else {
            dish.abcClass = AbcClass::C;
        }
    }
}

MenuAnalysis MenuEngineeringClassifier::classify(int tenantId, const QDateTime &from, const QDateTime &to) const
{
    MenuAnalysis analysis;
    analysis.periodStart = from;
    analysis.periodEnd = to;

    if (!from.isValid() || !to.isValid() || to <= from) {
        analysis.error = CostingError::make(CostingErrorCode::InvalidDate, "Analysis period is empty or invalid");
        return analysis;
    }

    struct SalesTotals {
        int volume = 0;
        qint64 revenueCents = 0;
        qint64 profitCents = 0;
    };

    QHash<int, SalesTotals> totals;
    const QList<DishSale> sales = m_dishRepo->findSales(tenantId, from, to);
    for (const auto &sale : sales) {
        SalesTotals &t = totals[sale.dishId];
        t.volume += sale.quantity;
        t.revenueCents += sale.revenueCents();
        t.profitCents += sale.profitCents();
    }

    const QList<Dish> dishes = m_dishRepo->findAll(tenantId, true);
    for (const auto &dish : dishes) {
        const auto it = totals.constFind(dish.id);
        if (it == totals.constEnd() || it->volume <= 0) {
            continue;
        }

        DishPerformance performance;
        performance.dishId = dish.id;
        performance.dishName = dish.name;
        performance.salesVolume = it->volume;
        performance.totalRevenueCents = it->revenueCents;
        performance.totalProfitCents = it->profitCents;

        const DishFinancials financials = m_profitability->analyze(tenantId, dish.id);
        if (financials.isOk()) {
            performance.profitMarginPercent = financials.profitMarginPercent;
        } else if (financials.error.code == CostingErrorCode::NoStockAvailable && it->revenueCents > 0) {
            performance.profitMarginPercent =
                Decimal(100) * decimalFromCents(it->profitCents) / decimalFromCents(it->revenueCents);
            performance.marginFromSales = true;
            qDebug(menuEngineering) << "MenuEngineeringClassifier::classify:" << dish.name
                                    << "uses margin from sales -" << financials.error.message;
        } else {
            analysis.error = financials.error;
            qWarning(menuEngineering) << "MenuEngineeringClassifier::classify: Cannot analyze" << dish.name
                                      << "-" << financials.error.toString();
            return analysis;
        }

        analysis.dishes.append(performance);
    }

    analysis.summary = assignQuadrants(analysis.dishes, m_settings.ties);
    assignAbcClasses(analysis.dishes, m_settings.abcAShare, m_settings.abcBShare);

    for (auto &dish : analysis.dishes) {
        dish.strategy = menuStrategy(dish.category, dish.abcClass);
    }

    qInfo(menuEngineering) << "MenuEngineeringClassifier::classify: tenant" << tenantId
                           << "dishes" << analysis.summary.dishCount
                           << "stars" << analysis.summary.starCount
                           << "plowhorses" << analysis.summary.plowhorseCount
                           << "puzzles" << analysis.summary.puzzleCount
                           << "dogs" << analysis.summary.dogCount;
    return analysis;
}
