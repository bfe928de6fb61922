#include "AppConfig.h"
#include "Clock.h"
#include "DateTimeUtils.h"
#include "DbManager.h"
#include "DishProfitabilityCalculator.h"
#include "IngredientCostResolver.h"
#include "InventoryLedger.h"
#include "InventoryReportService.h"
#include "LedgerLockRegistry.h"
#include "MenuEngineeringClassifier.h"
#include "MigrationRunner.h"
#include "RecipeCostEngine.h"
#include "SaleService.h"

#include "repositories/BatchRepository.h"
#include "repositories/DishRepository.h"
#include "repositories/IngredientRepository.h"
#include "repositories/RecipeRepository.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>

Q_LOGGING_CATEGORY(cli, "cli")

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString formatCents(qint64 cents)
{
    return decimalToString(decimalFromCents(cents) / 100, 2);
}

QString formatPercent(const Decimal &value)
{
    return decimalToString(value, 2) + "%";
}

int reportError(const CostingError &error)
{
    err() << "error: " << error.toString() << Qt::endl;
    return ExitFailure;
}

/**
 * @brief Сервисы, собранные поверх одного соединения с БД
 */
struct Services {
    Services(QSqlDatabase db, const AppConfig &config)
        : ingredientRepo(db)
        , batchRepo(db)
        , recipeRepo(db)
        , dishRepo(db)
        , ledger(&batchRepo, &ingredientRepo, &locks, &clock)
        , resolver(&batchRepo, &ingredientRepo)
        , costEngine(&recipeRepo, &resolver, config.maxRecipeDepth)
        , profitability(&dishRepo, &costEngine, thresholds(config))
        , classifier(&dishRepo, &profitability, classifierSettings(config))
        , sales(&dishRepo, &costEngine, &ledger, &clock)
        , reports(&batchRepo, &ingredientRepo, &clock, config.expiringSoonDays)
    {
    }

    static ProfitThresholds thresholds(const AppConfig &config)
    {
        ProfitThresholds t;
        t.minMarginPercent = config.minMarginPercent;
        t.maxFoodCostPercent = config.maxFoodCostPercent;
        return t;
    }

    static MenuClassifierSettings classifierSettings(const AppConfig &config)
    {
        MenuClassifierSettings s;
        s.ties = config.quadrantTies;
        s.abcAShare = config.abcAShare;
        s.abcBShare = config.abcBShare;
        return s;
    }

    SystemClock clock;
    LedgerLockRegistry locks;

    IngredientRepository ingredientRepo;
    BatchRepository batchRepo;
    RecipeRepository recipeRepo;
    DishRepository dishRepo;

    InventoryLedger ledger;
    IngredientCostResolver resolver;
    RecipeCostEngine costEngine;
    DishProfitabilityCalculator profitability;
    MenuEngineeringClassifier classifier;
    SaleService sales;
    InventoryReportService reports;
};

bool requireInt(const QCommandLineParser &parser, const QString &name, int &value)
{
    bool ok = false;
    value = parser.value(name).toInt(&ok);
    if (!parser.isSet(name) || !ok || value <= 0) {
        err() << "error: --" << name << " must be a positive integer" << Qt::endl;
        return false;
    }
    return true;
}

bool requireDecimal(const QCommandLineParser &parser, const QString &name, Decimal &value)
{
    if (!parser.isSet(name) || !tryParseDecimal(parser.value(name), value)) {
        err() << "error: --" << name << " must be a decimal number" << Qt::endl;
        return false;
    }
    return true;
}

bool readPeriod(const QCommandLineParser &parser, const IClock &clock, QDateTime &from, QDateTime &to)
{
    to = parser.isSet("to") ? dateTimeFromInput(parser.value("to")) : clock.now();
    from = parser.isSet("from") ? dateTimeFromInput(parser.value("from")) : to.addDays(-30);
    if (!from.isValid() || !to.isValid() || to <= from) {
        err() << "error: invalid period, use --from/--to as YYYY-MM-DD or ISO date-time" << Qt::endl;
        return false;
    }
    return true;
}

void printDraws(const QList<BatchDraw> &draws)
{
    for (const auto &draw : draws) {
        out() << "  batch " << draw.batchId << ": " << decimalToStorageString(draw.quantity)
              << " x " << formatCents(draw.unitCostCents) << Qt::endl;
    }
}

int runReceive(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int ingredientId = 0;
    Decimal quantity;
    if (!requireInt(parser, "ingredient", ingredientId) || !requireDecimal(parser, "quantity", quantity)) {
        return ExitUsage;
    }
    bool ok = false;
    const qint64 unitCost = parser.value("cost").toLongLong(&ok);
    if (!ok) {
        err() << "error: --cost must be an integer amount of cents" << Qt::endl;
        return ExitUsage;
    }

    const QDateTime receivedAt = parser.isSet("received") ? dateTimeFromInput(parser.value("received")) : QDateTime();
    const QDateTime expiresAt = dateTimeFromInput(parser.value("expires"));

    const ReceiveResult result = s.ledger.receive(tenantId, ingredientId, quantity, unitCost, receivedAt, expiresAt,
                                                  parser.value("supplier"), parser.value("invoice"));
    if (!result.isOk()) return reportError(result.error);

    out() << "batch " << result.batchId << " received" << Qt::endl;
    return ExitOk;
}

int runConsume(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int ingredientId = 0;
    Decimal quantity;
    if (!requireInt(parser, "ingredient", ingredientId) || !requireDecimal(parser, "quantity", quantity)) {
        return ExitUsage;
    }

    ConsumptionReference reference;
    reference.type = MovementType::OutSale;
    reference.referenceType = "manual";
    reference.reason = parser.value("reason");

    const ConsumptionResult result = s.ledger.consume(tenantId, ingredientId, quantity, reference);
    if (!result.isOk()) return reportError(result.error);

    out() << "consumed " << decimalToStorageString(result.quantity) << " for " << formatCents(result.totalCostCents)
          << " (avg " << decimalToString(result.weightedUnitCostCents() / 100, 4) << ")" << Qt::endl;
    printDraws(result.draws);
    return ExitOk;
}

int runExpire(Services &s, int tenantId)
{
    const LedgerOperationResult result = s.ledger.processExpirations(tenantId);
    if (!result.isOk()) return reportError(result.error);

    out() << result.affected << " expired batch(es) written off" << Qt::endl;
    return ExitOk;
}

int runArchive(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int batchId = 0;
    if (!requireInt(parser, "batch", batchId)) return ExitUsage;

    const LedgerOperationResult result = s.ledger.archiveBatch(tenantId, batchId);
    if (!result.isOk()) return reportError(result.error);

    out() << "batch " << batchId << " archived" << Qt::endl;
    return ExitOk;
}

int runWriteOff(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int batchId = 0;
    Decimal quantity;
    if (!requireInt(parser, "batch", batchId) || !requireDecimal(parser, "quantity", quantity)) {
        return ExitUsage;
    }

    const LedgerOperationResult result = s.ledger.writeOff(tenantId, batchId, quantity, parser.value("reason"));
    if (!result.isOk()) return reportError(result.error);

    out() << "written off " << decimalToStorageString(quantity) << " from batch " << batchId << Qt::endl;
    return ExitOk;
}

int runBatches(const QCommandLineParser &parser, Services &s, int tenantId)
{
    const int ingredientId = parser.value("ingredient").toInt();
    const QDate today = s.clock.today();

    const QList<InventoryBatch> batches = s.ledger.batches(tenantId, ingredientId);
    for (const auto &batch : batches) {
        out() << batch.id << "\t" << batch.ingredientId
              << "\t" << decimalToStorageString(batch.remainingQuantity) << "/" << decimalToStorageString(batch.initialQuantity)
              << "\t" << formatCents(batch.unitCostCents)
              << "\t" << batch.receivedAt.toString(Qt::ISODate)
              << "\t" << batch.expiresAt.toString(Qt::ISODate)
              << "\t" << batchStatusToString(batch.status)
              << "\t" << expirationStatusToString(batch.expirationStatus(today, s.reports.expiringSoonDays()))
              << Qt::endl;
    }

    if (parser.isSet("batch")) {
        const QList<InventoryMovement> movements = s.ledger.movements(tenantId, parser.value("batch").toInt());
        for (const auto &movement : movements) {
            out() << "  " << movement.createdAt.toString(Qt::ISODateWithMs)
                  << "\t" << movementTypeToString(movement.type)
                  << "\t" << decimalToStorageString(movement.quantityDelta)
                  << "\t" << formatCents(movement.totalCostCents)
                  << "\t" << movement.referenceType << " " << movement.referenceId
                  << Qt::endl;
        }
    }
    return ExitOk;
}

int runCostRecipe(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int recipeId = 0;
    if (!requireInt(parser, "recipe", recipeId)) return ExitUsage;

    const RecipeCost cost = s.costEngine.calculateCost(tenantId, recipeId);
    if (!cost.isOk()) return reportError(cost.error);

    out() << cost.recipeName << ": total " << formatCents(cost.totalCostCents)
          << ", per serving " << formatCents(cost.costPerServingCents)
          << " (" << cost.servings << " servings)" << Qt::endl;
    if (!cost.coveredByStock) {
        out() << "warning: stock does not cover the recipe, shortfall priced at the latest purchase price" << Qt::endl;
    }
    for (const auto &line : cost.breakdown) {
        out() << "  ingredient " << line.ingredientId << ": " << decimalToStorageString(line.quantity)
              << " -> " << decimalToString(line.exactCostCents / 100, 4) << Qt::endl;
    }
    return ExitOk;
}

int runAnalyzeDish(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int dishId = 0;
    if (!requireInt(parser, "dish", dishId)) return ExitUsage;

    const DishFinancials financials = s.profitability.analyze(tenantId, dishId);
    if (!financials.isOk()) return reportError(financials.error);

    out() << financials.dishName << Qt::endl
          << "  price      " << formatCents(financials.sellingPriceCents) << Qt::endl
          << "  cost       " << formatCents(financials.recipeCostCents) << Qt::endl
          << "  profit     " << formatCents(financials.profitCents) << Qt::endl
          << "  margin     " << formatPercent(financials.profitMarginPercent) << Qt::endl
          << "  food cost  " << formatPercent(financials.foodCostPercent) << Qt::endl;
    for (ProfitWarning warning : financials.warnings) {
        out() << "  " << profitWarningToString(warning) << Qt::endl;
    }
    return ExitOk;
}

int runSell(const QCommandLineParser &parser, Services &s, int tenantId)
{
    int dishId = 0;
    int quantity = 0;
    if (!requireInt(parser, "dish", dishId) || !requireInt(parser, "quantity", quantity)) return ExitUsage;

    const QDateTime soldAt = parser.isSet("sold-at") ? dateTimeFromInput(parser.value("sold-at")) : QDateTime();

    const SaleResult result = s.sales.recordSale(tenantId, dishId, quantity, soldAt);
    if (!result.isOk()) return reportError(result.error);

    out() << "sale " << result.saleId << " (" << result.reference << "): " << quantity
          << " x " << formatCents(result.unitSellingPriceCents)
          << ", cost snapshot " << formatCents(result.unitRecipeCostCents)
          << ", stock consumed " << formatCents(result.consumedCostCents) << Qt::endl;
    return ExitOk;
}

int runMenuReport(const QCommandLineParser &parser, Services &s, int tenantId)
{
    QDateTime from;
    QDateTime to;
    if (!readPeriod(parser, s.clock, from, to)) return ExitUsage;

    const MenuAnalysis analysis = s.classifier.classify(tenantId, from, to);
    if (!analysis.isOk()) return reportError(analysis.error);

    const MenuMatrixSummary &summary = analysis.summary;
    out() << "dishes " << summary.dishCount
          << ", stars " << summary.starCount << ", plowhorses " << summary.plowhorseCount
          << ", puzzles " << summary.puzzleCount << ", dogs " << summary.dogCount << Qt::endl
          << "average margin " << formatPercent(summary.averageMarginPercent)
          << ", average volume " << decimalToString(summary.averagePopularity, 2)
          << ", revenue " << formatCents(summary.totalRevenueCents)
          << ", profit " << formatCents(summary.totalProfitCents) << Qt::endl;

    for (const auto &dish : analysis.dishes) {
        out() << dish.dishName
              << "\t" << menuCategoryToString(dish.category) << "/" << abcClassToString(dish.abcClass)
              << "\tmargin " << formatPercent(dish.profitMarginPercent) << (dish.marginFromSales ? "*" : "")
              << "\tsold " << dish.salesVolume
              << "\trevenue " << formatCents(dish.totalRevenueCents)
              << "\tcumulative " << formatPercent(dish.cumulativeSharePercent)
              << Qt::endl
              << "  " << dish.strategy << Qt::endl;
    }
    return ExitOk;
}

int runStock(Services &s, int tenantId)
{
    const QList<StockLine> lines = s.reports.stockSummary(tenantId);
    for (const auto &line : lines) {
        out() << line.ingredientName << "\t" << decimalToStorageString(line.totalRemaining) << " " << line.unit
              << "\t" << line.activeBatches << " batch(es)"
              << "\tavg " << decimalToString(line.averageUnitCostCents / 100, 4)
              << "\tvalue " << formatCents(line.stockValueCents) << Qt::endl;
    }
    return ExitOk;
}

int runLosses(const QCommandLineParser &parser, Services &s, int tenantId)
{
    QDateTime from;
    QDateTime to;
    if (!readPeriod(parser, s.clock, from, to)) return ExitUsage;

    const LossReport report = s.reports.lossReport(tenantId, from, to);
    for (const auto &line : report.lines) {
        out() << line.ingredientName << "\t" << decimalToStorageString(line.quantity)
              << "\t" << formatCents(line.valueCents) << Qt::endl;
    }
    out() << "losses " << formatCents(report.totalLossCents)
          << ", purchases " << formatCents(report.totalPurchasesCents)
          << ", waste " << formatPercent(report.wastePercent) << Qt::endl;
    return ExitOk;
}

int runAlerts(Services &s, int tenantId)
{
    const InventoryAlerts alerts = s.reports.alerts(tenantId);
    for (const auto &alert : alerts.expiry) {
        out() << expirationStatusToString(alert.status) << "\t" << alert.ingredientName
              << "\tbatch " << alert.batchId
              << "\t" << decimalToStorageString(alert.remainingQuantity)
              << "\texpires " << alert.expiresAt.toString(Qt::ISODate) << Qt::endl;
    }
    for (const auto &alert : alerts.stock) {
        out() << (alert.isOutOfStock() ? "OutOfStock" : "LowStock") << "\t" << alert.ingredientName
              << "\t" << decimalToStorageString(alert.totalRemaining)
              << " (threshold " << decimalToStorageString(alert.threshold) << ")" << Qt::endl;
    }
    out() << "health " << alerts.healthScore << " (" << alerts.healthLabel << ")" << Qt::endl;
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("kitchencost");
    QCoreApplication::setOrganizationName("kitchencost");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Restaurant costing engine: batch inventory, recipe costing and menu engineering.\n\n"
        "Commands:\n"
        "  migrate        create or upgrade the database (--demo loads sample data)\n"
        "  receive        receive a batch (--ingredient --quantity --cost --expires)\n"
        "  consume        consume stock by FIFO (--ingredient --quantity)\n"
        "  write-off      adjust one batch (--batch --quantity --reason)\n"
        "  expire         write off all expired batches\n"
        "  archive        archive a batch (--batch)\n"
        "  batches        list batches (--ingredient), movements of --batch\n"
        "  cost-recipe    recipe cost (--recipe)\n"
        "  analyze-dish   dish profitability (--dish)\n"
        "  sell           record a sale (--dish --quantity)\n"
        "  menu-report    menu engineering matrix (--from --to)\n"
        "  stock          stock summary\n"
        "  losses         expiry losses (--from --to)\n"
        "  alerts         expiry and low stock alerts");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "Command to run");

    parser.addOptions({
        {"config", "INI configuration file.", "path"},
        {"db", "SQLite database file, overrides the configuration.", "path"},
        {"tenant", "Tenant id.", "id", "1"},
        {"ingredient", "Ingredient id.", "id"},
        {"batch", "Batch id.", "id"},
        {"recipe", "Recipe id.", "id"},
        {"dish", "Dish id.", "id"},
        {"quantity", "Quantity (decimal) or number of portions.", "qty"},
        {"cost", "Unit cost in cents.", "cents"},
        {"received", "Receipt date/time.", "date"},
        {"expires", "Expiry date/time.", "date"},
        {"supplier", "Supplier name.", "name"},
        {"invoice", "Invoice number.", "number"},
        {"reason", "Reason for a write-off or manual consumption.", "text"},
        {"sold-at", "Sale date/time.", "date"},
        {"from", "Period start (inclusive).", "date"},
        {"to", "Period end (exclusive).", "date"},
        {"demo", "Load demo data after migration."}
    });

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(ExitUsage);
    }
    const QString command = positional.first();

    const QString configPath = parser.isSet("config") ? parser.value("config") : AppConfig::defaultConfigPath();
    AppConfig config = AppConfig::load(configPath);
    if (parser.isSet("db")) {
        config.databasePath = parser.value("db");
    }

    QString configError;
    if (!config.validate(&configError)) {
        err() << "error: invalid configuration: " << configError << Qt::endl;
        return ExitUsage;
    }
    if (!config.loggingRules.isEmpty()) {
        QLoggingCategory::setFilterRules(config.loggingRules);
    }

    bool tenantOk = false;
    const int tenantId = parser.value("tenant").toInt(&tenantOk);
    if (!tenantOk || tenantId <= 0) {
        err() << "error: --tenant must be a positive integer" << Qt::endl;
        return ExitUsage;
    }

    DbManager& dbManager = DbManager::instance();
    if (!dbManager.initialize(config.databasePath, config.busyTimeoutMs)) {
        err() << "error: cannot open database " << config.databasePath << Qt::endl;
        return ExitFailure;
    }

    MigrationRunner migrationRunner(dbManager.database());
    if (!migrationRunner.runMigrations()) {
        err() << "error: database migration failed" << Qt::endl;
        dbManager.close();
        return ExitFailure;
    }

    qCDebug(cli) << "main: command" << command << "tenant" << tenantId;

    int code = ExitOk;
    {
        Services services(dbManager.database(), config);

        if (command == "migrate") {
            if (parser.isSet("demo") && !migrationRunner.loadDemoData()) {
                err() << "error: cannot load demo data" << Qt::endl;
                code = ExitFailure;
            } else {
                out() << "database ready at " << dbManager.databasePath() << Qt::endl;
            }
        } else if (command == "receive") {
            code = runReceive(parser, services, tenantId);
        } else if (command == "consume") {
            code = runConsume(parser, services, tenantId);
        } else if (command == "write-off") {
            code = runWriteOff(parser, services, tenantId);
        } else if (command == "expire") {
            code = runExpire(services, tenantId);
        } else if (command == "archive") {
            code = runArchive(parser, services, tenantId);
        } else if (command == "batches") {
            code = runBatches(parser, services, tenantId);
        } else if (command == "cost-recipe") {
            code = runCostRecipe(parser, services, tenantId);
        } else if (command == "analyze-dish") {
            code = runAnalyzeDish(parser, services, tenantId);
        } else if (command == "sell") {
            code = runSell(parser, services, tenantId);
        } else if (command == "menu-report") {
            code = runMenuReport(parser, services, tenantId);
        } else if (command == "stock") {
            code = runStock(services, tenantId);
        } else if (command == "losses") {
            code = runLosses(parser, services, tenantId);
        } else if (command == "alerts") {
            code = runAlerts(services, tenantId);
        } else {
            err() << "error: unknown command " << command << Qt::endl;
            code = ExitUsage;
        }
    }

    dbManager.close();
    return code;
}
