#include "repositories/IBatchRepository.h"
#include "repositories/IRecipeRepository.h"

QString batchStatusToString(BatchStatus status)
{
    switch (status) {
        case BatchStatus::Active:    return "active";
        case BatchStatus::Exhausted: return "exhausted";
        case BatchStatus::Archived:  return "archived";
    }
    return "active";
}

BatchStatus batchStatusFromString(const QString &str)
{
    const QString v = str.trimmed().toLower();
    if (v == "exhausted") return BatchStatus::Exhausted;
    if (v == "archived") return BatchStatus::Archived;
    return BatchStatus::Active;
}

QString movementTypeToString(MovementType type)
{
    switch (type) {
        case MovementType::In:         return "IN";
        case MovementType::OutSale:    return "OUT_SALE";
        case MovementType::OutExpire:  return "OUT_EXPIRE";
        case MovementType::Adjustment: return "ADJUSTMENT";
    }
    return "IN";
}

bool movementTypeFromString(const QString &str, MovementType &type)
{
    const QString v = str.trimmed().toUpper();
    if (v == "IN") { type = MovementType::In; return true; }
    if (v == "OUT_SALE") { type = MovementType::OutSale; return true; }
    if (v == "OUT_EXPIRE") { type = MovementType::OutExpire; return true; }
    if (v == "ADJUSTMENT") { type = MovementType::Adjustment; return true; }
    return false;
}

bool isOutgoingMovement(MovementType type)
{
    switch (type) {
        case MovementType::In:
            return false;
        case MovementType::OutSale:
        case MovementType::OutExpire:
        case MovementType::Adjustment:
            return true;
    }
    return false;
}

QString expirationStatusToString(ExpirationStatus status)
{
    switch (status) {
        case ExpirationStatus::Expired:      return "Expired";
        case ExpirationStatus::ExpiresToday: return "ExpiresToday";
        case ExpirationStatus::ExpiringSoon: return "ExpiringSoon";
        case ExpirationStatus::Fresh:        return "Fresh";
    }
    return "Fresh";
}

ExpirationStatus classifyExpiration(const QDateTime &expiresAt, const QDate &today, int soonDays)
{
    const QDate expiryDate = expiresAt.toUTC().date();

    if (expiryDate < today) return ExpirationStatus::Expired;
    if (expiryDate == today) return ExpirationStatus::ExpiresToday;
    if (expiryDate <= today.addDays(soonDays)) return ExpirationStatus::ExpiringSoon;
    return ExpirationStatus::Fresh;
}

QString recipeTypeToString(RecipeType type)
{
    switch (type) {
        case RecipeType::Preparation: return "preparation";
        case RecipeType::Final:       return "final";
    }
    return "final";
}

RecipeType recipeTypeFromString(const QString &str)
{
    if (str.trimmed().toLower() == "preparation") return RecipeType::Preparation;
    return RecipeType::Final;
}
