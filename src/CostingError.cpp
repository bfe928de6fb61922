#include "CostingError.h"

QString CostingError::codeString() const
{
    switch (code) {
        case CostingErrorCode::None:                    return "None";
        case CostingErrorCode::InsufficientStock:       return "InsufficientStock";
        case CostingErrorCode::NoStockAvailable:        return "NoStockAvailable";
        case CostingErrorCode::CircularRecipeReference: return "CircularRecipeReference";
        case CostingErrorCode::RecursionDepthExceeded:  return "RecursionDepthExceeded";
        case CostingErrorCode::InvalidQuantity:         return "InvalidQuantity";
        case CostingErrorCode::InvalidPrice:            return "InvalidPrice";
        case CostingErrorCode::InvalidDate:             return "InvalidDate";
        case CostingErrorCode::InvalidReference:        return "InvalidReference";
        case CostingErrorCode::NotFound:                return "NotFound";
        case CostingErrorCode::ConcurrentModification:  return "ConcurrentModification";
        case CostingErrorCode::StorageFailure:          return "StorageFailure";
    }
    return "None";
}

QString CostingError::toString() const
{
    if (!isError()) {
        return QString();
    }
    return QString("%1: %2").arg(codeString(), message);
}

CostingError CostingError::make(CostingErrorCode code, const QString &message)
{
    CostingError e;
    e.code = code;
    e.message = message;
    return e;
}
