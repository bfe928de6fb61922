#ifndef COSTINGERROR_H
#define COSTINGERROR_H

#include <QString>

/**
 * @brief Коды ошибок складского учёта и калькуляции
 *
 * Все ошибки возвращаются вызывающей стороне синхронно и не повторяются
 * автоматически.
 */
enum class CostingErrorCode {
    None,
    InsufficientStock,
    NoStockAvailable,
    CircularRecipeReference,
    RecursionDepthExceeded,
    InvalidQuantity,
    InvalidPrice,
    InvalidDate,
    InvalidReference,
    NotFound,
    ConcurrentModification,
    StorageFailure
};

struct CostingError {
    CostingErrorCode code = CostingErrorCode::None;
    QString message;

    bool isError() const { return code != CostingErrorCode::None; }

    QString codeString() const;
    QString toString() const;

    static CostingError make(CostingErrorCode code, const QString &message);
};

#endif // COSTINGERROR_H
