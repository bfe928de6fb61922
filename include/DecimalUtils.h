#ifndef DECIMALUTILS_H
#define DECIMALUTILS_H

#include <QString>
#include <QVariant>
#include <QtGlobal>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>

using Decimal = boost::multiprecision::cpp_dec_float_50;

/**
 * @brief Разобрать десятичное число (допускается ',' как разделитель)
 */
inline bool tryParseDecimal(const QString &input, Decimal &out)
{
    QString normalized = input.trimmed();
    if (normalized.isEmpty()) {
        return false;
    }
    normalized.replace(',', '.');
    try {
        out = Decimal(normalized.toStdString());
    } catch (const std::exception&) {
        return false;
    }
    return boost::multiprecision::isfinite(out);
}

inline Decimal decimalFromString(const QString &input)
{
    Decimal value;
    if (!tryParseDecimal(input, value)) {
        return Decimal(0);
    }
    return value;
}

inline Decimal decimalFromVariant(const QVariant &value)
{
    return decimalFromString(value.toString());
}

inline Decimal decimalFromCents(qint64 cents)
{
    return Decimal(static_cast<long long>(cents));
}

inline QString decimalToString(const Decimal &value, int decimals = 2)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(decimals) << value;
    return QString::fromStdString(stream.str());
}

/**
 * @brief Текстовая форма для хранения в БД: полная точность Decimal, без экспоненты и хвостовых нулей
 */
inline QString decimalToStorageString(const Decimal &value)
{
    QString text = decimalToString(value, std::numeric_limits<Decimal>::digits10);
    if (text.contains('.')) {
        while (text.endsWith('0')) text.chop(1);
        if (text.endsWith('.')) text.chop(1);
    }
    if (text == "-0") {
        return "0";
    }
    return text;
}

/**
 * @brief Округление до целых копеек, половина от нуля
 */
inline qint64 roundHalfUp(const Decimal &value)
{
    const Decimal half("0.5");
    const Decimal rounded = value >= 0
        ? Decimal(boost::multiprecision::floor(value + half))
        : Decimal(-boost::multiprecision::floor(-value + half));
    return rounded.convert_to<long long>();
}

inline bool isPositiveQuantity(const Decimal &value)
{
    return boost::multiprecision::isfinite(value) && value > 0;
}

inline Decimal minDecimal(const Decimal &a, const Decimal &b)
{
    return a < b ? a : b;
}

#endif // DECIMALUTILS_H
