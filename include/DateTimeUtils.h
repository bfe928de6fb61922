#ifndef DATETIMEUTILS_H
#define DATETIMEUTILS_H

#include <QDateTime>
#include <QString>
#include <QTimeZone>
#include <QVariant>

/**
 * @brief Метки времени хранятся в UTC в формате ISO с миллисекундами,
 * поэтому лексикографический порядок в SQL совпадает с хронологическим.
 */
inline QString dateTimeToDb(const QDateTime &value)
{
    if (!value.isValid()) {
        return QString();
    }
    return value.toUTC().toString("yyyy-MM-ddTHH:mm:ss.zzzZ");
}

inline QDateTime dateTimeFromDb(const QVariant &value)
{
    if (value.isNull()) {
        return QDateTime();
    }
    QDateTime dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value.toString(), Qt::ISODate);
    }
    if (dt.isValid() && dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeZone(QTimeZone::utc());
    }
    return dt.toUTC();
}

/**
 * @brief Разбор даты/времени из командной строки: "2024-01-05" или ISO-строка
 */
inline QDateTime dateTimeFromInput(const QString &input)
{
    const QString trimmed = input.trimmed();
    QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        const QDate d = QDate::fromString(trimmed, Qt::ISODate);
        if (d.isValid()) {
            dt = QDateTime(d, QTime(0, 0), QTimeZone::utc());
        }
    }
    if (dt.isValid() && dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeZone(QTimeZone::utc());
    }
    return dt.toUTC();
}

#endif // DATETIMEUTILS_H
