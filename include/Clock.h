#ifndef CLOCK_H
#define CLOCK_H

#include <QDate>
#include <QDateTime>

/**
 * @brief Источник текущего времени. Вся доменная логика получает "сейчас" только отсюда.
 */
class IClock
{
public:
    virtual ~IClock() = default;

    virtual QDateTime now() const = 0;

    QDate today() const { return now().toUTC().date(); }
};

class SystemClock : public IClock
{
public:
    QDateTime now() const override { return QDateTime::currentDateTimeUtc(); }
};

class FixedClock : public IClock
{
public:
    explicit FixedClock(const QDateTime &now) : m_now(now.toUTC()) {}

    QDateTime now() const override { return m_now; }

    void setNow(const QDateTime &now) { m_now = now.toUTC(); }
    void advanceDays(int days) { m_now = m_now.addDays(days); }

private:
    QDateTime m_now;
};

#endif // CLOCK_H
