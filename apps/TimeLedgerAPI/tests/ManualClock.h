#ifndef MANUALCLOCK_H
#define MANUALCLOCK_H

#include <QDateTime>
#include <QMutex>
#include <QMutexLocker>
#include <QTimeZone>

#include "Core/Clock.h"

// Clock that only moves when a test moves it
class ManualClock : public Clock
{
public:
    explicit ManualClock(const QDateTime &start = QDateTime(QDate(2024, 1, 1), QTime(0, 0), QTimeZone::utc()))
        : m_now(start.toUTC())
    {
    }

    QDateTime now() const override
    {
        QMutexLocker locker(&m_mutex);
        return m_now;
    }

    void set(const QDateTime &instant)
    {
        QMutexLocker locker(&m_mutex);
        m_now = instant.toUTC();
    }

    void advance(qint64 seconds)
    {
        QMutexLocker locker(&m_mutex);
        m_now = m_now.addSecs(seconds);
    }

    static QDateTime utc(int year, int month, int day, int hour = 0, int minute = 0, int second = 0)
    {
        return QDateTime(QDate(year, month, day), QTime(hour, minute, second), QTimeZone::utc());
    }

private:
    mutable QMutex m_mutex;
    QDateTime m_now;
};

#endif // MANUALCLOCK_H
