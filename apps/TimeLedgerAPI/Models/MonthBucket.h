#ifndef MONTHBUCKET_H
#define MONTHBUCKET_H

#include <QList>
#include <QString>

// Derived per-month total; never stored
struct MonthBucket {
    QString monthKey;   // "yyyy-MM" in the display timezone
    qint64 minutes = 0;

    bool operator==(const MonthBucket &other) const
    {
        return monthKey == other.monthKey && minutes == other.minutes;
    }
    bool operator!=(const MonthBucket &other) const { return !(*this == other); }
};

using MonthBucketList = QList<MonthBucket>;

#endif // MONTHBUCKET_H
