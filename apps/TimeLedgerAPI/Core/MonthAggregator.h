#ifndef MONTHAGGREGATOR_H
#define MONTHAGGREGATOR_H

#include <QObject>
#include <QHash>
#include <QTimeZone>

#include "Core/LedgerStore.h"
#include "Models/MonthBucket.h"

class Clock;

/**
 * @brief Month-bucketed totals computed from finished sessions and adjustments
 *
 * A session counts towards the month of its end instant, an adjustment
 * towards the month of its creation instant; months are calendar months in
 * the display timezone. Results are never stored. A short-lived per-user cache
 * is keyed by the store revision and the current month key.
 */
class MonthAggregator : public QObject
{
    Q_OBJECT
public:
    MonthAggregator(LedgerStore &store, const Clock &clock, const QTimeZone &displayZone,
                    int cacheTtlSeconds, QObject *parent = nullptr);

    // Newest month first
    LedgerResult<MonthBucketList> monthTotals(qint64 userId);

    // Minutes of the month containing clock.now(); 0 when nothing is booked
    LedgerResult<qint64> currentMonthMinutes(qint64 userId);

    QString currentMonthKey() const;

    // "yyyy-MM" of the instant in the given zone
    static QString monthKey(const QDateTime &instant, const QTimeZone &zone);

    static MonthBucketList bucketize(const QList<LedgerStore::SessionPtr> &sessions,
                                     const QList<LedgerStore::AdjustmentPtr> &adjustments,
                                     const QTimeZone &zone);

public slots:
    void invalidate(qint64 userId);
    void clear();

private:
    struct CacheEntry {
        qint64 revision = -1;
        QString monthKey;
        QDateTime computedAt;
        MonthBucketList buckets;
    };

    bool isFresh(const CacheEntry &entry) const;

    LedgerStore &m_store;
    const Clock &m_clock;
    QTimeZone m_displayZone;
    int m_cacheTtlSeconds;
    QHash<qint64, CacheEntry> m_cache;
};

#endif // MONTHAGGREGATOR_H
