#include "MonthAggregator.h"

#include "Core/Clock.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "logger/logger.h"

#include <QMap>

MonthAggregator::MonthAggregator(LedgerStore &store, const Clock &clock, const QTimeZone &displayZone,
                                 int cacheTtlSeconds, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
    , m_displayZone(displayZone)
    , m_cacheTtlSeconds(cacheTtlSeconds)
{
}

QString MonthAggregator::monthKey(const QDateTime &instant, const QTimeZone &zone)
{
    return instant.toTimeZone(zone).toString("yyyy-MM");
}

QString MonthAggregator::currentMonthKey() const
{
    return monthKey(m_clock.now(), m_displayZone);
}

MonthBucketList MonthAggregator::bucketize(const QList<LedgerStore::SessionPtr> &sessions,
                                           const QList<LedgerStore::AdjustmentPtr> &adjustments,
                                           const QTimeZone &zone)
{
    QMap<QString, qint64> totals;

    for (const auto &session : sessions) {
        if (session->isRunning() || !session->minutes().has_value()) {
            continue;
        }
        totals[monthKey(session->endTime(), zone)] += *session->minutes();
    }

    for (const auto &adjustment : adjustments) {
        totals[monthKey(adjustment->createdAt(), zone)] += adjustment->minutes();
    }

    // QMap iterates ascending; "yyyy-MM" sorts chronologically
    MonthBucketList buckets;
    for (auto it = totals.constEnd(); it != totals.constBegin();) {
        --it;
        buckets.append(MonthBucket{it.key(), it.value()});
    }
    return buckets;
}

bool MonthAggregator::isFresh(const CacheEntry &entry) const
{
    if (m_cacheTtlSeconds <= 0) {
        return false;
    }
    if (entry.revision != m_store.revision() || entry.monthKey != currentMonthKey()) {
        return false;
    }
    return entry.computedAt.secsTo(m_clock.now()) < m_cacheTtlSeconds;
}

LedgerResult<MonthBucketList> MonthAggregator::monthTotals(qint64 userId)
{
    auto cached = m_cache.constFind(userId);
    if (cached != m_cache.constEnd() && isFresh(cached.value())) {
        return cached->buckets;
    }

    auto sessions = m_store.listFinishedSessions(userId);
    if (!sessions) {
        return sessions.error();
    }

    auto adjustments = m_store.listAdjustments(userId);
    if (!adjustments) {
        return adjustments.error();
    }

    MonthBucketList buckets = bucketize(sessions.value(), adjustments.value(), m_displayZone);
    LOG_DEBUG(QString("Computed %1 month buckets for user %2 from %3 sessions and %4 adjustments")
              .arg(buckets.size())
              .arg(userId)
              .arg(sessions.value().size())
              .arg(adjustments.value().size()));

    if (m_cacheTtlSeconds > 0) {
        CacheEntry entry;
        entry.revision = m_store.revision();
        entry.monthKey = currentMonthKey();
        entry.computedAt = m_clock.now();
        entry.buckets = buckets;
        m_cache.insert(userId, entry);
    }

    return buckets;
}

LedgerResult<qint64> MonthAggregator::currentMonthMinutes(qint64 userId)
{
    auto totals = monthTotals(userId);
    if (!totals) {
        return totals.error();
    }

    const QString key = currentMonthKey();
    for (const MonthBucket &bucket : totals.value()) {
        if (bucket.monthKey == key) {
            return bucket.minutes;
        }
    }
    return qint64(0);
}

void MonthAggregator::invalidate(qint64 userId)
{
    m_cache.remove(userId);
}

void MonthAggregator::clear()
{
    m_cache.clear();
}
