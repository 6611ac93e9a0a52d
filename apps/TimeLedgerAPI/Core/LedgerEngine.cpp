#include "LedgerEngine.h"

#include "Core/Clock.h"
#include "Core/DurationPolicy.h"
#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "logger/logger.h"

LedgerEngine::LedgerEngine(LedgerStore &store, const Clock &clock, const LedgerConfig &config,
                           QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
    , m_config(config)
    , m_sessionController(new SessionController(store, clock, config.displayTimeZone(), this))
    , m_aggregator(new MonthAggregator(store, clock, config.displayTimeZone(), config.cacheTtlSeconds(), this))
{
    connect(m_sessionController, &SessionController::ledgerChanged,
            m_aggregator, &MonthAggregator::invalidate);

    LOG_INFO(QString("Ledger engine ready (time zone %1, log limit %2, cache ttl %3 s)")
             .arg(QString::fromLatin1(m_config.displayTimeZone().id()))
             .arg(m_config.logLimit())
             .arg(m_config.cacheTtlSeconds()));
}

LedgerError LedgerEngine::requireUser(qint64 userId)
{
    auto user = m_store.userById(userId);
    return user ? LedgerError() : user.error();
}

LedgerResult<LedgerStore::UserPtr> LedgerEngine::login(const QString &name)
{
    auto user = m_store.findOrCreateUser(name);
    if (user) {
        LOG_INFO(QString("User '%1' logged in (ID %2)").arg(user.value()->name()).arg(user.value()->id()));
    }
    return user;
}

LedgerResult<LedgerStore::SessionPtr> LedgerEngine::startSession(qint64 userId)
{
    return m_sessionController->start(userId);
}

LedgerResult<LedgerStore::SessionPtr> LedgerEngine::stopSession(qint64 userId)
{
    return m_sessionController->stop(userId);
}

LedgerResult<LedgerStore::AdjustmentPtr> LedgerEngine::adjust(qint64 userId, int deltaMinutes, const QString &reason)
{
    return m_sessionController->adjust(userId, deltaMinutes, reason);
}

LedgerResult<LedgerStore::SessionPtr> LedgerEngine::activeSession(qint64 userId)
{
    LedgerError missing = requireUser(userId);
    if (missing.isError()) {
        return missing;
    }
    return m_store.activeSession(userId);
}

LedgerResult<MonthBucketList> LedgerEngine::monthTotals(qint64 userId)
{
    LedgerError missing = requireUser(userId);
    if (missing.isError()) {
        return missing;
    }
    return m_aggregator->monthTotals(userId);
}

LedgerResult<qint64> LedgerEngine::currentMonthMinutes(qint64 userId)
{
    LedgerError missing = requireUser(userId);
    if (missing.isError()) {
        return missing;
    }
    return m_aggregator->currentMonthMinutes(userId);
}

LedgerResult<QList<LedgerStore::LogPtr>> LedgerEngine::recentLogs(qint64 userId, int limit)
{
    LedgerError missing = requireUser(userId);
    if (missing.isError()) {
        return missing;
    }

    int effectiveLimit = limit;
    if (effectiveLimit <= 0 || effectiveLimit > m_config.logLimit()) {
        effectiveLimit = m_config.logLimit();
    }
    return m_store.listLogs(userId, effectiveLimit);
}

qint64 LedgerEngine::elapsedSeconds(const WorkSessionModel *session) const
{
    if (!session || !session->isRunning()) {
        return 0;
    }
    return DurationPolicy::elapsedSeconds(session->startTime(), m_clock.now());
}
