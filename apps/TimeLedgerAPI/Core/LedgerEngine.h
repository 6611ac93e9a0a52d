#ifndef LEDGERENGINE_H
#define LEDGERENGINE_H

#include <QObject>

#include "Core/LedgerConfig.h"
#include "Core/LedgerStore.h"
#include "Core/MonthAggregator.h"
#include "Core/SessionController.h"

class Clock;

/**
 * @brief Command and query surface of the time ledger
 *
 * Built around an injected store and clock; holds no timers and no global
 * state. Commands go through the SessionController, reporting queries through
 * the MonthAggregator, and plain reads straight to the store.
 */
class LedgerEngine : public QObject
{
    Q_OBJECT
public:
    LedgerEngine(LedgerStore &store, const Clock &clock, const LedgerConfig &config,
                 QObject *parent = nullptr);

    // Commands
    LedgerResult<LedgerStore::UserPtr> login(const QString &name);
    LedgerResult<LedgerStore::SessionPtr> startSession(qint64 userId);
    LedgerResult<LedgerStore::SessionPtr> stopSession(qint64 userId);
    LedgerResult<LedgerStore::AdjustmentPtr> adjust(qint64 userId, int deltaMinutes, const QString &reason);

    // Queries
    LedgerResult<LedgerStore::SessionPtr> activeSession(qint64 userId);
    LedgerResult<MonthBucketList> monthTotals(qint64 userId);
    LedgerResult<qint64> currentMonthMinutes(qint64 userId);

    // limit <= 0 means the configured maximum; larger values are capped to it
    LedgerResult<QList<LedgerStore::LogPtr>> recentLogs(qint64 userId, int limit = 0);

    // Seconds the session has been running as of now; not persisted
    qint64 elapsedSeconds(const WorkSessionModel *session) const;

    QTimeZone displayZone() const { return m_config.displayTimeZone(); }
    const LedgerConfig &config() const { return m_config; }
    LedgerStore &store() { return m_store; }
    MonthAggregator *aggregator() { return m_aggregator; }

private:
    LedgerError requireUser(qint64 userId);

    LedgerStore &m_store;
    const Clock &m_clock;
    LedgerConfig m_config;
    SessionController *m_sessionController;
    MonthAggregator *m_aggregator;
};

#endif // LEDGERENGINE_H
