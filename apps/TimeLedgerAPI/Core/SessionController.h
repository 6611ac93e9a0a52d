#ifndef SESSIONCONTROLLER_H
#define SESSIONCONTROLLER_H

#include <QObject>
#include <QTimeZone>

#include "Core/LedgerStore.h"

class Clock;

/**
 * @brief The only writer of session and adjustment state
 *
 * Per user the controller is either Idle (no running session) or Running.
 * Each mutation and its audit log entry are written in one transaction, so a
 * session never changes state without its matching log entry.
 */
class SessionController : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle = 0,     // No running session
        Running = 1   // Exactly one running session
    };
    Q_ENUM(State)

    SessionController(LedgerStore &store, const Clock &clock, const QTimeZone &displayZone,
                      QObject *parent = nullptr);

    LedgerResult<State> state(qint64 userId);

    // Conflict when the user already has a running session
    LedgerResult<LedgerStore::SessionPtr> start(qint64 userId);

    // NotFound when nothing is running; returns the finished session
    LedgerResult<LedgerStore::SessionPtr> stop(qint64 userId);

    // Valid in either state; a zero delta is rejected
    LedgerResult<LedgerStore::AdjustmentPtr> adjust(qint64 userId, int deltaMinutes, const QString &reason);

signals:
    // Emitted after the transaction of a mutation has been committed
    void ledgerChanged(qint64 userId);
    void sessionStarted(qint64 userId, qint64 sessionId);
    void sessionStopped(qint64 userId, qint64 sessionId, int minutes);
    void adjustmentRecorded(qint64 userId, int minutes);

private:
    QString localTimestamp(const QDateTime &instant) const;

    LedgerStore &m_store;
    const Clock &m_clock;
    QTimeZone m_displayZone;
};

#endif // SESSIONCONTROLLER_H
