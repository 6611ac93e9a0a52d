#include "SessionController.h"

#include "Core/Clock.h"
#include "Core/DurationPolicy.h"
#include "Core/ModelFactory.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "logger/logger.h"

SessionController::SessionController(LedgerStore &store, const Clock &clock, const QTimeZone &displayZone,
                                     QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
    , m_displayZone(displayZone)
{
}

QString SessionController::localTimestamp(const QDateTime &instant) const
{
    return ModelFactory::formatLocal(instant, m_displayZone);
}

LedgerResult<SessionController::State> SessionController::state(qint64 userId)
{
    auto active = m_store.activeSession(userId);
    if (!active) {
        return active.error();
    }
    return active.value() ? Running : Idle;
}

LedgerResult<LedgerStore::SessionPtr> SessionController::start(qint64 userId)
{
    auto user = m_store.userById(userId);
    if (!user) {
        return user.error();
    }

    const QDateTime now = m_clock.now();
    LedgerStore::SessionPtr session;

    LedgerError error = m_store.executeInTransaction([&]() -> LedgerError {
        auto inserted = m_store.insertSession(userId, now);
        if (!inserted) {
            return inserted.error();
        }
        session = inserted.value();

        auto entry = m_store.appendLog(userId, LedgerTypes::LogKind::Start, std::nullopt,
                                       QString("Started at %1").arg(localTimestamp(now)), now);
        if (!entry) {
            return entry.error();
        }
        return LedgerError();
    });

    if (error.isError()) {
        LOG_INFO(QString("Start for user %1 not applied: %2").arg(userId).arg(error.toString()));
        return error;
    }

    LOG_INFO(QString("User %1 started session %2 at %3")
             .arg(userId)
             .arg(session->id())
             .arg(ModelFactory::toStorageTimestamp(now)));

    emit sessionStarted(userId, session->id());
    emit ledgerChanged(userId);
    return session;
}

LedgerResult<LedgerStore::SessionPtr> SessionController::stop(qint64 userId)
{
    const QDateTime now = m_clock.now();
    LedgerStore::SessionPtr session;

    LedgerError error = m_store.executeInTransaction([&]() -> LedgerError {
        auto active = m_store.activeSession(userId);
        if (!active) {
            return active.error();
        }
        if (!active.value()) {
            return LedgerError::notFound(QString("User %1 has no running session").arg(userId));
        }
        session = active.value();

        const qint64 elapsed = DurationPolicy::elapsedSeconds(session->startTime(), now);
        const int minutes = DurationPolicy::billableMinutes(session->startTime(), now);

        LedgerError finished = m_store.finishSession(session->id(), now, minutes);
        if (finished.isError()) {
            return finished;
        }
        session->setEndTime(now);
        session->setMinutes(minutes);

        auto entry = m_store.appendLog(userId, LedgerTypes::LogKind::Stop, minutes,
                                       QString("Stopped at %1 after %2")
                                           .arg(localTimestamp(now), DurationPolicy::formatHms(elapsed)),
                                       now);
        if (!entry) {
            return entry.error();
        }
        return LedgerError();
    });

    if (error.isError()) {
        LOG_INFO(QString("Stop for user %1 not applied: %2").arg(userId).arg(error.toString()));
        return error;
    }

    const int minutes = session->minutes().value_or(0);
    LOG_INFO(QString("User %1 stopped session %2 after %3 minutes").arg(userId).arg(session->id()).arg(minutes));

    emit sessionStopped(userId, session->id(), minutes);
    emit ledgerChanged(userId);
    return session;
}

LedgerResult<LedgerStore::AdjustmentPtr> SessionController::adjust(qint64 userId, int deltaMinutes,
                                                                    const QString &reason)
{
    if (deltaMinutes == 0) {
        return LedgerError::validation("Adjustment must be a nonzero number of minutes");
    }

    const QString trimmedReason = reason.trimmed();
    const QString details = trimmedReason.isEmpty() ? QStringLiteral("Manual adjustment") : trimmedReason;
    const QDateTime now = m_clock.now();
    LedgerStore::AdjustmentPtr adjustment;

    LedgerError error = m_store.executeInTransaction([&]() -> LedgerError {
        auto inserted = m_store.insertAdjustment(userId, deltaMinutes, trimmedReason, now);
        if (!inserted) {
            return inserted.error();
        }
        adjustment = inserted.value();

        auto entry = m_store.appendLog(userId, LedgerTypes::LogKind::Adjust, deltaMinutes, details, now);
        if (!entry) {
            return entry.error();
        }
        return LedgerError();
    });

    if (error.isError()) {
        LOG_INFO(QString("Adjustment for user %1 not applied: %2").arg(userId).arg(error.toString()));
        return error;
    }

    LOG_INFO(QString("User %1 adjusted by %2 minutes (%3)").arg(userId).arg(deltaMinutes).arg(details));

    emit adjustmentRecorded(userId, deltaMinutes);
    emit ledgerChanged(userId);
    return adjustment;
}
