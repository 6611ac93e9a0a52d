#ifndef LEDGERSTORE_H
#define LEDGERSTORE_H

#include <QObject>
#include <QTimeZone>
#include <QSharedPointer>
#include <QList>
#include <QSqlError>
#include <functional>
#include <optional>

#include "Core/LedgerErrors.h"
#include "Core/LedgerSchema.h"
#include "Models/LedgerTypes.h"

class DbManager;
class UserModel;
class WorkSessionModel;
class AdjustmentModel;
class LedgerLogModel;
class UserRepository;
class WorkSessionRepository;
class AdjustmentRepository;
class LedgerLogRepository;

/**
 * @brief Persistent store of users, sessions, adjustments and log entries
 *
 * Wraps one DbManager connection and the four repositories built on it.
 * Driver errors are classified into LedgerError codes: a unique violation is
 * a Conflict, a foreign key violation is NotFound, anything else is Storage.
 *
 * Writes that must land together go through executeInTransaction(); the
 * revision counter advances only after a successful commit.
 */
class LedgerStore : public QObject
{
    Q_OBJECT
public:
    using UserPtr = QSharedPointer<UserModel>;
    using SessionPtr = QSharedPointer<WorkSessionModel>;
    using AdjustmentPtr = QSharedPointer<AdjustmentModel>;
    using LogPtr = QSharedPointer<LedgerLogModel>;

    explicit LedgerStore(DbManager &db, QObject *parent = nullptr);
    ~LedgerStore() override;

    // Opens the connection if needed and creates the schema
    bool initialize();
    bool isInitialized() const { return m_initialized; }
    QString lastError() const { return m_lastError; }

    LedgerResult<UserPtr> findOrCreateUser(const QString &name);
    LedgerResult<UserPtr> userById(qint64 userId);

    // Null value when the user has no running session
    LedgerResult<SessionPtr> activeSession(qint64 userId);

    // Conflict if the user already has a running session
    LedgerResult<SessionPtr> insertSession(qint64 userId, const QDateTime &start);

    // NotFound for an unknown session, Conflict if it is already finished
    LedgerError finishSession(qint64 sessionId, const QDateTime &end, int minutes);

    LedgerResult<AdjustmentPtr> insertAdjustment(qint64 userId, int minutes, const QString &reason,
                                                 const QDateTime &createdAt);

    LedgerResult<LogPtr> appendLog(qint64 userId, LedgerTypes::LogKind kind, std::optional<int> minutes,
                                   const QString &details, const QDateTime &timestamp);

    LedgerResult<QList<SessionPtr>> listFinishedSessions(qint64 userId);
    LedgerResult<QList<AdjustmentPtr>> listAdjustments(qint64 userId);
    LedgerResult<QList<LogPtr>> listLogs(qint64 userId, int limit);

    /**
     * @brief Run @p operation inside one database transaction
     *
     * Commits when the operation returns no error, otherwise rolls back and
     * returns that error. A failed commit is a Storage error. Calls made while
     * a transaction is already open join it.
     */
    LedgerError executeInTransaction(const std::function<LedgerError()> &operation);

    // Advances after every committed mutation made through this store
    qint64 revision() const { return m_revision; }

    // True while durations are still stored in seconds
    bool requiresMigration() const { return m_requiresMigration; }
    QString durationUnit();

    /**
     * @brief Convert a seconds-era ledger to the current format
     *
     * Durations become minutes, rounded half-up at 30 s keeping the sign; a
     * nonzero value keeps a magnitude of at least one minute. Timestamps,
     * stored then as naive wall-clock time in @p legacyZone, become UTC.
     * Runs in one transaction and records the new unit. Returns the number
     * of duration values rewritten; 0 when the store already counts in
     * minutes.
     */
    LedgerResult<int> migrateLegacySeconds(const QTimeZone &legacyZone);

    static LedgerError classifyError(const QSqlError &error, const QString &context);

private:
    LedgerError runTransaction(const std::function<LedgerError()> &operation);
    LedgerError checkReady() const;
    template<typename Repo>
    LedgerError repositoryError(const Repo *repository, const QString &context) const;

    DbManager &m_db;
    LedgerSchema m_schema;
    UserRepository *m_userRepository;
    WorkSessionRepository *m_sessionRepository;
    AdjustmentRepository *m_adjustmentRepository;
    LedgerLogRepository *m_logRepository;
    bool m_initialized;
    bool m_requiresMigration;
    qint64 m_revision;
    QString m_lastError;
};

#endif // LEDGERSTORE_H
