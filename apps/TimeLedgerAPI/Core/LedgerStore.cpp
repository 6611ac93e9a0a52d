#include "LedgerStore.h"

#include "dbservice/dbmanager.h"
#include "logger/logger.h"
#include "Core/DurationPolicy.h"
#include "Core/ModelFactory.h"
#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "Models/LedgerLogModel.h"
#include "Repositories/UserRepository.h"
#include "Repositories/WorkSessionRepository.h"
#include "Repositories/AdjustmentRepository.h"
#include "Repositories/LedgerLogRepository.h"

#include <exception>

LedgerStore::LedgerStore(DbManager &db, QObject *parent)
    : QObject(parent)
    , m_db(db)
    , m_schema(db)
    , m_userRepository(new UserRepository(this))
    , m_sessionRepository(new WorkSessionRepository(this))
    , m_adjustmentRepository(new AdjustmentRepository(this))
    , m_logRepository(new LedgerLogRepository(this))
    , m_initialized(false)
    , m_requiresMigration(false)
    , m_revision(0)
{
    LOG_DEBUG("LedgerStore created");
}

LedgerStore::~LedgerStore()
{
    LOG_DEBUG(QString("LedgerStore destroyed at revision %1").arg(m_revision));
}

bool LedgerStore::initialize()
{
    if (m_initialized) {
        LOG_WARNING("LedgerStore already initialized");
        return true;
    }

    if (!m_db.isInitialized() && !m_db.initialize()) {
        m_lastError = QString("Database connection failed: %1").arg(m_db.lastError());
        LOG_ERROR(m_lastError);
        return false;
    }

    if (!m_schema.ensureSchema()) {
        m_lastError = QString("Schema creation failed: %1").arg(m_schema.lastError());
        LOG_ERROR(m_lastError);
        return false;
    }

    if (!m_userRepository->initialize(&m_db.getService<UserModel>())
        || !m_sessionRepository->initialize(&m_db.getService<WorkSessionModel>())
        || !m_adjustmentRepository->initialize(&m_db.getService<AdjustmentModel>())
        || !m_logRepository->initialize(&m_db.getService<LedgerLogModel>())) {
        m_lastError = "Repository initialization failed";
        LOG_ERROR(m_lastError);
        return false;
    }

    const QString unit = m_schema.durationUnit();
    if (unit.isEmpty()) {
        m_lastError = QString("Cannot read the stored duration unit: %1").arg(m_schema.lastError());
        LOG_ERROR(m_lastError);
        return false;
    }

    m_requiresMigration = (unit == LedgerSchema::kUnitSeconds);
    if (m_requiresMigration) {
        LOG_WARNING("Stored durations are in seconds; the store is read-only until they are migrated");
    }

    m_initialized = true;
    LOG_INFO("LedgerStore initialized");
    return true;
}

LedgerError LedgerStore::checkReady() const
{
    if (!m_initialized) {
        return LedgerError::storage("Ledger store is not initialized");
    }
    if (m_requiresMigration) {
        return LedgerError::storage("Stored durations are in seconds; run the legacy seconds migration first");
    }
    return LedgerError();
}

LedgerError LedgerStore::classifyError(const QSqlError &error, const QString &context)
{
    const QString code = error.nativeErrorCode();
    const QString text = error.text();

    // 23505: PostgreSQL unique_violation; 2067/1555: SQLite UNIQUE/PRIMARYKEY
    if (code == "23505" || code == "2067" || code == "1555"
        || text.contains("UNIQUE constraint failed", Qt::CaseInsensitive)
        || text.contains("duplicate key", Qt::CaseInsensitive)) {
        return LedgerError::conflict(context);
    }

    // 23503: PostgreSQL foreign_key_violation; 787: SQLite FOREIGNKEY
    if (code == "23503" || code == "787"
        || text.contains("FOREIGN KEY constraint failed", Qt::CaseInsensitive)) {
        return LedgerError::notFound(QString("%1: referenced record does not exist").arg(context));
    }

    // 23514: PostgreSQL check_violation; 275: SQLite CHECK
    if (code == "23514" || code == "275"
        || text.contains("CHECK constraint failed", Qt::CaseInsensitive)) {
        return LedgerError::validation(QString("%1: %2").arg(context, text));
    }

    // Remaining SQLite constraint failures (primary code without the extended code)
    if (code == "19") {
        return LedgerError::conflict(context);
    }

    return LedgerError::storage(QString("%1: %2").arg(context, text));
}

template<typename Repo>
LedgerError LedgerStore::repositoryError(const Repo *repository, const QString &context) const
{
    if (repository->lastQueryFailed()) {
        return classifyError(repository->lastSqlError(), context);
    }
    return LedgerError::storage(QString("%1: %2").arg(context, repository->lastError()));
}

LedgerResult<LedgerStore::UserPtr> LedgerStore::findOrCreateUser(const QString &name)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    UserModel candidate;
    candidate.setName(name.trimmed());

    QStringList errors;
    if (!ModelFactory::validateUserModel(&candidate, errors)) {
        return LedgerError::validation(errors.join(", "));
    }

    UserPtr user = m_userRepository->findOrCreateUser(candidate.name());
    if (!user) {
        return repositoryError(m_userRepository, QString("Cannot load user '%1'").arg(candidate.name()));
    }
    return user;
}

LedgerResult<LedgerStore::UserPtr> LedgerStore::userById(qint64 userId)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    UserPtr user = m_userRepository->getById(userId);
    if (!user) {
        if (m_userRepository->lastQueryFailed()) {
            return repositoryError(m_userRepository, QString("Cannot load user %1").arg(userId));
        }
        return LedgerError::notFound(QString("User %1 does not exist").arg(userId));
    }
    return user;
}

LedgerResult<LedgerStore::SessionPtr> LedgerStore::activeSession(qint64 userId)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    SessionPtr session = m_sessionRepository->getActiveSession(userId);
    if (!session && m_sessionRepository->lastQueryFailed()) {
        return repositoryError(m_sessionRepository, QString("Cannot load active session of user %1").arg(userId));
    }
    return session;
}

LedgerResult<LedgerStore::SessionPtr> LedgerStore::insertSession(qint64 userId, const QDateTime &start)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    SessionPtr session(new WorkSessionModel());
    session->setUserId(userId);
    session->setStartTime(start.toUTC());

    QStringList errors;
    if (!ModelFactory::validateWorkSessionModel(session.data(), errors)) {
        return LedgerError::validation(errors.join(", "));
    }

    if (!m_sessionRepository->insert(session.data())) {
        LedgerError error = repositoryError(m_sessionRepository, QString("Cannot start session for user %1").arg(userId));
        if (error.code() == LedgerError::Conflict) {
            LOG_INFO(QString("Rejected second running session for user %1").arg(userId));
            return LedgerError::conflict(QString("User %1 already has a running session").arg(userId));
        }
        if (error.code() == LedgerError::NotFound) {
            return LedgerError::notFound(QString("User %1 does not exist").arg(userId));
        }
        return error;
    }

    LOG_DEBUG(QString("Session %1 started for user %2").arg(session->id()).arg(userId));
    return session;
}

LedgerError LedgerStore::finishSession(qint64 sessionId, const QDateTime &end, int minutes)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    if (!end.isValid()) {
        return LedgerError::validation("End time must be valid");
    }
    if (minutes < 0) {
        return LedgerError::validation("Session minutes must not be negative");
    }

    if (!m_sessionRepository->finishSession(sessionId, end.toUTC(), minutes)) {
        return repositoryError(m_sessionRepository, QString("Cannot finish session %1").arg(sessionId));
    }

    if (m_sessionRepository->lastRowsAffected() > 0) {
        return LedgerError();
    }

    // Nothing matched: either no such session or it was finished already
    SessionPtr existing = m_sessionRepository->getById(sessionId);
    if (!existing) {
        if (m_sessionRepository->lastQueryFailed()) {
            return repositoryError(m_sessionRepository, QString("Cannot load session %1").arg(sessionId));
        }
        return LedgerError::notFound(QString("Session %1 does not exist").arg(sessionId));
    }
    return LedgerError::conflict(QString("Session %1 is already finished").arg(sessionId));
}

LedgerResult<LedgerStore::AdjustmentPtr> LedgerStore::insertAdjustment(qint64 userId, int minutes,
                                                                        const QString &reason,
                                                                        const QDateTime &createdAt)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    AdjustmentPtr adjustment(new AdjustmentModel());
    adjustment->setUserId(userId);
    adjustment->setMinutes(minutes);
    adjustment->setReason(reason);
    adjustment->setCreatedAt(createdAt.toUTC());

    QStringList errors;
    if (!ModelFactory::validateAdjustmentModel(adjustment.data(), errors)) {
        return LedgerError::validation(errors.join(", "));
    }

    if (!m_adjustmentRepository->insert(adjustment.data())) {
        LedgerError error = repositoryError(m_adjustmentRepository, QString("Cannot record adjustment for user %1").arg(userId));
        if (error.code() == LedgerError::NotFound) {
            return LedgerError::notFound(QString("User %1 does not exist").arg(userId));
        }
        return error;
    }
    return adjustment;
}

LedgerResult<LedgerStore::LogPtr> LedgerStore::appendLog(qint64 userId, LedgerTypes::LogKind kind,
                                                         std::optional<int> minutes,
                                                         const QString &details,
                                                         const QDateTime &timestamp)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    LogPtr entry(new LedgerLogModel());
    entry->setUserId(userId);
    entry->setKind(kind);
    entry->setMinutes(minutes);
    entry->setDetails(details);
    entry->setTimestamp(timestamp.toUTC());

    QStringList errors;
    if (!ModelFactory::validateLedgerLogModel(entry.data(), errors)) {
        return LedgerError::validation(errors.join(", "));
    }

    if (!m_logRepository->insert(entry.data())) {
        return repositoryError(m_logRepository, QString("Cannot append %1 log entry for user %2")
                               .arg(LedgerTypes::logKindToString(kind))
                               .arg(userId));
    }
    return entry;
}

LedgerResult<QList<LedgerStore::SessionPtr>> LedgerStore::listFinishedSessions(qint64 userId)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    QList<SessionPtr> sessions = m_sessionRepository->getFinishedSessions(userId);
    if (sessions.isEmpty() && m_sessionRepository->lastQueryFailed()) {
        return repositoryError(m_sessionRepository, QString("Cannot list sessions of user %1").arg(userId));
    }
    return sessions;
}

LedgerResult<QList<LedgerStore::AdjustmentPtr>> LedgerStore::listAdjustments(qint64 userId)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    QList<AdjustmentPtr> adjustments = m_adjustmentRepository->getByUserId(userId);
    if (adjustments.isEmpty() && m_adjustmentRepository->lastQueryFailed()) {
        return repositoryError(m_adjustmentRepository, QString("Cannot list adjustments of user %1").arg(userId));
    }
    return adjustments;
}

LedgerResult<QList<LedgerStore::LogPtr>> LedgerStore::listLogs(qint64 userId, int limit)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }

    if (limit < 1) {
        return LedgerError::validation("Log limit must be at least 1");
    }

    QList<LogPtr> entries = m_logRepository->getRecent(userId, limit);
    if (entries.isEmpty() && m_logRepository->lastQueryFailed()) {
        return repositoryError(m_logRepository, QString("Cannot list log entries of user %1").arg(userId));
    }
    return entries;
}

LedgerError LedgerStore::executeInTransaction(const std::function<LedgerError()> &operation)
{
    LedgerError ready = checkReady();
    if (ready.isError()) {
        return ready;
    }
    return runTransaction(operation);
}

LedgerError LedgerStore::runTransaction(const std::function<LedgerError()> &operation)
{
    if (m_db.inTransaction()) {
        return operation();
    }

    if (!m_db.beginTransaction()) {
        return classifyError(m_db.lastSqlError(), "Failed to begin transaction");
    }

    LedgerError result;
    try {
        result = operation();
    } catch (const std::exception &e) {
        LOG_ERROR(QString("Exception during ledger transaction: %1").arg(e.what()));
        result = LedgerError::storage(QString("Unexpected failure: %1").arg(e.what()));
    }

    if (result.isError()) {
        if (result.isRetryable()) {
            LOG_ERROR(QString("Transaction failed, rolling back: %1").arg(result.toString()));
        } else {
            LOG_DEBUG(QString("Transaction rejected, rolling back: %1").arg(result.toString()));
        }
        m_db.rollbackTransaction();
        return result;
    }

    if (!m_db.commitTransaction()) {
        LedgerError commitError = LedgerError::storage(QString("Failed to commit transaction: %1").arg(m_db.lastError()));
        m_db.rollbackTransaction();
        return commitError;
    }

    ++m_revision;
    return LedgerError();
}

QString LedgerStore::durationUnit()
{
    return m_schema.durationUnit();
}

LedgerResult<int> LedgerStore::migrateLegacySeconds(const QTimeZone &legacyZone)
{
    if (!m_initialized) {
        return LedgerError::storage("Ledger store is not initialized");
    }

    const QString unit = m_schema.durationUnit();
    if (unit.isEmpty()) {
        return LedgerError::storage(QString("Cannot read the stored duration unit: %1").arg(m_schema.lastError()));
    }

    if (unit == LedgerSchema::kUnitMinutes) {
        LOG_INFO("Durations are already stored in minutes; nothing to migrate");
        m_requiresMigration = false;
        return 0;
    }

    int converted = 0;
    LedgerError error = runTransaction([this, &converted, &legacyZone]() -> LedgerError {
        // Timestamps first: the repositories below read rows as UTC instants
        int timestamps = 0;
        if (!m_schema.convertLegacyTimestamps(legacyZone, timestamps)) {
            return LedgerError::storage(QString("Cannot convert legacy timestamps: %1").arg(m_schema.lastError()));
        }

        const auto sessions = m_sessionRepository->getAllFinishedSessions();
        if (sessions.isEmpty() && m_sessionRepository->lastQueryFailed()) {
            return repositoryError(m_sessionRepository, "Cannot read sessions for migration");
        }
        for (const auto &session : sessions) {
            const int minutes = DurationPolicy::minutesFromLegacySeconds(session->minutes().value_or(0), true);
            if (!m_sessionRepository->updateMinutes(session->id(), minutes)) {
                return repositoryError(m_sessionRepository, QString("Cannot migrate session %1").arg(session->id()));
            }
            ++converted;
        }

        const auto adjustments = m_adjustmentRepository->getAll();
        if (adjustments.isEmpty() && m_adjustmentRepository->lastQueryFailed()) {
            return repositoryError(m_adjustmentRepository, "Cannot read adjustments for migration");
        }
        for (const auto &adjustment : adjustments) {
            const int minutes = DurationPolicy::minutesFromLegacySeconds(adjustment->minutes(), true);
            if (!m_adjustmentRepository->updateMinutes(adjustment->id(), minutes)) {
                return repositoryError(m_adjustmentRepository, QString("Cannot migrate adjustment %1").arg(adjustment->id()));
            }
            ++converted;
        }

        const auto entries = m_logRepository->getAllWithMinutes();
        if (entries.isEmpty() && m_logRepository->lastQueryFailed()) {
            return repositoryError(m_logRepository, "Cannot read log entries for migration");
        }
        for (const auto &entry : entries) {
            const int minutes = DurationPolicy::minutesFromLegacySeconds(entry->minutes().value_or(0), true);
            if (!m_logRepository->updateMinutes(entry->id(), minutes)) {
                return repositoryError(m_logRepository, QString("Cannot migrate log entry %1").arg(entry->id()));
            }
            ++converted;
        }

        if (!m_schema.setDurationUnit(LedgerSchema::kUnitMinutes)) {
            return LedgerError::storage(QString("Cannot record duration unit: %1").arg(m_schema.lastError()));
        }
        return LedgerError();
    });

    if (error.isError()) {
        return error;
    }

    m_requiresMigration = false;
    LOG_INFO(QString("Migrated %1 legacy duration values from seconds to minutes").arg(converted));
    return converted;
}
