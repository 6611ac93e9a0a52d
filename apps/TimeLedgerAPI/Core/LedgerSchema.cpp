#include "LedgerSchema.h"

#include "Core/DurationPolicy.h"
#include "Core/ModelFactory.h"
#include "dbservice/dbmanager.h"
#include "logger/logger.h"

#include <QSqlRecord>

namespace {

struct TimestampColumn
{
    const char *table;
    const char *column;
};

const TimestampColumn kTimestampColumns[] = {
    { "sessions", "start_ts" },
    { "sessions", "end_ts" },
    { "adjustments", "created_ts" },
    { "logs", "ts" },
};

} // namespace

const QString LedgerSchema::kUnitMinutes = QStringLiteral("minutes");
const QString LedgerSchema::kUnitSeconds = QStringLiteral("seconds");

LedgerSchema::LedgerSchema(DbManager &db)
    : m_db(db)
    , m_foundLegacyTables(false)
{
}

QStringList LedgerSchema::tableStatements() const
{
    const bool sqlite = m_db.config().isSqlite();
    const QString idColumn = sqlite ? "id INTEGER PRIMARY KEY AUTOINCREMENT" : "id BIGSERIAL PRIMARY KEY";
    const QString refType = sqlite ? "INTEGER" : "BIGINT";
    const QString tsType = sqlite ? "TEXT" : "TIMESTAMPTZ";

    QStringList statements;

    statements << QString(
        "CREATE TABLE IF NOT EXISTS users ("
        "%1, "
        "name TEXT NOT NULL UNIQUE)").arg(idColumn);

    statements << QString(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "%1, "
        "user_id %2 NOT NULL REFERENCES users(id) ON DELETE CASCADE, "
        "start_ts %3 NOT NULL, "
        "end_ts %3, "
        "minutes INTEGER, "
        "CHECK ((end_ts IS NULL) = (minutes IS NULL)))").arg(idColumn, refType, tsType);

    statements << QString(
        "CREATE TABLE IF NOT EXISTS adjustments ("
        "%1, "
        "user_id %2 NOT NULL REFERENCES users(id) ON DELETE CASCADE, "
        "minutes INTEGER NOT NULL CHECK (minutes <> 0), "
        "reason TEXT, "
        "created_ts %3 NOT NULL)").arg(idColumn, refType, tsType);

    statements << QString(
        "CREATE TABLE IF NOT EXISTS logs ("
        "%1, "
        "user_id %2 NOT NULL REFERENCES users(id) ON DELETE CASCADE, "
        "kind TEXT NOT NULL CHECK (kind IN ('start', 'stop', 'adjust')), "
        "minutes INTEGER, "
        "ts %3 NOT NULL, "
        "details TEXT NOT NULL DEFAULT '')").arg(idColumn, refType, tsType);

    statements << "CREATE TABLE IF NOT EXISTS ledger_meta ("
                  "key TEXT PRIMARY KEY, "
                  "value TEXT NOT NULL)";

    return statements;
}

QStringList LedgerSchema::indexStatements() const
{
    QStringList statements;

    // One running session per user, enforced by the database
    statements << "CREATE UNIQUE INDEX IF NOT EXISTS ux_sessions_one_running "
                  "ON sessions (user_id) WHERE end_ts IS NULL";
    statements << "CREATE INDEX IF NOT EXISTS ix_sessions_user ON sessions (user_id)";
    statements << "CREATE INDEX IF NOT EXISTS ix_adjustments_user ON adjustments (user_id)";
    statements << "CREATE INDEX IF NOT EXISTS ix_logs_user ON logs (user_id, id)";

    return statements;
}

bool LedgerSchema::ensureSchema()
{
    m_foundLegacyTables = !m_db.tableExists("ledger_meta") && m_db.tableExists("sessions");
    if (m_foundLegacyTables) {
        LOG_WARNING("Found ledger tables without metadata; durations are assumed to be stored in seconds");
    }

    if (!m_db.beginTransaction()) {
        m_lastError = m_db.lastError();
        return false;
    }

    const bool created = executeAll(tableStatements())
        && (!m_foundLegacyTables || closeSurplusRunningSessions())
        && executeAll(indexStatements());
    if (!created) {
        m_db.rollbackTransaction();
        return false;
    }

    const QString unit = m_foundLegacyTables ? kUnitSeconds : kUnitMinutes;
    if (!insertMetaIfAbsent("schema_version", QString::number(kSchemaVersion))
        || !insertMetaIfAbsent("duration_unit", unit)) {
        m_db.rollbackTransaction();
        return false;
    }

    if (!m_db.commitTransaction()) {
        m_lastError = m_db.lastError();
        return false;
    }

    LOG_INFO(QString("Ledger schema ready (version %1, driver %2)")
             .arg(kSchemaVersion)
             .arg(m_db.config().driver()));
    return true;
}

bool LedgerSchema::executeAll(const QStringList &statements)
{
    for (const QString &statement : statements) {
        if (!m_db.executeRaw(statement)) {
            m_lastError = m_db.lastError();
            return false;
        }
    }
    return true;
}

bool LedgerSchema::closeSurplusRunningSessions()
{
    const auto running = m_db.queryRows(
        "SELECT id, user_id, start_ts FROM sessions WHERE end_ts IS NULL ORDER BY user_id, id");
    if (!running) {
        m_lastError = m_db.lastError();
        return false;
    }

    // Values stay in the seconds-era format; the legacy migration converts them with the rest
    int closed = 0;
    for (int i = 0; i + 1 < running->size(); ++i) {
        const QSqlRecord &session = running->at(i);
        const QSqlRecord &successor = running->at(i + 1);
        const qint64 userId = session.value("user_id").toLongLong();
        if (successor.value("user_id").toLongLong() != userId) {
            continue;
        }

        const QVariant endValue = successor.value("start_ts");
        const qint64 seconds = DurationPolicy::elapsedSeconds(
            ModelFactory::fromLegacyLocal(session.value("start_ts"), QTimeZone::utc()),
            ModelFactory::fromLegacyLocal(endValue, QTimeZone::utc()));
        const qint64 sessionId = session.value("id").toLongLong();

        QMap<QString, QVariant> params;
        params["id"] = sessionId;
        params["end_ts"] = endValue;
        params["seconds"] = seconds;
        if (!m_db.execute("UPDATE sessions SET end_ts = :end_ts, minutes = :seconds WHERE id = :id", params)) {
            m_lastError = m_db.lastError();
            return false;
        }

        QMap<QString, QVariant> log;
        log["user_id"] = userId;
        log["seconds"] = seconds;
        log["ts"] = endValue;
        log["details"] = QString("Stopped at %1 after %2; superseded by session %3")
                             .arg(endValue.toString(), DurationPolicy::formatHms(seconds))
                             .arg(successor.value("id").toLongLong());
        if (!m_db.execute("INSERT INTO logs (user_id, kind, minutes, ts, details) "
                          "VALUES (:user_id, 'stop', :seconds, :ts, :details)", log)) {
            m_lastError = m_db.lastError();
            return false;
        }

        LOG_WARNING(QString("Closed running session %1 of user %2, superseded by session %3")
                    .arg(sessionId).arg(userId).arg(successor.value("id").toLongLong()));
        ++closed;
    }

    if (closed > 0) {
        LOG_WARNING(QString("Closed %1 surplus running sessions").arg(closed));
    }
    return true;
}

QString LedgerSchema::timestampColumnUpgrade(const QString &table, const QString &column)
{
    return QString("ALTER TABLE %1 ALTER COLUMN %2 TYPE TIMESTAMPTZ "
                   "USING (NULLIF(%2::text, '')::timestamp AT TIME ZONE 'UTC')").arg(table, column);
}

bool LedgerSchema::ensureTimestampTzColumn(const QString &table, const QString &column)
{
    QMap<QString, QVariant> params;
    params["table"] = table;
    params["column"] = column;

    const auto type = m_db.queryValue(
        "SELECT data_type FROM information_schema.columns "
        "WHERE table_schema = current_schema() AND table_name = :table AND column_name = :column", params);
    if (!type) {
        m_lastError = m_db.lastSqlError().isValid() ? m_db.lastError()
                                                    : QString("Column %1.%2 does not exist").arg(table, column);
        return false;
    }

    if (type->toString() == QLatin1String("timestamp with time zone")) {
        return true;
    }

    LOG_INFO(QString("Converting %1.%2 from %3 to TIMESTAMPTZ").arg(table, column, type->toString()));
    if (!m_db.executeRaw(timestampColumnUpgrade(table, column))) {
        m_lastError = m_db.lastError();
        return false;
    }
    return true;
}

bool LedgerSchema::convertLegacyTimestamps(const QTimeZone &legacyZone, int &rewritten)
{
    rewritten = 0;

    for (const TimestampColumn &entry : kTimestampColumns) {
        const QString table = QString::fromLatin1(entry.table);
        const QString column = QString::fromLatin1(entry.column);

        if (!m_db.config().isSqlite() && !ensureTimestampTzColumn(table, column)) {
            return false;
        }

        const auto rows = m_db.queryRows(QString("SELECT id, %1 FROM %2 WHERE %1 IS NOT NULL").arg(column, table));
        if (!rows) {
            m_lastError = m_db.lastError();
            return false;
        }

        for (const QSqlRecord &row : *rows) {
            const QDateTime instant = ModelFactory::fromLegacyLocal(row.value(1), legacyZone);
            if (!instant.isValid()) {
                m_lastError = QString("%1.%2 of row %3 holds '%4', which is not a timestamp")
                                  .arg(table, column, row.value(0).toString(), row.value(1).toString());
                return false;
            }

            QMap<QString, QVariant> params;
            params["id"] = row.value(0);
            params["ts"] = ModelFactory::toStorageTimestamp(instant);
            if (!m_db.execute(QString("UPDATE %1 SET %2 = :ts WHERE id = :id").arg(table, column), params)) {
                m_lastError = m_db.lastError();
                return false;
            }
            ++rewritten;
        }
    }

    LOG_INFO(QString("Rewrote %1 legacy timestamps from %2 to UTC")
             .arg(rewritten).arg(QString::fromUtf8(legacyZone.id())));
    return true;
}

QString LedgerSchema::durationUnit()
{
    return readMeta("duration_unit");
}

bool LedgerSchema::setDurationUnit(const QString &unit)
{
    QMap<QString, QVariant> params;
    params["value"] = unit;

    // RETURNING gives a row to check, so a missing key is not mistaken for success
    auto updated = m_db.queryValue(
        "UPDATE ledger_meta SET value = :value WHERE key = 'duration_unit' RETURNING key", params);
    if (!updated) {
        m_lastError = m_db.lastSqlError().isValid() ? m_db.lastError() : QString("duration_unit is not recorded");
        LOG_ERROR(QString("Failed to set duration unit: %1").arg(m_lastError));
        return false;
    }

    LOG_INFO(QString("Duration unit set to %1").arg(unit));
    return true;
}

bool LedgerSchema::insertMetaIfAbsent(const QString &key, const QString &value)
{
    QMap<QString, QVariant> params;
    params["key"] = key;
    params["value"] = value;

    // No row back means the key already existed
    m_db.queryValue("INSERT INTO ledger_meta (key, value) VALUES (:key, :value) "
                    "ON CONFLICT (key) DO NOTHING RETURNING key", params);
    if (m_db.lastSqlError().isValid()) {
        m_lastError = m_db.lastError();
        LOG_ERROR(QString("Failed to record %1: %2").arg(key, m_lastError));
        return false;
    }
    return true;
}

QString LedgerSchema::readMeta(const QString &key)
{
    QMap<QString, QVariant> params;
    params["key"] = key;

    auto value = m_db.queryValue("SELECT value FROM ledger_meta WHERE key = :key", params);
    if (!value) {
        if (m_db.lastSqlError().isValid()) {
            m_lastError = m_db.lastError();
        }
        return QString();
    }
    return value->toString();
}
