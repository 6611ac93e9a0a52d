#ifndef LEDGERSCHEMA_H
#define LEDGERSCHEMA_H

#include <QString>
#include <QStringList>
#include <QTimeZone>

class DbManager;

/**
 * @brief Creates the ledger tables and tracks schema metadata
 *
 * Tables: users, sessions, adjustments, logs and ledger_meta. The partial
 * unique index ux_sessions_one_running guarantees at most one session with a
 * NULL end time per user. DDL is emitted for PostgreSQL or SQLite depending on
 * the connection driver.
 */
class LedgerSchema
{
public:
    static constexpr int kSchemaVersion = 1;
    static const QString kUnitMinutes;
    static const QString kUnitSeconds;

    explicit LedgerSchema(DbManager &db);

    // Create missing tables and indexes, then record version and duration unit
    bool ensureSchema();

    // "minutes" or "seconds"; empty when the value cannot be read
    QString durationUnit();
    bool setDurationUnit(const QString &unit);

    /**
     * @brief Rewrite seconds-era timestamps as UTC instants
     *
     * Those rows hold naive wall-clock time in @p legacyZone. On PostgreSQL the
     * text columns are first converted to TIMESTAMPTZ. Runs inside the
     * caller's transaction; @p rewritten counts the values written back.
     */
    bool convertLegacyTimestamps(const QTimeZone &legacyZone, int &rewritten);

    // PostgreSQL DDL turning a naive text column into TIMESTAMPTZ, wall clock read as UTC
    static QString timestampColumnUpgrade(const QString &table, const QString &column);

    QString lastError() const { return m_lastError; }

private:
    QStringList tableStatements() const;
    QStringList indexStatements() const;
    bool executeAll(const QStringList &statements);

    // Older releases could leave two running sessions for one user
    bool closeSurplusRunningSessions();
    bool ensureTimestampTzColumn(const QString &table, const QString &column);
    bool insertMetaIfAbsent(const QString &key, const QString &value);
    QString readMeta(const QString &key);

    DbManager &m_db;
    bool m_foundLegacyTables;
    QString m_lastError;
};

#endif // LEDGERSCHEMA_H
