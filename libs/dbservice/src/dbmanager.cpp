#include "dbservice/dbmanager.h"
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlDriver>
#include <QSqlQuery>
#include <QUuid>

DbManager::DbManager(const DbConfig& config)
    : m_config(config)
    , m_connectionName(QString("dbmanager_%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces)))
{
    LOG_DEBUG(QString("DbManager created for %1").arg(m_config.describe()));
}

DbManager::~DbManager() {
    // Services hold only the connection name; drop them before the connection goes
    m_services.clear();

    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen()) {
            if (m_inTransaction) {
                LOG_WARNING("Closing connection with an open transaction, rolling back");
                db.rollback();
            }
            LOG_DEBUG(QString("Closing database connection: %1").arg(m_connectionName));
            db.close();
        }
    }

    if (QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool DbManager::initialize() {
    if (m_initialized) {
        LOG_WARNING("DbManager already initialized!");
        return true;
    }

    if (!checkDrivers()) {
        LOG_FATAL(QString("Required database driver %1 is not available").arg(m_config.driver()));
        return false;
    }

    QSqlDatabase db = QSqlDatabase::addDatabase(m_config.driver(), m_connectionName);
    db.setDatabaseName(m_config.database());
    if (!m_config.isSqlite()) {
        db.setHostName(m_config.host());
        db.setUserName(m_config.username());
        db.setPassword(m_config.password());
        db.setPort(m_config.port());
    }
    db.setConnectOptions(connectOptions());

    if (!db.open()) {
        m_lastError = db.lastError();
        LOG_FATAL(QString("Database connection failed: %1 for %2")
                 .arg(m_lastError.text(), m_config.describe()));
        return false;
    }

    m_initialized = true;

    if (m_config.isSqlite()) {
        // Foreign keys are off by default in SQLite; WAL lets readers run beside the writer
        if (!executeRaw("PRAGMA foreign_keys = ON") || !executeRaw("PRAGMA journal_mode = WAL")) {
            m_initialized = false;
            db.close();
            return false;
        }
    }

    if (!testConnection()) {
        m_initialized = false;
        db.close();
        return false;
    }

    LOG_INFO(QString("DbManager successfully initialized for %1").arg(m_config.describe()));
    return true;
}

QSqlDatabase DbManager::database() const {
    return QSqlDatabase::database(m_connectionName, false);
}

bool DbManager::testConnection() {
    QSqlQuery query(database());
    if (!query.exec("SELECT 1") || !query.next()) {
        m_lastError = query.lastError();
        LOG_FATAL(QString("Test query failed: %1").arg(m_lastError.text()));
        return false;
    }

    LOG_DEBUG(QString("Test connection successful to %1").arg(m_config.describe()));
    return true;
}

bool DbManager::beginTransaction() {
    if (!m_initialized) {
        LOG_ERROR("Cannot begin transaction, DbManager is not initialized");
        return false;
    }

    if (m_inTransaction) {
        LOG_ERROR("Transaction already open on this connection");
        return false;
    }

    QSqlDatabase db = database();
    bool success = false;

    if (m_config.isSqlite()) {
        // Take the write lock up front so concurrent writers queue on the busy
        // timeout instead of failing a lock upgrade mid-transaction
        success = executeRaw("BEGIN IMMEDIATE");
    } else {
        if (!db.driver()->hasFeature(QSqlDriver::Transactions)) {
            LOG_WARNING("Database driver does not support transactions");
            return false;
        }
        success = db.transaction();
        if (!success) {
            m_lastError = db.lastError();
        }
    }

    if (!success) {
        LOG_ERROR(QString("Failed to begin transaction: %1").arg(m_lastError.text()));
        return false;
    }

    m_inTransaction = true;
    LOG_DEBUG("Transaction started");
    return true;
}

bool DbManager::commitTransaction() {
    if (!m_inTransaction) {
        LOG_ERROR("Cannot commit, no transaction is open");
        return false;
    }

    bool success = false;
    if (m_config.isSqlite()) {
        success = executeRaw("COMMIT");
    } else {
        QSqlDatabase db = database();
        success = db.commit();
        if (!success) {
            m_lastError = db.lastError();
        }
    }

    if (!success) {
        LOG_ERROR(QString("Failed to commit transaction: %1").arg(m_lastError.text()));
        return false;
    }

    m_inTransaction = false;
    LOG_DEBUG("Transaction committed");
    return true;
}

bool DbManager::rollbackTransaction() {
    if (!m_inTransaction) {
        LOG_WARNING("Rollback requested with no open transaction");
        return false;
    }

    bool success = false;
    if (m_config.isSqlite()) {
        success = executeRaw("ROLLBACK");
    } else {
        QSqlDatabase db = database();
        success = db.rollback();
        if (!success) {
            m_lastError = db.lastError();
        }
    }

    // The server discards the transaction even when the rollback reports an error
    m_inTransaction = false;

    if (!success) {
        LOG_ERROR(QString("Failed to rollback transaction: %1").arg(m_lastError.text()));
        return false;
    }

    LOG_DEBUG("Transaction rolled back");
    return true;
}

bool DbManager::executeRaw(const QString& statement) {
    QSqlQuery query(database());
    if (!query.exec(statement)) {
        m_lastError = query.lastError();
        LOG_ERROR(QString("Statement failed: %1\nStatement: %2").arg(m_lastError.text(), statement));
        return false;
    }
    return true;
}

bool DbManager::prepareAndRun(QSqlQuery& query, const QString& statement, const QMap<QString, QVariant>& params) {
    m_lastError = QSqlError();
    if (!query.prepare(statement)) {
        m_lastError = query.lastError();
        LOG_ERROR(QString("Statement preparation failed: %1\nStatement: %2").arg(m_lastError.text(), statement));
        return false;
    }

    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        query.bindValue(":" + it.key(), it.value());
    }

    if (!query.exec()) {
        m_lastError = query.lastError();
        LOG_ERROR(QString("Statement failed: %1\nStatement: %2").arg(m_lastError.text(), statement));
        return false;
    }
    return true;
}

std::optional<QVariant> DbManager::queryValue(const QString& statement, const QMap<QString, QVariant>& params) {
    QSqlQuery query(database());
    if (!prepareAndRun(query, statement, params) || !query.next()) {
        return std::nullopt;
    }
    return query.value(0);
}

std::optional<QList<QSqlRecord>> DbManager::queryRows(const QString& statement, const QMap<QString, QVariant>& params) {
    QSqlQuery query(database());
    query.setForwardOnly(true);
    if (!prepareAndRun(query, statement, params)) {
        return std::nullopt;
    }

    QList<QSqlRecord> rows;
    while (query.next()) {
        rows.append(query.record());
    }
    return rows;
}

bool DbManager::execute(const QString& statement, const QMap<QString, QVariant>& params) {
    QSqlQuery query(database());
    return prepareAndRun(query, statement, params);
}

bool DbManager::tableExists(const QString& tableName) const {
    return database().tables(QSql::Tables).contains(tableName, Qt::CaseInsensitive);
}

bool DbManager::checkDrivers() const {
    QStringList drivers = QSqlDatabase::drivers();

    LOG_DEBUG(QString("Available SQL drivers: %1").arg(drivers.join(", ")));

    if (!drivers.contains(m_config.driver())) {
        LOG_FATAL(QString("Driver %1 not available. Available drivers: %2")
                .arg(m_config.driver(), drivers.join(", ")));
        return false;
    }

    return true;
}

QString DbManager::connectOptions() const {
    if (m_config.isSqlite()) {
        return QString("QSQLITE_BUSY_TIMEOUT=%1").arg(m_config.busyTimeoutMs());
    }

    // Statements fail after the busy timeout instead of hanging on a lock
    return QString("connect_timeout=%1;application_name=TimeLedger;options=-cstatement_timeout=%2")
        .arg(m_config.connectTimeoutSeconds())
        .arg(m_config.busyTimeoutMs());
}
