#pragma once
#include "dbservice.hpp"
#include "dbconfig.h"
#include "logger/logger.h"
#include <QList>
#include <QMap>
#include <QSqlRecord>
#include <memory>
#include <optional>
#include <stdexcept>
#include <typeindex>

/**
 * @brief Owns one named database connection and its transaction boundary
 *
 * Qt connections may only be used from the thread that created them, so a
 * DbManager (and everything built on it) belongs to a single thread. Use one
 * DbManager per worker thread.
 */
class DbManager {
public:
    explicit DbManager(const DbConfig& config);
    ~DbManager();

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

    // Register and open the connection; false if the driver is missing or the open fails
    bool initialize();

    bool isInitialized() const { return m_initialized; }
    const DbConfig& config() const { return m_config; }
    QSqlDatabase database() const;

    bool testConnection();

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();
    bool inTransaction() const { return m_inTransaction; }

    // Execute a statement that needs no binding (DDL, pragmas)
    bool executeRaw(const QString& statement);

    // First column of the first row; nullopt when no row matches or on failure (lastSqlError() is set)
    std::optional<QVariant> queryValue(const QString& statement,
                                       const QMap<QString, QVariant>& params = QMap<QString, QVariant>());

    // Every row of the result; nullopt on failure (lastSqlError() is set)
    std::optional<QList<QSqlRecord>> queryRows(const QString& statement,
                                               const QMap<QString, QVariant>& params = QMap<QString, QVariant>());

    // Bound statement without a result set; false on failure
    bool execute(const QString& statement, const QMap<QString, QVariant>& params);

    bool tableExists(const QString& tableName) const;

    QString lastError() const { return m_lastError.text(); }
    QSqlError lastSqlError() const { return m_lastError; }

    // Get the query service for a specific model; all services share this connection
    template<typename T>
    DbService<T>& getService() {
        if (!m_initialized) {
            LOG_FATAL(QString("DbManager not initialized! Attempting to get service for %1")
                     .arg(QString::fromLatin1(typeid(T).name())));
            throw std::runtime_error("DbManager not initialized");
        }

        const std::type_index typeIndex(typeid(T));
        if (!m_services.contains(typeIndex)) {
            LOG_DEBUG(QString("Creating new DB service for %1").arg(QString::fromLatin1(typeid(T).name())));
            m_services[typeIndex] = std::make_shared<DbService<T>>(m_connectionName);
        }

        return *std::static_pointer_cast<DbService<T>>(m_services[typeIndex]);
    }

private:
    bool prepareAndRun(QSqlQuery& query, const QString& statement, const QMap<QString, QVariant>& params);
    bool checkDrivers() const;
    QString connectOptions() const;

    DbConfig m_config;
    QString m_connectionName;
    bool m_initialized = false;
    bool m_inTransaction = false;
    QSqlError m_lastError;
    QMap<std::type_index, std::shared_ptr<void>> m_services;
};
