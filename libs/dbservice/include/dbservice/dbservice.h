#pragma once
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QList>
#include <QMap>
#include <QVariant>
#include <functional>
#include <optional>
#include "logger/logger.h"

/**
 * @brief Typed query executor bound to a named connection owned by DbManager
 *
 * All services created by the same DbManager share one connection, so their
 * statements take part in the transaction DbManager has open. Failures are
 * reported through the return value; lastQueryFailed() tells an empty result
 * apart from a failed query.
 */
template<typename T>
class DbService {
public:
    using QueryProcessor = std::function<T*(const QSqlQuery&)>;

    explicit DbService(const QString& connectionName);
    ~DbService();

    // Execute a SELECT query and return every mapped row
    QList<T*> executeSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor& processor);

    // Execute a SELECT query and map the first row only
    std::optional<T*> executeSingleSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor& processor);

    // Execute an INSERT, UPDATE, or DELETE query
    bool executeModificationQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params);

    // Execute an INSERT ... RETURNING <idColumn> and hand the generated id to idHandler
    bool executeInsertWithReturningId(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QString& idColumn,
        const std::function<void(const QVariant&)>& idHandler);

    QString lastError() const;
    QSqlError lastSqlError() const { return m_lastError; }
    bool lastQueryFailed() const { return m_lastQueryFailed; }
    int lastRowsAffected() const { return m_lastRowsAffected; }

private:
    QSqlDatabase database() const;
    bool ensureConnected();
    bool run(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params);
    void resetStatus();

    QString m_connectionName;
    QSqlError m_lastError;
    bool m_lastQueryFailed = false;
    int m_lastRowsAffected = -1;
};
