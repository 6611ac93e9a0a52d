#pragma once
#include "dbservice/dbservice.h"
#include "logger/logger.h"
#include <QElapsedTimer>
#include <typeinfo>

template<typename T>
DbService<T>::DbService(const QString& connectionName)
    : m_connectionName(connectionName)
{
    LOG_DEBUG(QString("DbService<%1> bound to connection %2")
              .arg(QString::fromLatin1(typeid(T).name()), m_connectionName));
}

template<typename T>
DbService<T>::~DbService() = default;

template<typename T>
QSqlDatabase DbService<T>::database() const {
    return QSqlDatabase::database(m_connectionName, false);
}

template<typename T>
bool DbService<T>::ensureConnected() {
    QSqlDatabase db = database();
    if (!db.isValid()) {
        LOG_ERROR(QString("Connection %1 is not registered").arg(m_connectionName));
        return false;
    }

    if (!db.isOpen()) {
        LOG_WARNING("Database connection is closed, attempting to reopen...");

        if (!db.open()) {
            m_lastError = db.lastError();
            LOG_ERROR(QString("Failed to reopen database connection: %1").arg(m_lastError.text()));
            return false;
        }
        LOG_INFO(QString("Successfully reopened database connection: %1").arg(m_connectionName));
    }
    return true;
}

template<typename T>
void DbService<T>::resetStatus() {
    m_lastError = QSqlError();
    m_lastQueryFailed = false;
    m_lastRowsAffected = -1;
}

template<typename T>
bool DbService<T>::run(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params) {
    bool ok = false;

    if (params.isEmpty()) {
        ok = query.exec(queryStr);
    } else {
        if (!query.prepare(queryStr)) {
            m_lastError = query.lastError();
            m_lastQueryFailed = true;
            LOG_ERROR(QString("Query preparation failed: %1\nQuery: %2")
                     .arg(m_lastError.text(), queryStr));
            return false;
        }

        for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
            query.bindValue(":" + it.key(), it.value());
        }
        ok = query.exec();
    }

    if (!ok) {
        m_lastError = query.lastError();
        m_lastQueryFailed = true;
        LOG_ERROR(QString("Query failed: %1 (native code %2)\nQuery: %3")
                 .arg(m_lastError.text(), m_lastError.nativeErrorCode(), queryStr));
        if (!params.isEmpty()) {
            LOG_DATA(Logger::Error, params);
        }
    }
    return ok;
}

template<typename T>
QList<T*> DbService<T>::executeSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor& processor)
{
    resetStatus();
    if (!ensureConnected()) {
        m_lastQueryFailed = true;
        return QList<T*>();
    }

    QElapsedTimer timer;
    timer.start();

    QSqlQuery query(database());
    if (!run(query, queryStr, params)) {
        return QList<T*>();
    }

    QList<T*> results;
    while (query.next()) {
        results.append(processor(query));
    }

    LOG_DEBUG(QString("Query executed in %1 ms, returned %2 rows")
             .arg(timer.elapsed())
             .arg(results.size()));
    return results;
}

template<typename T>
std::optional<T*> DbService<T>::executeSingleSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor& processor)
{
    resetStatus();
    if (!ensureConnected()) {
        m_lastQueryFailed = true;
        return std::nullopt;
    }

    QElapsedTimer timer;
    timer.start();

    QSqlQuery query(database());
    if (!run(query, queryStr, params)) {
        return std::nullopt;
    }

    if (query.next()) {
        T* result = processor(query);
        LOG_DEBUG(QString("Query executed in %1 ms, returned 1 row").arg(timer.elapsed()));
        return result;
    }

    LOG_DEBUG(QString("Query executed in %1 ms, returned 0 rows").arg(timer.elapsed()));
    return std::nullopt;
}

template<typename T>
bool DbService<T>::executeModificationQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params)
{
    resetStatus();
    if (!ensureConnected()) {
        m_lastQueryFailed = true;
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    QSqlQuery query(database());
    if (!run(query, queryStr, params)) {
        return false;
    }

    m_lastRowsAffected = query.numRowsAffected();
    LOG_DEBUG(QString("Query executed in %1 ms, affected %2 rows")
             .arg(timer.elapsed())
             .arg(m_lastRowsAffected));
    return true;
}

template<typename T>
bool DbService<T>::executeInsertWithReturningId(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QString& idColumn,
    const std::function<void(const QVariant&)>& idHandler)
{
    resetStatus();
    if (!ensureConnected()) {
        m_lastQueryFailed = true;
        return false;
    }

    QSqlQuery query(database());
    if (!run(query, queryStr, params)) {
        return false;
    }

    if (!query.next()) {
        // ON CONFLICT DO NOTHING inserts return no row
        m_lastRowsAffected = 0;
        LOG_DEBUG("Insert returned no generated id");
        return true;
    }

    m_lastRowsAffected = 1;
    idHandler(query.value(idColumn));
    return true;
}

template<typename T>
QString DbService<T>::lastError() const {
    return m_lastError.text();
}
