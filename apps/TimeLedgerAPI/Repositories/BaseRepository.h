#ifndef BASEREPOSITORY_H
#define BASEREPOSITORY_H

#include <QList>
#include <QObject>
#include <QSharedPointer>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>

#include "dbservice/dbservice.hpp"
#include "logger/logger.h"

/**
 * @brief Shared row plumbing for the ledger tables
 *
 * Every ledger table has an integer primary key generated by the database;
 * a model whose id is 0 has not been inserted yet. Rows are immutable apart
 * from the narrow updates subclasses expose (closing a session, the legacy
 * unit conversion).
 *
 * Repositories never open transactions. All repositories of one LedgerStore
 * share its connection and the store owns the transaction boundary.
 */
template <typename T>
class BaseRepository : public QObject {
public:
    using Ptr = QSharedPointer<T>;

    explicit BaseRepository(QObject* parent = nullptr)
        : QObject(parent)
    {
    }

    ~BaseRepository() override = default;

    bool initialize(DbService<T>* service) {
        if (!service) {
            LOG_ERROR(QString("No database service for %1 rows").arg(entityName()));
            return false;
        }
        m_service = service;
        return true;
    }

    QString lastError() const {
        return m_service ? m_service->lastError() : QString("%1 repository has no database").arg(entityName());
    }

    QSqlError lastSqlError() const {
        return m_service ? m_service->lastSqlError() : QSqlError();
    }

    // Distinguishes a driver failure from a select that matched nothing
    bool lastQueryFailed() const {
        return !m_service || m_service->lastQueryFailed();
    }

    int lastRowsAffected() const {
        return m_service ? m_service->lastRowsAffected() : -1;
    }

    /**
     * @brief Insert an unsaved model and assign the generated id to it
     *
     * Fails without touching the database when the model does not validate.
     */
    bool insert(T* model) {
        if (!ready()) {
            return false;
        }

        QStringList problems;
        if (!validateForInsert(model, problems)) {
            LOG_ERROR(QString("Refusing to insert %1: %2").arg(entityName(), problems.join("; ")));
            return false;
        }

        qint64 id = 0;
        const bool ok = m_service->executeInsertWithReturningId(
            insertStatement(), insertParams(model), "id",
            [&id](const QVariant& value) { id = value.toLongLong(); });

        if (!ok) {
            return false;
        }
        if (id <= 0) {
            LOG_ERROR(QString("Insert into %1 returned no id").arg(entityName()));
            return false;
        }

        model->setId(id);
        return true;
    }

    Ptr getById(qint64 id) {
        return selectOne(selectByIdStatement(), {{"id", id}});
    }

protected:
    Ptr selectOne(const QString& sql, const QMap<QString, QVariant>& params) {
        if (!ready()) {
            return Ptr();
        }

        const auto row = m_service->executeSingleSelectQuery(
            sql, params, [this](const QSqlQuery& query) { return fromRow(query); });
        return row ? Ptr(*row) : Ptr();
    }

    QList<Ptr> selectMany(const QString& sql, const QMap<QString, QVariant>& params) {
        QList<Ptr> rows;
        if (!ready()) {
            return rows;
        }

        const QList<T*> raw = m_service->executeSelectQuery(
            sql, params, [this](const QSqlQuery& query) { return fromRow(query); });
        rows.reserve(raw.size());
        for (T* model : raw) {
            rows.append(Ptr(model));
        }
        return rows;
    }

    bool execute(const QString& sql, const QMap<QString, QVariant>& params) {
        return ready() && m_service->executeModificationQuery(sql, params);
    }

    DbService<T>* dbService() const { return m_service; }

    bool ready() const {
        if (!m_service) {
            LOG_ERROR(QString("%1 repository used before initialize()").arg(entityName()));
            return false;
        }
        return true;
    }

    virtual QString entityName() const = 0;
    virtual bool validateForInsert(T* model, QStringList& errors) = 0;

    // INSERT ... RETURNING id
    virtual QString insertStatement() = 0;
    virtual QString selectByIdStatement() = 0;
    virtual QMap<QString, QVariant> insertParams(T* model) = 0;
    virtual T* fromRow(const QSqlQuery& query) = 0;

private:
    DbService<T>* m_service = nullptr;
};

#endif // BASEREPOSITORY_H
