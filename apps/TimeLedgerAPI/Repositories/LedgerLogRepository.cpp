#include "LedgerLogRepository.h"
#include "Core/ModelFactory.h"

LedgerLogRepository::LedgerLogRepository(QObject *parent)
    : BaseRepository<LedgerLogModel>(parent)
{
    LOG_DEBUG("LedgerLogRepository created");
}

QString LedgerLogRepository::entityName() const
{
    return "LedgerLog";
}

bool LedgerLogRepository::validateForInsert(LedgerLogModel *model, QStringList &errors)
{
    return ModelFactory::validateLedgerLogModel(model, errors);
}

QString LedgerLogRepository::insertStatement()
{
    return "INSERT INTO logs (user_id, kind, minutes, ts, details) "
           "VALUES (:user_id, :kind, :minutes, :ts, :details) "
           "RETURNING id";
}

QString LedgerLogRepository::selectByIdStatement()
{
    return "SELECT id, user_id, kind, minutes, ts, details FROM logs WHERE id = :id";
}

QMap<QString, QVariant> LedgerLogRepository::insertParams(LedgerLogModel *entry)
{
    QMap<QString, QVariant> params;
    params["user_id"] = entry->userId();
    params["kind"] = LedgerTypes::logKindToString(entry->kind());
    params["minutes"] = ModelFactory::optionalToVariant(entry->minutes());
    params["ts"] = ModelFactory::toStorageTimestamp(entry->timestamp());
    params["details"] = entry->details();
    return params;
}

LedgerLogModel* LedgerLogRepository::fromRow(const QSqlQuery &query)
{
    return ModelFactory::createLedgerLogFromQuery(query);
}

QList<QSharedPointer<LedgerLogModel>> LedgerLogRepository::getRecent(qint64 userId, int limit)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;
    params["limit"] = limit;

    return selectMany(
        "SELECT id, user_id, kind, minutes, ts, details FROM logs "
        "WHERE user_id = :user_id ORDER BY id DESC LIMIT :limit",
        params);
}

QList<QSharedPointer<LedgerLogModel>> LedgerLogRepository::getAllWithMinutes()
{
    return selectMany(
        "SELECT id, user_id, kind, minutes, ts, details FROM logs WHERE minutes IS NOT NULL ORDER BY id",
        QMap<QString, QVariant>());
}

bool LedgerLogRepository::updateMinutes(qint64 logId, int minutes)
{
    QMap<QString, QVariant> params;
    params["id"] = logId;
    params["minutes"] = minutes;

    return execute("UPDATE logs SET minutes = :minutes WHERE id = :id", params);
}
