#include "WorkSessionRepository.h"
#include "Core/ModelFactory.h"

namespace {
const char *kSessionColumns = "id, user_id, start_ts, end_ts, minutes";
}

WorkSessionRepository::WorkSessionRepository(QObject *parent)
    : BaseRepository<WorkSessionModel>(parent)
{
    LOG_DEBUG("WorkSessionRepository created");
}

QString WorkSessionRepository::entityName() const
{
    return "WorkSession";
}

bool WorkSessionRepository::validateForInsert(WorkSessionModel *model, QStringList &errors)
{
    return ModelFactory::validateWorkSessionModel(model, errors);
}

QString WorkSessionRepository::insertStatement()
{
    return "INSERT INTO sessions (user_id, start_ts, end_ts, minutes) "
           "VALUES (:user_id, :start_ts, :end_ts, :minutes) "
           "RETURNING id";
}

QString WorkSessionRepository::selectByIdStatement()
{
    return QString("SELECT %1 FROM sessions WHERE id = :id").arg(kSessionColumns);
}

QMap<QString, QVariant> WorkSessionRepository::insertParams(WorkSessionModel *session)
{
    QMap<QString, QVariant> params;
    params["user_id"] = session->userId();
    params["start_ts"] = ModelFactory::toStorageTimestamp(session->startTime());
    params["end_ts"] = session->endTime().isValid()
        ? QVariant(ModelFactory::toStorageTimestamp(session->endTime()))
        : QVariant(QMetaType::fromType<QString>());
    params["minutes"] = ModelFactory::optionalToVariant(session->minutes());
    return params;
}

WorkSessionModel* WorkSessionRepository::fromRow(const QSqlQuery &query)
{
    return ModelFactory::createWorkSessionFromQuery(query);
}

QSharedPointer<WorkSessionModel> WorkSessionRepository::getActiveSession(qint64 userId)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;

    return selectOne(
        QString("SELECT %1 FROM sessions WHERE user_id = :user_id AND end_ts IS NULL").arg(kSessionColumns),
        params);
}

bool WorkSessionRepository::finishSession(qint64 sessionId, const QDateTime &endTime, int minutes)
{
    QMap<QString, QVariant> params;
    params["id"] = sessionId;
    params["end_ts"] = ModelFactory::toStorageTimestamp(endTime);
    params["minutes"] = minutes;

    bool success = execute(
        "UPDATE sessions SET end_ts = :end_ts, minutes = :minutes "
        "WHERE id = :id AND end_ts IS NULL",
        params);

    if (success) {
        LOG_DEBUG(QString("Finish of session %1 affected %2 rows").arg(sessionId).arg(lastRowsAffected()));
    }
    return success;
}

QList<QSharedPointer<WorkSessionModel>> WorkSessionRepository::getFinishedSessions(qint64 userId)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;

    return selectMany(
        QString("SELECT %1 FROM sessions WHERE user_id = :user_id AND end_ts IS NOT NULL "
                "ORDER BY end_ts, id").arg(kSessionColumns),
        params);
}

QList<QSharedPointer<WorkSessionModel>> WorkSessionRepository::getAllFinishedSessions()
{
    return selectMany(
        QString("SELECT %1 FROM sessions WHERE minutes IS NOT NULL ORDER BY id").arg(kSessionColumns),
        QMap<QString, QVariant>());
}

bool WorkSessionRepository::updateMinutes(qint64 sessionId, int minutes)
{
    QMap<QString, QVariant> params;
    params["id"] = sessionId;
    params["minutes"] = minutes;

    return execute("UPDATE sessions SET minutes = :minutes WHERE id = :id", params);
}
