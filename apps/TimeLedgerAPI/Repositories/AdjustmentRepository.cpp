#include "AdjustmentRepository.h"
#include "Core/ModelFactory.h"

AdjustmentRepository::AdjustmentRepository(QObject *parent)
    : BaseRepository<AdjustmentModel>(parent)
{
    LOG_DEBUG("AdjustmentRepository created");
}

QString AdjustmentRepository::entityName() const
{
    return "Adjustment";
}

bool AdjustmentRepository::validateForInsert(AdjustmentModel *model, QStringList &errors)
{
    return ModelFactory::validateAdjustmentModel(model, errors);
}

QString AdjustmentRepository::insertStatement()
{
    return "INSERT INTO adjustments (user_id, minutes, reason, created_ts) "
           "VALUES (:user_id, :minutes, :reason, :created_ts) "
           "RETURNING id";
}

QString AdjustmentRepository::selectByIdStatement()
{
    return "SELECT id, user_id, minutes, reason, created_ts FROM adjustments WHERE id = :id";
}

QMap<QString, QVariant> AdjustmentRepository::insertParams(AdjustmentModel *adjustment)
{
    QMap<QString, QVariant> params;
    params["user_id"] = adjustment->userId();
    params["minutes"] = adjustment->minutes();
    params["reason"] = adjustment->reason().isEmpty()
        ? QVariant(QMetaType::fromType<QString>())
        : QVariant(adjustment->reason());
    params["created_ts"] = ModelFactory::toStorageTimestamp(adjustment->createdAt());
    return params;
}

AdjustmentModel* AdjustmentRepository::fromRow(const QSqlQuery &query)
{
    return ModelFactory::createAdjustmentFromQuery(query);
}

QList<QSharedPointer<AdjustmentModel>> AdjustmentRepository::getByUserId(qint64 userId)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;

    return selectMany(
        "SELECT id, user_id, minutes, reason, created_ts FROM adjustments "
        "WHERE user_id = :user_id ORDER BY created_ts, id",
        params);
}

QList<QSharedPointer<AdjustmentModel>> AdjustmentRepository::getAll()
{
    return selectMany(
        "SELECT id, user_id, minutes, reason, created_ts FROM adjustments ORDER BY id",
        QMap<QString, QVariant>());
}

bool AdjustmentRepository::updateMinutes(qint64 adjustmentId, int minutes)
{
    QMap<QString, QVariant> params;
    params["id"] = adjustmentId;
    params["minutes"] = minutes;

    return execute("UPDATE adjustments SET minutes = :minutes WHERE id = :id", params);
}
