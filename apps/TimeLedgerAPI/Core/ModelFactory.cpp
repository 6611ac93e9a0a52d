#include "ModelFactory.h"

#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "Models/LedgerLogModel.h"
#include "Core/DurationPolicy.h"

#include <QSqlRecord>
#include "logger/logger.h"

//------------------------------------------------------------------------------
// Model creation from database query results
//------------------------------------------------------------------------------

UserModel* ModelFactory::createUserFromQuery(const QSqlQuery& query) {
    UserModel* user = new UserModel();

    user->setId(getInt64OrDefault(query, "id"));
    user->setName(getStringOrDefault(query, "name"));

    return user;
}

WorkSessionModel* ModelFactory::createWorkSessionFromQuery(const QSqlQuery& query) {
    WorkSessionModel* session = new WorkSessionModel();

    session->setId(getInt64OrDefault(query, "id"));
    session->setUserId(getInt64OrDefault(query, "user_id"));
    session->setStartTime(getDateTimeOrDefault(query, "start_ts"));
    session->setEndTime(getDateTimeOrDefault(query, "end_ts"));
    session->setMinutes(getOptionalInt(query, "minutes"));

    return session;
}

AdjustmentModel* ModelFactory::createAdjustmentFromQuery(const QSqlQuery& query) {
    AdjustmentModel* adjustment = new AdjustmentModel();

    adjustment->setId(getInt64OrDefault(query, "id"));
    adjustment->setUserId(getInt64OrDefault(query, "user_id"));
    adjustment->setMinutes(getIntOrDefault(query, "minutes"));
    adjustment->setReason(getStringOrDefault(query, "reason"));
    adjustment->setCreatedAt(getDateTimeOrDefault(query, "created_ts"));

    return adjustment;
}

LedgerLogModel* ModelFactory::createLedgerLogFromQuery(const QSqlQuery& query) {
    LedgerLogModel* entry = new LedgerLogModel();

    entry->setId(getInt64OrDefault(query, "id"));
    entry->setUserId(getInt64OrDefault(query, "user_id"));

    const QString kindName = getStringOrDefault(query, "kind");
    LedgerTypes::LogKind kind;
    if (LedgerTypes::logKindFromString(kindName, kind)) {
        entry->setKind(kind);
    } else {
        LOG_WARNING(QString("Log entry %1 has unknown kind '%2'").arg(entry->id()).arg(kindName));
    }

    entry->setMinutes(getOptionalInt(query, "minutes"));
    entry->setTimestamp(getDateTimeOrDefault(query, "ts"));
    entry->setDetails(getStringOrDefault(query, "details"));

    return entry;
}

//------------------------------------------------------------------------------
// Model validation
//------------------------------------------------------------------------------

bool ModelFactory::validateUserModel(const UserModel* model, QStringList& errors) {
    errors.clear();

    const QString name = model->name();
    if (name.trimmed().isEmpty()) {
        errors.append("Name is required");
    } else if (name.size() > kMaxNameLength) {
        errors.append(QString("Name must be at most %1 characters").arg(kMaxNameLength));
    }

    return errors.isEmpty();
}

bool ModelFactory::validateWorkSessionModel(const WorkSessionModel* model, QStringList& errors) {
    errors.clear();

    if (model->userId() <= 0) {
        errors.append("User ID is required");
    }

    if (!model->startTime().isValid()) {
        errors.append("Start time is required and must be valid");
    }

    // End and minutes are set together when the session stops
    if (model->endTime().isValid() != model->minutes().has_value()) {
        errors.append("End time and minutes must be set together");
    }

    if (model->minutes().has_value() && *model->minutes() < 0) {
        errors.append("Minutes must not be negative");
    }

    return errors.isEmpty();
}

bool ModelFactory::validateAdjustmentModel(const AdjustmentModel* model, QStringList& errors) {
    errors.clear();

    if (model->userId() <= 0) {
        errors.append("User ID is required");
    }

    if (model->minutes() == 0) {
        errors.append("Adjustment minutes must be nonzero");
    }

    if (!model->createdAt().isValid()) {
        errors.append("Creation time is required and must be valid");
    }

    return errors.isEmpty();
}

bool ModelFactory::validateLedgerLogModel(const LedgerLogModel* model, QStringList& errors) {
    errors.clear();

    if (model->userId() <= 0) {
        errors.append("User ID is required");
    }

    if (!model->timestamp().isValid()) {
        errors.append("Timestamp is required and must be valid");
    }

    if (model->kind() == LedgerTypes::LogKind::Start && model->minutes().has_value()) {
        errors.append("Start entries carry no minutes");
    }

    if (model->kind() != LedgerTypes::LogKind::Start && !model->minutes().has_value()) {
        errors.append("Stop and adjust entries require minutes");
    }

    return errors.isEmpty();
}

//------------------------------------------------------------------------------
// JSON conversion
//------------------------------------------------------------------------------

QJsonObject ModelFactory::modelToJson(const UserModel* model) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id();
    json["name"] = model->name();
    return json;
}

QJsonObject ModelFactory::modelToJson(const WorkSessionModel* model, const QTimeZone& displayZone) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id();
    json["user_id"] = model->userId();
    json["start"] = toStorageTimestamp(model->startTime());
    json["start_local"] = formatLocal(model->startTime(), displayZone);
    json["running"] = model->isRunning();

    if (!model->isRunning()) {
        json["end"] = toStorageTimestamp(model->endTime());
        json["end_local"] = formatLocal(model->endTime(), displayZone);
    }

    if (model->minutes().has_value()) {
        json["minutes"] = *model->minutes();
        json["duration_hms"] = DurationPolicy::formatHms(qint64(*model->minutes()) * DurationPolicy::kSecondsPerMinute);
    }

    return json;
}

QJsonObject ModelFactory::modelToJson(const AdjustmentModel* model, const QTimeZone& displayZone) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id();
    json["user_id"] = model->userId();
    json["minutes"] = model->minutes();
    json["reason"] = model->reason();
    json["created_at"] = toStorageTimestamp(model->createdAt());
    json["created_local"] = formatLocal(model->createdAt(), displayZone);
    return json;
}

QJsonObject ModelFactory::modelToJson(const LedgerLogModel* model, const QTimeZone& displayZone) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id();
    json["ts"] = formatLocal(model->timestamp(), displayZone);
    json["kind"] = LedgerTypes::logKindToString(model->kind());

    if (model->minutes().has_value()) {
        json["minutes"] = *model->minutes();
        json["duration_hms"] = DurationPolicy::formatHms(qint64(*model->minutes()) * DurationPolicy::kSecondsPerMinute);
    } else {
        json["minutes"] = QJsonValue::Null;
        json["duration_hms"] = QString();
    }

    json["details"] = model->details();
    return json;
}

QJsonObject ModelFactory::monthBucketToJson(const MonthBucket& bucket) {
    QJsonObject json;
    json["month"] = bucket.monthKey;
    json["minutes"] = bucket.minutes;
    json["duration_hms"] = DurationPolicy::formatHms(bucket.minutes * DurationPolicy::kSecondsPerMinute);
    return json;
}

QJsonArray ModelFactory::modelsToJsonArray(const QList<QSharedPointer<LedgerLogModel>>& models, const QTimeZone& displayZone) {
    QJsonArray array;
    for (const auto& model : models) {
        array.append(modelToJson(model.data(), displayZone));
    }
    return array;
}

QJsonArray ModelFactory::monthBucketsToJsonArray(const MonthBucketList& buckets) {
    QJsonArray array;
    for (const auto& bucket : buckets) {
        array.append(monthBucketToJson(bucket));
    }
    return array;
}

//------------------------------------------------------------------------------
// Timestamp conversion
//------------------------------------------------------------------------------

QString ModelFactory::toStorageTimestamp(const QDateTime& instant) {
    if (!instant.isValid()) {
        return QString();
    }
    return instant.toUTC().toString("yyyy-MM-ddTHH:mm:ss.zzzZ");
}

QDateTime ModelFactory::fromStorageValue(const QVariant& value) {
    if (value.isNull()) {
        return QDateTime();
    }

    // QPSQL hands back QDateTime for timestamptz; QSQLITE returns the stored text
    if (value.typeId() == QMetaType::QDateTime) {
        return value.toDateTime().toUTC();
    }

    const QString text = value.toString().trimmed();
    QDateTime parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        // Rows written as "yyyy-MM-dd HH:mm:ss"
        parsed = QDateTime::fromString(text, "yyyy-MM-dd HH:mm:ss");
    }
    if (!parsed.isValid()) {
        LOG_WARNING(QString("Unparseable stored timestamp '%1'").arg(text));
        return QDateTime();
    }

    // Text without an offset is UTC by storage convention
    if (parsed.timeSpec() == Qt::LocalTime) {
        parsed = QDateTime(parsed.date(), parsed.time(), QTimeZone::utc());
    }
    return parsed.toUTC();
}

QDateTime ModelFactory::fromLegacyLocal(const QVariant& value, const QTimeZone& legacyZone) {
    if (value.isNull()) {
        return QDateTime();
    }

    QDate date;
    QTime time;

    if (value.typeId() == QMetaType::QDateTime) {
        const QDateTime wallClock = value.toDateTime().toUTC();
        date = wallClock.date();
        time = wallClock.time();
    } else {
        const QString text = value.toString().trimmed();
        // Split by hand so a wall clock inside this machine's DST gap still parses
        if (text.size() == 19 && (text.at(10) == QLatin1Char(' ') || text.at(10) == QLatin1Char('T'))) {
            date = QDate::fromString(text.left(10), "yyyy-MM-dd");
            time = QTime::fromString(text.mid(11), "HH:mm:ss");
        }

        if (!date.isValid() || !time.isValid()) {
            const QDateTime withOffset = QDateTime::fromString(text, Qt::ISODateWithMs);
            if (withOffset.isValid() && withOffset.timeSpec() != Qt::LocalTime) {
                return withOffset.toUTC();
            }
            LOG_WARNING(QString("Unparseable legacy timestamp '%1'").arg(text));
            return QDateTime();
        }
    }

    return QDateTime(date, time, legacyZone).toUTC();
}

QString ModelFactory::formatLocal(const QDateTime& instant, const QTimeZone& zone) {
    if (!instant.isValid()) {
        return QString();
    }
    return instant.toTimeZone(zone).toString("yyyy-MM-dd HH:mm:ss");
}

QVariant ModelFactory::optionalToVariant(const std::optional<int>& value) {
    return value.has_value() ? QVariant(*value) : QVariant(QMetaType::fromType<int>());
}

//------------------------------------------------------------------------------
// Query value helpers
//------------------------------------------------------------------------------

QString ModelFactory::getStringOrDefault(const QSqlQuery& query, const QString& fieldName, const QString& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        return query.value(fieldName).toString();
    }
    return defaultValue;
}

int ModelFactory::getIntOrDefault(const QSqlQuery& query, const QString& fieldName, int defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        bool ok;
        int value = query.value(fieldName).toInt(&ok);
        return ok ? value : defaultValue;
    }
    return defaultValue;
}

qint64 ModelFactory::getInt64OrDefault(const QSqlQuery& query, const QString& fieldName, qint64 defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        bool ok;
        qint64 value = query.value(fieldName).toLongLong(&ok);
        return ok ? value : defaultValue;
    }
    return defaultValue;
}

std::optional<int> ModelFactory::getOptionalInt(const QSqlQuery& query, const QString& fieldName) {
    if (query.record().indexOf(fieldName) == -1 || query.value(fieldName).isNull()) {
        return std::nullopt;
    }

    bool ok;
    int value = query.value(fieldName).toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

QDateTime ModelFactory::getDateTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QDateTime& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QDateTime dt = fromStorageValue(query.value(fieldName));
        return dt.isValid() ? dt : defaultValue;
    }
    return defaultValue;
}
