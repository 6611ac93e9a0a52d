#ifndef MODELFACTORY_H
#define MODELFACTORY_H

#include <QSqlQuery>
#include <QDateTime>
#include <QTimeZone>
#include <QVariant>
#include <QJsonObject>
#include <QJsonArray>
#include <QStringList>
#include <QSharedPointer>
#include <optional>

#include "Models/MonthBucket.h"

class UserModel;
class WorkSessionModel;
class AdjustmentModel;
class LedgerLogModel;

/**
 * @brief Central place for building, validating and serialising ledger models
 *
 * Rows are mapped here so that every repository reads timestamps and nullable
 * minute columns the same way regardless of the SQL driver.
 */
class ModelFactory {
public:
    // Create models from query results
    static UserModel* createUserFromQuery(const QSqlQuery& query);
    static WorkSessionModel* createWorkSessionFromQuery(const QSqlQuery& query);
    static AdjustmentModel* createAdjustmentFromQuery(const QSqlQuery& query);
    static LedgerLogModel* createLedgerLogFromQuery(const QSqlQuery& query);

    // Model validation functions
    static bool validateUserModel(const UserModel* model, QStringList& errors);
    static bool validateWorkSessionModel(const WorkSessionModel* model, QStringList& errors);
    static bool validateAdjustmentModel(const AdjustmentModel* model, QStringList& errors);
    static bool validateLedgerLogModel(const LedgerLogModel* model, QStringList& errors);

    // JSON conversion; instants are emitted in UTC and in the display zone
    static QJsonObject modelToJson(const UserModel* model);
    static QJsonObject modelToJson(const WorkSessionModel* model, const QTimeZone& displayZone);
    static QJsonObject modelToJson(const AdjustmentModel* model, const QTimeZone& displayZone);
    static QJsonObject modelToJson(const LedgerLogModel* model, const QTimeZone& displayZone);
    static QJsonObject monthBucketToJson(const MonthBucket& bucket);

    static QJsonArray modelsToJsonArray(const QList<QSharedPointer<LedgerLogModel>>& models, const QTimeZone& displayZone);
    static QJsonArray monthBucketsToJsonArray(const MonthBucketList& buckets);

    // Timestamp conversion at the storage boundary (always UTC)
    static QString toStorageTimestamp(const QDateTime& instant);
    static QDateTime fromStorageValue(const QVariant& value);

    /**
     * @brief Read a timestamp written by the seconds-era schema
     *
     * Those rows hold naive wall-clock text ("yyyy-MM-dd HH:mm:ss") in
     * @p legacyZone. A timestamptz value carries the same wall clock read as
     * UTC. Text that already has an offset is returned unchanged.
     */
    static QDateTime fromLegacyLocal(const QVariant& value, const QTimeZone& legacyZone);

    // "yyyy-MM-dd HH:mm:ss" in the given zone
    static QString formatLocal(const QDateTime& instant, const QTimeZone& zone);

    static QVariant optionalToVariant(const std::optional<int>& value);

    static constexpr int kMaxNameLength = 255;

private:
    // Helpers for query value extraction with default values
    static QString getStringOrDefault(const QSqlQuery& query, const QString& fieldName, const QString& defaultValue = QString());
    static int getIntOrDefault(const QSqlQuery& query, const QString& fieldName, int defaultValue = 0);
    static qint64 getInt64OrDefault(const QSqlQuery& query, const QString& fieldName, qint64 defaultValue = 0);
    static std::optional<int> getOptionalInt(const QSqlQuery& query, const QString& fieldName);
    static QDateTime getDateTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QDateTime& defaultValue = QDateTime());
};

#endif // MODELFACTORY_H
