// LedgerLogModel.h
#ifndef LEDGERLOGMODEL_H
#define LEDGERLOGMODEL_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <optional>

#include "LedgerTypes.h"

/**
 * Append-only audit record of one start, stop or adjust mutation.
 */
class LedgerLogModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qint64 id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(qint64 userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(LedgerTypes::LogKind kind READ kind WRITE setKind NOTIFY kindChanged)
    Q_PROPERTY(QDateTime timestamp READ timestamp WRITE setTimestamp NOTIFY timestampChanged)
    Q_PROPERTY(QString details READ details WRITE setDetails NOTIFY detailsChanged)

public:
    explicit LedgerLogModel(QObject *parent = nullptr);

    qint64 id() const;
    void setId(qint64 id);

    qint64 userId() const;
    void setUserId(qint64 userId);

    LedgerTypes::LogKind kind() const;
    void setKind(LedgerTypes::LogKind kind);

    // Minutes booked by the event; absent for start entries
    std::optional<int> minutes() const;
    void setMinutes(std::optional<int> minutes);

    QDateTime timestamp() const;
    void setTimestamp(const QDateTime &timestamp);

    QString details() const;
    void setDetails(const QString &details);

signals:
    void idChanged(qint64 id);
    void userIdChanged(qint64 userId);
    void kindChanged(LedgerTypes::LogKind kind);
    void minutesChanged();
    void timestampChanged(const QDateTime &timestamp);
    void detailsChanged(const QString &details);

private:
    qint64 m_id;
    qint64 m_userId;
    LedgerTypes::LogKind m_kind;
    std::optional<int> m_minutes;
    QDateTime m_timestamp;
    QString m_details;
};

#endif // LEDGERLOGMODEL_H
