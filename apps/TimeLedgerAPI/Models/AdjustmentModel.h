// AdjustmentModel.h
#ifndef ADJUSTMENTMODEL_H
#define ADJUSTMENTMODEL_H

#include <QObject>
#include <QString>
#include <QDateTime>

class AdjustmentModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qint64 id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(qint64 userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(int minutes READ minutes WRITE setMinutes NOTIFY minutesChanged)
    Q_PROPERTY(QString reason READ reason WRITE setReason NOTIFY reasonChanged)
    Q_PROPERTY(QDateTime createdAt READ createdAt WRITE setCreatedAt NOTIFY createdAtChanged)

public:
    explicit AdjustmentModel(QObject *parent = nullptr);

    qint64 id() const;
    void setId(qint64 id);

    qint64 userId() const;
    void setUserId(qint64 userId);

    // Signed correction in whole minutes, never zero once persisted
    int minutes() const;
    void setMinutes(int minutes);

    QString reason() const;
    void setReason(const QString &reason);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

signals:
    void idChanged(qint64 id);
    void userIdChanged(qint64 userId);
    void minutesChanged(int minutes);
    void reasonChanged(const QString &reason);
    void createdAtChanged(const QDateTime &createdAt);

private:
    qint64 m_id;
    qint64 m_userId;
    int m_minutes;
    QString m_reason;
    QDateTime m_createdAt;
};

#endif // ADJUSTMENTMODEL_H
