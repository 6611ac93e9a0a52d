// WorkSessionModel.h
#ifndef WORKSESSIONMODEL_H
#define WORKSESSIONMODEL_H

#include <QObject>
#include <QDateTime>
#include <optional>

/**
 * One continuous work interval. Running while endTime is invalid; stopping
 * fixes endTime and minutes exactly once.
 */
class WorkSessionModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qint64 id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(qint64 userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(QDateTime startTime READ startTime WRITE setStartTime NOTIFY startTimeChanged)
    Q_PROPERTY(QDateTime endTime READ endTime WRITE setEndTime NOTIFY endTimeChanged)
    Q_PROPERTY(bool running READ isRunning)

public:
    explicit WorkSessionModel(QObject *parent = nullptr);

    qint64 id() const;
    void setId(qint64 id);

    qint64 userId() const;
    void setUserId(qint64 userId);

    QDateTime startTime() const;
    void setStartTime(const QDateTime &startTime);

    QDateTime endTime() const;
    void setEndTime(const QDateTime &endTime);

    // Billable whole minutes; absent while the session is running
    std::optional<int> minutes() const;
    void setMinutes(std::optional<int> minutes);

    bool isRunning() const;

signals:
    void idChanged(qint64 id);
    void userIdChanged(qint64 userId);
    void startTimeChanged(const QDateTime &startTime);
    void endTimeChanged(const QDateTime &endTime);
    void minutesChanged();

private:
    qint64 m_id;
    qint64 m_userId;
    QDateTime m_startTime;
    QDateTime m_endTime;
    std::optional<int> m_minutes;
};

#endif // WORKSESSIONMODEL_H
