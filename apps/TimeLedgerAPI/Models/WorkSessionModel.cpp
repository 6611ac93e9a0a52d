// WorkSessionModel.cpp
#include "WorkSessionModel.h"

WorkSessionModel::WorkSessionModel(QObject *parent)
    : QObject(parent),
      m_id(0),
      m_userId(0)
{
}

qint64 WorkSessionModel::id() const
{
    return m_id;
}

void WorkSessionModel::setId(qint64 id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

qint64 WorkSessionModel::userId() const
{
    return m_userId;
}

void WorkSessionModel::setUserId(qint64 userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

QDateTime WorkSessionModel::startTime() const
{
    return m_startTime;
}

void WorkSessionModel::setStartTime(const QDateTime &startTime)
{
    if (m_startTime != startTime) {
        m_startTime = startTime;
        emit startTimeChanged(m_startTime);
    }
}

QDateTime WorkSessionModel::endTime() const
{
    return m_endTime;
}

void WorkSessionModel::setEndTime(const QDateTime &endTime)
{
    if (m_endTime != endTime) {
        m_endTime = endTime;
        emit endTimeChanged(m_endTime);
    }
}

std::optional<int> WorkSessionModel::minutes() const
{
    return m_minutes;
}

void WorkSessionModel::setMinutes(std::optional<int> minutes)
{
    if (m_minutes != minutes) {
        m_minutes = minutes;
        emit minutesChanged();
    }
}

bool WorkSessionModel::isRunning() const
{
    return !m_endTime.isValid();
}
