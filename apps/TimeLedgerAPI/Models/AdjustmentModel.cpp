// AdjustmentModel.cpp
#include "AdjustmentModel.h"

AdjustmentModel::AdjustmentModel(QObject *parent)
    : QObject(parent),
      m_id(0),
      m_userId(0),
      m_minutes(0)
{
}

qint64 AdjustmentModel::id() const
{
    return m_id;
}

void AdjustmentModel::setId(qint64 id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

qint64 AdjustmentModel::userId() const
{
    return m_userId;
}

void AdjustmentModel::setUserId(qint64 userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

int AdjustmentModel::minutes() const
{
    return m_minutes;
}

void AdjustmentModel::setMinutes(int minutes)
{
    if (m_minutes != minutes) {
        m_minutes = minutes;
        emit minutesChanged(m_minutes);
    }
}

QString AdjustmentModel::reason() const
{
    return m_reason;
}

void AdjustmentModel::setReason(const QString &reason)
{
    if (m_reason != reason) {
        m_reason = reason;
        emit reasonChanged(m_reason);
    }
}

QDateTime AdjustmentModel::createdAt() const
{
    return m_createdAt;
}

void AdjustmentModel::setCreatedAt(const QDateTime &createdAt)
{
    if (m_createdAt != createdAt) {
        m_createdAt = createdAt;
        emit createdAtChanged(m_createdAt);
    }
}
