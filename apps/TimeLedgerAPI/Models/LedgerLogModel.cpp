// LedgerLogModel.cpp
#include "LedgerLogModel.h"

LedgerLogModel::LedgerLogModel(QObject *parent)
    : QObject(parent),
      m_id(0),
      m_userId(0),
      m_kind(LedgerTypes::LogKind::Start)
{
}

qint64 LedgerLogModel::id() const
{
    return m_id;
}

void LedgerLogModel::setId(qint64 id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

qint64 LedgerLogModel::userId() const
{
    return m_userId;
}

void LedgerLogModel::setUserId(qint64 userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

LedgerTypes::LogKind LedgerLogModel::kind() const
{
    return m_kind;
}

void LedgerLogModel::setKind(LedgerTypes::LogKind kind)
{
    if (m_kind != kind) {
        m_kind = kind;
        emit kindChanged(m_kind);
    }
}

std::optional<int> LedgerLogModel::minutes() const
{
    return m_minutes;
}

void LedgerLogModel::setMinutes(std::optional<int> minutes)
{
    if (m_minutes != minutes) {
        m_minutes = minutes;
        emit minutesChanged();
    }
}

QDateTime LedgerLogModel::timestamp() const
{
    return m_timestamp;
}

void LedgerLogModel::setTimestamp(const QDateTime &timestamp)
{
    if (m_timestamp != timestamp) {
        m_timestamp = timestamp;
        emit timestampChanged(m_timestamp);
    }
}

QString LedgerLogModel::details() const
{
    return m_details;
}

void LedgerLogModel::setDetails(const QString &details)
{
    if (m_details != details) {
        m_details = details;
        emit detailsChanged(m_details);
    }
}
