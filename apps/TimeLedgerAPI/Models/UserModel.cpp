// UserModel.cpp
#include "UserModel.h"

UserModel::UserModel(QObject *parent)
    : QObject(parent),
      m_id(0)
{
}

qint64 UserModel::id() const
{
    return m_id;
}

void UserModel::setId(qint64 id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QString UserModel::name() const
{
    return m_name;
}

void UserModel::setName(const QString &name)
{
    if (m_name != name) {
        m_name = name;
        emit nameChanged(m_name);
    }
}
