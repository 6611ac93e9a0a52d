// UserModel.h
#ifndef USERMODEL_H
#define USERMODEL_H

#include <QObject>
#include <QString>

class UserModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qint64 id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QString name READ name WRITE setName NOTIFY nameChanged)

public:
    explicit UserModel(QObject *parent = nullptr);

    qint64 id() const;
    void setId(qint64 id);

    QString name() const;
    void setName(const QString &name);

signals:
    void idChanged(qint64 id);
    void nameChanged(const QString &name);

private:
    qint64 m_id;
    QString m_name;
};

#endif // USERMODEL_H
