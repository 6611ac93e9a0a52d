#include "UserRepository.h"
#include "Core/ModelFactory.h"

UserRepository::UserRepository(QObject *parent)
    : BaseRepository<UserModel>(parent)
{
    LOG_DEBUG("UserRepository created");
}

QString UserRepository::entityName() const
{
    return "User";
}

bool UserRepository::validateForInsert(UserModel *model, QStringList &errors)
{
    return ModelFactory::validateUserModel(model, errors);
}

QString UserRepository::insertStatement()
{
    return "INSERT INTO users (name) VALUES (:name) RETURNING id";
}

QString UserRepository::selectByIdStatement()
{
    return "SELECT id, name FROM users WHERE id = :id";
}

QMap<QString, QVariant> UserRepository::insertParams(UserModel *user)
{
    QMap<QString, QVariant> params;
    params["name"] = user->name();
    return params;
}

UserModel* UserRepository::fromRow(const QSqlQuery &query)
{
    return ModelFactory::createUserFromQuery(query);
}

QSharedPointer<UserModel> UserRepository::getByName(const QString &name)
{
    QMap<QString, QVariant> params;
    params["name"] = name;

    return selectOne("SELECT id, name FROM users WHERE name = :name", params);
}

QSharedPointer<UserModel> UserRepository::findOrCreateUser(const QString &name)
{
    if (!ready()) {
        return nullptr;
    }

    QMap<QString, QVariant> params;
    params["name"] = name;

    qint64 insertedId = 0;
    bool inserted = dbService()->executeInsertWithReturningId(
        "INSERT INTO users (name) VALUES (:name) ON CONFLICT (name) DO NOTHING RETURNING id",
        params,
        "id",
        [&insertedId](const QVariant &value) {
            insertedId = value.toLongLong();
        });

    if (!inserted) {
        LOG_ERROR(QString("Failed to create user '%1': %2").arg(name, lastError()));
        return nullptr;
    }

    if (insertedId > 0) {
        LOG_INFO(QString("Created user '%1' with ID %2").arg(name).arg(insertedId));
        QSharedPointer<UserModel> user(new UserModel());
        user->setId(insertedId);
        user->setName(name);
        return user;
    }

    // Row already existed
    auto existing = getByName(name);
    if (!existing && !lastQueryFailed()) {
        LOG_ERROR(QString("User '%1' neither inserted nor found").arg(name));
    }
    return existing;
}
