#ifndef USERREPOSITORY_H
#define USERREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/UserModel.h"

class UserRepository : public BaseRepository<UserModel>
{
    Q_OBJECT
public:
    explicit UserRepository(QObject *parent = nullptr);

    QSharedPointer<UserModel> getByName(const QString &name);

    /**
     * @brief Return the user with this name, inserting it first if needed
     *
     * The insert uses ON CONFLICT DO NOTHING against the unique name index, so
     * two callers racing on a first login both end up with the same row.
     * Returns nullptr when either statement fails; lastSqlError() has the cause.
     */
    QSharedPointer<UserModel> findOrCreateUser(const QString &name);

protected:
    QString entityName() const override;
    bool validateForInsert(UserModel *model, QStringList &errors) override;
    QString insertStatement() override;
    QString selectByIdStatement() override;
    QMap<QString, QVariant> insertParams(UserModel *model) override;
    UserModel* fromRow(const QSqlQuery &query) override;
};

#endif // USERREPOSITORY_H
