#ifndef LEDGERLOGREPOSITORY_H
#define LEDGERLOGREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/LedgerLogModel.h"

class LedgerLogRepository : public BaseRepository<LedgerLogModel>
{
    Q_OBJECT
public:
    explicit LedgerLogRepository(QObject *parent = nullptr);

    // Newest first, by insertion order
    QList<QSharedPointer<LedgerLogModel>> getRecent(qint64 userId, int limit);

    // Entries that carry a duration (stop and adjust)
    QList<QSharedPointer<LedgerLogModel>> getAllWithMinutes();

    bool updateMinutes(qint64 logId, int minutes);

protected:
    QString entityName() const override;
    bool validateForInsert(LedgerLogModel *model, QStringList &errors) override;
    QString insertStatement() override;
    QString selectByIdStatement() override;
    QMap<QString, QVariant> insertParams(LedgerLogModel *model) override;
    LedgerLogModel* fromRow(const QSqlQuery &query) override;
};

#endif // LEDGERLOGREPOSITORY_H
