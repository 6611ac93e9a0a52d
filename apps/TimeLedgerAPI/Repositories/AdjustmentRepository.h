#ifndef ADJUSTMENTREPOSITORY_H
#define ADJUSTMENTREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/AdjustmentModel.h"

class AdjustmentRepository : public BaseRepository<AdjustmentModel>
{
    Q_OBJECT
public:
    explicit AdjustmentRepository(QObject *parent = nullptr);

    QList<QSharedPointer<AdjustmentModel>> getByUserId(qint64 userId);
    QList<QSharedPointer<AdjustmentModel>> getAll();

    bool updateMinutes(qint64 adjustmentId, int minutes);

protected:
    QString entityName() const override;
    bool validateForInsert(AdjustmentModel *model, QStringList &errors) override;
    QString insertStatement() override;
    QString selectByIdStatement() override;
    QMap<QString, QVariant> insertParams(AdjustmentModel *model) override;
    AdjustmentModel* fromRow(const QSqlQuery &query) override;
};

#endif // ADJUSTMENTREPOSITORY_H
