#ifndef WORKSESSIONREPOSITORY_H
#define WORKSESSIONREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/WorkSessionModel.h"

class WorkSessionRepository : public BaseRepository<WorkSessionModel>
{
    Q_OBJECT
public:
    explicit WorkSessionRepository(QObject *parent = nullptr);

    // The session of this user with no end time, or nullptr
    QSharedPointer<WorkSessionModel> getActiveSession(qint64 userId);

    /**
     * @brief Close a running session
     *
     * Only matches a row whose end time is still NULL. Returns true when the
     * statement ran; lastRowsAffected() is 0 if the session was not running.
     */
    bool finishSession(qint64 sessionId, const QDateTime &endTime, int minutes);

    // Finished sessions of the user, oldest end time first
    QList<QSharedPointer<WorkSessionModel>> getFinishedSessions(qint64 userId);
    QList<QSharedPointer<WorkSessionModel>> getAllFinishedSessions();

    bool updateMinutes(qint64 sessionId, int minutes);

protected:
    QString entityName() const override;
    bool validateForInsert(WorkSessionModel *model, QStringList &errors) override;
    QString insertStatement() override;
    QString selectByIdStatement() override;
    QMap<QString, QVariant> insertParams(WorkSessionModel *model) override;
    WorkSessionModel* fromRow(const QSqlQuery &query) override;
};

#endif // WORKSESSIONREPOSITORY_H
