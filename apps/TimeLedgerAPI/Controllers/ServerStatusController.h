#ifndef SERVERSTATUSCONTROLLER_H
#define SERVERSTATUSCONTROLLER_H

#include "httpserver/controller.h"
#include <QDateTime>

class LedgerEngine;
class DbManager;

/**
 * @brief GET /api/status: liveness, database reachability and store revision
 */
class ServerStatusController : public Http::Controller
{
    Q_OBJECT
public:
    ServerStatusController(LedgerEngine *engine, DbManager *dbManager, QObject *parent = nullptr);
    ~ServerStatusController() override;

    void setupRoutes(QHttpServer &server) override;
    QString getControllerName() const override { return "ServerStatusController"; }

private:
    QHttpServerResponse handleStatus();

    LedgerEngine *m_engine;
    DbManager *m_dbManager;

    // Server start time for uptime calculation
    QDateTime m_startTime;
    QString m_version;
};

#endif // SERVERSTATUSCONTROLLER_H
