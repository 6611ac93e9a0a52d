#ifndef LEDGERCONTROLLER_H
#define LEDGERCONTROLLER_H

#include "httpserver/controller.h"
#include "Core/LedgerErrors.h"

class LedgerEngine;

/**
 * @brief JSON adapter over the ledger engine
 *
 * Routes:
 *   POST /api/login
 *   POST /api/users/<id>/sessions/start
 *   POST /api/users/<id>/sessions/stop
 *   POST /api/users/<id>/adjustments
 *   GET  /api/users/<id>/sessions/active
 *   GET  /api/users/<id>/totals
 *   GET  /api/users/<id>/totals/current
 *   GET  /api/users/<id>/logs?limit=n
 */
class LedgerController : public Http::Controller
{
    Q_OBJECT
public:
    explicit LedgerController(LedgerEngine *engine, QObject *parent = nullptr);
    ~LedgerController() override;

    bool initialize();
    void setupRoutes(QHttpServer &server) override;
    QString getControllerName() const override;

private:
    QHttpServerResponse handleLogin(const QHttpServerRequest &request);
    QHttpServerResponse handleStartSession(qint64 userId);
    QHttpServerResponse handleStopSession(qint64 userId);
    QHttpServerResponse handleAdjust(qint64 userId, const QHttpServerRequest &request);
    QHttpServerResponse handleGetActiveSession(qint64 userId);
    QHttpServerResponse handleGetMonthTotals(qint64 userId);
    QHttpServerResponse handleGetCurrentMonth(qint64 userId);
    QHttpServerResponse handleGetLogs(qint64 userId, const QHttpServerRequest &request);

    // Validation 400, Conflict 409, NotFound 404, Storage 503
    QHttpServerResponse errorResponse(const LedgerError &error) const;

    LedgerEngine *m_engine;
};

#endif // LEDGERCONTROLLER_H
