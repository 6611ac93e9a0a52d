#include "ServerStatusController.h"
#include "Core/LedgerEngine.h"
#include "dbservice/dbmanager.h"
#include "logger/logger.h"
#include <QCoreApplication>
#include <QJsonObject>

ServerStatusController::ServerStatusController(LedgerEngine *engine, DbManager *dbManager, QObject *parent)
    : Http::Controller(parent)
    , m_engine(engine)
    , m_dbManager(dbManager)
    , m_startTime(QDateTime::currentDateTimeUtc())
    , m_version(QCoreApplication::applicationVersion())
{
    m_initialized = (m_engine != nullptr && m_dbManager != nullptr);
    LOG_DEBUG("ServerStatusController created");
}

ServerStatusController::~ServerStatusController()
{
    LOG_DEBUG("ServerStatusController destroyed");
}

void ServerStatusController::setupRoutes(QHttpServer &server)
{
    if (!m_initialized) {
        LOG_ERROR("Cannot setup routes - ServerStatusController not initialized");
        return;
    }

    LOG_INFO("Setting up ServerStatusController routes");

    server.route("/api/status", QHttpServerRequest::Method::Get,
        [this](const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleStatus();
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    LOG_INFO("ServerStatusController routes configured");
}

QHttpServerResponse ServerStatusController::handleStatus()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const bool databaseOk = m_dbManager->testConnection();

    QJsonObject database;
    database["driver"] = m_dbManager->config().driver();
    database["reachable"] = databaseOk;
    database["duration_unit"] = m_engine->store().durationUnit();

    QJsonObject response;
    response["status"] = databaseOk ? "ok" : "degraded";
    response["version"] = m_version;
    response["server_time"] = now.toString(Qt::ISODate);
    response["uptime_seconds"] = m_startTime.secsTo(now);
    response["time_zone"] = QString::fromLatin1(m_engine->displayZone().id());
    response["revision"] = m_engine->store().revision();
    response["database"] = database;

    return createResponse(response, databaseOk ? QHttpServerResponder::StatusCode::Ok
                                               : QHttpServerResponder::StatusCode::ServiceUnavailable);
}
