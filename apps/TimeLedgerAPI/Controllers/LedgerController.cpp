#include "LedgerController.h"

#include <QJsonArray>
#include <QJsonObject>

#include "Core/LedgerEngine.h"
#include "Core/ModelFactory.h"
#include "Core/DurationPolicy.h"
#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "httpserver/response.h"
#include "logger/logger.h"

#include <limits>

LedgerController::LedgerController(LedgerEngine *engine, QObject *parent)
    : Http::Controller(parent)
    , m_engine(engine)
{
    LOG_DEBUG("LedgerController created");
}

LedgerController::~LedgerController()
{
    LOG_DEBUG("LedgerController destroyed");
}

QString LedgerController::getControllerName() const
{
    return "LedgerController";
}

bool LedgerController::initialize()
{
    if (m_initialized) {
        LOG_WARNING("LedgerController already initialized");
        return true;
    }

    if (!m_engine) {
        LOG_ERROR("Ledger engine not provided");
        return false;
    }

    if (!m_engine->store().isInitialized()) {
        LOG_ERROR("Ledger store not initialized");
        return false;
    }

    m_initialized = true;
    LOG_INFO("LedgerController initialized successfully");
    return true;
}

void LedgerController::setupRoutes(QHttpServer &server)
{
    if (!m_initialized) {
        LOG_ERROR("Cannot setup routes - LedgerController not initialized");
        return;
    }

    LOG_INFO("Setting up LedgerController routes");

    server.route("/api/login", QHttpServerRequest::Method::Post,
        [this](const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleLogin(request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/sessions/start", QHttpServerRequest::Method::Post,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleStartSession(userId);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/sessions/stop", QHttpServerRequest::Method::Post,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleStopSession(userId);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/adjustments", QHttpServerRequest::Method::Post,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleAdjust(userId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/sessions/active", QHttpServerRequest::Method::Get,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleGetActiveSession(userId);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/totals", QHttpServerRequest::Method::Get,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleGetMonthTotals(userId);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/totals/current", QHttpServerRequest::Method::Get,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleGetCurrentMonth(userId);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/users/<arg>/logs", QHttpServerRequest::Method::Get,
        [this](const qint64 userId, const QHttpServerRequest &request) {
            logRequestReceived(request);
            auto response = handleGetLogs(userId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    LOG_INFO("LedgerController routes configured");
}

QHttpServerResponse LedgerController::errorResponse(const LedgerError &error) const
{
    switch (error.code()) {
        case LedgerError::Validation:
            return Http::Response::badRequest(error.message(), error.codeName());
        case LedgerError::Conflict:
            return Http::Response::conflict(error.message(), error.codeName());
        case LedgerError::NotFound:
            return Http::Response::notFound(error.message(), error.codeName());
        case LedgerError::Storage:
            return Http::Response::serviceUnavailable(error.message(), error.codeName());
        case LedgerError::None:
            break;
    }
    return Http::Response::internalError("Operation failed without an error code");
}

QHttpServerResponse LedgerController::handleLogin(const QHttpServerRequest &request)
{
    bool ok;
    const QJsonObject json = extractJsonFromRequest(request, ok);
    if (!ok) {
        return Http::Response::badRequest("Request body must be a JSON object");
    }

    const QStringList problems = checkFields(json, {{"name", Http::FieldType::String, true}});
    if (!problems.isEmpty()) {
        return Http::Response::invalidFields(problems);
    }

    auto user = m_engine->login(json["name"].toString());
    if (!user) {
        return errorResponse(user.error());
    }

    return createResponse(ModelFactory::modelToJson(user.value().data()));
}

QHttpServerResponse LedgerController::handleStartSession(qint64 userId)
{
    auto session = m_engine->startSession(userId);
    if (!session) {
        return errorResponse(session.error());
    }

    return Http::Response::created(ModelFactory::modelToJson(session.value().data(), m_engine->displayZone()));
}

QHttpServerResponse LedgerController::handleStopSession(qint64 userId)
{
    auto session = m_engine->stopSession(userId);
    if (!session) {
        return errorResponse(session.error());
    }

    return createResponse(ModelFactory::modelToJson(session.value().data(), m_engine->displayZone()));
}

QHttpServerResponse LedgerController::handleAdjust(qint64 userId, const QHttpServerRequest &request)
{
    bool ok;
    const QJsonObject json = extractJsonFromRequest(request, ok);
    if (!ok) {
        return Http::Response::badRequest("Request body must be a JSON object");
    }

    const QStringList problems = checkFields(json, {
        {"minutes", Http::FieldType::Integer, true},
        {"reason", Http::FieldType::String, false}
    });
    if (!problems.isEmpty()) {
        return Http::Response::invalidFields(problems);
    }

    const qint64 minutes = json["minutes"].toInteger();
    if (minutes > std::numeric_limits<int>::max() || minutes < std::numeric_limits<int>::min()) {
        return Http::Response::invalidFields(QStringList{"minutes is out of range"});
    }

    auto adjustment = m_engine->adjust(userId, static_cast<int>(minutes), json["reason"].toString());
    if (!adjustment) {
        return errorResponse(adjustment.error());
    }

    return Http::Response::created(ModelFactory::modelToJson(adjustment.value().data(), m_engine->displayZone()));
}

QHttpServerResponse LedgerController::handleGetActiveSession(qint64 userId)
{
    auto session = m_engine->activeSession(userId);
    if (!session) {
        return errorResponse(session.error());
    }

    if (!session.value()) {
        return createResponse(QJsonObject{{"active", false}});
    }

    // Elapsed time is computed per request and never stored
    const qint64 elapsed = m_engine->elapsedSeconds(session.value().data());

    QJsonObject json = ModelFactory::modelToJson(session.value().data(), m_engine->displayZone());
    json["active"] = true;
    json["elapsed_seconds"] = elapsed;
    json["elapsed_hms"] = DurationPolicy::formatHms(elapsed);
    return createResponse(json);
}

QHttpServerResponse LedgerController::handleGetMonthTotals(qint64 userId)
{
    auto totals = m_engine->monthTotals(userId);
    if (!totals) {
        return errorResponse(totals.error());
    }

    return createResponse(ModelFactory::monthBucketsToJsonArray(totals.value()));
}

QHttpServerResponse LedgerController::handleGetCurrentMonth(qint64 userId)
{
    auto minutes = m_engine->currentMonthMinutes(userId);
    if (!minutes) {
        return errorResponse(minutes.error());
    }

    MonthBucket bucket{m_engine->aggregator()->currentMonthKey(), minutes.value()};
    QJsonObject json = ModelFactory::monthBucketToJson(bucket);
    json["user_id"] = userId;
    return createResponse(json);
}

QHttpServerResponse LedgerController::handleGetLogs(qint64 userId, const QHttpServerRequest &request)
{
    // 0 selects the configured default
    int limit = 0;
    if (!readIntQueryParam(request, "limit", limit)) {
        return Http::Response::invalidFields(QStringList{"limit must be an integer"});
    }
    if (limit < 0) {
        return Http::Response::invalidFields(QStringList{"limit must not be negative"});
    }

    auto entries = m_engine->recentLogs(userId, limit);
    if (!entries) {
        return errorResponse(entries.error());
    }

    return createResponse(ModelFactory::modelsToJsonArray(entries.value(), m_engine->displayZone()));
}
