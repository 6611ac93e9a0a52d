#include "httpserver/response.h"
#include "logger/logger.h"

#include <QJsonArray>

namespace Http {

    using Status = QHttpServerResponder::StatusCode;

    QJsonObject Response::errorBody(const QString& message, const QString& errorCode) {
        QJsonObject body;
        body["error"] = true;
        body["message"] = message;
        if (!errorCode.isEmpty()) {
            body["code"] = errorCode;
        }
        return body;
    }

    QHttpServerResponse Response::created(const QJsonObject& data) {
        return QHttpServerResponse(data, Status::Created);
    }

    QHttpServerResponse Response::badRequest(const QString& message, const QString& errorCode) {
        LOG_WARNING(QString("Rejected request (%1): %2").arg(errorCode, message));
        return error(message, Status::BadRequest, errorCode);
    }

    QHttpServerResponse Response::invalidFields(const QStringList& problems) {
        LOG_WARNING(QString("Rejected request body: %1").arg(problems.join("; ")));
        QJsonObject body = errorBody("Validation failed", "VALIDATION_ERROR");
        body["fields"] = QJsonArray::fromStringList(problems);
        return QHttpServerResponse(body, Status::BadRequest);
    }

    QHttpServerResponse Response::notFound(const QString& message, const QString& errorCode) {
        LOG_INFO(QString("Not found (%1): %2").arg(errorCode, message));
        return error(message, Status::NotFound, errorCode);
    }

    QHttpServerResponse Response::conflict(const QString& message, const QString& errorCode) {
        LOG_INFO(QString("Conflict (%1): %2").arg(errorCode, message));
        return error(message, Status::Conflict, errorCode);
    }

    QHttpServerResponse Response::internalError(const QString& message, const QString& errorCode) {
        LOG_ERROR(QString("Internal error (%1): %2").arg(errorCode, message));
        return error(message, Status::InternalServerError, errorCode);
    }

    QHttpServerResponse Response::serviceUnavailable(const QString& message, const QString& errorCode) {
        LOG_ERROR(QString("Storage unavailable (%1): %2").arg(errorCode, message));
        QJsonObject body = errorBody(message, errorCode);
        body["retryable"] = true;
        return QHttpServerResponse(body, Status::ServiceUnavailable);
    }

    QHttpServerResponse Response::error(const QString& message, Status statusCode, const QString& errorCode) {
        return QHttpServerResponse(errorBody(message, errorCode), statusCode);
    }

} // namespace Http
