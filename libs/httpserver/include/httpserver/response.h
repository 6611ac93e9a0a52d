#ifndef HTTP_RESPONSE_H
#define HTTP_RESPONSE_H

#include <QHttpServerResponse>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace Http {

    // JSON error bodies: {"error": true, "message": ..., "code": ...}
    class Response {
    public:
        static QHttpServerResponse created(const QJsonObject& data);

        static QHttpServerResponse badRequest(const QString& message, const QString& errorCode = "BAD_REQUEST");
        // 400 with one entry per offending field under "fields"
        static QHttpServerResponse invalidFields(const QStringList& problems);
        static QHttpServerResponse notFound(const QString& message, const QString& errorCode = "NOT_FOUND");
        static QHttpServerResponse conflict(const QString& message, const QString& errorCode = "CONFLICT");
        static QHttpServerResponse internalError(const QString& message, const QString& errorCode = "INTERNAL_ERROR");
        // Transient storage failures; clients may retry
        static QHttpServerResponse serviceUnavailable(const QString& message, const QString& errorCode = "SERVICE_UNAVAILABLE");

    private:
        static QHttpServerResponse error(const QString& message, QHttpServerResponder::StatusCode statusCode,
                                         const QString& errorCode);
        static QJsonObject errorBody(const QString& message, const QString& errorCode);
    };

} // namespace Http

#endif // HTTP_RESPONSE_H
