#ifndef HTTP_CONTROLLER_H
#define HTTP_CONTROLLER_H

#include <QObject>
#include <QJsonArray>
#include <QJsonObject>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QList>
#include <QStringList>
#include "logger/logger.h"

namespace Http {

    enum class FieldType {
        String,
        Integer,    // JSON number without a fractional part
        Boolean
    };

    struct FieldRule {
        QString name;
        FieldType type;
        bool required;
    };

    /**
     * @brief Base class of every route group registered with Http::Server
     *
     * Subclasses register their routes in setupRoutes() and answer with JSON.
     * Errors always carry "error": true, a message and a machine-readable code.
     */
    class Controller : public QObject {
        Q_OBJECT
    public:
        explicit Controller(QObject* parent = nullptr);
        ~Controller() override;

        virtual void setupRoutes(QHttpServer& server) = 0;

        bool isInitialized() const { return m_initialized; }

        // Prefix of request log lines
        virtual QString getControllerName() const = 0;

    protected:
        // ok is false for an empty body, malformed JSON or a non-object document
        QJsonObject extractJsonFromRequest(const QHttpServerRequest& request, bool& ok) const;

        // Problems found in body; empty when every rule holds
        QStringList checkFields(const QJsonObject& body, const QList<FieldRule>& rules) const;

        // Leaves value untouched when the parameter is absent; false if present but not an integer
        bool readIntQueryParam(const QHttpServerRequest& request, const QString& name, int& value) const;

        QHttpServerResponse createResponse(const QJsonObject& data,
                                           QHttpServerResponder::StatusCode status = QHttpServerResponder::StatusCode::Ok) const;
        QHttpServerResponse createResponse(const QJsonArray& data,
                                           QHttpServerResponder::StatusCode status = QHttpServerResponder::StatusCode::Ok) const;

        void logRequestReceived(const QHttpServerRequest& request) const;
        void logRequestCompleted(const QHttpServerRequest& request, QHttpServerResponder::StatusCode status) const;

        bool m_initialized = false;

    private:
        static QString methodName(QHttpServerRequest::Method method);
        static QString typeName(FieldType type);
    };

} // namespace Http

#endif // HTTP_CONTROLLER_H
