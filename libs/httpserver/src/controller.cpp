#include "httpserver/controller.h"
#include "logger/logger.h"
#include <QJsonDocument>
#include <QUrlQuery>

namespace Http {

    Controller::Controller(QObject* parent)
        : QObject(parent)
    {
    }

    Controller::~Controller() = default;

    QJsonObject Controller::extractJsonFromRequest(const QHttpServerRequest& request, bool& ok) const {
        ok = false;
        const QByteArray body = request.body();

        if (body.isEmpty()) {
            LOG_DEBUG(QString("[%1] Empty request body").arg(getControllerName()));
            return QJsonObject();
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

        if (parseError.error != QJsonParseError::NoError) {
            LOG_WARNING(QString("[%1] Malformed JSON at offset %2: %3")
                        .arg(getControllerName())
                        .arg(parseError.offset)
                        .arg(parseError.errorString()));
            return QJsonObject();
        }

        if (!doc.isObject()) {
            LOG_WARNING(QString("[%1] Request body is not a JSON object").arg(getControllerName()));
            return QJsonObject();
        }

        ok = true;
        return doc.object();
    }

    QStringList Controller::checkFields(const QJsonObject& body, const QList<FieldRule>& rules) const {
        QStringList problems;

        for (const FieldRule& rule : rules) {
            const QJsonValue value = body.value(rule.name);

            if (value.isUndefined() || value.isNull()) {
                if (rule.required) {
                    problems.append(QString("%1 is required").arg(rule.name));
                }
                continue;
            }

            bool matches = false;
            switch (rule.type) {
                case FieldType::String:
                    matches = value.isString();
                    break;
                case FieldType::Integer:
                    matches = value.isDouble() && value.toDouble() == static_cast<double>(value.toInteger());
                    break;
                case FieldType::Boolean:
                    matches = value.isBool();
                    break;
            }

            if (!matches) {
                problems.append(QString("%1 must be %2").arg(rule.name, typeName(rule.type)));
            }
        }

        return problems;
    }

    bool Controller::readIntQueryParam(const QHttpServerRequest& request, const QString& name, int& value) const {
        const QUrlQuery query(request.url().query());
        if (!query.hasQueryItem(name)) {
            return true;
        }

        bool ok = false;
        const int parsed = query.queryItemValue(name).toInt(&ok);
        if (!ok) {
            return false;
        }
        value = parsed;
        return true;
    }

    QHttpServerResponse Controller::createResponse(const QJsonObject& data, QHttpServerResponder::StatusCode status) const {
        return QHttpServerResponse(data, status);
    }

    QHttpServerResponse Controller::createResponse(const QJsonArray& data, QHttpServerResponder::StatusCode status) const {
        return QHttpServerResponse(data, status);
    }

    void Controller::logRequestReceived(const QHttpServerRequest& request) const {
        LOG_DEBUG(QString("[%1] %2 %3")
                 .arg(getControllerName(), methodName(request.method()), request.url().path()));
    }

    void Controller::logRequestCompleted(const QHttpServerRequest& request, QHttpServerResponder::StatusCode status) const {
        const int code = static_cast<int>(status);
        const QString line = QString("[%1] %2 %3 -> %4")
                                 .arg(getControllerName(), methodName(request.method()), request.url().path())
                                 .arg(code);
        if (code >= 500) {
            LOG_WARNING(line);
        } else {
            LOG_INFO(line);
        }
    }

    QString Controller::methodName(QHttpServerRequest::Method method) {
        switch (method) {
            case QHttpServerRequest::Method::Get:    return "GET";
            case QHttpServerRequest::Method::Post:   return "POST";
            case QHttpServerRequest::Method::Put:    return "PUT";
            case QHttpServerRequest::Method::Delete: return "DELETE";
            case QHttpServerRequest::Method::Patch:  return "PATCH";
            default:
                break;
        }
        return QString::number(static_cast<int>(method));
    }

    QString Controller::typeName(FieldType type) {
        switch (type) {
            case FieldType::String:  return "a string";
            case FieldType::Integer: return "an integer";
            case FieldType::Boolean: return "a boolean";
        }
        return "valid";
    }

} // namespace Http
