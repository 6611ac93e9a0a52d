#include "httpserver/server.h"
#include "logger/logger.h"

namespace Http {

    Server::Server(QObject* parent)
        : QObject(parent)
    {
    }

    Server::~Server() = default;

    void Server::registerController(std::shared_ptr<Controller> controller) {
        if (!controller) {
            LOG_WARNING("Ignoring null controller");
            return;
        }

        controller->setupRoutes(m_http);
        LOG_DEBUG(QString("Routes of %1 registered").arg(controller->getControllerName()));
        m_controllers.push_back(std::move(controller));
    }

    bool Server::start(quint16 port, const QHostAddress& address) {
        if (isRunning()) {
            return true;
        }

        auto listener = std::make_unique<QTcpServer>();
        if (!listener->listen(address, port)) {
            LOG_ERROR(QString("Cannot listen on %1:%2: %3")
                     .arg(address.toString())
                     .arg(port)
                     .arg(listener->errorString()));
            return false;
        }

        // bind() reparents the listener to m_http on success
        if (!m_http.bind(listener.get())) {
            LOG_ERROR(QString("HTTP server refused listener on %1:%2").arg(address.toString()).arg(port));
            return false;
        }

        m_listener = listener.release();
        LOG_INFO(QString("HTTP listening on %1:%2").arg(address.toString()).arg(m_listener->serverPort()));
        return true;
    }

    void Server::stop() {
        if (isRunning()) {
            m_listener->close();
            LOG_INFO("HTTP listener closed");
        }
    }

    bool Server::isRunning() const {
        return m_listener != nullptr && m_listener->isListening();
    }

    quint16 Server::port() const {
        return isRunning() ? m_listener->serverPort() : 0;
    }

} // namespace Http
