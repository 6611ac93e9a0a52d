#pragma once

#include <QHostAddress>
#include <QHttpServer>
#include <QObject>
#include <QTcpServer>

#include <memory>
#include <vector>

#include "controller.h"

namespace Http {

    /**
     * @brief QHttpServer bound to its own QTcpServer listener
     *
     * Controllers add their routes once, on registration. Port 0 asks the
     * system for a free port; port() reports the one actually bound.
     */
    class Server : public QObject {
        Q_OBJECT
    public:
        explicit Server(QObject* parent = nullptr);
        ~Server() override;

        void registerController(std::shared_ptr<Controller> controller);

        bool start(quint16 port, const QHostAddress& address = QHostAddress::Any);
        void stop();

        bool isRunning() const;
        // 0 while not listening
        quint16 port() const;

    private:
        QHttpServer m_http;
        QTcpServer* m_listener = nullptr;
        std::vector<std::shared_ptr<Controller>> m_controllers;
    };

} // namespace Http
