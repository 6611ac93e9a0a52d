#ifndef APISERVER_H
#define APISERVER_H

#include <QObject>
#include <QString>
#include <QHostAddress>
#include <memory>
#include "httpserver/server.h"
#include "dbservice/dbconfig.h"
#include "Core/Clock.h"
#include "Core/LedgerConfig.h"
#include "logger/logger.h"

class DbManager;
class LedgerStore;
class LedgerEngine;
class LedgerController;
class ServerStatusController;

class ApiServer : public QObject
{
    Q_OBJECT
public:
    explicit ApiServer(QObject *parent = nullptr);
    ~ApiServer() override;

    /**
     * @brief Connect to the database, prepare the schema and wire the controllers
     *
     * A database that still stores durations in seconds is only accepted when
     * @p migrateLegacySeconds is set; it is then converted before serving.
     * Its timestamps are read as wall-clock time in the display timezone.
     */
    bool initialize(const DbConfig &dbConfig, const LedgerConfig &ledgerConfig, bool migrateLegacySeconds);

    bool start(quint16 port, const QHostAddress &address = QHostAddress::Any);
    void stop();
    bool isRunning() const { return m_server.isRunning(); }
    // Bound port, 0 while stopped
    quint16 port() const { return m_server.port(); }

    LedgerEngine *engine() const { return m_engine.get(); }

signals:
    void serverStarted(quint16 port);
    void serverStopped();
    void errorOccurred(const QString &errorMessage);

private:
    // Seconds-era rows hold wall-clock time in legacyZone
    bool prepareStore(bool migrateLegacySeconds, const QTimeZone &legacyZone);
    bool setupControllers();

    bool m_initialized = false;

    SystemClock m_clock;
    std::unique_ptr<DbManager> m_dbManager;
    std::unique_ptr<LedgerStore> m_store;
    std::unique_ptr<LedgerEngine> m_engine;

    std::shared_ptr<LedgerController> m_ledgerController;
    std::shared_ptr<ServerStatusController> m_serverStatusController;

    // Declared last so routes go away before the engine they call into
    Http::Server m_server;
};

#endif // APISERVER_H
