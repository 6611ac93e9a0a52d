#include "ApiServer.h"
#include "dbservice/dbmanager.h"
#include "Core/LedgerStore.h"
#include "Core/LedgerEngine.h"
#include "Controllers/LedgerController.h"
#include "Controllers/ServerStatusController.h"

ApiServer::ApiServer(QObject *parent)
    : QObject(parent)
{
}

ApiServer::~ApiServer()
{
    stop();
}

bool ApiServer::initialize(const DbConfig &dbConfig, const LedgerConfig &ledgerConfig, bool migrateLegacySeconds)
{
    if (m_initialized) {
        return true;
    }

    m_dbManager = std::make_unique<DbManager>(dbConfig);
    if (!m_dbManager->initialize()) {
        const QString message = QString("Cannot connect to %1: %2").arg(dbConfig.describe(), m_dbManager->lastError());
        LOG_FATAL(message);
        emit errorOccurred(message);
        return false;
    }

    m_store = std::make_unique<LedgerStore>(*m_dbManager);
    if (!prepareStore(migrateLegacySeconds, ledgerConfig.displayTimeZone())) {
        return false;
    }

    m_engine = std::make_unique<LedgerEngine>(*m_store, m_clock, ledgerConfig);

    if (!setupControllers()) {
        emit errorOccurred("Ledger routes could not be registered");
        return false;
    }

    m_initialized = true;
    LOG_INFO(QString("Ledger ready on %1, revision %2").arg(dbConfig.describe()).arg(m_store->revision()));
    return true;
}

bool ApiServer::prepareStore(bool migrateLegacySeconds, const QTimeZone &legacyZone)
{
    if (!m_store->initialize()) {
        LOG_FATAL(QString("Failed to initialize ledger store: %1").arg(m_store->lastError()));
        emit errorOccurred(m_store->lastError());
        return false;
    }

    if (!m_store->requiresMigration()) {
        if (migrateLegacySeconds) {
            LOG_INFO("Legacy seconds migration requested, but durations are already in minutes");
        }
        return true;
    }

    if (!migrateLegacySeconds) {
        const QString message = "Stored durations are in seconds; restart with --migrate-legacy-seconds to convert them";
        LOG_FATAL(message);
        emit errorOccurred(message);
        return false;
    }

    auto migrated = m_store->migrateLegacySeconds(legacyZone);
    if (!migrated) {
        LOG_FATAL(QString("Legacy seconds migration failed: %1").arg(migrated.error().toString()));
        emit errorOccurred(migrated.error().message());
        return false;
    }

    LOG_INFO(QString("Legacy seconds migration converted %1 values").arg(migrated.value()));
    return true;
}

bool ApiServer::start(quint16 port, const QHostAddress &address)
{
    if (!m_initialized) {
        LOG_ERROR("start() called before initialize()");
        emit errorOccurred("Server not initialized");
        return false;
    }

    if (isRunning()) {
        return true;
    }

    if (!m_server.start(port, address)) {
        emit errorOccurred(QString("Cannot listen on %1:%2").arg(address.toString()).arg(port));
        return false;
    }

    emit serverStarted(m_server.port());
    return true;
}

void ApiServer::stop()
{
    if (!isRunning()) {
        return;
    }

    m_server.stop();
    emit serverStopped();
}

bool ApiServer::setupControllers()
{
    // Owned by the shared pointers, not by QObject parents
    m_ledgerController = std::make_shared<LedgerController>(m_engine.get());
    if (!m_ledgerController->initialize()) {
        LOG_ERROR("LedgerController failed to initialize");
        return false;
    }

    m_serverStatusController = std::make_shared<ServerStatusController>(m_engine.get(), m_dbManager.get());

    m_server.registerController(m_ledgerController);
    m_server.registerController(m_serverStatusController);
    return true;
}
