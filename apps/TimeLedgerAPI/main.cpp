#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QHostAddress>
#include <QNetworkInterface>

#include "Core/LedgerConfig.h"
#include "Server/ApiServer.h"
#include "dbservice/dbconfig.h"
#include "logger/logger.h"

namespace {

struct LaunchOptions
{
    quint16 port = 8080;
    QHostAddress bindAddress = QHostAddress(QHostAddress::Any);
    QString configPath;
    bool migrateLegacySeconds = false;
};

// Non-loopback IPv4 addresses of this machine, loopback first
QStringList reachableAddresses()
{
    QStringList result{QStringLiteral("127.0.0.1")};
    const QList<QHostAddress> all = QNetworkInterface::allAddresses();
    for (const QHostAddress &address : all) {
        if (address.isLoopback() || address.protocol() != QAbstractSocket::IPv4Protocol) {
            continue;
        }
        result.append(address.toString());
    }
    return result;
}

bool parseLaunchOptions(const QCoreApplication &app, LaunchOptions &options)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Time ledger REST service: work sessions, adjustments and monthly totals");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption portOption({"p", "port"}, "Port to listen on (0 picks a free port).", "port", "8080");
    const QCommandLineOption configOption({"c", "config"}, "INI file with [Database] and [Ledger] groups.",
                                          "path", "config/ledger.ini");
    const QCommandLineOption logLevelOption({"l", "log-level"}, "debug, info, warning, error or fatal.",
                                            "level", "info");
    const QCommandLineOption hostOption("host", "Interface address to bind, or 'all'.", "address", "all");
    const QCommandLineOption migrateOption("migrate-legacy-seconds",
                                           "Convert a database that stores seconds to minutes before serving.");
    parser.addOptions({portOption, configOption, logLevelOption, hostOption, migrateOption});
    parser.process(app);

    bool ok = false;
    const uint port = parser.value(portOption).toUInt(&ok);
    if (!ok || port > 65535) {
        LOG_FATAL(QString("Port must be between 0 and 65535, got '%1'").arg(parser.value(portOption)));
        return false;
    }
    options.port = static_cast<quint16>(port);

    const QString host = parser.value(hostOption).trimmed();
    if (host.compare("all", Qt::CaseInsensitive) != 0) {
        options.bindAddress = QHostAddress(host);
        if (options.bindAddress.isNull()) {
            LOG_FATAL(QString("Cannot bind to '%1': not an IP address").arg(host));
            return false;
        }
    }

    const QString level = parser.value(logLevelOption);
    if (!Logger::instance()->setLogLevel(level)) {
        LOG_WARNING(QString("Ignoring unknown log level '%1'").arg(level));
    }

    options.configPath = parser.value(configOption);
    options.migrateLegacySeconds = parser.isSet(migrateOption);
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("TimeLedgerAPI");
    QCoreApplication::setApplicationVersion("1.0.0");

    Logger::instance()->enableConsoleOutput(true);
    Logger::instance()->setLogFile("logs/time_ledger_api.log");

    LaunchOptions options;
    if (!parseLaunchOptions(app, options)) {
        return 1;
    }

    DbConfig dbConfig;
    LedgerConfig ledgerConfig;
    if (QFile::exists(options.configPath)) {
        dbConfig = DbConfig::fromFile(options.configPath);
        ledgerConfig = LedgerConfig::fromFile(options.configPath);
    } else {
        LOG_WARNING(QString("No config file at %1, reading LEDGER_* environment variables")
                    .arg(options.configPath));
        dbConfig = DbConfig::fromEnvironment();
        ledgerConfig = LedgerConfig::fromEnvironment();
    }

    LOG_DATA(Logger::Info, (QMap<QString, QVariant>{
        {"version", QCoreApplication::applicationVersion()},
        {"database", dbConfig.describe()},
        {"timezone", QString::fromUtf8(ledgerConfig.displayTimeZone().id())},
        {"log_limit", ledgerConfig.logLimit()},
        {"cache_ttl", ledgerConfig.cacheTtlSeconds()},
        {"migrate", options.migrateLegacySeconds}
    }));

    ApiServer server;

    QObject::connect(&server, &ApiServer::serverStarted, [&options](quint16 actualPort) {
        if (options.bindAddress == QHostAddress(QHostAddress::Any)) {
            for (const QString &address : reachableAddresses()) {
                LOG_INFO(QString("Listening on http://%1:%2/").arg(address).arg(actualPort));
            }
        } else {
            LOG_INFO(QString("Listening on http://%1:%2/").arg(options.bindAddress.toString()).arg(actualPort));
        }
    });
    QObject::connect(&server, &ApiServer::serverStopped, []() {
        LOG_INFO("Stopped accepting requests");
    });
    QObject::connect(&server, &ApiServer::errorOccurred, [](const QString &error) {
        LOG_ERROR(error);
    });

    if (!server.initialize(dbConfig, ledgerConfig, options.migrateLegacySeconds)) {
        LOG_FATAL("Ledger could not be opened, exiting");
        return 1;
    }

    if (!server.start(options.port, options.bindAddress)) {
        LOG_FATAL(QString("Cannot listen on %1:%2").arg(options.bindAddress.toString()).arg(options.port));
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &server, [&server]() {
        server.stop();
    });

    return app.exec();
}
