#include "dbservice/dbconfig.h"
#include <QSettings>
#include <QProcessEnvironment>

DbConfig DbConfig::fromEnvironment() {
    DbConfig config;
    auto env = QProcessEnvironment::systemEnvironment();

    config.m_driver = env.value("DB_DRIVER", config.m_driver).toUpper();
    config.m_host = env.value("DB_HOST", config.m_host);
    config.m_database = env.value("DB_NAME", config.m_database);
    config.m_username = env.value("DB_USER", config.m_username);
    config.m_password = env.value("DB_PASSWORD", config.m_password);
    config.m_port = env.value("DB_PORT", QString::number(config.m_port)).toInt();
    config.m_connectTimeout = env.value("DB_CONNECT_TIMEOUT", QString::number(config.m_connectTimeout)).toInt();
    config.m_busyTimeout = env.value("DB_BUSY_TIMEOUT", QString::number(config.m_busyTimeout)).toInt();

    return config;
}

DbConfig DbConfig::fromFile(const QString& configPath) {
    DbConfig config;
    QSettings settings(configPath, QSettings::IniFormat);

    settings.beginGroup("Database");
    config.m_driver = settings.value("driver", config.m_driver).toString().toUpper();
    config.m_host = settings.value("host", config.m_host).toString();
    config.m_database = settings.value("database", config.m_database).toString();
    config.m_username = settings.value("username", config.m_username).toString();
    config.m_password = settings.value("password", config.m_password).toString();
    config.m_port = settings.value("port", config.m_port).toInt();
    config.m_connectTimeout = settings.value("connect_timeout", config.m_connectTimeout).toInt();
    config.m_busyTimeout = settings.value("busy_timeout", config.m_busyTimeout).toInt();
    settings.endGroup();

    return config;
}

DbConfig DbConfig::sqlite(const QString& filePath) {
    DbConfig config;
    config.m_driver = "QSQLITE";
    config.m_database = filePath;
    config.m_host.clear();
    config.m_username.clear();
    config.m_port = 0;
    return config;
}

QString DbConfig::describe() const {
    if (isSqlite()) {
        return QString("sqlite:%1").arg(m_database);
    }
    return QString("%1@%2:%3/%4").arg(m_username, m_host).arg(m_port).arg(m_database);
}
