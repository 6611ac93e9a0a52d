#pragma once
#include <QString>

/**
 * @brief Connection settings for the ledger database
 *
 * QPSQL is the production driver. QSQLITE uses database() as the file path
 * and ignores host, port and credentials.
 */
class DbConfig {
public:
    static DbConfig fromEnvironment();
    static DbConfig fromFile(const QString& configPath);
    static DbConfig sqlite(const QString& filePath);

    QString driver() const { return m_driver; }
    QString host() const { return m_host; }
    QString database() const { return m_database; }
    QString username() const { return m_username; }
    QString password() const { return m_password; }
    int port() const { return m_port; }
    int connectTimeoutSeconds() const { return m_connectTimeout; }
    int busyTimeoutMs() const { return m_busyTimeout; }

    bool isSqlite() const { return m_driver == QLatin1String("QSQLITE"); }

    // "user@host:port/database" or "sqlite:path"; never contains the password
    QString describe() const;

private:
    QString m_driver = "QPSQL";
    QString m_host = "localhost";
    QString m_database = "timeledger";
    QString m_username = "postgres";
    QString m_password;
    int m_port = 5432;
    int m_connectTimeout = 5;
    int m_busyTimeout = 5000;
};
