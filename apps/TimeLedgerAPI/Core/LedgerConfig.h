#ifndef LEDGERCONFIG_H
#define LEDGERCONFIG_H

#include <QString>
#include <QTimeZone>

/**
 * @brief Engine settings that are not tied to the database connection
 */
class LedgerConfig
{
public:
    static constexpr int kDefaultLogLimit = 500;
    static constexpr int kDefaultCacheTtlSeconds = 5;

    LedgerConfig();

    static LedgerConfig fromEnvironment();
    static LedgerConfig fromFile(const QString &configPath);

    QTimeZone displayTimeZone() const { return m_displayTimeZone; }
    void setDisplayTimeZone(const QString &ianaId);
    void setDisplayTimeZone(const QTimeZone &zone);

    // Upper bound on the number of log entries a single query returns
    int logLimit() const { return m_logLimit; }
    void setLogLimit(int limit);

    // 0 disables caching of month totals
    int cacheTtlSeconds() const { return m_cacheTtlSeconds; }
    void setCacheTtlSeconds(int seconds);

private:
    QTimeZone m_displayTimeZone;
    int m_logLimit;
    int m_cacheTtlSeconds;
};

#endif // LEDGERCONFIG_H
