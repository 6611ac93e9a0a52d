#include "LedgerConfig.h"
#include "logger/logger.h"

#include <QProcessEnvironment>
#include <QSettings>

namespace {
const char *kDefaultTimeZone = "Europe/Zurich";
}

LedgerConfig::LedgerConfig()
    : m_displayTimeZone(QByteArray(kDefaultTimeZone))
    , m_logLimit(kDefaultLogLimit)
    , m_cacheTtlSeconds(kDefaultCacheTtlSeconds)
{
    if (!m_displayTimeZone.isValid()) {
        LOG_WARNING(QString("Time zone %1 unavailable, falling back to UTC").arg(kDefaultTimeZone));
        m_displayTimeZone = QTimeZone::utc();
    }
}

LedgerConfig LedgerConfig::fromEnvironment()
{
    LedgerConfig config;
    auto env = QProcessEnvironment::systemEnvironment();

    if (env.contains("LEDGER_TIMEZONE")) {
        config.setDisplayTimeZone(env.value("LEDGER_TIMEZONE"));
    }
    if (env.contains("LEDGER_LOG_LIMIT")) {
        config.setLogLimit(env.value("LEDGER_LOG_LIMIT").toInt());
    }
    if (env.contains("LEDGER_CACHE_TTL")) {
        config.setCacheTtlSeconds(env.value("LEDGER_CACHE_TTL").toInt());
    }

    return config;
}

LedgerConfig LedgerConfig::fromFile(const QString &configPath)
{
    LedgerConfig config;
    QSettings settings(configPath, QSettings::IniFormat);

    settings.beginGroup("Ledger");
    config.setDisplayTimeZone(settings.value("timezone", kDefaultTimeZone).toString());
    config.setLogLimit(settings.value("log_limit", kDefaultLogLimit).toInt());
    config.setCacheTtlSeconds(settings.value("cache_ttl", kDefaultCacheTtlSeconds).toInt());
    settings.endGroup();

    return config;
}

void LedgerConfig::setDisplayTimeZone(const QString &ianaId)
{
    QTimeZone zone(ianaId.trimmed().toUtf8());
    if (!zone.isValid()) {
        LOG_WARNING(QString("Unknown time zone '%1', falling back to UTC").arg(ianaId));
        zone = QTimeZone::utc();
    }
    m_displayTimeZone = zone;
}

void LedgerConfig::setDisplayTimeZone(const QTimeZone &zone)
{
    m_displayTimeZone = zone.isValid() ? zone : QTimeZone::utc();
}

void LedgerConfig::setLogLimit(int limit)
{
    if (limit < 1) {
        LOG_WARNING(QString("Invalid log limit %1, using %2").arg(limit).arg(kDefaultLogLimit));
        limit = kDefaultLogLimit;
    }
    m_logLimit = limit;
}

void LedgerConfig::setCacheTtlSeconds(int seconds)
{
    m_cacheTtlSeconds = qMax(0, seconds);
}
