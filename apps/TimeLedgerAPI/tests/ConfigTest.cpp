#include <QtTest/QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "Core/LedgerConfig.h"
#include "dbservice/dbconfig.h"
#include "logger/logger.h"

class ConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        Logger::instance()->setLogLevel(Logger::Fatal);
        QVERIFY(m_tempDir.isValid());
    }

    void cleanup() {
        for (const char *name : {"DB_DRIVER", "DB_NAME", "DB_PORT", "DB_BUSY_TIMEOUT",
                                 "LEDGER_TIMEZONE", "LEDGER_LOG_LIMIT", "LEDGER_CACHE_TTL"}) {
            qunsetenv(name);
        }
    }

    void testDbConfigDefaults() {
        DbConfig config = DbConfig::fromFile(m_tempDir.filePath("missing.ini"));
        QCOMPARE(config.driver(), QString("QPSQL"));
        QCOMPARE(config.host(), QString("localhost"));
        QCOMPARE(config.port(), 5432);
        QCOMPARE(config.database(), QString("timeledger"));
        QVERIFY(!config.isSqlite());
    }

    void testDbConfigFromFile() {
        const QString path = m_tempDir.filePath("db.ini");
        {
            QSettings settings(path, QSettings::IniFormat);
            settings.beginGroup("Database");
            settings.setValue("driver", "qsqlite");
            settings.setValue("database", "/var/lib/ledger/ledger.db");
            settings.setValue("busy_timeout", 2500);
            settings.endGroup();
        }

        DbConfig config = DbConfig::fromFile(path);
        QCOMPARE(config.driver(), QString("QSQLITE"));
        QVERIFY(config.isSqlite());
        QCOMPARE(config.database(), QString("/var/lib/ledger/ledger.db"));
        QCOMPARE(config.busyTimeoutMs(), 2500);
        QCOMPARE(config.describe(), QString("sqlite:/var/lib/ledger/ledger.db"));
    }

    void testDbConfigFromEnvironment() {
        qputenv("DB_DRIVER", "qpsql");
        qputenv("DB_NAME", "ledger_test");
        qputenv("DB_PORT", "6543");

        DbConfig config = DbConfig::fromEnvironment();
        QCOMPARE(config.driver(), QString("QPSQL"));
        QCOMPARE(config.database(), QString("ledger_test"));
        QCOMPARE(config.port(), 6543);
    }

    void testDescribeOmitsPassword() {
        const QString path = m_tempDir.filePath("pg.ini");
        {
            QSettings settings(path, QSettings::IniFormat);
            settings.beginGroup("Database");
            settings.setValue("username", "ledger");
            settings.setValue("password", "s3cret");
            settings.setValue("host", "db.internal");
            settings.endGroup();
        }

        DbConfig config = DbConfig::fromFile(path);
        QCOMPARE(config.password(), QString("s3cret"));
        QCOMPARE(config.describe(), QString("ledger@db.internal:5432/timeledger"));
        QVERIFY(!config.describe().contains("s3cret"));
    }

    void testSqliteFactory() {
        DbConfig config = DbConfig::sqlite("/tmp/ledger.db");
        QVERIFY(config.isSqlite());
        QCOMPARE(config.database(), QString("/tmp/ledger.db"));
        QCOMPARE(config.port(), 0);
    }

    void testLedgerConfigDefaults() {
        LedgerConfig config;
        QCOMPARE(config.logLimit(), LedgerConfig::kDefaultLogLimit);
        QCOMPARE(config.cacheTtlSeconds(), LedgerConfig::kDefaultCacheTtlSeconds);
        QVERIFY(config.displayTimeZone().isValid());
    }

    void testLedgerConfigFromFile() {
        const QString path = m_tempDir.filePath("ledger.ini");
        {
            QSettings settings(path, QSettings::IniFormat);
            settings.beginGroup("Ledger");
            settings.setValue("timezone", "UTC");
            settings.setValue("log_limit", 50);
            settings.setValue("cache_ttl", 0);
            settings.endGroup();
        }

        LedgerConfig config = LedgerConfig::fromFile(path);
        QVERIFY(isUtc(config.displayTimeZone()));
        QCOMPARE(config.logLimit(), 50);
        QCOMPARE(config.cacheTtlSeconds(), 0);
    }

    void testLedgerConfigFromEnvironment() {
        qputenv("LEDGER_TIMEZONE", "UTC");
        qputenv("LEDGER_LOG_LIMIT", "25");
        qputenv("LEDGER_CACHE_TTL", "12");

        LedgerConfig config = LedgerConfig::fromEnvironment();
        QVERIFY(isUtc(config.displayTimeZone()));
        QCOMPARE(config.logLimit(), 25);
        QCOMPARE(config.cacheTtlSeconds(), 12);
    }

    void testInvalidValuesFallBack() {
        LedgerConfig config;
        config.setDisplayTimeZone(QString("Nowhere/Atlantis"));
        QVERIFY(isUtc(config.displayTimeZone()));

        config.setLogLimit(0);
        QCOMPARE(config.logLimit(), LedgerConfig::kDefaultLogLimit);

        config.setCacheTtlSeconds(-3);
        QCOMPARE(config.cacheTtlSeconds(), 0);
    }

    void testLogLevelNames() {
        Logger *logger = Logger::instance();
        QVERIFY(logger->setLogLevel(QString("debug")));
        QCOMPARE(logger->getLogLevel(), Logger::Debug);
        QVERIFY(logger->setLogLevel(QString("WARN")));
        QCOMPARE(logger->getLogLevel(), Logger::Warning);
        QVERIFY(!logger->setLogLevel(QString("verbose")));
        QCOMPARE(logger->getLogLevel(), Logger::Warning);
        logger->setLogLevel(Logger::Fatal);
    }

private:
    static bool isUtc(const QTimeZone &zone) {
        const QDateTime summer(QDate(2024, 7, 1), QTime(12, 0), QTimeZone::utc());
        const QDateTime winter(QDate(2024, 1, 1), QTime(12, 0), QTimeZone::utc());
        return zone.isValid() && zone.offsetFromUtc(summer) == 0 && zone.offsetFromUtc(winter) == 0;
    }

    QTemporaryDir m_tempDir;
};

QTEST_GUILESS_MAIN(ConfigTest)
#include "ConfigTest.moc"
