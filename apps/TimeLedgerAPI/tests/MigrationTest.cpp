#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QTimeZone>
#include <memory>

#include "Core/LedgerStore.h"
#include "Core/LedgerSchema.h"
#include "Core/MonthAggregator.h"
#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "Models/LedgerLogModel.h"
#include "dbservice/dbmanager.h"
#include "ManualClock.h"
#include "logger/logger.h"

class MigrationTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        Logger::instance()->setLogLevel(Logger::Fatal);
        m_zurich = QTimeZone("Europe/Zurich");
        if (!m_zurich.isValid()) {
            QSKIP("Europe/Zurich is not in this system's time zone database");
        }
    }

    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        QVERIFY(createLegacyDatabase());
    }

    void cleanup() {
        m_tempDir.reset();
    }

    void testLegacyDatabaseBlocksOperations() {
        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore store(db);
        QVERIFY2(store.initialize(), qPrintable(store.lastError()));

        QVERIFY(store.requiresMigration());
        QCOMPARE(store.durationUnit(), QString("seconds"));

        auto user = store.findOrCreateUser("alice");
        QVERIFY(!user.isOk());
        QCOMPARE(user.error().code(), LedgerError::Storage);

        auto sessions = store.listFinishedSessions(1);
        QVERIFY(!sessions.isOk());
        QCOMPARE(sessions.error().code(), LedgerError::Storage);
    }

    void testMigrationConvertsSecondsToMinutes() {
        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore store(db);
        QVERIFY2(store.initialize(), qPrintable(store.lastError()));

        auto migrated = store.migrateLegacySeconds(m_zurich);
        QVERIFY2(migrated.isOk(), qPrintable(migrated.error().toString()));
        // Two finished sessions, one adjustment, two log entries with durations
        QCOMPARE(migrated.value(), 5);
        QVERIFY(!store.requiresMigration());
        QCOMPARE(store.durationUnit(), QString("minutes"));

        auto sessions = store.listFinishedSessions(1);
        QVERIFY(sessions.isOk());
        QCOMPARE(sessions.value().size(), 2);
        QCOMPARE(sessions.value().at(0)->minutes().value_or(-1), 3);
        QCOMPARE(sessions.value().at(1)->minutes().value_or(-1), 1);

        auto adjustments = store.listAdjustments(1);
        QVERIFY(adjustments.isOk());
        QCOMPARE(adjustments.value().size(), 1);
        QCOMPARE(adjustments.value().first()->minutes(), -15);

        auto logs = store.listLogs(1, 10);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().size(), 3);
        QCOMPARE(logs.value().at(0)->minutes().value_or(0), 1);
        QCOMPARE(logs.value().at(1)->minutes().value_or(0), 3);
        QVERIFY(!logs.value().at(2)->minutes().has_value());

        // The running session is untouched and still blocks a second start
        auto active = store.activeSession(1);
        QVERIFY(active.isOk());
        QVERIFY(active.value());
        QVERIFY(!active.value()->minutes().has_value());
    }

    void testMigrationRunsOnce() {
        {
            DbManager db(DbConfig::sqlite(databasePath()));
            LedgerStore store(db);
            QVERIFY(store.initialize());
            QCOMPARE(store.migrateLegacySeconds(m_zurich).value(), 5);

            auto again = store.migrateLegacySeconds(m_zurich);
            QVERIFY(again.isOk());
            QCOMPARE(again.value(), 0);
        }

        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore reopened(db);
        QVERIFY(reopened.initialize());
        QVERIFY(!reopened.requiresMigration());

        auto sessions = reopened.listFinishedSessions(1);
        QVERIFY(sessions.isOk());
        QCOMPARE(sessions.value().at(0)->minutes().value_or(-1), 3);
        // Converted exactly once
        QCOMPARE(sessions.value().at(0)->endTime(), ManualClock::utc(2024, 3, 31, 21, 30, 0));

        auto user = reopened.findOrCreateUser("alice");
        QVERIFY(user.isOk());
        QCOMPARE(user.value()->id(), qint64(1));
    }

    void testLegacyWallClockKeepsMonth() {
        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore store(db);
        QVERIFY(store.initialize());
        QVERIFY(store.migrateLegacySeconds(m_zurich).isOk());

        // 23:30 on March 31 in Zurich (CEST) is 21:30 UTC
        auto sessions = store.listFinishedSessions(1);
        QVERIFY(sessions.isOk());
        const auto &lastMarch = sessions.value().at(0);
        QCOMPARE(lastMarch->startTime(), ManualClock::utc(2024, 3, 31, 21, 27, 30));
        QCOMPARE(lastMarch->endTime(), ManualClock::utc(2024, 3, 31, 21, 30, 0));
        QCOMPARE(MonthAggregator::monthKey(lastMarch->endTime(), m_zurich), QString("2024-03"));

        // Winter time before the switch
        auto adjustments = store.listAdjustments(1);
        QVERIFY(adjustments.isOk());
        QCOMPARE(adjustments.value().first()->createdAt(), ManualClock::utc(2024, 3, 15, 11, 0, 0));

        auto active = store.activeSession(1);
        QVERIFY(active.isOk());
        QVERIFY(active.value());
        QCOMPARE(active.value()->startTime(), ManualClock::utc(2024, 4, 4, 6, 0, 0));

        auto logs = store.listLogs(1, 10);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().at(1)->timestamp(), ManualClock::utc(2024, 3, 31, 21, 30, 0));

        MonthBucketList buckets = MonthAggregator::bucketize(sessions.value(), adjustments.value(), m_zurich);
        QCOMPARE(buckets.size(), 2);
        QCOMPARE(buckets.at(0).monthKey, QString("2024-04"));
        QCOMPARE(buckets.at(0).minutes, qint64(1));
        QCOMPARE(buckets.at(1).monthKey, QString("2024-03"));
        QCOMPARE(buckets.at(1).minutes, qint64(3 - 15));
    }

    void testWritesSucceedAfterMigration() {
        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore store(db);
        QVERIFY(store.initialize());
        QVERIFY(store.migrateLegacySeconds(m_zurich).isOk());

        auto active = store.activeSession(1);
        QVERIFY(active.isOk());
        QVERIFY(active.value());

        const QDateTime end = ManualClock::utc(2024, 4, 4, 7, 0, 0);
        LedgerError finished = store.executeInTransaction([&]() -> LedgerError {
            LedgerError error = store.finishSession(active.value()->id(), end, 60);
            if (error.isError()) {
                return error;
            }
            auto entry = store.appendLog(1, LedgerTypes::LogKind::Stop, 60, "Stopped", end);
            return entry.isOk() ? LedgerError() : entry.error();
        });
        QVERIFY2(!finished.isError(), qPrintable(finished.toString()));

        auto started = store.insertSession(1, end.addSecs(60));
        QVERIFY2(started.isOk(), qPrintable(started.error().toString()));
        QCOMPARE(started.value()->startTime(), end.addSecs(60));

        auto second = store.insertSession(1, end.addSecs(120));
        QVERIFY(!second.isOk());
        QCOMPARE(second.error().code(), LedgerError::Conflict);
    }

    void testDuplicateRunningSessionsAreClosed() {
        QVERIFY(seedLegacy("INSERT INTO sessions (user_id, start_ts) VALUES (1, '2024-04-04 09:15:00')"));

        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore store(db);
        QVERIFY2(store.initialize(), qPrintable(store.lastError()));
        QVERIFY(store.requiresMigration());

        auto migrated = store.migrateLegacySeconds(m_zurich);
        QVERIFY2(migrated.isOk(), qPrintable(migrated.error().toString()));
        // The closed session and its stop entry are converted as well
        QCOMPARE(migrated.value(), 7);

        auto active = store.activeSession(1);
        QVERIFY(active.isOk());
        QVERIFY(active.value());
        QCOMPARE(active.value()->id(), qint64(4));

        auto sessions = store.listFinishedSessions(1);
        QVERIFY(sessions.isOk());
        QCOMPARE(sessions.value().size(), 3);
        const auto &closed = sessions.value().last();
        QCOMPARE(closed->id(), qint64(3));
        QCOMPARE(closed->endTime(), active.value()->startTime());
        QCOMPARE(closed->minutes().value_or(-1), 75);

        auto logs = store.listLogs(1, 10);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().size(), 4);
        const auto &stop = logs.value().first();
        QCOMPARE(stop->kind(), LedgerTypes::LogKind::Stop);
        QCOMPARE(stop->minutes().value_or(-1), 75);
        QCOMPARE(stop->timestamp(), ManualClock::utc(2024, 4, 4, 7, 15, 0));
        QCOMPARE(stop->details(), QString("Stopped at 2024-04-04 09:15:00 after 01:15:00; superseded by session 4"));

        auto again = store.insertSession(1, ManualClock::utc(2024, 4, 5, 8, 0, 0));
        QVERIFY(!again.isOk());
        QCOMPARE(again.error().code(), LedgerError::Conflict);
    }

    void testUnparseableLegacyTimestampAbortsMigration() {
        QVERIFY(seedLegacy("UPDATE adjustments SET created_ts = 'yesterday' WHERE id = 1"));

        DbManager db(DbConfig::sqlite(databasePath()));
        LedgerStore store(db);
        QVERIFY(store.initialize());

        auto migrated = store.migrateLegacySeconds(m_zurich);
        QVERIFY(!migrated.isOk());
        QCOMPARE(migrated.error().code(), LedgerError::Storage);
        QVERIFY(store.requiresMigration());
        QCOMPARE(store.durationUnit(), QString("seconds"));

        // Rolled back as a whole
        auto raw = db.queryValue("SELECT end_ts FROM sessions WHERE id = 1");
        QVERIFY(raw.has_value());
        QCOMPARE(raw->toString(), QString("2024-03-31 23:30:00"));
    }

    void testTextColumnUpgradeStatement() {
        const QString statement = LedgerSchema::timestampColumnUpgrade("sessions", "end_ts");
        QCOMPARE(statement, QString("ALTER TABLE sessions ALTER COLUMN end_ts TYPE TIMESTAMPTZ "
                                    "USING (NULLIF(end_ts::text, '')::timestamp AT TIME ZONE 'UTC')"));
    }

    void testFreshDatabaseNeedsNoMigration() {
        QTemporaryDir freshDir;
        QVERIFY(freshDir.isValid());

        DbManager db(DbConfig::sqlite(freshDir.filePath("fresh.db")));
        LedgerStore store(db);
        QVERIFY(store.initialize());
        QVERIFY(!store.requiresMigration());
        QCOMPARE(store.durationUnit(), QString("minutes"));
    }

private:
    QString databasePath() const {
        return m_tempDir->filePath("legacy.db");
    }

    bool seedLegacy(const QString &statement) {
        DbManager db(DbConfig::sqlite(databasePath()));
        return db.initialize() && db.executeRaw(statement);
    }

    // Tables as the seconds-era release wrote them: no metadata, durations in
    // seconds, naive Zurich wall-clock text, no running-session index
    bool createLegacyDatabase() {
        DbManager db(DbConfig::sqlite(databasePath()));
        if (!db.initialize()) {
            return false;
        }

        const QStringList statements = {
            "CREATE TABLE users (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE)",
            "CREATE TABLE sessions (id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "user_id INTEGER NOT NULL REFERENCES users(id), start_ts TEXT NOT NULL, "
            "end_ts TEXT, minutes INTEGER)",
            "CREATE TABLE adjustments (id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "user_id INTEGER NOT NULL REFERENCES users(id), minutes INTEGER NOT NULL, "
            "reason TEXT, created_ts TEXT NOT NULL)",
            "CREATE TABLE logs (id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "user_id INTEGER NOT NULL REFERENCES users(id), kind TEXT NOT NULL, "
            "minutes INTEGER, ts TEXT NOT NULL, details TEXT NOT NULL DEFAULT '')",
            "INSERT INTO users (name) VALUES ('alice')",
            "INSERT INTO sessions (user_id, start_ts, end_ts, minutes) VALUES "
            "(1, '2024-03-31 23:27:30', '2024-03-31 23:30:00', 150)",
            "INSERT INTO sessions (user_id, start_ts, end_ts, minutes) VALUES "
            "(1, '2024-04-02 08:00:00', '2024-04-02 08:00:10', 10)",
            "INSERT INTO sessions (user_id, start_ts) VALUES (1, '2024-04-04 08:00:00')",
            "INSERT INTO adjustments (user_id, minutes, reason, created_ts) VALUES "
            "(1, -900, 'correction', '2024-03-15 12:00:00')",
            "INSERT INTO logs (user_id, kind, minutes, ts, details) VALUES "
            "(1, 'start', NULL, '2024-04-04 08:00:00', 'Started')",
            "INSERT INTO logs (user_id, kind, minutes, ts, details) VALUES "
            "(1, 'stop', 150, '2024-03-31 23:30:00', 'Stopped')",
            "INSERT INTO logs (user_id, kind, minutes, ts, details) VALUES "
            "(1, 'adjust', 20, '2024-04-04 10:00:00', 'Adjusted')"
        };

        for (const QString &statement : statements) {
            if (!db.executeRaw(statement)) {
                qWarning() << "Legacy setup failed:" << db.lastError();
                return false;
            }
        }
        return true;
    }

    QScopedPointer<QTemporaryDir> m_tempDir;
    QTimeZone m_zurich;
};

QTEST_GUILESS_MAIN(MigrationTest)
#include "MigrationTest.moc"
