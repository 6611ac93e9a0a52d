#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>

#include "Core/SessionController.h"
#include "Core/MonthAggregator.h"
#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "Models/LedgerLogModel.h"
#include "dbservice/dbmanager.h"
#include "ManualClock.h"
#include "logger/logger.h"

class SessionControllerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        Logger::instance()->setLogLevel(Logger::Fatal);
    }

    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        m_clock.set(ManualClock::utc(2024, 3, 31, 23, 58, 30));
        m_db = std::make_unique<DbManager>(DbConfig::sqlite(m_tempDir->filePath("ledger.db")));
        m_store = std::make_unique<LedgerStore>(*m_db);
        QVERIFY2(m_store->initialize(), qPrintable(m_store->lastError()));

        m_controller = std::make_unique<SessionController>(*m_store, m_clock, m_zone);

        auto user = m_store->findOrCreateUser("Alice");
        QVERIFY(user.isOk());
        m_userId = user.value()->id();
    }

    void cleanup() {
        m_controller.reset();
        m_store.reset();
        m_db.reset();
        m_tempDir.reset();
    }

    void testStateFollowsStartAndStop() {
        auto idle = m_controller->state(m_userId);
        QVERIFY(idle.isOk());
        QCOMPARE(idle.value(), SessionController::Idle);

        QVERIFY(m_controller->start(m_userId).isOk());
        QCOMPARE(m_controller->state(m_userId).value(), SessionController::Running);

        m_clock.advance(90);
        QVERIFY(m_controller->stop(m_userId).isOk());
        QCOMPARE(m_controller->state(m_userId).value(), SessionController::Idle);
    }

    void testStopAcrossMonthBoundary() {
        auto started = m_controller->start(m_userId);
        QVERIFY(started.isOk());

        m_clock.set(ManualClock::utc(2024, 4, 1, 0, 1, 10));
        auto stopped = m_controller->stop(m_userId);
        QVERIFY(stopped.isOk());
        QCOMPARE(stopped.value()->id(), started.value()->id());
        QCOMPARE(stopped.value()->minutes().value_or(-1), 3);

        auto sessions = m_store->listFinishedSessions(m_userId);
        QVERIFY(sessions.isOk());
        QCOMPARE(sessions.value().size(), 1);
        QCOMPARE(sessions.value().first()->minutes().value_or(-1), 3);

        MonthBucketList buckets = MonthAggregator::bucketize(sessions.value(), {}, m_zone);
        QCOMPARE(buckets.size(), 1);
        QCOMPARE(buckets.first().monthKey, QString("2024-04"));
        QCOMPARE(buckets.first().minutes, qint64(3));
    }

    void testSessionStartedInMarchEndsInApril() {
        // 23:59:30 on March 31 at UTC+1
        m_clock.set(ManualClock::utc(2024, 3, 31, 22, 59, 30));
        auto started = m_controller->start(m_userId);
        QVERIFY(started.isOk());
        QCOMPARE(MonthAggregator::monthKey(started.value()->startTime(), m_zone), QString("2024-03"));

        m_clock.set(ManualClock::utc(2024, 3, 31, 23, 1, 10));
        auto stopped = m_controller->stop(m_userId);
        QVERIFY(stopped.isOk());
        QCOMPARE(MonthAggregator::monthKey(stopped.value()->endTime(), m_zone), QString("2024-04"));
        // 100 seconds
        QCOMPARE(stopped.value()->minutes().value_or(-1), 2);

        auto logs = m_store->listLogs(m_userId, 10);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().size(), 2);
        QCOMPARE(logs.value().at(1)->details(), QString("Started at 2024-03-31 23:59:30"));
        QCOMPARE(logs.value().at(0)->details(), QString("Stopped at 2024-04-01 00:01:10 after 00:01:40"));

        auto sessions = m_store->listFinishedSessions(m_userId);
        QVERIFY(sessions.isOk());
        MonthBucketList buckets = MonthAggregator::bucketize(sessions.value(), {}, m_zone);
        QCOMPARE(buckets.size(), 1);
        QCOMPARE(buckets.first().monthKey, QString("2024-04"));
        QCOMPARE(buckets.first().minutes, qint64(2));
    }

    void testShortSessionBillsOneMinute() {
        QVERIFY(m_controller->start(m_userId).isOk());
        m_clock.advance(12);

        auto stopped = m_controller->stop(m_userId);
        QVERIFY(stopped.isOk());
        QCOMPARE(stopped.value()->minutes().value_or(-1), 1);
    }

    void testLogEntriesPairWithMutations() {
        QVERIFY(m_controller->start(m_userId).isOk());
        m_clock.set(ManualClock::utc(2024, 4, 1, 0, 1, 10));
        QVERIFY(m_controller->stop(m_userId).isOk());
        m_clock.set(ManualClock::utc(2024, 4, 5, 9, 0, 0));
        QVERIFY(m_controller->adjust(m_userId, -15, "  forgot to stop  ").isOk());
        QVERIFY(m_controller->adjust(m_userId, 20, QString()).isOk());

        auto logs = m_store->listLogs(m_userId, 10);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().size(), 4);

        const auto &entries = logs.value();
        QCOMPARE(entries.at(3)->kind(), LedgerTypes::LogKind::Start);
        QVERIFY(!entries.at(3)->minutes().has_value());
        QCOMPARE(entries.at(3)->details(), QString("Started at 2024-04-01 00:58:30"));

        QCOMPARE(entries.at(2)->kind(), LedgerTypes::LogKind::Stop);
        QCOMPARE(entries.at(2)->minutes().value_or(-1), 3);
        QCOMPARE(entries.at(2)->details(), QString("Stopped at 2024-04-01 01:01:10 after 00:02:40"));

        QCOMPARE(entries.at(1)->kind(), LedgerTypes::LogKind::Adjust);
        QCOMPARE(entries.at(1)->minutes().value_or(0), -15);
        QCOMPARE(entries.at(1)->details(), QString("forgot to stop"));

        QCOMPARE(entries.at(0)->minutes().value_or(0), 20);
        QCOMPARE(entries.at(0)->details(), QString("Manual adjustment"));

        auto adjustments = m_store->listAdjustments(m_userId);
        QVERIFY(adjustments.isOk());
        QCOMPARE(adjustments.value().size(), 2);
        QCOMPARE(adjustments.value().first()->reason(), QString("forgot to stop"));
    }

    void testAdjustmentBucketsByCreationMonth() {
        QVERIFY(m_controller->start(m_userId).isOk());
        m_clock.set(ManualClock::utc(2024, 4, 1, 0, 1, 10));
        QVERIFY(m_controller->stop(m_userId).isOk());
        m_clock.set(ManualClock::utc(2024, 4, 5, 9, 0, 0));
        QVERIFY(m_controller->adjust(m_userId, -15, "correction").isOk());

        auto sessions = m_store->listFinishedSessions(m_userId);
        auto adjustments = m_store->listAdjustments(m_userId);
        QVERIFY(sessions.isOk());
        QVERIFY(adjustments.isOk());

        MonthBucketList buckets = MonthAggregator::bucketize(sessions.value(), adjustments.value(), m_zone);
        QCOMPARE(buckets.size(), 1);
        QCOMPARE(buckets.first().monthKey, QString("2024-04"));
        QCOMPARE(buckets.first().minutes, qint64(-12));
    }

    void testAdjustWhileRunning() {
        QVERIFY(m_controller->start(m_userId).isOk());
        QVERIFY(m_controller->adjust(m_userId, 30, "meeting").isOk());
        QCOMPARE(m_controller->state(m_userId).value(), SessionController::Running);
    }

    void testRejectedCommandsLeaveNoTrace() {
        auto stopIdle = m_controller->stop(m_userId);
        QVERIFY(!stopIdle.isOk());
        QCOMPARE(stopIdle.error().code(), LedgerError::NotFound);

        QVERIFY(m_controller->start(m_userId).isOk());
        auto doubleStart = m_controller->start(m_userId);
        QVERIFY(!doubleStart.isOk());
        QCOMPARE(doubleStart.error().code(), LedgerError::Conflict);

        auto zero = m_controller->adjust(m_userId, 0, "nothing");
        QVERIFY(!zero.isOk());
        QCOMPARE(zero.error().code(), LedgerError::Validation);

        auto unknown = m_controller->start(m_userId + 100);
        QVERIFY(!unknown.isOk());
        QCOMPARE(unknown.error().code(), LedgerError::NotFound);

        // Only the successful start left a log entry
        auto logs = m_store->listLogs(m_userId, 10);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().size(), 1);
        QCOMPARE(logs.value().first()->kind(), LedgerTypes::LogKind::Start);
    }

    void testSignalsAfterCommit() {
        QSignalSpy changed(m_controller.get(), &SessionController::ledgerChanged);
        QSignalSpy started(m_controller.get(), &SessionController::sessionStarted);
        QSignalSpy stopped(m_controller.get(), &SessionController::sessionStopped);
        QSignalSpy adjusted(m_controller.get(), &SessionController::adjustmentRecorded);

        QVERIFY(m_controller->start(m_userId).isOk());
        QVERIFY(!m_controller->start(m_userId).isOk());
        m_clock.advance(600);
        QVERIFY(m_controller->stop(m_userId).isOk());
        QVERIFY(!m_controller->adjust(m_userId, 0, "nothing").isOk());
        QVERIFY(m_controller->adjust(m_userId, -5, "lunch").isOk());

        QCOMPARE(changed.count(), 3);
        QCOMPARE(started.count(), 1);
        QCOMPARE(stopped.count(), 1);
        QCOMPARE(stopped.first().at(2).toInt(), 10);
        QCOMPARE(adjusted.count(), 1);
        QCOMPARE(adjusted.first().at(0).toLongLong(), m_userId);
        QCOMPARE(adjusted.first().at(1).toInt(), -5);
    }

private:
    QScopedPointer<QTemporaryDir> m_tempDir;
    std::unique_ptr<DbManager> m_db;
    std::unique_ptr<LedgerStore> m_store;
    std::unique_ptr<SessionController> m_controller;
    ManualClock m_clock;
    QTimeZone m_zone{3600};
    qint64 m_userId = 0;
};

QTEST_GUILESS_MAIN(SessionControllerTest)
#include "SessionControllerTest.moc"
