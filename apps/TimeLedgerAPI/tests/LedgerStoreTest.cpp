#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <memory>

#include "Core/LedgerStore.h"
#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "Models/LedgerLogModel.h"
#include "dbservice/dbmanager.h"
#include "ManualClock.h"
#include "logger/logger.h"

class LedgerStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        Logger::instance()->setLogLevel(Logger::Fatal);
    }

    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        m_db = std::make_unique<DbManager>(DbConfig::sqlite(m_tempDir->filePath("ledger.db")));
        m_store = std::make_unique<LedgerStore>(*m_db);
        QVERIFY2(m_store->initialize(), qPrintable(m_store->lastError()));
    }

    void cleanup() {
        m_store.reset();
        m_db.reset();
        m_tempDir.reset();
    }

    void testFindOrCreateUserIsStable() {
        auto first = m_store->findOrCreateUser("Alice");
        QVERIFY(first.isOk());
        QVERIFY(first.value()->id() > 0);

        auto second = m_store->findOrCreateUser("  Alice ");
        QVERIFY(second.isOk());
        QCOMPARE(second.value()->id(), first.value()->id());
        QCOMPARE(second.value()->name(), QString("Alice"));

        auto other = m_store->findOrCreateUser("Bob");
        QVERIFY(other.isOk());
        QVERIFY(other.value()->id() != first.value()->id());
    }

    void testInvalidUserNames() {
        auto empty = m_store->findOrCreateUser("   ");
        QVERIFY(!empty.isOk());
        QCOMPARE(empty.error().code(), LedgerError::Validation);

        auto tooLong = m_store->findOrCreateUser(QString(256, QChar('x')));
        QVERIFY(!tooLong.isOk());
        QCOMPARE(tooLong.error().code(), LedgerError::Validation);
    }

    void testUnknownUserIsNotFound() {
        auto user = m_store->userById(4242);
        QVERIFY(!user.isOk());
        QCOMPARE(user.error().code(), LedgerError::NotFound);

        auto session = m_store->insertSession(4242, m_clock.now());
        QVERIFY(!session.isOk());
        QCOMPARE(session.error().code(), LedgerError::NotFound);
    }

    void testSecondRunningSessionIsRejected() {
        const qint64 userId = createUser("Alice");

        auto first = m_store->insertSession(userId, m_clock.now());
        QVERIFY(first.isOk());
        QVERIFY(first.value()->isRunning());

        m_clock.advance(5);
        auto second = m_store->insertSession(userId, m_clock.now());
        QVERIFY(!second.isOk());
        QCOMPARE(second.error().code(), LedgerError::Conflict);

        auto active = m_store->activeSession(userId);
        QVERIFY(active.isOk());
        QVERIFY(active.value());
        QCOMPARE(active.value()->id(), first.value()->id());
        QCOMPARE(active.value()->startTime(), ManualClock::utc(2024, 1, 1));
    }

    void testRunningSessionsAreIndependentPerUser() {
        const qint64 alice = createUser("Alice");
        const qint64 bob = createUser("Bob");

        QVERIFY(m_store->insertSession(alice, m_clock.now()).isOk());
        QVERIFY(m_store->insertSession(bob, m_clock.now()).isOk());
    }

    void testFinishSessionOnlyOnce() {
        const qint64 userId = createUser("Alice");
        auto session = m_store->insertSession(userId, m_clock.now());
        QVERIFY(session.isOk());

        m_clock.advance(160);
        LedgerError finished = m_store->finishSession(session.value()->id(), m_clock.now(), 3);
        QVERIFY(!finished.isError());

        LedgerError again = m_store->finishSession(session.value()->id(), m_clock.now(), 7);
        QCOMPARE(again.code(), LedgerError::Conflict);

        LedgerError missing = m_store->finishSession(999, m_clock.now(), 1);
        QCOMPARE(missing.code(), LedgerError::NotFound);

        auto active = m_store->activeSession(userId);
        QVERIFY(active.isOk());
        QVERIFY(!active.value());

        auto finishedSessions = m_store->listFinishedSessions(userId);
        QVERIFY(finishedSessions.isOk());
        QCOMPARE(finishedSessions.value().size(), 1);
        QCOMPARE(finishedSessions.value().first()->minutes().value_or(-1), 3);
        QCOMPARE(finishedSessions.value().first()->endTime(), m_clock.now());

        // A new session can start once the previous one is finished
        QVERIFY(m_store->insertSession(userId, m_clock.now()).isOk());
    }

    void testZeroAdjustmentIsRejected() {
        const qint64 userId = createUser("Alice");

        auto zero = m_store->insertAdjustment(userId, 0, "nothing", m_clock.now());
        QVERIFY(!zero.isOk());
        QCOMPARE(zero.error().code(), LedgerError::Validation);

        auto negative = m_store->insertAdjustment(userId, -15, "correction", m_clock.now());
        QVERIFY(negative.isOk());

        auto adjustments = m_store->listAdjustments(userId);
        QVERIFY(adjustments.isOk());
        QCOMPARE(adjustments.value().size(), 1);
        QCOMPARE(adjustments.value().first()->minutes(), -15);
        QCOMPARE(adjustments.value().first()->reason(), QString("correction"));
    }

    void testLogsNewestFirstAndCapped() {
        const qint64 userId = createUser("Alice");

        for (int i = 1; i <= 5; ++i) {
            m_clock.advance(60);
            auto entry = m_store->appendLog(userId, LedgerTypes::LogKind::Adjust, i,
                                            QString("entry %1").arg(i), m_clock.now());
            QVERIFY(entry.isOk());
        }

        auto logs = m_store->listLogs(userId, 3);
        QVERIFY(logs.isOk());
        QCOMPARE(logs.value().size(), 3);
        QCOMPARE(logs.value().at(0)->details(), QString("entry 5"));
        QCOMPARE(logs.value().at(2)->details(), QString("entry 3"));
        QCOMPARE(logs.value().at(0)->kind(), LedgerTypes::LogKind::Adjust);

        auto invalid = m_store->listLogs(userId, 0);
        QCOMPARE(invalid.error().code(), LedgerError::Validation);
    }

    void testStartLogCarriesNoMinutes() {
        const qint64 userId = createUser("Alice");

        auto bad = m_store->appendLog(userId, LedgerTypes::LogKind::Start, 5, "Started", m_clock.now());
        QVERIFY(!bad.isOk());
        QCOMPARE(bad.error().code(), LedgerError::Validation);

        auto good = m_store->appendLog(userId, LedgerTypes::LogKind::Start, std::nullopt, "Started", m_clock.now());
        QVERIFY(good.isOk());
        QVERIFY(!good.value()->minutes().has_value());
    }

    void testFailedTransactionRollsBack() {
        const qint64 userId = createUser("Alice");
        const qint64 revisionBefore = m_store->revision();

        LedgerError error = m_store->executeInTransaction([&]() -> LedgerError {
            auto session = m_store->insertSession(userId, m_clock.now());
            if (!session) {
                return session.error();
            }
            return LedgerError::validation("abort after insert");
        });

        QCOMPARE(error.code(), LedgerError::Validation);
        QCOMPARE(m_store->revision(), revisionBefore);

        auto active = m_store->activeSession(userId);
        QVERIFY(active.isOk());
        QVERIFY(!active.value());
    }

    void testCommittedTransactionBumpsRevision() {
        const qint64 userId = createUser("Alice");
        const qint64 revisionBefore = m_store->revision();

        LedgerError error = m_store->executeInTransaction([&]() -> LedgerError {
            auto adjustment = m_store->insertAdjustment(userId, 10, QString(), m_clock.now());
            return adjustment ? LedgerError() : adjustment.error();
        });

        QVERIFY(!error.isError());
        QCOMPARE(m_store->revision(), revisionBefore + 1);
    }

    void testTimestampsRoundTripInUtc() {
        const qint64 userId = createUser("Alice");
        const QDateTime local = QDateTime(QDate(2024, 7, 1), QTime(12, 0, 0), QTimeZone(7200));

        auto session = m_store->insertSession(userId, local);
        QVERIFY(session.isOk());

        auto active = m_store->activeSession(userId);
        QVERIFY(active.isOk());
        QCOMPARE(active.value()->startTime(), ManualClock::utc(2024, 7, 1, 10, 0, 0));
    }

    void testSchemaMetadata() {
        QCOMPARE(m_store->durationUnit(), QString("minutes"));
        QVERIFY(!m_store->requiresMigration());

        auto migrated = m_store->migrateLegacySeconds(QTimeZone::utc());
        QVERIFY(migrated.isOk());
        QCOMPARE(migrated.value(), 0);
    }

    void testClassifyDriverErrors() {
        QSqlError pgUnique("", "duplicate key value violates unique constraint", QSqlError::StatementError, "23505");
        QCOMPARE(LedgerStore::classifyError(pgUnique, "ctx").code(), LedgerError::Conflict);

        QSqlError sqliteUnique("", "UNIQUE constraint failed: users.name", QSqlError::StatementError, "2067");
        QCOMPARE(LedgerStore::classifyError(sqliteUnique, "ctx").code(), LedgerError::Conflict);

        QSqlError foreignKey("", "FOREIGN KEY constraint failed", QSqlError::StatementError, "787");
        QCOMPARE(LedgerStore::classifyError(foreignKey, "ctx").code(), LedgerError::NotFound);

        QSqlError busy("", "database is locked", QSqlError::StatementError, "5");
        LedgerError storage = LedgerStore::classifyError(busy, "ctx");
        QCOMPARE(storage.code(), LedgerError::Storage);
        QVERIFY(storage.isRetryable());
    }

private:
    qint64 createUser(const QString &name) {
        auto user = m_store->findOrCreateUser(name);
        if (!user) {
            qWarning() << "Cannot create user" << name << user.error().toString();
            return 0;
        }
        return user.value()->id();
    }

    QScopedPointer<QTemporaryDir> m_tempDir;
    std::unique_ptr<DbManager> m_db;
    std::unique_ptr<LedgerStore> m_store;
    ManualClock m_clock;
};

QTEST_GUILESS_MAIN(LedgerStoreTest)
#include "LedgerStoreTest.moc"
