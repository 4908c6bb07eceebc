#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include <atomic>
#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

using namespace Episodic;
using namespace Episodic::Test;

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testLevelFiltersMessages();
    void testReinitializeWhileLogging();

private:
    QString logDirectory_;
};

void TestLogger::initTestCase() {
    TestUtils::initializeTestEnvironment();
    logDirectory_ = TestUtils::createTempDirectory("logger");
}

void TestLogger::cleanupTestCase() {
    // Back to the runner's log for the remaining suites
    Logger::instance().initialize("episodic-tests.log", Logger::Level::Trace);
    TestUtils::cleanupTempDirectory(logDirectory_);
    TestUtils::cleanupTestEnvironment();
}

void TestLogger::testLevelFiltersMessages() {
    const QString logFile = QDir(logDirectory_).filePath("levels.log");
    Logger::instance().initialize(logFile.toStdString(), Logger::Level::Warn);

    EPISODIC_INFO("below threshold {}", 1);
    EPISODIC_WARN("at threshold {}", 2);

    // Warnings flush the file sink
    const QByteArray written = TestUtils::readFile(logFile);
    QVERIFY(written.contains("at threshold 2"));
    QVERIFY(!written.contains("below threshold 1"));
}

void TestLogger::testReinitializeWhileLogging() {
    constexpr int workers = 4;
    std::atomic<bool> stop{false};
    std::atomic<int> logged{0};

    Logger::instance().initialize(QDir(logDirectory_).filePath("swap_0.log").toStdString(), Logger::Level::Warn);

    QList<QFuture<void>> futures;
    for (int worker = 0; worker < workers; ++worker) {
        futures << QtConcurrent::run([&stop, &logged, worker]() {
            while (!stop.load()) {
                // Filtered by level, but still goes through the shared logger
                Logger::instance().debug("worker {} message {}", worker, logged.load());
                ++logged;
            }
        });
    }

    for (int round = 1; round <= 20; ++round) {
        if (round % 5 == 0) {
            Logger::instance().initializeConsoleOnly(Logger::Level::Warn);
        } else {
            Logger::instance().initialize(
                QDir(logDirectory_).filePath(QString("swap_%1.log").arg(round)).toStdString(), Logger::Level::Warn);
        }
        QTest::qWait(2);
    }

    const QString finalLog = QDir(logDirectory_).filePath("swap_final.log");
    Logger::instance().initialize(finalLog.toStdString(), Logger::Level::Warn);
    stop = true;
    for (QFuture<void>& future : futures) {
        future.waitForFinished();
    }

    QVERIFY(logged.load() > 0);
    for (int worker = 0; worker < workers; ++worker) {
        EPISODIC_WARN("worker {} stopped", worker);
    }
    const QByteArray written = TestUtils::readFile(finalLog);
    for (int worker = 0; worker < workers; ++worker) {
        QVERIFY(written.contains(QString("worker %1 stopped").arg(worker).toUtf8()));
    }
}

int runTestLogger(int argc, char** argv) {
    TestLogger test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_logger.moc"
