#include <QtTest/QtTest>
#include "utils/TestHttpServer.hpp"
#include "utils/TestUtils.hpp"
#include "../src/core/pipeline/OutputLayout.hpp"
#include "../src/core/storage/ProgressStore.hpp"
#include "../src/core/transfer/TransferEngine.hpp"

Q_DECLARE_METATYPE(Episodic::TransferError::UnreachableReason)

using namespace Episodic;
using namespace Episodic::Test;

class TestTransferEngine : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // Downloads
    void testFreshDownload();
    void testSendsTransferHeaders();
    void testOffsetBeyondPartFileStartsOver();
    void testResumeAfterConnectionDrop();
    void testServerIgnoringRangeRestartsFromZero();
    void testServerIgnoringRangeWithoutRestart();
    void testRangeAnsweredAtAnotherOffsetRestarts();
    void testChangedTotalRestartsFromZero();
    void testChangedTotalWithoutRestart();
    void testCompletePartFileIsFinalizedWithoutRequest();
    void testReplacesExistingDestination();

    // Failures
    void testHttpStatusMapping_data();
    void testHttpStatusMapping();
    void testUnsatisfiableRange();
    void testShortRangedBodyIsSizeMismatch();
    void testBodyPastRecordedTotalIsSizeMismatch();
    void testInvalidUrl();
    void testCancelledBeforeStart();
    void testCancelDuringTransferKeepsPartFile();

    // Helpers
    void testParseContentRange_data();
    void testParseContentRange();

private:
    Config::TransferSettings smallChunks() const;
    QString destination(const QString& fileName) const;

    std::unique_ptr<TestHttpServer> server_;
    std::unique_ptr<MemoryProgressStore> store_;
    QString workDir_;
    QByteArray media_;
};

void TestTransferEngine::initTestCase() {
    TestUtils::initializeTestEnvironment();
    media_ = TestUtils::generateRandomData(96 * 1024, 7);
}

void TestTransferEngine::cleanupTestCase() {
    TestUtils::cleanupTestEnvironment();
}

void TestTransferEngine::init() {
    server_ = std::make_unique<TestHttpServer>();
    QVERIFY(server_->start());
    server_->setResource("/media/EP01.mp4", media_, "video/mp4");
    store_ = std::make_unique<MemoryProgressStore>();
    workDir_ = TestUtils::createTempDirectory("transfer");
}

void TestTransferEngine::cleanup() {
    server_.reset();
    store_.reset();
    TestUtils::cleanupTempDirectory(workDir_);
}

Config::TransferSettings TestTransferEngine::smallChunks() const {
    Config::TransferSettings settings;
    settings.chunkSize = 4096;
    return settings;
}

QString TestTransferEngine::destination(const QString& fileName) const {
    return QDir(workDir_).filePath(fileName);
}

void TestTransferEngine::testFreshDownload() {
    TransferEngine engine(*store_, smallChunks());
    const QString dest = destination("ep_01.mp4");

    QList<qint64> reported;
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 0, CancellationToken(),
                                  [&reported](qint64 received, qint64 total) {
                                      Q_UNUSED(total);
                                      reported << received;
                                  });
    ASSERT_EXPECTED_VALUE(result);

    const TransferOutcome& outcome = result.value();
    QCOMPARE(outcome.resumedFrom, qint64(0));
    QCOMPARE(outcome.bytesWritten, qint64(media_.size()));
    QCOMPARE(outcome.totalSize, qint64(media_.size()));
    QVERIFY(!outcome.restartedFromZero);

    QCOMPARE(TestUtils::readFile(dest), media_);
    ASSERT_FILE_NOT_EXISTS(OutputLayout::partFilePath(dest));

    const auto state = store_->load(dest);
    QVERIFY(state.has_value());
    QVERIFY(state->completed);
    QCOMPARE(state->bytesReceived, qint64(media_.size()));

    // Progress is monotonic and ends at the total
    QVERIFY(!reported.isEmpty());
    for (int i = 1; i < reported.size(); ++i) {
        QVERIFY(reported.at(i) > reported.at(i - 1));
    }
    QCOMPARE(reported.last(), qint64(media_.size()));
    QVERIFY(server_->lastRangeHeader("/media/EP01.mp4").isEmpty());
}

void TestTransferEngine::testSendsTransferHeaders() {
    Config::NetworkSettings network;
    network.userAgent = "EpisodicTest/2.0";
    network.referer = "https://rongyok.com/watch/?series_id=941";
    TransferEngine engine(*store_, smallChunks(), network);

    auto result = engine.transfer(server_->url("/media/EP01.mp4"), destination("ep_01.mp4"), 0);
    ASSERT_EXPECTED_VALUE(result);

    QCOMPARE(server_->lastHeader("/media/EP01.mp4", "User-Agent"), QByteArray("EpisodicTest/2.0"));
    QCOMPARE(server_->lastHeader("/media/EP01.mp4", "Referer"),
             QByteArray("https://rongyok.com/watch/?series_id=941"));
    QCOMPARE(server_->lastHeader("/media/EP01.mp4", "Accept-Encoding"), QByteArray("identity"));
}

void TestTransferEngine::testOffsetBeyondPartFileStartsOver() {
    TransferEngine engine(*store_, smallChunks());
    const QString dest = destination("ep_01.mp4");

    // No part file on disk, so the offset cannot be honoured
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 5000);
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(result.value().resumedFrom, qint64(0));
    QVERIFY(server_->lastRangeHeader("/media/EP01.mp4").isEmpty());
    QCOMPARE(TestUtils::readFile(dest), media_);
}

void TestTransferEngine::testResumeAfterConnectionDrop() {
    TestHttpServer::Resource flaky;
    flaky.body = media_;
    flaky.contentType = "video/mp4";
    flaky.dropAfterBytes = 40000;
    server_->setResource("/media/EP01.mp4", flaky);

    TransferEngine engine(*store_, smallChunks());
    const QString dest = destination("ep_01.mp4");
    const QString part = OutputLayout::partFilePath(dest);

    auto first = engine.transfer(server_->url("/media/EP01.mp4"), dest, 0);
    ASSERT_EXPECTED_ERROR(first, TransferError::Kind::Unreachable);
    QCOMPARE(first.error().reason, TransferError::UnreachableReason::Network);

    // Every received byte was kept and recorded
    ASSERT_FILE_EXISTS(part);
    ASSERT_FILE_NOT_EXISTS(dest);
    const auto interrupted = store_->load(dest);
    QVERIFY(interrupted.has_value());
    QVERIFY(!interrupted->completed);
    QCOMPARE(interrupted->totalSize, qint64(media_.size()));
    const qint64 received = interrupted->bytesReceived;
    QVERIFY(received > 0);
    QVERIFY(received <= 40000);
    QCOMPARE(QFileInfo(part).size(), received);
    QCOMPARE(TestUtils::readFile(part), media_.left(static_cast<int>(received)));

    auto second = engine.transfer(server_->url("/media/EP01.mp4"), dest, received);
    ASSERT_EXPECTED_VALUE(second);
    QCOMPARE(second.value().resumedFrom, received);
    QCOMPARE(second.value().bytesWritten, qint64(media_.size()) - received);
    QCOMPARE(server_->lastRangeHeader("/media/EP01.mp4"), QString("bytes=%1-").arg(received).toLatin1());

    QCOMPARE(TestUtils::readFile(dest), media_);
    ASSERT_FILE_NOT_EXISTS(part);
    QVERIFY(store_->load(dest)->completed);
}

void TestTransferEngine::testServerIgnoringRangeRestartsFromZero() {
    TestHttpServer::Resource noRanges;
    noRanges.body = media_;
    noRanges.honorRange = false;
    server_->setResource("/media/EP01.mp4", noRanges);

    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_.left(10000));
    ASSERT_EXPECTED_VALUE(store_->update(dest, 10000, false, media_.size()));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 10000);
    ASSERT_EXPECTED_VALUE(result);

    QVERIFY(result.value().restartedFromZero);
    QCOMPARE(result.value().resumedFrom, qint64(0));
    QCOMPARE(result.value().bytesWritten, qint64(media_.size()));
    QCOMPARE(server_->lastRangeHeader("/media/EP01.mp4"), QByteArray("bytes=10000-"));
    QCOMPARE(TestUtils::readFile(dest), media_);
}

void TestTransferEngine::testServerIgnoringRangeWithoutRestart() {
    TestHttpServer::Resource noRanges;
    noRanges.body = media_;
    noRanges.honorRange = false;
    server_->setResource("/media/EP01.mp4", noRanges);

    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_.left(10000));

    Config::TransferSettings settings = smallChunks();
    settings.restartWhenRangeIgnored = false;
    TransferEngine engine(*store_, settings);

    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 10000);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::RangeNotSupported);

    // The partial data is left for a later attempt
    QCOMPARE(TestUtils::readFile(OutputLayout::partFilePath(dest)), media_.left(10000));
}

void TestTransferEngine::testRangeAnsweredAtAnotherOffsetRestarts() {
    TestHttpServer::Resource shifted;
    shifted.body = media_;
    shifted.rangeStartShift = -4096;
    server_->setResource("/media/EP01.mp4", shifted);

    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_.left(10000));
    ASSERT_EXPECTED_VALUE(store_->update(dest, 10000, false, media_.size()));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 10000);
    ASSERT_EXPECTED_VALUE(result);

    // First request asked for the range, the retry went without one
    QCOMPARE(server_->requestCount("/media/EP01.mp4"), 2);
    QVERIFY(server_->lastRangeHeader("/media/EP01.mp4").isEmpty());
    QVERIFY(result.value().restartedFromZero);
    QCOMPARE(result.value().bytesWritten, qint64(media_.size()));
    QCOMPARE(TestUtils::readFile(dest), media_);
}

void TestTransferEngine::testChangedTotalRestartsFromZero() {
    const QByteArray original = media_.left(50000);
    const QByteArray replacement = TestUtils::generateRandomData(60000, 99);

    TestHttpServer::Resource flaky;
    flaky.body = original;
    flaky.dropAfterBytes = 20000;
    server_->setResource("/media/EP01.mp4", flaky);

    TransferEngine engine(*store_, smallChunks());
    const QString dest = destination("ep_01.mp4");

    auto first = engine.transfer(server_->url("/media/EP01.mp4"), dest, 0);
    ASSERT_EXPECTED_ERROR(first, TransferError::Kind::Unreachable);
    const auto interrupted = store_->load(dest);
    QVERIFY(interrupted.has_value());
    QCOMPARE(interrupted->totalSize, qint64(original.size()));
    const qint64 received = interrupted->bytesReceived;
    QVERIFY(received > 0);

    // The file was replaced upstream; the server still honours the range
    server_->setResource("/media/EP01.mp4", replacement);

    auto second = engine.transfer(server_->url("/media/EP01.mp4"), dest, received);
    ASSERT_EXPECTED_VALUE(second);
    QVERIFY(second.value().restartedFromZero);
    QCOMPARE(second.value().totalSize, qint64(replacement.size()));
    QCOMPARE(server_->requestCount("/media/EP01.mp4"), 3);
    QVERIFY(server_->lastRangeHeader("/media/EP01.mp4").isEmpty());

    QCOMPARE(TestUtils::readFile(dest), replacement);
    QCOMPARE(store_->load(dest)->totalSize, qint64(replacement.size()));
}

void TestTransferEngine::testChangedTotalWithoutRestart() {
    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_.left(10000));
    ASSERT_EXPECTED_VALUE(store_->update(dest, 10000, false, 50000));

    Config::TransferSettings settings = smallChunks();
    settings.restartWhenRangeIgnored = false;
    TransferEngine engine(*store_, settings);

    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 10000);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::SizeMismatch);
    QCOMPARE(result.error().httpStatus, 206);
    QVERIFY(result.error().detail.contains(QString::number(media_.size())));

    QCOMPARE(server_->requestCount("/media/EP01.mp4"), 1);
    QCOMPARE(TestUtils::readFile(OutputLayout::partFilePath(dest)), media_.left(10000));
    ASSERT_FILE_NOT_EXISTS(dest);
}

void TestTransferEngine::testCompletePartFileIsFinalizedWithoutRequest() {
    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_);
    ASSERT_EXPECTED_VALUE(store_->update(dest, media_.size(), false, media_.size()));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, media_.size());
    ASSERT_EXPECTED_VALUE(result);

    QCOMPARE(result.value().bytesWritten, qint64(0));
    QCOMPARE(server_->requestCount(), 0);
    QCOMPARE(TestUtils::readFile(dest), media_);
    QVERIFY(store_->load(dest)->completed);
}

void TestTransferEngine::testReplacesExistingDestination() {
    const QString dest = TestUtils::createTestFile(workDir_, "ep_01.mp4", QByteArray("stale"));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 0);
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(TestUtils::readFile(dest), media_);
}

void TestTransferEngine::testHttpStatusMapping_data() {
    QTest::addColumn<int>("status");
    QTest::addColumn<TransferError::UnreachableReason>("reason");

    QTest::newRow("403") << 403 << TransferError::UnreachableReason::UrlExpired;
    QTest::newRow("410") << 410 << TransferError::UnreachableReason::UrlExpired;
    QTest::newRow("404") << 404 << TransferError::UnreachableReason::NotFound;
    QTest::newRow("500") << 500 << TransferError::UnreachableReason::HttpStatus;
    QTest::newRow("503") << 503 << TransferError::UnreachableReason::HttpStatus;
}

void TestTransferEngine::testHttpStatusMapping() {
    QFETCH(int, status);
    QFETCH(TransferError::UnreachableReason, reason);

    TestHttpServer::Resource failing;
    failing.status = status;
    server_->setResource("/media/EP01.mp4", failing);

    const QString dest = destination("ep_01.mp4");
    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 0);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::Unreachable);
    QCOMPARE(result.error().reason, reason);
    QCOMPARE(result.error().httpStatus, status);
    ASSERT_FILE_NOT_EXISTS(dest);

    // The static mapping agrees with what the engine reported
    const TransferError mapped = TransferEngine::errorForHttpStatus(status, server_->url("/media/EP01.mp4"));
    QCOMPARE(mapped.kind, TransferError::Kind::Unreachable);
    QCOMPARE(mapped.reason, reason);
    QVERIFY(mapped.detail.contains(QString::number(status)));
}

void TestTransferEngine::testUnsatisfiableRange() {
    server_->setResource("/media/short.mp4", media_.left(100));

    const QString dest = destination("ep_02.mp4");
    TestUtils::createTestFile(workDir_, "ep_02.mp4.part", media_.left(200));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/short.mp4"), dest, 200);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::RangeNotSupported);
    QCOMPARE(result.error().httpStatus, 416);
}

void TestTransferEngine::testShortRangedBodyIsSizeMismatch() {
    TestHttpServer::Resource shortBody;
    shortBody.body = media_;
    shortBody.rangedBodyLimit = 30000;
    server_->setResource("/media/EP01.mp4", shortBody);

    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_.left(10000));
    ASSERT_EXPECTED_VALUE(store_->update(dest, 10000, false, media_.size()));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 10000);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::SizeMismatch);

    // The response closed cleanly, so what arrived is kept for a resume
    ASSERT_FILE_NOT_EXISTS(dest);
    const QString part = OutputLayout::partFilePath(dest);
    QCOMPARE(TestUtils::readFile(part), media_.left(40000));
    const auto state = store_->load(dest);
    QVERIFY(state.has_value());
    QVERIFY(!state->completed);
    QCOMPARE(state->bytesReceived, qint64(40000));
    QCOMPARE(state->totalSize, qint64(media_.size()));
}

void TestTransferEngine::testBodyPastRecordedTotalIsSizeMismatch() {
    TestHttpServer::Resource unknownTotal;
    unknownTotal.body = media_;
    unknownTotal.hideRangeTotal = true;
    server_->setResource("/media/EP01.mp4", unknownTotal);

    const QString dest = destination("ep_01.mp4");
    TestUtils::createTestFile(workDir_, "ep_01.mp4.part", media_.left(10000));
    ASSERT_EXPECTED_VALUE(store_->update(dest, 10000, false, 50000));

    TransferEngine engine(*store_, smallChunks());
    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 10000);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::SizeMismatch);

    ASSERT_FILE_NOT_EXISTS(dest);
    const qint64 partSize = QFileInfo(OutputLayout::partFilePath(dest)).size();
    QVERIFY(partSize <= 50000);
    QVERIFY(store_->load(dest)->bytesReceived <= 50000);
}

void TestTransferEngine::testInvalidUrl() {
    TransferEngine engine(*store_, smallChunks());

    auto result = engine.transfer("ftp://cdn.example.com/EP01.mp4", destination("ep_01.mp4"), 0);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::Unreachable);
    QCOMPARE(server_->requestCount(), 0);
    QVERIFY(!store_->load(destination("ep_01.mp4")).has_value());
}

void TestTransferEngine::testCancelledBeforeStart() {
    TransferEngine engine(*store_, smallChunks());
    CancellationToken token;
    token.cancel();

    auto result = engine.transfer(server_->url("/media/EP01.mp4"), destination("ep_01.mp4"), 0, token);
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::Cancelled);
    QCOMPARE(server_->requestCount(), 0);
}

void TestTransferEngine::testCancelDuringTransferKeepsPartFile() {
    server_->setThrottle(4096, 5);

    TransferEngine engine(*store_, smallChunks());
    const QString dest = destination("ep_01.mp4");
    CancellationToken token;

    auto result = engine.transfer(server_->url("/media/EP01.mp4"), dest, 0, token,
                                  [&token](qint64 received, qint64) {
                                      if (received >= 16384) {
                                          token.cancel();
                                      }
                                  });
    ASSERT_EXPECTED_ERROR(result, TransferError::Kind::Cancelled);

    const QString part = OutputLayout::partFilePath(dest);
    ASSERT_FILE_EXISTS(part);
    ASSERT_FILE_NOT_EXISTS(dest);

    const auto state = store_->load(dest);
    QVERIFY(state.has_value());
    QVERIFY(!state->completed);
    QVERIFY(state->bytesReceived >= 16384);
    QVERIFY(state->bytesReceived < media_.size());
    QCOMPARE(QFileInfo(part).size(), state->bytesReceived);
    QCOMPARE(TestUtils::readFile(part), media_.left(static_cast<int>(state->bytesReceived)));
}

void TestTransferEngine::testParseContentRange_data() {
    QTest::addColumn<QByteArray>("header");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<qint64>("start");
    QTest::addColumn<qint64>("end");
    QTest::addColumn<qint64>("total");

    QTest::newRow("full") << QByteArray("bytes 0-99/100") << true << qint64(0) << qint64(99) << qint64(100);
    QTest::newRow("resume") << QByteArray("bytes 4096-8191/8192") << true << qint64(4096) << qint64(8191) << qint64(8192);
    QTest::newRow("unknown total") << QByteArray("bytes 10-19/*") << true << qint64(10) << qint64(19) << qint64(-1);
    QTest::newRow("case and spaces") << QByteArray("  Bytes 1-2/3 ") << true << qint64(1) << qint64(2) << qint64(3);
    QTest::newRow("unsatisfied") << QByteArray("bytes */100") << false << qint64(0) << qint64(0) << qint64(0);
    QTest::newRow("end before start") << QByteArray("bytes 50-10/100") << false << qint64(0) << qint64(0) << qint64(0);
    QTest::newRow("end past total") << QByteArray("bytes 0-100/100") << false << qint64(0) << qint64(0) << qint64(0);
    QTest::newRow("wrong unit") << QByteArray("items 0-1/2") << false << qint64(0) << qint64(0) << qint64(0);
    QTest::newRow("empty") << QByteArray() << false << qint64(0) << qint64(0) << qint64(0);
}

void TestTransferEngine::testParseContentRange() {
    QFETCH(QByteArray, header);
    QFETCH(bool, valid);
    QFETCH(qint64, start);
    QFETCH(qint64, end);
    QFETCH(qint64, total);

    const auto range = TransferEngine::parseContentRange(header);
    QCOMPARE(range.has_value(), valid);
    if (valid) {
        QCOMPARE(range->start, start);
        QCOMPARE(range->end, end);
        QCOMPARE(range->total, total);
    }
}

int runTestTransferEngine(int argc, char** argv) {
    TestTransferEngine test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_transfer_engine.moc"
