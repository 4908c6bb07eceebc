#include <QtTest/QtTest>
#include <QtCore/QUrlQuery>
#include "utils/TestHttpServer.hpp"
#include "utils/TestUtils.hpp"
#include "../src/core/resolver/SeriesResolver.hpp"

using namespace Episodic;
using namespace Episodic::Test;

class TestSeriesResolver : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testResolvesSeriesPage();
    void testAcceptsAllPageUrlForms();
    void testSendsBrowserHeaders();
    void testCachesBySeriesId();
    void testForceRefreshRefetches();
    void testInvalidPageUrl();
    void testHttpErrorIsPageUnreachable();
    void testConnectionRefusedIsPageUnreachable();
    void testPageWithoutPayload();
    void testCancelledBeforeFetch();
    void testPageUrlForKeepsBaseQuery();

private:
    Config::NetworkSettings settings() const;
    QMap<int, QString> episodeUrls(int count) const;

    std::unique_ptr<TestHttpServer> server_;
};

void TestSeriesResolver::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestSeriesResolver::cleanupTestCase() {
    TestUtils::cleanupTestEnvironment();
}

void TestSeriesResolver::init() {
    server_ = std::make_unique<TestHttpServer>();
    QVERIFY(server_->start());
}

void TestSeriesResolver::cleanup() {
    server_.reset();
}

Config::NetworkSettings TestSeriesResolver::settings() const {
    Config::NetworkSettings network;
    network.baseUrl = server_->url("/watch/");
    network.requestTimeoutSeconds = 5;
    return network;
}

QMap<int, QString> TestSeriesResolver::episodeUrls(int count) const {
    QMap<int, QString> urls;
    for (int episode = 1; episode <= count; ++episode) {
        urls.insert(episode, QString("https://cdn.example.com/media/941/EP%1.mp4?sig=%2")
                                 .arg(episode, 2, 10, QChar('0'))
                                 .arg(episode * 7));
    }
    return urls;
}

void TestSeriesResolver::testResolvesSeriesPage() {
    TEST_SCOPE("testResolvesSeriesPage");
    server_->setResource("/watch/", TestUtils::createSeriesPageHtml("Rain Over Bangkok", episodeUrls(5)).toUtf8(),
                         "text/html; charset=utf-8");

    SeriesResolver resolver(settings());
    auto result = resolver.resolve("https://rongyok.com/watch/?series_id=941");
    ASSERT_EXPECTED_VALUE(result);

    const SeriesInfo& info = result.value();
    QCOMPARE(info.seriesId, 941);
    QCOMPARE(info.title, QString("Rain Over Bangkok"));
    QCOMPARE(info.totalEpisodes, 5);
    QCOMPARE(info.episodeUrls.size(), 5);
    QCOMPARE(info.episodeUrls.value(2), QString("https://cdn.example.com/media/941/EP02.mp4?sig=14"));
    QVERIFY(info.posterUrl.has_value());
    QVERIFY(info.pageUrl.contains("series_id=941"));

    QCOMPARE(server_->requestCount("/watch/"), 1);
    QVERIFY(server_->requestedPaths().first().endsWith("?series_id=941"));
}

void TestSeriesResolver::testAcceptsAllPageUrlForms() {
    TEST_SCOPE("testAcceptsAllPageUrlForms");
    server_->setResource("/watch/?series_id=12", TestUtils::createSeriesPageHtml("Twelve", episodeUrls(2)).toUtf8());
    server_->setResource("/watch/?series_id=34", TestUtils::createSeriesPageHtml("Thirty Four", episodeUrls(3)).toUtf8());

    SeriesResolver resolver(settings());

    auto byPath = resolver.resolve("https://rongyok.com/series/12/twelve");
    ASSERT_EXPECTED_VALUE(byPath);
    QCOMPARE(byPath.value().title, QString("Twelve"));

    auto byId = resolver.resolve("34");
    ASSERT_EXPECTED_VALUE(byId);
    QCOMPARE(byId.value().title, QString("Thirty Four"));
    QCOMPARE(byId.value().episodeUrls.size(), 3);
}

void TestSeriesResolver::testSendsBrowserHeaders() {
    server_->setResource("/watch/", TestUtils::createSeriesPageHtml("Headers", episodeUrls(1)).toUtf8());

    Config::NetworkSettings network = settings();
    network.userAgent = "EpisodicTest/1.0";
    network.referer = "https://rongyok.com/";
    SeriesResolver resolver(network);

    auto result = resolver.resolve("941");
    ASSERT_EXPECTED_VALUE(result);

    QCOMPARE(server_->lastHeader("/watch/", "User-Agent"), QByteArray("EpisodicTest/1.0"));
    QCOMPARE(server_->lastHeader("/watch/", "Referer"), QByteArray("https://rongyok.com/"));
    QVERIFY(server_->lastHeader("/watch/", "Accept-Language").startsWith("th"));
}

void TestSeriesResolver::testCachesBySeriesId() {
    server_->setResource("/watch/", TestUtils::createSeriesPageHtml("Cached", episodeUrls(3)).toUtf8());

    SeriesResolver resolver(settings());
    QVERIFY(!resolver.isCached(941));

    auto first = resolver.resolve("https://rongyok.com/watch/?series_id=941");
    ASSERT_EXPECTED_VALUE(first);
    QVERIFY(resolver.isCached(941));

    // Same id through another URL form
    auto second = resolver.resolve("https://rongyok.com/series/941");
    ASSERT_EXPECTED_VALUE(second);
    QCOMPARE(second.value().episodeUrls, first.value().episodeUrls);
    QCOMPARE(server_->requestCount("/watch/"), 1);

    resolver.clearCache();
    QVERIFY(!resolver.isCached(941));
}

void TestSeriesResolver::testForceRefreshRefetches() {
    server_->setResource("/watch/", TestUtils::createSeriesPageHtml("Refresh", episodeUrls(2)).toUtf8());

    SeriesResolver resolver(settings());
    auto first = resolver.resolve("941");
    ASSERT_EXPECTED_VALUE(first);
    QCOMPARE(first.value().episodeUrls.size(), 2);

    // Fresh signed URLs on the page
    server_->setResource("/watch/", TestUtils::createSeriesPageHtml("Refresh", episodeUrls(4)).toUtf8());
    auto cached = resolver.resolve("941");
    ASSERT_EXPECTED_VALUE(cached);
    QCOMPARE(cached.value().episodeUrls.size(), 2);

    auto refreshed = resolver.resolve("941", true);
    ASSERT_EXPECTED_VALUE(refreshed);
    QCOMPARE(refreshed.value().episodeUrls.size(), 4);
    QCOMPARE(server_->requestCount("/watch/"), 2);
}

void TestSeriesResolver::testInvalidPageUrl() {
    SeriesResolver resolver(settings());

    auto result = resolver.resolve("https://rongyok.com/about");
    ASSERT_EXPECTED_ERROR(result, ResolutionError::Kind::InvalidPageUrl);

    auto empty = resolver.resolve(QString());
    ASSERT_EXPECTED_ERROR(empty, ResolutionError::Kind::InvalidPageUrl);

    QCOMPARE(server_->requestCount(), 0);
}

void TestSeriesResolver::testHttpErrorIsPageUnreachable() {
    TestHttpServer::Resource unavailable;
    unavailable.status = 503;
    server_->setResource("/watch/", unavailable);

    SeriesResolver resolver(settings());
    auto result = resolver.resolve("941");
    ASSERT_EXPECTED_ERROR(result, ResolutionError::Kind::PageUnreachable);
    QVERIFY(result.error().detail.contains("503"));
    QVERIFY(!resolver.isCached(941));

    // No resource registered at all
    server_->removeResource("/watch/");
    auto missing = resolver.resolve("941");
    ASSERT_EXPECTED_ERROR(missing, ResolutionError::Kind::PageUnreachable);
    QVERIFY(missing.error().detail.contains("404"));
}

void TestSeriesResolver::testConnectionRefusedIsPageUnreachable() {
    const Config::NetworkSettings network = settings();
    server_->stop();

    SeriesResolver resolver(network);
    auto result = resolver.resolve("941");
    ASSERT_EXPECTED_ERROR(result, ResolutionError::Kind::PageUnreachable);
}

void TestSeriesResolver::testPageWithoutPayload() {
    server_->setResource("/watch/", QByteArray("<html><head><title>Empty</title></head>"
                                               "<body><script>var x = 1;</script></body></html>"),
                         "text/html");

    SeriesResolver resolver(settings());
    auto result = resolver.resolve("941");
    ASSERT_EXPECTED_ERROR(result, ResolutionError::Kind::PayloadNotFound);
    QVERIFY(!resolver.isCached(941));
}

void TestSeriesResolver::testCancelledBeforeFetch() {
    server_->setResource("/watch/", TestUtils::createSeriesPageHtml("Cancelled", episodeUrls(1)).toUtf8());

    SeriesResolver resolver(settings());
    CancellationToken token;
    token.cancel();
    resolver.setCancellationToken(token);

    auto result = resolver.resolve("941");
    ASSERT_EXPECTED_ERROR(result, ResolutionError::Kind::Cancelled);
    QCOMPARE(server_->requestCount(), 0);
}

void TestSeriesResolver::testPageUrlForKeepsBaseQuery() {
    Config::NetworkSettings network;
    network.baseUrl = "https://rongyok.com/watch/?lang=th&series_id=1";
    SeriesResolver resolver(network);

    const QUrl url = resolver.pageUrlFor(941);
    const QUrlQuery query(url);
    QCOMPARE(url.path(), QString("/watch/"));
    QCOMPARE(query.queryItemValue("lang"), QString("th"));
    QCOMPARE(query.allQueryItemValues("series_id"), QStringList({"941"}));
}

int runTestSeriesResolver(int argc, char** argv) {
    TestSeriesResolver test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_series_resolver.moc"
