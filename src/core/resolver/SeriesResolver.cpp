#include "SeriesResolver.hpp"
#include "ScriptPayloadExtractor.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QTimer>
#include <QtCore/QUrlQuery>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace Episodic {

struct SeriesResolver::SeriesResolverPrivate {
    Config::NetworkSettings settings;
    CancellationToken cancellation;

    mutable QMutex cacheMutex;
    QHash<int, SeriesInfo> cache;
};

SeriesResolver::SeriesResolver(const Config::NetworkSettings& settings)
    : d(std::make_unique<SeriesResolverPrivate>()) {
    d->settings = settings;
}

SeriesResolver::~SeriesResolver() = default;

Expected<SeriesInfo, ResolutionError> SeriesResolver::resolve(const QString& pageUrl, bool forceRefresh) {
    const auto seriesId = ScriptPayloadExtractor::parseSeriesId(pageUrl);
    if (!seriesId) {
        Logger::instance().error("SeriesResolver: cannot find a series id in '{}'", pageUrl.toStdString());
        return makeUnexpected(ResolutionError{ResolutionError::Kind::InvalidPageUrl,
            QString("no series id in '%1'").arg(pageUrl)});
    }

    if (!forceRefresh) {
        QMutexLocker locker(&d->cacheMutex);
        auto it = d->cache.constFind(*seriesId);
        if (it != d->cache.constEnd()) {
            Logger::instance().debug("SeriesResolver: series {} served from cache", *seriesId);
            return it.value();
        }
    }

    const QUrl url = pageUrlFor(*seriesId);
    auto page = fetchPage(url);
    if (page.hasError()) {
        return makeUnexpected(page.error());
    }

    auto info = parsePage(*seriesId, url.toString(), page.value());
    if (info.hasError()) {
        Logger::instance().error("SeriesResolver: series {}: {}", *seriesId, describe(info.error()).toStdString());
        return info;
    }

    Logger::instance().info("SeriesResolver: '{}' has {} episode URLs (declared total {})",
                            info.value().title.toStdString(),
                            info.value().episodeUrls.size(),
                            info.value().totalEpisodes);

    QMutexLocker locker(&d->cacheMutex);
    d->cache.insert(*seriesId, info.value());
    return info;
}

Expected<SeriesInfo, ResolutionError> SeriesResolver::parsePage(int seriesId,
                                                                const QString& pageUrl,
                                                                const QString& html) {
    auto episodes = ScriptPayloadExtractor::extract(html);
    if (episodes.hasError()) {
        return makeUnexpected(episodes.error());
    }

    SeriesInfo info;
    info.seriesId = seriesId;
    info.pageUrl = pageUrl;
    info.title = ScriptPayloadExtractor::extractTitle(html, seriesId);
    info.posterUrl = ScriptPayloadExtractor::extractPosterUrl(html);
    info.episodeUrls = episodes.value();
    info.totalEpisodes = qMax(info.episodeUrls.lastKey(),
                              ScriptPayloadExtractor::extractDeclaredEpisodeCount(html));
    return info;
}

QUrl SeriesResolver::pageUrlFor(int seriesId) const {
    QUrl url(d->settings.baseUrl);
    QUrlQuery query(url);
    query.removeAllQueryItems("series_id");
    query.addQueryItem("series_id", QString::number(seriesId));
    url.setQuery(query);
    return url;
}

void SeriesResolver::setCancellationToken(const CancellationToken& token) {
    d->cancellation = token;
}

bool SeriesResolver::isCached(int seriesId) const {
    QMutexLocker locker(&d->cacheMutex);
    return d->cache.contains(seriesId);
}

void SeriesResolver::clearCache() {
    QMutexLocker locker(&d->cacheMutex);
    d->cache.clear();
}

Expected<QString, ResolutionError> SeriesResolver::fetchPage(const QUrl& url) {
    if (d->cancellation.isCancelled()) {
        return makeUnexpected(ResolutionError{ResolutionError::Kind::Cancelled, "cancelled before fetch"});
    }

    // Local manager: resolve() may run on a pool thread
    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", d->settings.userAgent.toUtf8());
    request.setRawHeader("Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8");
    request.setRawHeader("Accept-Language", d->settings.acceptLanguage.toUtf8());
    request.setRawHeader("Referer", d->settings.referer.toUtf8());

    Logger::instance().info("SeriesResolver: fetching {}", url.toString().toStdString());
    std::unique_ptr<QNetworkReply> reply(manager.get(request));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(d->settings.requestTimeoutSeconds * 1000);

    bool cancelled = false;
    QTimer cancelPoll;
    cancelPoll.setInterval(100);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
        if (d->cancellation.isCancelled()) {
            cancelled = true;
            loop.quit();
        }
    });
    cancelPoll.start();

    loop.exec();
    cancelPoll.stop();

    if (!reply->isFinished()) {
        reply->abort();
        if (cancelled) {
            Logger::instance().info("SeriesResolver: fetch of {} cancelled", url.toString().toStdString());
            return makeUnexpected(ResolutionError{ResolutionError::Kind::Cancelled, "fetch aborted"});
        }
        Logger::instance().error("SeriesResolver: timeout fetching {}", url.toString().toStdString());
        return makeUnexpected(ResolutionError{ResolutionError::Kind::PageUnreachable,
            QString("timed out after %1 s").arg(d->settings.requestTimeoutSeconds)});
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError) {
        Logger::instance().error("SeriesResolver: {} failed (HTTP {}): {}",
                                 url.toString().toStdString(), status, reply->errorString().toStdString());
        const QString detail = status > 0
            ? QString("HTTP %1").arg(status)
            : reply->errorString();
        return makeUnexpected(ResolutionError{ResolutionError::Kind::PageUnreachable, detail});
    }

    return QString::fromUtf8(reply->readAll());
}

} // namespace Episodic
