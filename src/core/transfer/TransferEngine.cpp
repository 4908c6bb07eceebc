#include "TransferEngine.hpp"
#include "../common/Logger.hpp"
#include "../pipeline/OutputLayout.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRegularExpression>
#include <QtCore/QTimer>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace Episodic {

namespace {

enum class AttemptResult {
    Finished,
    RestartWithoutRange
};

struct TransferSession {
    QString url;
    QString destPath;
    QString partPath;
    QFile part;
    QByteArray buffer;
    qint64 written = 0;         // bytes on disk in the part file
    qint64 total = -1;
    qint64 resumedFrom = 0;
    bool restartedFromZero = false;
};

TransferError transferError(TransferError::Kind kind,
                            const QString& detail,
                            TransferError::UnreachableReason reason = TransferError::UnreachableReason::None,
                            int httpStatus = 0) {
    TransferError error;
    error.kind = kind;
    error.reason = reason;
    error.httpStatus = httpStatus;
    error.detail = detail;
    return error;
}

} // namespace

struct TransferEngine::TransferEnginePrivate {
    TransferEnginePrivate(ProgressStore& s,
                          const Config::TransferSettings& t,
                          const Config::NetworkSettings& n)
        : store(s), transfer(t), network(n) {}

    ProgressStore& store;
    Config::TransferSettings transfer;
    Config::NetworkSettings network;

    QNetworkRequest buildRequest(const QString& url, qint64 offset) const;
    Expected<void, TransferError> record(const TransferSession& session, bool completed);
    Expected<void, TransferError> flush(TransferSession& session, const TransferProgressCallback& progress);
    Expected<AttemptResult, TransferError> runAttempt(TransferSession& session,
                                                      qint64 offset,
                                                      const CancellationToken& cancellation,
                                                      const TransferProgressCallback& progress);
    Expected<TransferOutcome, TransferError> finalize(TransferSession& session);
};

TransferEngine::TransferEngine(ProgressStore& store,
                               const Config::TransferSettings& transferSettings,
                               const Config::NetworkSettings& networkSettings)
    : d(std::make_unique<TransferEnginePrivate>(store, transferSettings, networkSettings)) {
    if (d->transfer.chunkSize <= 0) {
        d->transfer.chunkSize = Config::TransferSettings().chunkSize;
    }
}

TransferEngine::~TransferEngine() = default;

Config::TransferSettings TransferEngine::transferSettings() const {
    return d->transfer;
}

Expected<TransferOutcome, TransferError> TransferEngine::transfer(
    const QString& url,
    const QString& destPath,
    qint64 resumeFrom,
    const CancellationToken& cancellation,
    const TransferProgressCallback& progress) {

    const QUrl parsedUrl(url);
    if (!parsedUrl.isValid() || (parsedUrl.scheme() != "http" && parsedUrl.scheme() != "https")) {
        return makeUnexpected(transferError(TransferError::Kind::Unreachable,
            QString("invalid URL '%1'").arg(url), TransferError::UnreachableReason::Network));
    }

    if (cancellation.isCancelled()) {
        return makeUnexpected(transferError(TransferError::Kind::Cancelled, "cancelled before start"));
    }

    TransferSession session;
    session.url = url;
    session.destPath = QFileInfo(destPath).absoluteFilePath();
    session.partPath = OutputLayout::partFilePath(session.destPath);

    const QString directory = QFileInfo(session.destPath).absolutePath();
    if (!QDir().mkpath(directory)) {
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("cannot create directory %1").arg(directory)));
    }

    session.part.setFileName(session.partPath);
    if (!session.part.open(QIODevice::ReadWrite)) {
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("cannot open %1: %2").arg(session.partPath, session.part.errorString())));
    }

    // Reconcile the part file with the requested offset
    qint64 offset = qMax<qint64>(0, resumeFrom);
    const auto stored = d->store.load(session.destPath);
    if (stored && stored->hasKnownTotal()) {
        session.total = stored->totalSize;
        if (offset > session.total) {
            Logger::instance().warn("TransferEngine: offset {} beyond known size {} of {}, starting over",
                                    offset, session.total, session.destPath.toStdString());
            offset = 0;
        }
    }

    const qint64 partSize = session.part.size();
    if (partSize < offset) {
        Logger::instance().warn("TransferEngine: part file {} holds {} bytes, lowering offset from {}",
                                session.partPath.toStdString(), partSize, offset);
        offset = partSize;
    }
    if (partSize != offset && !session.part.resize(offset)) {
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("cannot truncate %1: %2").arg(session.partPath, session.part.errorString())));
    }
    if (!session.part.seek(offset)) {
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("cannot seek %1").arg(session.partPath)));
    }

    session.written = offset;
    session.resumedFrom = offset;

    auto recorded = d->record(session, false);
    if (recorded.hasError()) {
        return makeUnexpected(recorded.error());
    }

    // Every byte already arrived before the rename
    if (session.total > 0 && offset == session.total) {
        Logger::instance().info("TransferEngine: {} already holds all {} bytes",
                                session.partPath.toStdString(), session.total);
        return d->finalize(session);
    }

    if (offset > 0) {
        Logger::instance().info("TransferEngine: resuming {} at byte {}", session.destPath.toStdString(), offset);
    }

    for (int pass = 0; pass < 2; ++pass) {
        auto attempt = d->runAttempt(session, offset, cancellation, progress);
        if (attempt.hasError()) {
            session.part.close();
            return makeUnexpected(attempt.error());
        }
        if (attempt.value() == AttemptResult::Finished) {
            return d->finalize(session);
        }

        Logger::instance().warn("TransferEngine: range answer for {} does not continue the part file, "
                                "restarting without Range", session.destPath.toStdString());
        if (!session.part.resize(0) || !session.part.seek(0)) {
            session.part.close();
            return makeUnexpected(transferError(TransferError::Kind::IOFailure,
                QString("cannot truncate %1").arg(session.partPath)));
        }
        session.written = 0;
        session.total = -1;
        session.restartedFromZero = true;
        offset = 0;
    }

    session.part.close();
    return makeUnexpected(transferError(TransferError::Kind::RangeNotSupported,
        "server did not serve the requested range"));
}

QNetworkRequest TransferEngine::TransferEnginePrivate::buildRequest(const QString& url, qint64 offset) const {
    QNetworkRequest request{QUrl(url)};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", network.userAgent.toUtf8());
    request.setRawHeader("Referer", network.referer.toUtf8());
    request.setRawHeader("Accept", "*/*");
    // Content-Length must describe the bytes written to disk
    request.setRawHeader("Accept-Encoding", "identity");
    request.setTransferTimeout(network.inactivityTimeoutSeconds * 1000);

    if (offset > 0) {
        request.setRawHeader("Range", QString("bytes=%1-").arg(offset).toUtf8());
    }
    return request;
}

Expected<void, TransferError> TransferEngine::TransferEnginePrivate::record(const TransferSession& session,
                                                                            bool completed) {
    auto updated = store.update(session.destPath, session.written, completed,
                                session.total >= 0 ? session.total : ProgressStore::KeepTotal);
    if (updated.hasError()) {
        Logger::instance().error("TransferEngine: progress store rejected {}: {}",
                                 session.destPath.toStdString(), describe(updated.error()).toStdString());
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("progress store: %1").arg(describe(updated.error()))));
    }
    return {};
}

Expected<void, TransferError> TransferEngine::TransferEnginePrivate::flush(TransferSession& session,
                                                                           const TransferProgressCallback& progress) {
    if (session.buffer.isEmpty()) {
        return {};
    }

    const qint64 expected = session.buffer.size();
    const qint64 written = session.part.write(session.buffer);
    session.buffer.clear();

    if (written != expected || !session.part.flush()) {
        if (written > 0) {
            session.written += written;
        }
        Logger::instance().error("TransferEngine: write to {} failed: {}",
                                 session.partPath.toStdString(), session.part.errorString().toStdString());
        auto recorded = record(session, false);
        if (recorded.hasError()) {
            Logger::instance().warn("TransferEngine: could not record partial write for {}",
                                    session.destPath.toStdString());
        }
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("write to %1 failed: %2").arg(session.partPath, session.part.errorString())));
    }

    session.written += written;
    auto recorded = record(session, false);
    if (recorded.hasError()) {
        return recorded;
    }

    Logger::instance().trace("TransferEngine: {} {}/{} bytes", session.destPath.toStdString(),
                             session.written, session.total);
    if (progress) {
        progress(session.written, session.total);
    }
    return {};
}

Expected<AttemptResult, TransferError> TransferEngine::TransferEnginePrivate::runAttempt(
    TransferSession& session,
    qint64 offset,
    const CancellationToken& cancellation,
    const TransferProgressCallback& progress) {

    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(manager.get(buildRequest(session.url, offset)));

    QEventLoop loop;
    std::optional<TransferError> failure;
    bool headersChecked = false;
    bool restartWithoutRange = false;
    bool cancelled = false;

    auto fail = [&](const TransferError& error) {
        if (!failure) {
            failure = error;
        }
        if (!reply->isFinished()) {
            reply->abort();
        }
    };

    auto checkHeaders = [&]() {
        if (headersChecked) {
            return;
        }
        const QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (!statusAttribute.isValid()) {
            return;
        }
        headersChecked = true;
        const int status = statusAttribute.toInt();

        if (status == 206) {
            const auto range = parseContentRange(reply->rawHeader("Content-Range"));
            if (!range || range->start != offset) {
                if (!transfer.restartWhenRangeIgnored) {
                    fail(transferError(TransferError::Kind::RangeNotSupported,
                        QString("requested byte %1, got Content-Range '%2'")
                            .arg(offset).arg(QString::fromLatin1(reply->rawHeader("Content-Range"))),
                        TransferError::UnreachableReason::None, status));
                    return;
                }
                restartWithoutRange = true;
                reply->abort();
                return;
            }
            // A different total means the part file holds a prefix of another version
            if (range->total >= 0 && session.total >= 0 && range->total != session.total) {
                Logger::instance().warn("TransferEngine: {} is now {} bytes, part file was started for {}",
                                        session.destPath.toStdString(), range->total, session.total);
                if (!transfer.restartWhenRangeIgnored) {
                    fail(transferError(TransferError::Kind::SizeMismatch,
                        QString("resource is now %1 bytes, part file was started for %2")
                            .arg(range->total).arg(session.total),
                        TransferError::UnreachableReason::None, status));
                    return;
                }
                restartWithoutRange = true;
                reply->abort();
                return;
            }
            if (range->total >= 0) {
                session.total = range->total;
            }
        } else if (status == 200) {
            if (offset > 0) {
                if (!transfer.restartWhenRangeIgnored) {
                    fail(transferError(TransferError::Kind::RangeNotSupported,
                        QString("server ignored Range for byte %1").arg(offset),
                        TransferError::UnreachableReason::None, status));
                    return;
                }
                Logger::instance().warn("TransferEngine: server ignored Range for {}, restarting from zero",
                                        session.destPath.toStdString());
                if (!session.part.resize(0) || !session.part.seek(0)) {
                    fail(transferError(TransferError::Kind::IOFailure,
                        QString("cannot truncate %1").arg(session.partPath)));
                    return;
                }
                session.written = 0;
                session.restartedFromZero = true;
            }
            const QVariant length = reply->header(QNetworkRequest::ContentLengthHeader);
            session.total = length.isValid() ? length.toLongLong() : -1;
        } else if (status == 416 && offset > 0) {
            fail(transferError(TransferError::Kind::RangeNotSupported,
                QString("range from byte %1 not satisfiable").arg(offset),
                TransferError::UnreachableReason::None, status));
            return;
        } else {
            fail(errorForHttpStatus(status, session.url));
            return;
        }

        Logger::instance().debug("TransferEngine: HTTP {} for {}, total {}", status,
                                 session.destPath.toStdString(), session.total);
        auto recorded = record(session, false);
        if (recorded.hasError()) {
            fail(recorded.error());
        }
    };

    QObject::connect(reply.get(), &QNetworkReply::readyRead, &loop, [&]() {
        checkHeaders();
        if (failure || restartWithoutRange || cancelled) {
            return;
        }

        session.buffer.append(reply->readAll());
        if (session.total >= 0 && session.written + session.buffer.size() > session.total) {
            fail(transferError(TransferError::Kind::SizeMismatch,
                QString("server sent more than the announced %1 bytes").arg(session.total)));
            return;
        }

        if (session.buffer.size() >= transfer.chunkSize) {
            auto flushed = flush(session, progress);
            if (flushed.hasError()) {
                fail(flushed.error());
                return;
            }
            if (cancellation.isCancelled()) {
                cancelled = true;
                reply->abort();
            }
        }
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer cancelPoll;
    cancelPoll.setInterval(100);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
        if (cancellation.isCancelled() && !reply->isFinished()) {
            cancelled = true;
            reply->abort();
        }
    });
    cancelPoll.start();

    if (!reply->isFinished()) {
        loop.exec();
    }
    cancelPoll.stop();

    if (!failure && !restartWithoutRange && !cancelled) {
        checkHeaders();
        if (!failure && !restartWithoutRange) {
            session.buffer.append(reply->readAll());
        }
    }

    if (restartWithoutRange) {
        session.buffer.clear();
        return AttemptResult::RestartWithoutRange;
    }

    // Already received bytes are kept for the next resume
    if (session.total >= 0 && session.written + session.buffer.size() > session.total) {
        session.buffer.truncate(static_cast<int>(qMax<qint64>(0, session.total - session.written)));
    }
    auto flushed = flush(session, progress);
    if (flushed.hasError() && !failure) {
        failure = flushed.error();
    }

    if (failure) {
        Logger::instance().error("TransferEngine: {} failed: {}", session.destPath.toStdString(),
                                 describe(*failure).toStdString());
        return makeUnexpected(*failure);
    }

    if (cancelled) {
        Logger::instance().info("TransferEngine: {} cancelled at byte {}", session.destPath.toStdString(),
                                session.written);
        return makeUnexpected(transferError(TransferError::Kind::Cancelled,
            QString("cancelled at byte %1").arg(session.written)));
    }

    if (reply->error() != QNetworkReply::NoError) {
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status >= 400) {
            return makeUnexpected(errorForHttpStatus(status, session.url));
        }
        Logger::instance().error("TransferEngine: network error for {} at byte {}: {}",
                                 session.destPath.toStdString(), session.written,
                                 reply->errorString().toStdString());
        return makeUnexpected(transferError(TransferError::Kind::Unreachable, reply->errorString(),
                                            TransferError::UnreachableReason::Network));
    }

    return AttemptResult::Finished;
}

Expected<TransferOutcome, TransferError> TransferEngine::TransferEnginePrivate::finalize(TransferSession& session) {
    session.part.close();

    if (session.total >= 0 && session.written != session.total) {
        Logger::instance().error("TransferEngine: {} has {} bytes, expected {}",
                                 session.partPath.toStdString(), session.written, session.total);
        return makeUnexpected(transferError(TransferError::Kind::SizeMismatch,
            QString("received %1 of %2 bytes").arg(session.written).arg(session.total)));
    }
    if (session.total < 0) {
        session.total = session.written;
    }

    if (QFile::exists(session.destPath) && !QFile::remove(session.destPath)) {
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("cannot replace %1").arg(session.destPath)));
    }
    if (!QFile::rename(session.partPath, session.destPath)) {
        return makeUnexpected(transferError(TransferError::Kind::IOFailure,
            QString("cannot rename %1 to %2").arg(session.partPath, session.destPath)));
    }

    auto recorded = record(session, true);
    if (recorded.hasError()) {
        return makeUnexpected(recorded.error());
    }

    TransferOutcome outcome;
    outcome.destPath = session.destPath;
    outcome.resumedFrom = session.restartedFromZero ? 0 : session.resumedFrom;
    outcome.bytesWritten = session.restartedFromZero ? session.written : session.written - session.resumedFrom;
    outcome.totalSize = session.total;
    outcome.restartedFromZero = session.restartedFromZero;

    Logger::instance().info("TransferEngine: completed {} ({} bytes, {} this run)",
                            session.destPath.toStdString(), session.total, outcome.bytesWritten);
    return outcome;
}

std::optional<ContentRange> TransferEngine::parseContentRange(const QByteArray& header) {
    static const QRegularExpression pattern(
        "^\\s*bytes\\s+(\\d+)-(\\d+)/(\\d+|\\*)\\s*$", QRegularExpression::CaseInsensitiveOption);

    const auto match = pattern.match(QString::fromLatin1(header));
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ContentRange range;
    range.start = match.captured(1).toLongLong();
    range.end = match.captured(2).toLongLong();
    range.total = match.captured(3) == "*" ? -1 : match.captured(3).toLongLong();
    if (range.end < range.start || (range.total >= 0 && range.end >= range.total)) {
        return std::nullopt;
    }
    return range;
}

TransferError TransferEngine::errorForHttpStatus(int status, const QString& url) {
    TransferError::UnreachableReason reason = TransferError::UnreachableReason::HttpStatus;
    if (status == 401 || status == 403 || status == 410) {
        reason = TransferError::UnreachableReason::UrlExpired;
    } else if (status == 404) {
        reason = TransferError::UnreachableReason::NotFound;
    }

    Logger::instance().warn("TransferEngine: HTTP {} for {} ({})", status, url.toStdString(),
                            toString(reason).toStdString());
    return transferError(TransferError::Kind::Unreachable,
                         QString("HTTP %1 for %2").arg(status).arg(QUrl(url).path()),
                         reason, status);
}

} // namespace Episodic
