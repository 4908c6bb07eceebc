#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <functional>
#include <memory>
#include <optional>

#include "../common/CancellationToken.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/Expected.hpp"
#include "../pipeline/PipelineTypes.hpp"
#include "../storage/ProgressStore.hpp"

namespace Episodic {

using TransferProgressCallback = std::function<void(qint64 bytesReceived, qint64 bytesTotal)>;

// Parsed "Content-Range: bytes <start>-<end>/<total>" header.
struct ContentRange {
    qint64 start = 0;
    qint64 end = 0;
    qint64 total = -1;      // -1 for "*"
};

/**
 * @brief Resumable HTTP download of one media file
 *
 * Bytes go to "<destPath>.part" and the part file is renamed to destPath only
 * once the received size matches the announced total. Progress is committed to
 * the ProgressStore after every buffered chunk, so an interrupted transfer can
 * continue with a Range request from the last committed offset.
 *
 * transfer() blocks the calling thread on a local event loop and uses its own
 * QNetworkAccessManager, so one engine may serve several pool threads at once.
 */
class TransferEngine {
public:
    explicit TransferEngine(ProgressStore& store,
                            const Config::TransferSettings& transferSettings = Config::TransferSettings(),
                            const Config::NetworkSettings& networkSettings = Config::NetworkSettings());
    ~TransferEngine();

    /**
     * @brief Downloads url to destPath starting at byte resumeFrom
     * @param resumeFrom Offset to request; 0 starts fresh. Reconciled against the part file.
     * @param cancellation Checked at chunk boundaries and by a poll timer
     * @param progress Called with (bytesReceived, bytesTotal) after each chunk, on the calling thread
     */
    Expected<TransferOutcome, TransferError> transfer(
        const QString& url,
        const QString& destPath,
        qint64 resumeFrom,
        const CancellationToken& cancellation = CancellationToken(),
        const TransferProgressCallback& progress = nullptr
    );

    Config::TransferSettings transferSettings() const;

    static std::optional<ContentRange> parseContentRange(const QByteArray& header);

    // 401/403/410 mean the signed URL expired, 404 is NotFound, anything else HttpStatus.
    static TransferError errorForHttpStatus(int status, const QString& url);

private:
    struct TransferEnginePrivate;
    std::unique_ptr<TransferEnginePrivate> d;
};

} // namespace Episodic
