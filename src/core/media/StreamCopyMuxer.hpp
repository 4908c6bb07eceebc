#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <functional>
#include <optional>

#include "../common/CancellationToken.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/Expected.hpp"

namespace Episodic {

// Fraction of the merged output written so far, 0..1, reported on the muxing thread.
using MergeProgressCallback = std::function<void(double fraction)>;

/**
 * @brief Concatenates the files of a concat manifest into one container without re-encoding
 *
 * Success means the output file exists and is non-empty. Implementations do
 * not remove the output on failure; Merger owns that cleanup.
 */
class StreamCopyMuxer {
public:
    virtual ~StreamCopyMuxer() = default;

    // totalDurationUs is the summed duration of the inputs, 0 when unknown.
    virtual Expected<void, MergeError> concatenate(const QString& manifestPath,
                                                   const QString& outputPath,
                                                   qint64 totalDurationUs,
                                                   const CancellationToken& cancellation,
                                                   const MergeProgressCallback& progress) = 0;
};

// Runs `ffmpeg -f concat -safe 0 -i <manifest> -c copy -y <output>` through QProcess and
// follows the key=value lines ffmpeg writes to stdout with -progress.
class FFmpegProcessMuxer : public StreamCopyMuxer {
public:
    explicit FFmpegProcessMuxer(const Config::MergeSettings& settings = Config::MergeSettings());

    Expected<void, MergeError> concatenate(const QString& manifestPath,
                                           const QString& outputPath,
                                           qint64 totalDurationUs,
                                           const CancellationToken& cancellation,
                                           const MergeProgressCallback& progress) override;

    // Empty when no ffmpeg executable was found.
    QString executable() const { return executable_; }
    bool isAvailable() const { return !executable_.isEmpty(); }

    static QStringList buildArguments(const QString& manifestPath, const QString& outputPath);

    // Output position in microseconds from an "out_time_us=" or "out_time_ms=" progress line.
    static std::optional<qint64> parseProgressTime(const QByteArray& line);

    // Configured path, then PATH, then common install locations.
    static QString locateFfmpeg(const QString& configuredPath = QString());

private:
    QString executable_;
    int timeoutSeconds_;
};

} // namespace Episodic
