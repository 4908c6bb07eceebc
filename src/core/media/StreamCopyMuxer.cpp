#include "StreamCopyMuxer.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>

namespace Episodic {

FFmpegProcessMuxer::FFmpegProcessMuxer(const Config::MergeSettings& settings)
    : executable_(locateFfmpeg(settings.ffmpegPath))
    , timeoutSeconds_(settings.mergeTimeoutSeconds) {
    if (executable_.isEmpty()) {
        Logger::instance().warn("FFmpegProcessMuxer: ffmpeg executable not found");
    } else {
        Logger::instance().debug("FFmpegProcessMuxer: using {}", executable_.toStdString());
    }
}

QStringList FFmpegProcessMuxer::buildArguments(const QString& manifestPath, const QString& outputPath) {
    QStringList arguments;
    arguments << "-hide_banner"
              << "-nostats"
              << "-progress" << "pipe:1"
              << "-f" << "concat"
              << "-safe" << "0"       // manifest holds absolute paths
              << "-i" << manifestPath
              << "-c" << "copy"       // no re-encode
              << "-y" << outputPath;
    return arguments;
}

std::optional<qint64> FFmpegProcessMuxer::parseProgressTime(const QByteArray& line) {
    const int separator = line.indexOf('=');
    if (separator < 0) {
        return std::nullopt;
    }
    // out_time_ms carries microseconds as well
    const QByteArray key = line.left(separator).trimmed();
    if (key != "out_time_us" && key != "out_time_ms") {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 value = line.mid(separator + 1).trimmed().toLongLong(&ok);
    if (!ok || value < 0) {
        return std::nullopt;
    }
    return value;
}

QString FFmpegProcessMuxer::locateFfmpeg(const QString& configuredPath) {
    if (!configuredPath.isEmpty()) {
        const QFileInfo configured(configuredPath);
        if (configured.isFile() && configured.isExecutable()) {
            return configured.absoluteFilePath();
        }
        Logger::instance().warn("FFmpegProcessMuxer: configured ffmpeg '{}' is not executable",
                                configuredPath.toStdString());
    }

    const QString onPath = QStandardPaths::findExecutable("ffmpeg");
    if (!onPath.isEmpty()) {
        return onPath;
    }

    const QStringList commonLocations = {
        "/usr/local/bin/ffmpeg",
        "/usr/bin/ffmpeg",
        "/opt/homebrew/bin/ffmpeg",
        "C:/ffmpeg/bin/ffmpeg.exe",
        "C:/Program Files/ffmpeg/bin/ffmpeg.exe"
    };
    for (const QString& location : commonLocations) {
        if (QFileInfo(location).isExecutable()) {
            return location;
        }
    }
    return QString();
}

Expected<void, MergeError> FFmpegProcessMuxer::concatenate(const QString& manifestPath,
                                                          const QString& outputPath,
                                                          qint64 totalDurationUs,
                                                          const CancellationToken& cancellation,
                                                          const MergeProgressCallback& progress) {
    if (executable_.isEmpty()) {
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            "ffmpeg not found; install it or set merge/ffmpeg_path", manifestPath});
    }

    const QStringList arguments = buildArguments(manifestPath, outputPath);
    Logger::instance().info("FFmpegProcessMuxer: {} {}", executable_.toStdString(),
                            arguments.join(' ').toStdString());

    QProcess ffmpeg;
    ffmpeg.start(executable_, arguments);

    if (!ffmpeg.waitForStarted()) {
        Logger::instance().error("FFmpegProcessMuxer: failed to start {}: {}",
                                 executable_.toStdString(), ffmpeg.errorString().toStdString());
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            QString("cannot start ffmpeg: %1").arg(ffmpeg.errorString()), manifestPath});
    }

    double reported = 0.0;
    auto readProgress = [&]() {
        while (ffmpeg.canReadLine()) {
            const QByteArray line = ffmpeg.readLine().trimmed();
            double fraction = reported;
            if (line == "progress=end") {
                fraction = 1.0;
            } else if (const auto outTime = parseProgressTime(line)) {
                if (totalDurationUs > 0) {
                    fraction = qBound(0.0, double(*outTime) / double(totalDurationUs), 1.0);
                }
            }
            if (fraction > reported) {
                reported = fraction;
                if (progress) {
                    progress(fraction);
                }
            }
        }
    };

    QElapsedTimer elapsed;
    elapsed.start();
    while (!ffmpeg.waitForFinished(200)) {
        readProgress();
        if (cancellation.isCancelled()) {
            ffmpeg.kill();
            ffmpeg.waitForFinished();
            Logger::instance().info("FFmpegProcessMuxer: merge cancelled");
            return makeUnexpected(MergeError{MergeError::Kind::Cancelled, "ffmpeg killed on cancel", manifestPath});
        }
        if (timeoutSeconds_ > 0 && elapsed.elapsed() > qint64(timeoutSeconds_) * 1000) {
            ffmpeg.kill();
            ffmpeg.waitForFinished();
            Logger::instance().error("FFmpegProcessMuxer: ffmpeg timed out after {} s", timeoutSeconds_);
            return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
                QString("ffmpeg timed out after %1 s").arg(timeoutSeconds_), manifestPath});
        }
        if (ffmpeg.state() == QProcess::NotRunning) {
            break;
        }
    }

    readProgress();

    const QString errorOutput = QString::fromUtf8(ffmpeg.readAllStandardError()).trimmed();
    if (ffmpeg.exitStatus() != QProcess::NormalExit || ffmpeg.exitCode() != 0) {
        Logger::instance().error("FFmpegProcessMuxer: ffmpeg exited with {}: {}",
                                 ffmpeg.exitCode(), errorOutput.right(2000).toStdString());
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            QString("ffmpeg exited with code %1: %2").arg(ffmpeg.exitCode()).arg(errorOutput.right(500)),
            manifestPath});
    }

    const QFileInfo output(outputPath);
    if (!output.exists() || output.size() == 0) {
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            QString("ffmpeg reported success but %1 is missing or empty").arg(outputPath), manifestPath});
    }

    Logger::instance().info("FFmpegProcessMuxer: wrote {} ({} bytes)", outputPath.toStdString(), output.size());
    return {};
}

} // namespace Episodic
