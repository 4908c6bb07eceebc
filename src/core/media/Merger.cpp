#include "Merger.hpp"
#include "../common/Logger.hpp"
#include "../pipeline/OutputLayout.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace Episodic {

Merger::Merger(StreamCopyMuxer& muxer, StreamProbe& probe)
    : muxer_(muxer)
    , probe_(probe) {
}

Expected<MergeOutcome, MergeError> Merger::merge(const MergePlan& plan,
                                                 const CancellationToken& cancellation,
                                                 const MergeProgressCallback& progress) {
    return merge(plan.orderedPaths, plan.outputPath, cancellation, progress);
}

Expected<MergeOutcome, MergeError> Merger::merge(const QStringList& orderedPaths,
                                                 const QString& outputPath,
                                                 const CancellationToken& cancellation,
                                                 const MergeProgressCallback& progress) {
    auto inputs = checkInputs(orderedPaths);
    if (inputs.hasError()) {
        return makeUnexpected(inputs.error());
    }

    auto compatible = checkCompatibility(orderedPaths);
    if (compatible.hasError()) {
        return makeUnexpected(compatible.error());
    }

    if (cancellation.isCancelled()) {
        return makeUnexpected(MergeError{MergeError::Kind::Cancelled, "cancelled before muxing", QString()});
    }

    const QString output = QFileInfo(outputPath).absoluteFilePath();
    const QString manifestPath = OutputLayout::manifestPathFor(output);
    if (!QDir().mkpath(QFileInfo(output).absolutePath())) {
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            QString("cannot create directory for %1").arg(output), QString()});
    }

    auto written = ConcatManifest::write(orderedPaths, manifestPath, pathStyle_);
    if (written.hasError()) {
        return makeUnexpected(written.error());
    }

    Logger::instance().info("Merger: concatenating {} files into {}", orderedPaths.size(), output.toStdString());
    auto muxed = muxer_.concatenate(manifestPath, output, compatible.value(), cancellation, progress);
    if (muxed.hasError()) {
        MergeError error = muxed.error();
        if (QFile::exists(output) && !QFile::remove(output)) {
            Logger::instance().warn("Merger: could not remove partial output {}", output.toStdString());
        }
        if (error.kind == MergeError::Kind::Cancelled) {
            if (!QFile::remove(manifestPath)) {
                Logger::instance().warn("Merger: could not remove manifest {}", manifestPath.toStdString());
            }
            error.manifestPath.clear();
        } else {
            error.manifestPath = manifestPath;
            Logger::instance().error("Merger: {}; manifest kept at {}",
                                     describe(error).toStdString(), manifestPath.toStdString());
        }
        return makeUnexpected(error);
    }

    if (!QFile::remove(manifestPath)) {
        Logger::instance().warn("Merger: could not remove manifest {}", manifestPath.toStdString());
    }

    MergeOutcome outcome;
    outcome.outputPath = output;
    outcome.inputCount = orderedPaths.size();
    outcome.outputSize = QFileInfo(output).size();
    Logger::instance().info("Merger: {} written ({} bytes)", output.toStdString(), outcome.outputSize);
    return outcome;
}

Expected<void, MergeError> Merger::checkInputs(const QStringList& orderedPaths) {
    if (orderedPaths.isEmpty()) {
        return makeUnexpected(MergeError{MergeError::Kind::InputMissing, "no input files", QString()});
    }

    for (const QString& path : orderedPaths) {
        const QFileInfo info(path);
        if (!info.isFile()) {
            Logger::instance().error("Merger: input {} does not exist", path.toStdString());
            return makeUnexpected(MergeError{MergeError::Kind::InputMissing,
                QString("%1 does not exist").arg(path), QString()});
        }
        if (info.size() == 0) {
            return makeUnexpected(MergeError{MergeError::Kind::InputMissing,
                QString("%1 is empty").arg(path), QString()});
        }
    }
    return {};
}

Expected<qint64, MergeError> Merger::checkCompatibility(const QStringList& orderedPaths) {
    auto reference = probe_.probe(orderedPaths.first());
    if (reference.hasError()) {
        return makeUnexpected(reference.error());
    }

    qint64 totalDurationUs = reference.value().durationUs;
    bool durationKnown = totalDurationUs > 0;

    for (int i = 1; i < orderedPaths.size(); ++i) {
        auto signature = probe_.probe(orderedPaths.at(i));
        if (signature.hasError()) {
            return makeUnexpected(signature.error());
        }
        if (signature.value() != reference.value()) {
            const QString detail = QString("%1 (%2) differs from %3 (%4)")
                .arg(QFileInfo(orderedPaths.at(i)).fileName(), signature.value().describe(),
                     QFileInfo(orderedPaths.first()).fileName(), reference.value().describe());
            Logger::instance().error("Merger: {}", detail.toStdString());
            return makeUnexpected(MergeError{MergeError::Kind::FormatIncompatible, detail, QString()});
        }
        durationKnown = durationKnown && signature.value().durationUs > 0;
        totalDurationUs += signature.value().durationUs;
    }

    if (!durationKnown) {
        Logger::instance().debug("Merger: input durations unknown, merge progress limited to completion");
        return qint64(0);
    }
    return totalDurationUs;
}

} // namespace Episodic
