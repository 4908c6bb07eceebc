#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "ConcatManifest.hpp"
#include "StreamCopyMuxer.hpp"
#include "StreamProbe.hpp"
#include "../common/CancellationToken.hpp"
#include "../common/Errors.hpp"
#include "../common/Expected.hpp"
#include "../pipeline/PipelineTypes.hpp"

namespace Episodic {

/**
 * @brief Lossless concatenation of completed episode files
 *
 * Checks that every input exists and shares the codec parameters of the first
 * one, writes the concat manifest next to the output and hands it to the
 * muxer. A failed mux keeps the manifest for diagnosis and removes whatever
 * partial output was produced.
 */
class Merger {
public:
    Merger(StreamCopyMuxer& muxer, StreamProbe& probe);

    // progress receives the muxed fraction; it only advances past 0 when every input reports a duration
    Expected<MergeOutcome, MergeError> merge(const QStringList& orderedPaths,
                                             const QString& outputPath,
                                             const CancellationToken& cancellation = CancellationToken(),
                                             const MergeProgressCallback& progress = nullptr);

    Expected<MergeOutcome, MergeError> merge(const MergePlan& plan,
                                             const CancellationToken& cancellation = CancellationToken(),
                                             const MergeProgressCallback& progress = nullptr);

    void setPathStyle(PathStyle style) { pathStyle_ = style; }
    PathStyle pathStyle() const { return pathStyle_; }

private:
    Expected<void, MergeError> checkInputs(const QStringList& orderedPaths);
    // Summed input duration in microseconds, 0 if any input has none
    Expected<qint64, MergeError> checkCompatibility(const QStringList& orderedPaths);

    StreamCopyMuxer& muxer_;
    StreamProbe& probe_;
    PathStyle pathStyle_ = ConcatManifest::nativeStyle();
};

} // namespace Episodic
