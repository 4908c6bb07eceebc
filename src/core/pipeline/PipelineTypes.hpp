#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QDateTime>
#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QMetaType>
#include <optional>

#include "../common/Errors.hpp"

namespace Episodic {

// Result of resolving a series page. Media URLs expire after an unstated time.
struct SeriesInfo {
    int seriesId = 0;
    QString title;
    QString pageUrl;
    std::optional<QString> posterUrl;
    int totalEpisodes = 0;
    QMap<int, QString> episodeUrls;     // 1-based episode number -> media URL
};

struct EpisodeTask {
    int episode = 0;
    QString sourceUrl;
    QString destPath;
    bool selected = true;
};

// Durable per-episode record owned by a ProgressStore.
struct TransferState {
    QString destPath;
    qint64 totalSize = -1;              // -1 while unknown
    qint64 bytesReceived = 0;
    bool completed = false;
    QDateTime lastUpdated;

    bool hasKnownTotal() const { return totalSize >= 0; }
};

// Series context stored beside the TransferState table.
struct SessionRecord {
    int seriesId = 0;
    QString title;
    QString pageUrl;
    QString selection;

    bool isEmpty() const { return seriesId == 0 && pageUrl.isEmpty(); }
};

struct TransferOutcome {
    QString destPath;
    qint64 resumedFrom = 0;
    qint64 bytesWritten = 0;            // written during this call
    qint64 totalSize = -1;
    bool restartedFromZero = false;     // server ignored the requested range
};

struct MergePlan {
    QStringList orderedPaths;           // ascending episode number
    QString outputPath;
};

struct MergeOutcome {
    QString outputPath;
    int inputCount = 0;
    qint64 outputSize = 0;
};

enum class PipelineState {
    Idle,
    Resolving,
    Selecting,
    Transferring,
    Merging,
    Done,
    Failed
};

enum class EpisodeState {
    Pending,
    Downloading,
    Completed,
    AlreadyDone,
    Failed,
    Cancelled
};

struct EpisodeReport {
    int episode = 0;
    QString destPath;
    EpisodeState state = EpisodeState::Pending;
    int attempts = 0;
    qint64 bytesTotal = -1;
    std::optional<TransferError> error;

    bool succeeded() const {
        return state == EpisodeState::Completed || state == EpisodeState::AlreadyDone;
    }
};

struct PipelineRequest {
    QString pageUrl;
    QString selection = "all";
    QString outputDirectory = "./output";
    bool mergeEnabled = true;
    bool resume = true;
    bool listOnly = false;
    bool mergeOnly = false;
    bool cleanupAfterMerge = false;
    int parallelism = 0;                // 0 = configured default
};

struct PipelineReport {
    int resolvedEpisodeCount = 0;
    QString seriesTitle;
    QList<int> selectedEpisodes;
    QList<EpisodeReport> episodes;
    bool mergeAttempted = false;
    QString mergeSkippedReason;
    std::optional<MergeOutcome> mergeOutcome;
    std::optional<MergeError> mergeError;

    int succeededCount() const;
    int failedCount() const;
    bool allEpisodesSucceeded() const { return failedCount() == 0; }
};

// Run-level failure: the stage that aborted and why.
struct PipelineFailure {
    PipelineState stage = PipelineState::Failed;
    std::optional<ResolutionError> resolution;
    std::optional<SelectionError> selection;
    std::optional<StoreError> store;
    std::optional<MergeError> merge;
    bool cancelled = false;

    QString describe() const;
};

QString toString(PipelineState state);
QString toString(EpisodeState state);

} // namespace Episodic

Q_DECLARE_METATYPE(Episodic::PipelineState)
Q_DECLARE_METATYPE(Episodic::EpisodeState)
