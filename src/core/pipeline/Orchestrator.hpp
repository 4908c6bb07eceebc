#pragma once

#include <QtCore/QObject>
#include <QtCore/QList>
#include <QtCore/QString>
#include <memory>

#include "PipelineTypes.hpp"
#include "../common/CancellationToken.hpp"
#include "../common/Expected.hpp"
#include "../common/RetryManager.hpp"

namespace Episodic {

class SeriesResolver;
class TransferEngine;
class ProgressStore;
class Merger;

/**
 * @brief Drives resolve -> select -> transfer -> merge for one request
 *
 * run() blocks until the request is finished but keeps the calling thread's
 * event loop turning, so progress signals queued from the transfer workers
 * reach receivers living on that thread while the run is in progress.
 *
 * Resolution, selection and store failures abort the run. Failed episodes are
 * collected in the report; merging is skipped unless every selected episode
 * completed. A failed merge is reported, not propagated.
 */
class Orchestrator : public QObject {
    Q_OBJECT

public:
    Orchestrator(SeriesResolver& resolver,
                 TransferEngine& engine,
                 ProgressStore& store,
                 Merger& merger,
                 QObject* parent = nullptr);
    ~Orchestrator() override;

    Expected<PipelineReport, PipelineFailure> run(const PipelineRequest& request);

    // Thread-safe. Stops the current run at the next chunk boundary. A cancel issued
    // between runs applies to the next run; the token is cleared when that run returns.
    void cancel();
    CancellationToken cancellationToken() const;

    PipelineState state() const;

    // Used for page fetches (PageUnreachable) and episode transfers (network errors).
    void setRetryConfig(const RetryConfig& config);
    RetryConfig retryConfig() const;

    // Completed store entries for the given episodes, ascending, plus the merged file path.
    static MergePlan buildMergePlan(const ProgressStore& store,
                                    const QString& outputDirectory,
                                    const QString& seriesTitle,
                                    const QList<int>& episodes);

    // Every completed ep_NN.mp4 entry of the store under outputDirectory, ascending.
    static QList<int> completedEpisodes(const ProgressStore& store, const QString& outputDirectory);

signals:
    void stateChanged(Episodic::PipelineState state);
    void episodeProgress(int episode, qint64 bytesReceived, qint64 bytesTotal, Episodic::EpisodeState state);
    // Emitted on the thread running run(), fraction in 0..1
    void mergeProgress(double fraction);

private:
    Expected<PipelineReport, PipelineFailure> runRequest(const PipelineRequest& request);
    Expected<PipelineReport, PipelineFailure> runMergeOnly(const PipelineRequest& request);
    Expected<void, StoreError> resetEpisodes(const QList<EpisodeTask>& tasks);
    QList<EpisodeReport> runTransfers(const QList<EpisodeTask>& tasks, int parallelism);
    EpisodeReport transferEpisode(const EpisodeTask& task);
    void mergeEpisodes(const PipelineRequest& request, const QList<int>& episodes, PipelineReport& report);
    void cleanupEpisodes(const MergePlan& plan);

    void setState(PipelineState state);
    PipelineFailure fail(PipelineState stage);

    struct OrchestratorPrivate;
    std::unique_ptr<OrchestratorPrivate> d;
};

} // namespace Episodic
