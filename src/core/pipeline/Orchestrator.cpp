#include "Orchestrator.hpp"
#include "EpisodeSelection.hpp"
#include "OutputLayout.hpp"
#include "../common/Logger.hpp"
#include "../media/Merger.hpp"
#include "../resolver/SeriesResolver.hpp"
#include "../storage/ProgressStore.hpp"
#include "../transfer/TransferEngine.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QFutureWatcher>
#include <QtCore/QThreadPool>
#include <QtConcurrent/QtConcurrent>
#include <algorithm>
#include <atomic>

namespace Episodic {

struct Orchestrator::OrchestratorPrivate {
    OrchestratorPrivate(SeriesResolver& r, TransferEngine& e, ProgressStore& s, Merger& m)
        : resolver(r), engine(e), store(s), merger(m) {}

    SeriesResolver& resolver;
    TransferEngine& engine;
    ProgressStore& store;
    Merger& merger;

    CancellationToken cancellation;
    RetryConfig retryConfig;
    std::atomic<PipelineState> state{PipelineState::Idle};
};

Orchestrator::Orchestrator(SeriesResolver& resolver,
                           TransferEngine& engine,
                           ProgressStore& store,
                           Merger& merger,
                           QObject* parent)
    : QObject(parent)
    , d(std::make_unique<OrchestratorPrivate>(resolver, engine, store, merger)) {
    qRegisterMetaType<Episodic::PipelineState>("Episodic::PipelineState");
    qRegisterMetaType<Episodic::EpisodeState>("Episodic::EpisodeState");

    const auto transferSettings = engine.transferSettings();
    d->retryConfig.maxAttempts = qMax(1, transferSettings.retryAttempts);
    d->retryConfig.initialDelay = std::chrono::milliseconds(transferSettings.retryDelayMs);
}

Orchestrator::~Orchestrator() = default;

void Orchestrator::cancel() {
    Logger::instance().info("Orchestrator: cancellation requested");
    d->cancellation.cancel();
}

CancellationToken Orchestrator::cancellationToken() const {
    return d->cancellation;
}

PipelineState Orchestrator::state() const {
    return d->state.load();
}

void Orchestrator::setRetryConfig(const RetryConfig& config) {
    d->retryConfig = config;
}

RetryConfig Orchestrator::retryConfig() const {
    return d->retryConfig;
}

void Orchestrator::setState(PipelineState state) {
    if (d->state.exchange(state) == state) {
        return;
    }
    Logger::instance().debug("Orchestrator: -> {}", toString(state).toStdString());
    emit stateChanged(state);
}

PipelineFailure Orchestrator::fail(PipelineState stage) {
    PipelineFailure failure;
    failure.stage = stage;
    failure.cancelled = d->cancellation.isCancelled();
    setState(PipelineState::Failed);
    return failure;
}

Expected<PipelineReport, PipelineFailure> Orchestrator::run(const PipelineRequest& request) {
    d->state = PipelineState::Idle;
    d->resolver.setCancellationToken(d->cancellation);

    auto result = runRequest(request);

    // A cancel ends one run, the next starts clean
    if (d->cancellation.isCancelled()) {
        Logger::instance().debug("Orchestrator: clearing cancellation after the run");
        d->cancellation.reset();
    }
    return result;
}

Expected<PipelineReport, PipelineFailure> Orchestrator::runRequest(const PipelineRequest& request) {
    if (request.mergeOnly) {
        return runMergeOnly(request);
    }

    // Resolving
    setState(PipelineState::Resolving);
    RetryManager resolveRetry(d->retryConfig);
    resolveRetry.setCancellationToken(d->cancellation);
    auto series = resolveRetry.execute<SeriesInfo, ResolutionError>(
        [this, &request]() { return d->resolver.resolve(request.pageUrl); },
        [](const ResolutionError& error) { return error.kind == ResolutionError::Kind::PageUnreachable; });

    if (series.hasError()) {
        Logger::instance().error("Orchestrator: resolve failed: {}", describe(series.error()).toStdString());
        PipelineFailure failure = fail(PipelineState::Resolving);
        failure.resolution = series.error();
        failure.cancelled = failure.cancelled || series.error().kind == ResolutionError::Kind::Cancelled;
        return makeUnexpected(failure);
    }
    const SeriesInfo& info = series.value();

    // Selecting
    setState(PipelineState::Selecting);
    auto selected = EpisodeSelection::select(request.selection, info);
    if (selected.hasError()) {
        Logger::instance().error("Orchestrator: {}", describe(selected.error()).toStdString());
        PipelineFailure failure = fail(PipelineState::Selecting);
        failure.selection = selected.error();
        return makeUnexpected(failure);
    }

    PipelineReport report;
    report.resolvedEpisodeCount = info.episodeUrls.size();
    report.seriesTitle = info.title;
    report.selectedEpisodes = selected.value();

    const QString outputDirectory = QFileInfo(request.outputDirectory).absoluteFilePath();
    QList<EpisodeTask> tasks;
    for (int episode : report.selectedEpisodes) {
        EpisodeTask task;
        task.episode = episode;
        task.sourceUrl = info.episodeUrls.value(episode);
        task.destPath = OutputLayout::episodeFilePath(outputDirectory, episode);
        tasks.append(task);
    }

    if (request.listOnly) {
        for (const EpisodeTask& task : tasks) {
            EpisodeReport episodeReport;
            episodeReport.episode = task.episode;
            episodeReport.destPath = task.destPath;
            report.episodes.append(episodeReport);
        }
        report.mergeSkippedReason = "list only";
        setState(PipelineState::Done);
        return report;
    }

    if (!QDir().mkpath(outputDirectory)) {
        PipelineFailure failure = fail(PipelineState::Selecting);
        failure.store = StoreError{StoreError::Kind::IOFailure,
            QString("cannot create output directory %1").arg(outputDirectory)};
        return makeUnexpected(failure);
    }

    SessionRecord session;
    session.seriesId = info.seriesId;
    session.title = info.title;
    session.pageUrl = info.pageUrl;
    session.selection = EpisodeSelection::format(report.selectedEpisodes);
    auto sessionStored = d->store.setSession(session);
    if (sessionStored.hasError()) {
        PipelineFailure failure = fail(PipelineState::Selecting);
        failure.store = sessionStored.error();
        return makeUnexpected(failure);
    }

    if (!request.resume) {
        auto reset = resetEpisodes(tasks);
        if (reset.hasError()) {
            PipelineFailure failure = fail(PipelineState::Selecting);
            failure.store = reset.error();
            return makeUnexpected(failure);
        }
    }

    // Transferring
    setState(PipelineState::Transferring);
    const int parallelism = request.parallelism > 0
        ? request.parallelism
        : d->engine.transferSettings().parallelism;
    report.episodes = runTransfers(tasks, parallelism);

    Logger::instance().info("Orchestrator: {} of {} episodes complete",
                            report.succeededCount(), report.episodes.size());

    if (d->cancellation.isCancelled()) {
        return makeUnexpected(fail(PipelineState::Transferring));
    }

    // Merging
    if (!request.mergeEnabled) {
        report.mergeSkippedReason = "merging disabled";
    } else if (!report.allEpisodesSucceeded()) {
        report.mergeSkippedReason = QString("%1 of %2 episodes did not complete")
            .arg(report.failedCount()).arg(report.episodes.size());
        Logger::instance().warn("Orchestrator: merge skipped, {}", report.mergeSkippedReason.toStdString());
    } else {
        setState(PipelineState::Merging);
        mergeEpisodes(request, report.selectedEpisodes, report);
        if (d->cancellation.isCancelled()) {
            PipelineFailure failure = fail(PipelineState::Merging);
            failure.merge = report.mergeError;
            return makeUnexpected(failure);
        }
    }

    setState(PipelineState::Done);
    return report;
}

Expected<PipelineReport, PipelineFailure> Orchestrator::runMergeOnly(const PipelineRequest& request) {
    const QString outputDirectory = QFileInfo(request.outputDirectory).absoluteFilePath();
    const SessionRecord session = d->store.session();

    QList<int> episodes = completedEpisodes(d->store, outputDirectory);

    setState(PipelineState::Selecting);
    if (!episodes.isEmpty()) {
        auto selected = EpisodeSelection::parse(request.selection, episodes.last());
        if (selected.hasError()) {
            PipelineFailure failure = fail(PipelineState::Selecting);
            failure.selection = selected.error();
            return makeUnexpected(failure);
        }
        QList<int> filtered;
        for (int episode : selected.value()) {
            if (episodes.contains(episode)) {
                filtered.append(episode);
            }
        }
        episodes = filtered;
    }

    PipelineReport report;
    report.seriesTitle = session.title;
    report.selectedEpisodes = episodes;
    for (int episode : episodes) {
        EpisodeReport episodeReport;
        episodeReport.episode = episode;
        episodeReport.destPath = OutputLayout::episodeFilePath(outputDirectory, episode);
        episodeReport.state = EpisodeState::AlreadyDone;
        if (const auto state = d->store.load(episodeReport.destPath)) {
            episodeReport.bytesTotal = state->totalSize;
        }
        report.episodes.append(episodeReport);
    }

    Logger::instance().info("Orchestrator: merge only, {} completed episodes in {}",
                            episodes.size(), outputDirectory.toStdString());

    setState(PipelineState::Merging);
    mergeEpisodes(request, episodes, report);
    if (d->cancellation.isCancelled()) {
        PipelineFailure failure = fail(PipelineState::Merging);
        failure.merge = report.mergeError;
        return makeUnexpected(failure);
    }

    setState(PipelineState::Done);
    return report;
}

Expected<void, StoreError> Orchestrator::resetEpisodes(const QList<EpisodeTask>& tasks) {
    for (const EpisodeTask& task : tasks) {
        auto cleared = d->store.clear(task.destPath);
        if (cleared.hasError()) {
            return cleared;
        }
        const QString partPath = OutputLayout::partFilePath(task.destPath);
        if (QFile::exists(partPath) && !QFile::remove(partPath)) {
            return makeUnexpected(StoreError{StoreError::Kind::IOFailure,
                QString("cannot remove %1").arg(partPath)});
        }
    }
    Logger::instance().info("Orchestrator: cleared saved progress for {} episodes", tasks.size());
    return {};
}

QList<EpisodeReport> Orchestrator::runTransfers(const QList<EpisodeTask>& tasks, int parallelism) {
    QThreadPool pool;
    pool.setMaxThreadCount(qMax(1, parallelism));
    Logger::instance().info("Orchestrator: transferring {} episodes with {} workers",
                            tasks.size(), pool.maxThreadCount());

    std::function<EpisodeReport(const EpisodeTask&)> work = [this](const EpisodeTask& task) {
        return transferEpisode(task);
    };
    QFuture<EpisodeReport> future = QtConcurrent::mapped(&pool, tasks, work);

    // Keep this thread's queued signals flowing while the workers run
    QFutureWatcher<EpisodeReport> watcher;
    QEventLoop loop;
    connect(&watcher, &QFutureWatcher<EpisodeReport>::finished, &loop, &QEventLoop::quit);
    watcher.setFuture(future);
    if (!future.isFinished()) {
        loop.exec();
    }
    future.waitForFinished();

    QList<EpisodeReport> reports = future.results();
    std::sort(reports.begin(), reports.end(), [](const EpisodeReport& a, const EpisodeReport& b) {
        return a.episode < b.episode;
    });
    return reports;
}

EpisodeReport Orchestrator::transferEpisode(const EpisodeTask& task) {
    EpisodeReport report;
    report.episode = task.episode;
    report.destPath = task.destPath;

    if (d->cancellation.isCancelled()) {
        report.state = EpisodeState::Cancelled;
        report.error = TransferError{TransferError::Kind::Cancelled, TransferError::UnreachableReason::None, 0,
                                     "cancelled before start"};
        emit episodeProgress(task.episode, 0, -1, report.state);
        return report;
    }

    const auto stored = d->store.load(task.destPath);
    if (stored && stored->completed) {
        const QFileInfo existing(task.destPath);
        if (existing.isFile() && existing.size() == stored->totalSize) {
            Logger::instance().info("Orchestrator: episode {} already downloaded", task.episode);
            report.state = EpisodeState::AlreadyDone;
            report.bytesTotal = stored->totalSize;
            emit episodeProgress(task.episode, stored->totalSize, stored->totalSize, report.state);
            return report;
        }
        Logger::instance().warn("Orchestrator: episode {} was complete but {} is gone, downloading again",
                                task.episode, task.destPath.toStdString());
    }

    emit episodeProgress(task.episode, stored ? stored->bytesReceived : 0,
                         stored ? stored->totalSize : -1, EpisodeState::Downloading);

    const int episode = task.episode;
    TransferProgressCallback progress = [this, episode](qint64 received, qint64 total) {
        emit episodeProgress(episode, received, total, EpisodeState::Downloading);
    };

    RetryManager retry(d->retryConfig);
    retry.setCancellationToken(d->cancellation);
    auto result = retry.execute<TransferOutcome, TransferError>(
        [&]() {
            ++report.attempts;
            const auto state = d->store.load(task.destPath);
            const qint64 resumeFrom = (state && !state->completed) ? state->bytesReceived : 0;
            return d->engine.transfer(task.sourceUrl, task.destPath, resumeFrom, d->cancellation, progress);
        },
        [](const TransferError& error) {
            return error.kind == TransferError::Kind::Unreachable
                && error.reason == TransferError::UnreachableReason::Network;
        });

    if (result.hasError()) {
        report.state = result.error().kind == TransferError::Kind::Cancelled
            ? EpisodeState::Cancelled
            : EpisodeState::Failed;
        report.error = result.error();
        Logger::instance().error("Orchestrator: episode {} failed after {} attempts: {}",
                                 task.episode, report.attempts, describe(result.error()).toStdString());
        if (const auto state = d->store.load(task.destPath)) {
            emit episodeProgress(task.episode, state->bytesReceived, state->totalSize, report.state);
        } else {
            emit episodeProgress(task.episode, 0, -1, report.state);
        }
        return report;
    }

    report.state = EpisodeState::Completed;
    report.bytesTotal = result.value().totalSize;
    emit episodeProgress(task.episode, report.bytesTotal, report.bytesTotal, report.state);
    return report;
}

void Orchestrator::mergeEpisodes(const PipelineRequest& request, const QList<int>& episodes, PipelineReport& report) {
    const QString outputDirectory = QFileInfo(request.outputDirectory).absoluteFilePath();
    const MergePlan plan = buildMergePlan(d->store, outputDirectory, report.seriesTitle, episodes);

    report.mergeAttempted = true;
    auto merged = d->merger.merge(plan, d->cancellation, [this](double fraction) {
        emit mergeProgress(fraction);
    });
    if (merged.hasError()) {
        report.mergeError = merged.error();
        Logger::instance().error("Orchestrator: merge failed: {}", describe(merged.error()).toStdString());
        return;
    }

    report.mergeOutcome = merged.value();
    if (request.cleanupAfterMerge) {
        cleanupEpisodes(plan);
    }
}

void Orchestrator::cleanupEpisodes(const MergePlan& plan) {
    for (const QString& path : plan.orderedPaths) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            Logger::instance().warn("Orchestrator: could not delete {}", path.toStdString());
            continue;
        }
        auto cleared = d->store.clear(path);
        if (cleared.hasError()) {
            Logger::instance().warn("Orchestrator: could not clear progress for {}: {}",
                                    path.toStdString(), describe(cleared.error()).toStdString());
        }
    }
    Logger::instance().info("Orchestrator: removed {} episode files after merge", plan.orderedPaths.size());
}

MergePlan Orchestrator::buildMergePlan(const ProgressStore& store,
                                       const QString& outputDirectory,
                                       const QString& seriesTitle,
                                       const QList<int>& episodes) {
    QList<int> ordered = episodes;
    std::sort(ordered.begin(), ordered.end());

    MergePlan plan;
    plan.outputPath = OutputLayout::mergedFilePath(outputDirectory, seriesTitle);
    for (int episode : ordered) {
        const QString path = OutputLayout::episodeFilePath(outputDirectory, episode);
        const auto state = store.load(path);
        if (state && state->completed) {
            plan.orderedPaths.append(ProgressStore::normalizeKey(path));
        } else {
            Logger::instance().warn("Orchestrator: episode {} is not complete, left out of the merge", episode);
        }
    }
    return plan;
}

QList<int> Orchestrator::completedEpisodes(const ProgressStore& store, const QString& outputDirectory) {
    const QString directory = ProgressStore::normalizeKey(outputDirectory);

    QList<int> episodes;
    for (const TransferState& state : store.entries()) {
        if (!state.completed) {
            continue;
        }
        const QFileInfo info(state.destPath);
        if (QDir::cleanPath(info.absolutePath()) != directory || !info.isFile()) {
            continue;
        }
        const int episode = OutputLayout::episodeFromFileName(info.fileName());
        if (episode > 0) {
            episodes.append(episode);
        }
    }
    std::sort(episodes.begin(), episodes.end());
    return episodes;
}

} // namespace Episodic
