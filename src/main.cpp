#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QHash>
#include <QtCore/QStringList>
#include <fmt/core.h>
#include <csignal>

#include "core/common/CancellationToken.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/media/Merger.hpp"
#include "core/media/StreamCopyMuxer.hpp"
#include "core/media/StreamProbe.hpp"
#include "core/pipeline/EpisodeSelection.hpp"
#include "core/pipeline/Orchestrator.hpp"
#include "core/resolver/SeriesResolver.hpp"
#include "core/storage/FileProgressStore.hpp"
#include "core/transfer/TransferEngine.hpp"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitRunFailed = 1,
    ExitPartialFailure = 2
};

Episodic::CancellationToken* g_cancellation = nullptr;

void handleInterrupt(int) {
    if (g_cancellation) {
        g_cancellation->cancel();
    }
}

QString formatSize(qint64 bytes) {
    if (bytes < 0) {
        return "?";
    }
    const QStringList units = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    return QString("%1 %2").arg(value, 0, 'f', unit == 0 ? 0 : 1).arg(units.at(unit));
}

void printReport(const Episodic::PipelineReport& report, bool listOnly) {
    using namespace Episodic;

    fmt::print("\n{}\n", report.seriesTitle.toStdString());
    if (listOnly) {
        fmt::print("{} episodes available, {} selected: {}\n", report.resolvedEpisodeCount,
                   report.selectedEpisodes.size(),
                   EpisodeSelection::format(report.selectedEpisodes).toStdString());
        for (const EpisodeReport& episode : report.episodes) {
            fmt::print("  EP{:02d}  {}\n", episode.episode, episode.destPath.toStdString());
        }
        return;
    }

    fmt::print("{} succeeded, {} failed\n", report.succeededCount(), report.failedCount());
    for (const EpisodeReport& episode : report.episodes) {
        if (!episode.succeeded() && episode.error) {
            fmt::print("  EP{:02d}  {}\n", episode.episode, describe(*episode.error).toStdString());
        }
    }

    if (report.mergeOutcome) {
        fmt::print("Merged {} episodes into {} ({})\n", report.mergeOutcome->inputCount,
                   report.mergeOutcome->outputPath.toStdString(),
                   formatSize(report.mergeOutcome->outputSize).toStdString());
    } else if (report.mergeError) {
        fmt::print("Merge failed: {}\n", describe(*report.mergeError).toStdString());
        if (!report.mergeError->manifestPath.isEmpty()) {
            fmt::print("  manifest kept at {}\n", report.mergeError->manifestPath.toStdString());
        }
    } else if (!report.mergeSkippedReason.isEmpty()) {
        fmt::print("Merge skipped: {}\n", report.mergeSkippedReason.toStdString());
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("episodic");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Episodic");

    QCommandLineParser parser;
    parser.setApplicationDescription("Download a series episode by episode and merge it into one file.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("url", "Series page URL (?series_id=N or /series/N) or numeric series id.");

    QCommandLineOption episodesOption({"e", "episodes"}, "Episodes to download: all, 1-10, 1,3,5.", "selection", "all");
    QCommandLineOption outputOption({"o", "output"}, "Output directory.", "dir");
    QCommandLineOption noMergeOption("no-merge", "Do not merge the downloaded episodes.");
    QCommandLineOption mergeOnlyOption("merge-only", "Merge the completed episodes in the output directory.");
    QCommandLineOption listOption({"l", "list"}, "List the episodes and exit.");
    QCommandLineOption noResumeOption("no-resume", "Discard saved progress and download from scratch.");
    QCommandLineOption jobsOption({"j", "jobs"}, "Parallel downloads.", "n");
    QCommandLineOption cleanupOption("cleanup", "Delete the episode files after a successful merge.");
    QCommandLineOption ffmpegOption("ffmpeg", "Path to the ffmpeg executable.", "path");
    QCommandLineOption configOption("config", "Read settings from this INI file.", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Debug logging.");
    parser.addOptions({episodesOption, outputOption, noMergeOption, mergeOnlyOption, listOption,
                       noResumeOption, jobsOption, cleanupOption, ffmpegOption, configOption, verboseOption});
    parser.process(app);

    using namespace Episodic;

    try {
        auto& config = Config::instance();
        if (parser.isSet(configOption)) {
            config.initializeFromFile(parser.value(configOption));
        } else {
            config.initialize();
        }

        const auto level = parser.isSet(verboseOption) ? Logger::Level::Debug : Logger::Level::Info;
        Logger::instance().initialize(config.getLogPath().toStdString(), level);
        Logger::instance().info("Starting episodic v{}", app.applicationVersion().toStdString());

        const QStringList positional = parser.positionalArguments();
        const bool mergeOnly = parser.isSet(mergeOnlyOption);
        if (positional.isEmpty() && !mergeOnly) {
            fmt::print(stderr, "error: a series URL or id is required\n\n");
            parser.showHelp(ExitRunFailed);
        }

        auto networkSettings = config.getNetworkSettings();
        auto transferSettings = config.getTransferSettings();
        auto mergeSettings = config.getMergeSettings();

        PipelineRequest request;
        request.pageUrl = positional.value(0);
        request.selection = parser.value(episodesOption);
        request.outputDirectory = parser.isSet(outputOption) ? parser.value(outputOption) : config.getOutputDirectory();
        request.mergeEnabled = !parser.isSet(noMergeOption);
        request.resume = !parser.isSet(noResumeOption);
        request.listOnly = parser.isSet(listOption);
        request.mergeOnly = mergeOnly;
        request.cleanupAfterMerge = parser.isSet(cleanupOption) || !mergeSettings.keepEpisodesAfterMerge;

        if (parser.isSet(jobsOption)) {
            bool ok = false;
            const int jobs = parser.value(jobsOption).toInt(&ok);
            if (!ok || jobs < 1) {
                fmt::print(stderr, "error: --jobs expects a positive number\n");
                return ExitRunFailed;
            }
            request.parallelism = jobs;
        }
        if (parser.isSet(ffmpegOption)) {
            mergeSettings.ffmpegPath = parser.value(ffmpegOption);
        }

        // Listing never touches the record file
        MemoryProgressStore memoryStore;
        FileProgressStore fileStore;
        ProgressStore* store = &memoryStore;
        if (!request.listOnly) {
            const QString recordPath = QDir(request.outputDirectory).filePath(config.getStateFileName());
            auto opened = fileStore.open(recordPath);
            if (opened.hasError()) {
                fmt::print(stderr, "error: cannot use {}: {}\n", recordPath.toStdString(),
                           describe(opened.error()).toStdString());
                return ExitRunFailed;
            }
            store = &fileStore;
        }

        SeriesResolver resolver(networkSettings);
        TransferEngine engine(*store, transferSettings, networkSettings);
        FFmpegProcessMuxer muxer(mergeSettings);
        FFmpegStreamProbe probe;
        Merger merger(muxer, probe);
        Orchestrator orchestrator(resolver, engine, *store, merger);

        CancellationToken cancellation = orchestrator.cancellationToken();
        g_cancellation = &cancellation;
        std::signal(SIGINT, handleInterrupt);

        QObject::connect(&orchestrator, &Orchestrator::stateChanged, &app, [](PipelineState state) {
            fmt::print("[{}]\n", toString(state).toStdString());
        });

        QHash<int, int> lastPercent;
        QObject::connect(&orchestrator, &Orchestrator::episodeProgress, &app,
                         [&lastPercent](int episode, qint64 received, qint64 total, EpisodeState state) {
            if (state != EpisodeState::Downloading) {
                fmt::print("  EP{:02d}  {}  {}\n", episode, toString(state).toStdString(),
                           formatSize(total).toStdString());
                return;
            }
            const int percent = total > 0 ? static_cast<int>(received * 100 / total) : -1;
            if (percent >= 0 && percent / 10 == lastPercent.value(episode, -1) / 10) {
                return;
            }
            lastPercent.insert(episode, percent);
            fmt::print("  EP{:02d}  {} / {}\n", episode, formatSize(received).toStdString(),
                       formatSize(total).toStdString());
        });

        int lastMergePercent = -1;
        QObject::connect(&orchestrator, &Orchestrator::mergeProgress, &app, [&lastMergePercent](double fraction) {
            const int percent = static_cast<int>(fraction * 100);
            if (lastMergePercent >= 0 && percent / 10 == lastMergePercent / 10) {
                return;
            }
            lastMergePercent = percent;
            fmt::print("  merge  {}%\n", percent);
        });

        auto result = orchestrator.run(request);
        g_cancellation = nullptr;
        config.sync();

        if (result.hasError()) {
            fmt::print(stderr, "\nFailed: {}\n", result.error().describe().toStdString());
            Logger::instance().error("Run failed: {}", result.error().describe().toStdString());
            return ExitRunFailed;
        }

        const PipelineReport& report = result.value();
        printReport(report, request.listOnly);

        const bool mergeFailed = report.mergeError.has_value();
        if (!report.allEpisodesSucceeded() || mergeFailed) {
            return ExitPartialFailure;
        }
        return ExitSuccess;

    } catch (const std::exception& e) {
        Logger::instance().critical("Fatal error: {}", e.what());
        return ExitRunFailed;
    }
}
