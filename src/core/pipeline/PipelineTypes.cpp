#include "PipelineTypes.hpp"

#include <algorithm>

namespace Episodic {

int PipelineReport::succeededCount() const {
    return static_cast<int>(std::count_if(episodes.begin(), episodes.end(),
        [](const EpisodeReport& report) { return report.succeeded(); }));
}

int PipelineReport::failedCount() const {
    return static_cast<int>(episodes.size()) - succeededCount();
}

QString PipelineFailure::describe() const {
    if (cancelled) {
        return QString("%1: cancelled").arg(toString(stage));
    }
    if (resolution) {
        return QString("%1: %2").arg(toString(stage), Episodic::describe(*resolution));
    }
    if (selection) {
        return QString("%1: %2").arg(toString(stage), Episodic::describe(*selection));
    }
    if (store) {
        return QString("%1: %2").arg(toString(stage), Episodic::describe(*store));
    }
    if (merge) {
        return QString("%1: %2").arg(toString(stage), Episodic::describe(*merge));
    }
    return toString(stage);
}

QString toString(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "Idle";
        case PipelineState::Resolving: return "Resolving";
        case PipelineState::Selecting: return "Selecting";
        case PipelineState::Transferring: return "Transferring";
        case PipelineState::Merging: return "Merging";
        case PipelineState::Done: return "Done";
        case PipelineState::Failed: return "Failed";
    }
    return "Unknown";
}

QString toString(EpisodeState state) {
    switch (state) {
        case EpisodeState::Pending: return "Pending";
        case EpisodeState::Downloading: return "Downloading";
        case EpisodeState::Completed: return "Completed";
        case EpisodeState::AlreadyDone: return "AlreadyDone";
        case EpisodeState::Failed: return "Failed";
        case EpisodeState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

} // namespace Episodic
