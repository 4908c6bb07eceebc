#include "EpisodeSelection.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QRegularExpression>
#include <QtCore/QSet>
#include <QtCore/QStringList>
#include <algorithm>

namespace Episodic {

Expected<QList<int>, SelectionError> EpisodeSelection::parse(const QString& expression, int totalEpisodes) {
    static const QRegularExpression singleItem("^(\\d{1,6})$");
    static const QRegularExpression rangeItem("^(\\d{1,6})\\s*-\\s*(\\d{1,6})$");

    const QString trimmed = expression.trimmed();
    QSet<int> selected;

    if (trimmed.isEmpty() || trimmed.compare("all", Qt::CaseInsensitive) == 0) {
        for (int episode = 1; episode <= totalEpisodes; ++episode) {
            selected.insert(episode);
        }
    } else {
        const QStringList items = trimmed.split(',');
        for (const QString& rawItem : items) {
            const QString item = rawItem.trimmed();
            if (item.isEmpty()) {
                continue;
            }

            if (const auto single = singleItem.match(item); single.hasMatch()) {
                const int episode = single.captured(1).toInt();
                if (episode >= 1 && episode <= totalEpisodes) {
                    selected.insert(episode);
                }
                continue;
            }

            const auto range = rangeItem.match(item);
            if (!range.hasMatch()) {
                return makeUnexpected(SelectionError{SelectionError::Kind::Malformed,
                    QString("'%1' is not an episode number or range").arg(item)});
            }

            const int first = range.captured(1).toInt();
            const int last = range.captured(2).toInt();
            if (first > last) {
                return makeUnexpected(SelectionError{SelectionError::Kind::Malformed,
                    QString("range '%1' is reversed").arg(item)});
            }
            for (int episode = qMax(1, first); episode <= qMin(last, totalEpisodes); ++episode) {
                selected.insert(episode);
            }
        }
    }

    QList<int> episodes(selected.begin(), selected.end());
    std::sort(episodes.begin(), episodes.end());

    if (episodes.isEmpty()) {
        return makeUnexpected(SelectionError{SelectionError::Kind::Empty,
            QString("'%1' selects nothing out of %2 episodes").arg(expression).arg(totalEpisodes)});
    }
    return episodes;
}

Expected<QList<int>, SelectionError> EpisodeSelection::select(const QString& expression, const SeriesInfo& info) {
    auto parsed = parse(expression, info.totalEpisodes);
    if (parsed.hasError()) {
        return parsed;
    }

    QList<int> available;
    for (int episode : parsed.value()) {
        if (info.episodeUrls.contains(episode)) {
            available.append(episode);
        } else {
            Logger::instance().warn("EpisodeSelection: episode {} has no media URL, skipped", episode);
        }
    }

    if (available.isEmpty()) {
        return makeUnexpected(SelectionError{SelectionError::Kind::Empty,
            QString("none of the episodes in '%1' have a media URL").arg(expression)});
    }
    return available;
}

QString EpisodeSelection::format(const QList<int>& episodes) {
    QList<int> sorted = episodes;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    QStringList parts;
    for (int i = 0; i < sorted.size();) {
        int j = i;
        while (j + 1 < sorted.size() && sorted.at(j + 1) == sorted.at(j) + 1) {
            ++j;
        }
        parts << (i == j ? QString::number(sorted.at(i))
                         : QString("%1-%2").arg(sorted.at(i)).arg(sorted.at(j)));
        i = j + 1;
    }
    return parts.join(',');
}

} // namespace Episodic
