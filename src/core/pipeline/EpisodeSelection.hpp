#pragma once

#include <QtCore/QList>
#include <QtCore/QString>

#include "PipelineTypes.hpp"
#include "../common/Errors.hpp"
#include "../common/Expected.hpp"

namespace Episodic {

/**
 * @brief Episode selection expressions
 *
 * "all" (any case, or blank) selects every episode. Otherwise a comma
 * separated list of "N" and "A-B" items; ranges are clamped to
 * 1..totalEpisodes and single numbers outside it are dropped. The result is
 * sorted and free of duplicates.
 */
class EpisodeSelection {
public:
    static Expected<QList<int>, SelectionError> parse(const QString& expression, int totalEpisodes);

    // parse() against info.totalEpisodes, then restricted to episodes that have a URL.
    static Expected<QList<int>, SelectionError> select(const QString& expression, const SeriesInfo& info);

    // Compact form, e.g. {1,2,3,5} -> "1-3,5".
    static QString format(const QList<int>& episodes);
};

} // namespace Episodic
