#pragma once

#include <QtCore/QString>
#include <QtCore/QUrl>
#include <memory>

#include "../common/CancellationToken.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/Expected.hpp"
#include "../pipeline/PipelineTypes.hpp"

namespace Episodic {

/**
 * @brief Turns a series page identifier into a SeriesInfo
 *
 * Accepts the query form (?series_id=N), the path form (/series/N/slug) or a
 * bare numeric id, fetches the watch page from the configured base URL and
 * hands the HTML to ScriptPayloadExtractor. Blocking: the fetch runs a local
 * event loop, so it may be called from any thread. No retries are made here.
 */
class SeriesResolver {
public:
    explicit SeriesResolver(const Config::NetworkSettings& settings = Config::NetworkSettings());
    ~SeriesResolver();

    Expected<SeriesInfo, ResolutionError> resolve(const QString& pageUrl, bool forceRefresh = false);

    // Builds a SeriesInfo from an already fetched page.
    static Expected<SeriesInfo, ResolutionError> parsePage(int seriesId,
                                                           const QString& pageUrl,
                                                           const QString& html);

    QUrl pageUrlFor(int seriesId) const;

    void setCancellationToken(const CancellationToken& token);

    bool isCached(int seriesId) const;
    void clearCache();

private:
    Expected<QString, ResolutionError> fetchPage(const QUrl& url);

    struct SeriesResolverPrivate;
    std::unique_ptr<SeriesResolverPrivate> d;
};

} // namespace Episodic
