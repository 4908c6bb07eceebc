#pragma once

#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>

#include "../common/Errors.hpp"
#include "../common/Expected.hpp"

namespace Episodic {

// One `name = {...}` / `name = [...]` literal found in a script block.
struct ScriptPayload {
    QString variableName;   // empty for a script whose whole body is a literal
    QString literal;        // brackets included; empty when unterminated
    int offset = -1;        // position of the opening bracket in the scanned text
    bool terminated = false;
};

/**
 * @brief Narrow tokenizer for the series data embedded in a watch page
 *
 * The page carries its episode list as a JavaScript object or array literal
 * assigned to a variable inside a <script> block. The extractor never
 * evaluates script: it locates the literal by balanced-bracket scanning
 * (string literals, escapes and comments respected), decodes every string
 * token inside it and keeps the ones that are absolute .mp4 URLs. The episode
 * number comes from the URL file name (EP01.mp4, ep_1.mp4, 001.mp4, ...).
 */
class ScriptPayloadExtractor {
public:
    // Episode -> media URL, first well-formed URL per episode in document order.
    static Expected<QMap<int, QString>, ResolutionError> extract(const QString& html);

    // Script bodies of the page, or the whole input when it has no <script> tag.
    static QStringList scriptBlocks(const QString& html);

    static QList<ScriptPayload> findPayloads(const QString& scriptText);

    // Index one past the bracket closing the one at start, or -1 if unbalanced.
    static int scanBalanced(const QString& text, int start);

    // Decoded contents of every string literal in a script literal, in order.
    static QStringList stringTokens(const QString& literal);

    // Decodes a string literal body (quotes stripped): JS escapes, then &amp;.
    static QString decodeStringLiteral(const QString& raw);

    static bool isMediaUrl(const QString& candidate);

    // Canonical episode index from the URL file name, or 0 when there is none.
    static int episodeNumberFromUrl(const QString& url);

    // Page <title> without the trailing episode suffix; "Series <id>" when absent.
    static QString extractTitle(const QString& html, int seriesId);
    static std::optional<QString> extractPosterUrl(const QString& html);

    // "N ตอน" count from the meta description, 0 when not declared.
    static int extractDeclaredEpisodeCount(const QString& html);

    // series_id query parameter, /series/<id> path, or a bare numeric id.
    static std::optional<int> parseSeriesId(const QString& pageUrl);

private:
    static std::optional<QString> metaContent(const QString& html,
                                               const QString& attribute,
                                               const QString& value);
    static QString decodeHtmlEntities(const QString& text);
};

} // namespace Episodic
