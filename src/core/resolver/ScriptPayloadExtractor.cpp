#include "ScriptPayloadExtractor.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QRegularExpression>
#include <QtCore/QUrl>
#include <QtCore/QVector>

namespace Episodic {

namespace {

bool isQuote(QChar c) {
    return c == QLatin1Char('"') || c == QLatin1Char('\'') || c == QLatin1Char('`');
}

// Index of the quote closing the one at start, or -1. Plain quotes may not span lines.
int quoteEnd(const QString& text, int start) {
    const QChar quote = text.at(start);
    const bool multiline = quote == QLatin1Char('`');
    for (int i = start + 1; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c == QLatin1Char('\\')) {
            ++i;
            continue;
        }
        if (c == quote) {
            return i;
        }
        if (!multiline && c == QLatin1Char('\n')) {
            return -1;
        }
    }
    return -1;
}

// Index of the last character of a comment starting at start, -1 if unterminated,
// or start - 1 when no comment starts there.
int commentEnd(const QString& text, int start) {
    if (text.at(start) != QLatin1Char('/') || start + 1 >= text.size()) {
        return start - 1;
    }
    const QChar next = text.at(start + 1);
    if (next == QLatin1Char('/')) {
        const int newline = text.indexOf(QLatin1Char('\n'), start + 2);
        return newline < 0 ? text.size() - 1 : newline;
    }
    if (next == QLatin1Char('*')) {
        const int close = text.indexOf(QLatin1String("*/"), start + 2);
        return close < 0 ? -1 : close + 1;
    }
    return start - 1;
}

int hexValue(const QString& digits, bool* ok) {
    return digits.toInt(ok, 16);
}

QString attributeValue(const QString& tag, const QString& name) {
    const QRegularExpression pattern(
        QString("\\b%1\\s*=\\s*([\"'])(.*?)\\1").arg(QRegularExpression::escape(name)),
        QRegularExpression::CaseInsensitiveOption | QRegularExpression::DotMatchesEverythingOption);
    const auto match = pattern.match(tag);
    return match.hasMatch() ? match.captured(2) : QString();
}

} // namespace

Expected<QMap<int, QString>, ResolutionError> ScriptPayloadExtractor::extract(const QString& html) {
    QMap<int, QString> episodes;
    bool sawPayload = false;
    bool sawUnterminated = false;
    int mediaUrls = 0;
    int unnumbered = 0;

    for (const QString& block : scriptBlocks(html)) {
        for (const ScriptPayload& payload : findPayloads(block)) {
            sawPayload = true;
            if (!payload.terminated) {
                Logger::instance().warn("ScriptPayloadExtractor: literal '{}' at {} is not terminated",
                                        payload.variableName.toStdString(), payload.offset);
                sawUnterminated = true;
                continue;
            }

            for (const QString& token : stringTokens(payload.literal)) {
                if (!isMediaUrl(token)) {
                    continue;
                }
                ++mediaUrls;

                const int episode = episodeNumberFromUrl(token);
                if (episode <= 0) {
                    ++unnumbered;
                    continue;
                }
                if (!episodes.contains(episode)) {
                    episodes.insert(episode, token);
                }
            }
        }
    }

    if (!episodes.isEmpty()) {
        Logger::instance().debug("ScriptPayloadExtractor: {} episodes from {} media URLs ({} without episode token)",
                                 episodes.size(), mediaUrls, unnumbered);
        return episodes;
    }

    if (!sawPayload) {
        return makeUnexpected(ResolutionError{ResolutionError::Kind::PayloadNotFound,
            "no script literal assignment in page"});
    }
    if (sawUnterminated) {
        return makeUnexpected(ResolutionError{ResolutionError::Kind::PayloadMalformed,
            "script literal is not terminated"});
    }
    if (mediaUrls > 0) {
        return makeUnexpected(ResolutionError{ResolutionError::Kind::PayloadMalformed,
            QString("%1 media URLs carry no episode number").arg(mediaUrls)});
    }
    return makeUnexpected(ResolutionError{ResolutionError::Kind::PayloadNotFound,
        "script literals carry no media URLs"});
}

QStringList ScriptPayloadExtractor::scriptBlocks(const QString& html) {
    static const QRegularExpression scriptPattern(
        "<script\\b[^>]*>(.*?)</script\\s*>",
        QRegularExpression::CaseInsensitiveOption | QRegularExpression::DotMatchesEverythingOption);

    if (!html.contains(QLatin1String("<script"), Qt::CaseInsensitive)) {
        return {html};
    }

    QStringList blocks;
    auto it = scriptPattern.globalMatch(html);
    while (it.hasNext()) {
        const auto match = it.next();
        blocks.append(match.captured(1));
    }
    return blocks;
}

QList<ScriptPayload> ScriptPayloadExtractor::findPayloads(const QString& scriptText) {
    static const QRegularExpression assignment(
        "(?:\\b(?:var|let|const)\\s+)?([A-Za-z_$][\\w$]*(?:\\.[A-Za-z_$][\\w$]*)*)\\s*=\\s*([\\[{])");

    QList<ScriptPayload> payloads;

    auto record = [&](const QString& name, int bracket) -> int {
        ScriptPayload payload;
        payload.variableName = name;
        payload.offset = bracket;
        const int end = scanBalanced(scriptText, bracket);
        if (end > 0) {
            payload.literal = scriptText.mid(bracket, end - bracket);
            payload.terminated = true;
        }
        payloads.append(payload);
        return end;
    };

    // A script body that is only a literal (JSON data blocks).
    int first = 0;
    while (first < scriptText.size() && scriptText.at(first).isSpace()) {
        ++first;
    }
    if (first < scriptText.size()
        && (scriptText.at(first) == QLatin1Char('{') || scriptText.at(first) == QLatin1Char('['))) {
        record(QString(), first);
        return payloads;
    }

    int from = 0;
    while (from < scriptText.size()) {
        const auto match = assignment.match(scriptText, from);
        if (!match.hasMatch()) {
            break;
        }
        const int end = record(match.captured(1), match.capturedStart(2));
        if (end < 0) {
            break;
        }
        from = end;
    }
    return payloads;
}

int ScriptPayloadExtractor::scanBalanced(const QString& text, int start) {
    if (start < 0 || start >= text.size()) {
        return -1;
    }
    const QChar open = text.at(start);
    if (open != QLatin1Char('{') && open != QLatin1Char('[')) {
        return -1;
    }

    QVector<QChar> closers;
    for (int i = start; i < text.size(); ++i) {
        const QChar c = text.at(i);

        if (isQuote(c)) {
            const int close = quoteEnd(text, i);
            if (close < 0) {
                return -1;
            }
            i = close;
            continue;
        }

        const int comment = commentEnd(text, i);
        if (comment < 0) {
            return -1;
        }
        if (comment >= i) {
            i = comment;
            continue;
        }

        if (c == QLatin1Char('{')) {
            closers.append(QLatin1Char('}'));
        } else if (c == QLatin1Char('[')) {
            closers.append(QLatin1Char(']'));
        } else if (c == QLatin1Char('}') || c == QLatin1Char(']')) {
            if (closers.isEmpty() || closers.last() != c) {
                return -1;
            }
            closers.removeLast();
            if (closers.isEmpty()) {
                return i + 1;
            }
        }
    }
    return -1;
}

QStringList ScriptPayloadExtractor::stringTokens(const QString& literal) {
    QStringList tokens;
    for (int i = 0; i < literal.size(); ++i) {
        const QChar c = literal.at(i);
        if (isQuote(c)) {
            const int close = quoteEnd(literal, i);
            if (close < 0) {
                break;
            }
            tokens.append(decodeStringLiteral(literal.mid(i + 1, close - i - 1)));
            i = close;
            continue;
        }

        const int comment = commentEnd(literal, i);
        if (comment < 0) {
            break;
        }
        if (comment >= i) {
            i = comment;
        }
    }
    return tokens;
}

QString ScriptPayloadExtractor::decodeStringLiteral(const QString& raw) {
    QString decoded;
    decoded.reserve(raw.size());

    for (int i = 0; i < raw.size(); ++i) {
        const QChar c = raw.at(i);
        if (c != QLatin1Char('\\') || i + 1 >= raw.size()) {
            decoded.append(c);
            continue;
        }

        const QChar next = raw.at(++i);
        switch (next.unicode()) {
        case 'n': decoded.append(QLatin1Char('\n')); break;
        case 't': decoded.append(QLatin1Char('\t')); break;
        case 'r': decoded.append(QLatin1Char('\r')); break;
        case 'b': decoded.append(QLatin1Char('\b')); break;
        case 'f': decoded.append(QLatin1Char('\f')); break;
        case 'v': decoded.append(QLatin1Char('\v')); break;
        case '\n': break;   // line continuation
        case 'u': {
            bool ok = false;
            if (i + 1 < raw.size() && raw.at(i + 1) == QLatin1Char('{')) {
                const int close = raw.indexOf(QLatin1Char('}'), i + 2);
                const uint codePoint = close > 0 ? raw.mid(i + 2, close - i - 2).toUInt(&ok, 16) : 0;
                if (ok && codePoint <= 0x10FFFF) {
                    const char32_t ucs4 = codePoint;
                    decoded.append(QString::fromUcs4(&ucs4, 1));
                    i = close;
                } else {
                    decoded.append(next);
                }
                break;
            }
            const int unit = hexValue(raw.mid(i + 1, 4), &ok);
            if (ok && i + 4 < raw.size()) {
                decoded.append(QChar(static_cast<ushort>(unit)));
                i += 4;
            } else {
                decoded.append(next);
            }
            break;
        }
        case 'x': {
            bool ok = false;
            const int value = hexValue(raw.mid(i + 1, 2), &ok);
            if (ok && i + 2 < raw.size()) {
                decoded.append(QChar(static_cast<ushort>(value)));
                i += 2;
            } else {
                decoded.append(next);
            }
            break;
        }
        default:
            // \/ \" \' \\ and any other escaped character stand for themselves
            decoded.append(next);
            break;
        }
    }

    decoded.replace(QLatin1String("&amp;"), QLatin1String("&"));
    return decoded;
}

bool ScriptPayloadExtractor::isMediaUrl(const QString& candidate) {
    if (candidate.isEmpty()) {
        return false;
    }
    const QUrl url(candidate, QUrl::StrictMode);
    if (!url.isValid() || url.host().isEmpty()) {
        return false;
    }
    const QString scheme = url.scheme().toLower();
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https")) {
        return false;
    }
    return url.path().endsWith(QLatin1String(".mp4"), Qt::CaseInsensitive);
}

int ScriptPayloadExtractor::episodeNumberFromUrl(const QString& url) {
    static const QRegularExpression episodeToken(
        "^(?:ep[ _-]?)?(\\d{1,6})\\.mp4$", QRegularExpression::CaseInsensitiveOption);

    const QString fileName = QUrl(url).fileName(QUrl::FullyDecoded);
    const auto match = episodeToken.match(fileName);
    if (!match.hasMatch()) {
        return 0;
    }
    return match.captured(1).toInt();
}

QString ScriptPayloadExtractor::extractTitle(const QString& html, int seriesId) {
    static const QRegularExpression titlePattern(
        "<title[^>]*>(.*?)</title\\s*>",
        QRegularExpression::CaseInsensitiveOption | QRegularExpression::DotMatchesEverythingOption);
    // " - ตอนที่ N..." suffix of per-episode page titles
    static const QRegularExpression episodeSuffix(
        "\\s*-\\s*\\x{0E15}\\x{0E2D}\\x{0E19}\\x{0E17}\\x{0E35}\\x{0E48}\\s*\\d+.*$");

    QString title;
    const auto match = titlePattern.match(html);
    if (match.hasMatch()) {
        title = decodeHtmlEntities(match.captured(1)).simplified();
        title.remove(episodeSuffix);
        title = title.trimmed();
    }

    if (title.isEmpty()) {
        return QString("Series %1").arg(seriesId);
    }
    return title;
}

std::optional<QString> ScriptPayloadExtractor::extractPosterUrl(const QString& html) {
    auto content = metaContent(html, "property", "og:image");
    if (!content || content->trimmed().isEmpty()) {
        return std::nullopt;
    }
    return content->trimmed();
}

int ScriptPayloadExtractor::extractDeclaredEpisodeCount(const QString& html) {
    // "N ตอน"
    static const QRegularExpression declaredCount("(\\d{1,6})\\s*\\x{0E15}\\x{0E2D}\\x{0E19}");

    const auto description = metaContent(html, "name", "description");
    if (!description) {
        return 0;
    }
    const auto match = declaredCount.match(*description);
    return match.hasMatch() ? match.captured(1).toInt() : 0;
}

std::optional<int> ScriptPayloadExtractor::parseSeriesId(const QString& pageUrl) {
    static const QRegularExpression bareId("^\\d{1,9}$");
    static const QRegularExpression queryForm("[?&]series_id=(\\d{1,9})(?:[&#]|$)");
    static const QRegularExpression pathForm("/series/(\\d{1,9})(?:[/?#]|$)");

    const QString input = pageUrl.trimmed();
    if (input.isEmpty()) {
        return std::nullopt;
    }

    int id = 0;
    if (bareId.match(input).hasMatch()) {
        id = input.toInt();
    } else if (auto query = queryForm.match(input); query.hasMatch()) {
        id = query.captured(1).toInt();
    } else if (auto path = pathForm.match(input); path.hasMatch()) {
        id = path.captured(1).toInt();
    }

    if (id <= 0) {
        return std::nullopt;
    }
    return id;
}

std::optional<QString> ScriptPayloadExtractor::metaContent(const QString& html,
                                                           const QString& attribute,
                                                           const QString& value) {
    static const QRegularExpression metaTag("<meta\\b[^>]*>", QRegularExpression::CaseInsensitiveOption);

    auto it = metaTag.globalMatch(html);
    while (it.hasNext()) {
        const QString tag = it.next().captured(0);
        if (attributeValue(tag, attribute).compare(value, Qt::CaseInsensitive) != 0) {
            continue;
        }
        return decodeHtmlEntities(attributeValue(tag, "content"));
    }
    return std::nullopt;
}

QString ScriptPayloadExtractor::decodeHtmlEntities(const QString& text) {
    static const QRegularExpression numericEntity("&#(x[0-9a-fA-F]{1,6}|\\d{1,7});");

    QString decoded;
    int last = 0;
    auto it = numericEntity.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        decoded.append(text.mid(last, match.capturedStart() - last));

        const QString digits = match.captured(1);
        bool ok = false;
        const uint codePoint = digits.startsWith(QLatin1Char('x'))
            ? digits.mid(1).toUInt(&ok, 16)
            : digits.toUInt(&ok, 10);
        if (ok && codePoint > 0 && codePoint <= 0x10FFFF) {
            const char32_t ucs4 = codePoint;
            decoded.append(QString::fromUcs4(&ucs4, 1));
        } else {
            decoded.append(match.captured(0));
        }
        last = match.capturedEnd();
    }
    decoded.append(text.mid(last));

    decoded.replace(QLatin1String("&lt;"), QLatin1String("<"));
    decoded.replace(QLatin1String("&gt;"), QLatin1String(">"));
    decoded.replace(QLatin1String("&quot;"), QLatin1String("\""));
    decoded.replace(QLatin1String("&apos;"), QLatin1String("'"));
    decoded.replace(QLatin1String("&amp;"), QLatin1String("&"));
    return decoded;
}

} // namespace Episodic
