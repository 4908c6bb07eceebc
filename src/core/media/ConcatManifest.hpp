#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "../common/Errors.hpp"
#include "../common/Expected.hpp"

namespace Episodic {

enum class PathStyle {
    Posix,
    Windows
};

/**
 * @brief Input list for the ffmpeg concat demuxer
 *
 * One line per file, in order:
 * @code
 * file '/abs/path/ep_01.mp4'
 * @endcode
 * Single quotes inside a path close the quoted string, add an escaped quote
 * and reopen it ("'" becomes "'\''"). Windows paths use forward slashes.
 */
class ConcatManifest {
public:
    static PathStyle nativeStyle();

    static QString escapePath(const QString& path, PathStyle style);

    // Manifest text for the given files, made absolute.
    static QString build(const QStringList& orderedPaths, PathStyle style = nativeStyle());

    // Reverses build(): the file paths listed in a manifest.
    static QStringList parse(const QString& manifest);

    // Writes the manifest atomically.
    static Expected<void, MergeError> write(const QStringList& orderedPaths,
                                            const QString& manifestPath,
                                            PathStyle style = nativeStyle());
};

} // namespace Episodic
