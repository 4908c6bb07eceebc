#pragma once

#include <QtCore/QString>

namespace Episodic {
namespace OutputLayout {

// ep_01.mp4, ep_02.mp4, ..., ep_100.mp4
QString episodeFileName(int episode);
QString episodeFilePath(const QString& outputDirectory, int episode);

// Episode number encoded in an episodeFileName(), or 0.
int episodeFromFileName(const QString& fileName);

QString partFilePath(const QString& destPath);

// Strips characters that are invalid in file names and control characters, collapses
// whitespace, caps at 100 chars and drops trailing dots and spaces.
QString sanitizeTitle(const QString& title);

// "<sanitized title>.mp4", or "merged.mp4" when the title is empty. A title that reads
// like an episode file name gets a "_merged" suffix.
QString mergedFilePath(const QString& outputDirectory, const QString& seriesTitle);

QString manifestPathFor(const QString& outputPath);

} // namespace OutputLayout
} // namespace Episodic
