#include "OutputLayout.hpp"

#include <QtCore/QDir>
#include <QtCore/QRegularExpression>

namespace Episodic {
namespace OutputLayout {

QString episodeFileName(int episode) {
    return QString("ep_%1.mp4").arg(episode, 2, 10, QChar('0'));
}

QString episodeFilePath(const QString& outputDirectory, int episode) {
    return QDir(outputDirectory).filePath(episodeFileName(episode));
}

int episodeFromFileName(const QString& fileName) {
    static const QRegularExpression pattern("^ep_(\\d+)\\.mp4$");
    const auto match = pattern.match(fileName);
    if (!match.hasMatch()) {
        return 0;
    }
    return match.captured(1).toInt();
}

QString partFilePath(const QString& destPath) {
    return destPath + ".part";
}

QString sanitizeTitle(const QString& title) {
    static const QRegularExpression invalidChars("[<>:\"/\\\\|?*\\x{0000}-\\x{001f}\\x{007f}]");
    static const QRegularExpression whitespace("\\s+");
    static const QRegularExpression trailingDots("[. ]+$");

    // Tabs and newlines become spaces before control characters go
    QString name = title;
    name.replace(whitespace, " ");
    name.remove(invalidChars);
    name = name.replace(whitespace, " ").trimmed();
    if (name.size() > 100) {
        name = name.left(100);
    }
    // Windows drops trailing dots and spaces from file names
    name.remove(trailingDots);
    return name;
}

QString mergedFilePath(const QString& outputDirectory, const QString& seriesTitle) {
    static const QRegularExpression episodeName("^ep_\\d+$", QRegularExpression::CaseInsensitiveOption);

    QString baseName = sanitizeTitle(seriesTitle);
    if (baseName.isEmpty()) {
        baseName = "merged";
    } else if (episodeName.match(baseName).hasMatch()) {
        // Must not collide with an episode file
        baseName += "_merged";
    }
    return QDir(outputDirectory).filePath(baseName + ".mp4");
}

QString manifestPathFor(const QString& outputPath) {
    return outputPath + ".concat.txt";
}

} // namespace OutputLayout
} // namespace Episodic
