#include "ConcatManifest.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>

namespace Episodic {

PathStyle ConcatManifest::nativeStyle() {
#ifdef Q_OS_WIN
    return PathStyle::Windows;
#else
    return PathStyle::Posix;
#endif
}

QString ConcatManifest::escapePath(const QString& path, PathStyle style) {
    QString escaped = path;
    if (style == PathStyle::Windows) {
        escaped.replace(QLatin1Char('\\'), QLatin1Char('/'));
    }
    escaped.replace(QLatin1String("'"), QLatin1String("'\\''"));
    return escaped;
}

QString ConcatManifest::build(const QStringList& orderedPaths, PathStyle style) {
    QString manifest;
    for (const QString& path : orderedPaths) {
        const QString absolute = QFileInfo(path).absoluteFilePath();
        manifest += QString("file '%1'\n").arg(escapePath(absolute, style));
    }
    return manifest;
}

QStringList ConcatManifest::parse(const QString& manifest) {
    QStringList paths;
    const QStringList lines = manifest.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (QString line : lines) {
        line = line.trimmed();
        if (!line.startsWith(QLatin1String("file "))) {
            continue;
        }

        // Quoted segments concatenate; \' outside quotes is a literal quote
        const QString token = line.mid(5).trimmed();
        QString path;
        bool quoted = false;
        for (int i = 0; i < token.size(); ++i) {
            const QChar c = token.at(i);
            if (c == QLatin1Char('\'')) {
                quoted = !quoted;
            } else if (!quoted && c == QLatin1Char('\\') && i + 1 < token.size()) {
                path.append(token.at(++i));
            } else {
                path.append(c);
            }
        }
        paths.append(path);
    }
    return paths;
}

Expected<void, MergeError> ConcatManifest::write(const QStringList& orderedPaths,
                                                 const QString& manifestPath,
                                                 PathStyle style) {
    QSaveFile file(manifestPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            QString("cannot write manifest %1: %2").arg(manifestPath, file.errorString()), manifestPath});
    }

    const QByteArray content = build(orderedPaths, style).toUtf8();
    if (file.write(content) != content.size() || !file.commit()) {
        return makeUnexpected(MergeError{MergeError::Kind::ExternalToolFailure,
            QString("cannot write manifest %1: %2").arg(manifestPath, file.errorString()), manifestPath});
    }

    Logger::instance().debug("ConcatManifest: wrote {} entries to {}", orderedPaths.size(), manifestPath.toStdString());
    return {};
}

} // namespace Episodic
