#include "FileProgressStore.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QMutexLocker>
#include <QtCore/QSaveFile>
#include <algorithm>

namespace Episodic {

Expected<void, StoreError> FileProgressStore::open(const QString& recordPath) {
    QMutexLocker locker(&mutex_);

    recordPath_ = QFileInfo(recordPath).absoluteFilePath();
    states_.clear();
    session_ = SessionRecord{};
    open_ = false;

    QFileInfo info(recordPath_);
    if (!QDir().mkpath(info.absolutePath())) {
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure,
            QString("cannot create directory %1").arg(info.absolutePath())});
    }

    if (!info.exists()) {
        Logger::instance().info("FileProgressStore: starting new record at {}", recordPath_.toStdString());
        open_ = true;
        return {};
    }

    QFile file(recordPath_);
    if (!file.open(QIODevice::ReadOnly)) {
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure,
            QString("cannot read %1: %2").arg(recordPath_, file.errorString())});
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        Logger::instance().error("FileProgressStore: record {} is corrupt: {}",
                                 recordPath_.toStdString(), parseError.errorString().toStdString());
        return makeUnexpected(StoreError{StoreError::Kind::Corrupt,
            QString("%1: %2").arg(recordPath_, parseError.errorString())});
    }

    auto parsed = fromJson(document.object());
    if (parsed.hasError()) {
        return parsed;
    }

    open_ = true;
    Logger::instance().info("FileProgressStore: loaded {} transfer records from {}",
                            states_.size(), recordPath_.toStdString());
    return {};
}

bool FileProgressStore::isOpen() const {
    QMutexLocker locker(&mutex_);
    return open_;
}

QString FileProgressStore::recordPath() const {
    QMutexLocker locker(&mutex_);
    return recordPath_;
}

std::optional<TransferState> FileProgressStore::load(const QString& destPath) const {
    QMutexLocker locker(&mutex_);
    auto it = states_.constFind(normalizeKey(destPath));
    if (it == states_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

Expected<void, StoreError> FileProgressStore::update(const QString& destPath,
                                                     qint64 bytesReceived,
                                                     bool completed,
                                                     qint64 totalSize) {
    QMutexLocker locker(&mutex_);
    if (!open_) {
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure, "store is not open"});
    }

    const QString key = normalizeKey(destPath);
    const bool existed = states_.contains(key);
    const TransferState previous = states_.value(key);

    TransferState state = previous;
    state.destPath = key;
    auto applied = applyUpdate(state, bytesReceived, completed, totalSize);
    if (applied.hasError()) {
        Logger::instance().warn("FileProgressStore: rejected update for {}: {}",
                                key.toStdString(), applied.error().detail.toStdString());
        return applied;
    }

    states_.insert(key, state);
    auto committed = commitLocked();
    if (committed.hasError()) {
        if (existed) {
            states_.insert(key, previous);
        } else {
            states_.remove(key);
        }
        return committed;
    }
    return {};
}

Expected<void, StoreError> FileProgressStore::clear(const QString& destPath) {
    QMutexLocker locker(&mutex_);
    if (!open_) {
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure, "store is not open"});
    }

    const QString key = normalizeKey(destPath);
    auto it = states_.find(key);
    if (it == states_.end()) {
        return {};
    }

    const TransferState previous = it.value();
    states_.erase(it);
    auto committed = commitLocked();
    if (committed.hasError()) {
        states_.insert(key, previous);
    }
    return committed;
}

QList<TransferState> FileProgressStore::entries() const {
    QMutexLocker locker(&mutex_);
    QList<TransferState> result = states_.values();
    std::sort(result.begin(), result.end(), [](const TransferState& a, const TransferState& b) {
        return a.destPath < b.destPath;
    });
    return result;
}

SessionRecord FileProgressStore::session() const {
    QMutexLocker locker(&mutex_);
    return session_;
}

Expected<void, StoreError> FileProgressStore::setSession(const SessionRecord& record) {
    QMutexLocker locker(&mutex_);
    if (!open_) {
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure, "store is not open"});
    }

    const SessionRecord previous = session_;
    session_ = record;
    auto committed = commitLocked();
    if (committed.hasError()) {
        session_ = previous;
    }
    return committed;
}

Expected<void, StoreError> FileProgressStore::reset() {
    QMutexLocker locker(&mutex_);
    states_.clear();
    session_ = SessionRecord{};
    if (!recordPath_.isEmpty() && QFile::exists(recordPath_) && !QFile::remove(recordPath_)) {
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure,
            QString("cannot remove %1").arg(recordPath_)});
    }
    return {};
}

Expected<void, StoreError> FileProgressStore::commitLocked() {
    QSaveFile file(recordPath_);
    if (!file.open(QIODevice::WriteOnly)) {
        Logger::instance().error("FileProgressStore: cannot open {} for writing: {}",
                                 recordPath_.toStdString(), file.errorString().toStdString());
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure, file.errorString()});
    }

    const QByteArray payload = QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure, file.errorString()});
    }

    if (!file.commit()) {
        Logger::instance().error("FileProgressStore: commit of {} failed: {}",
                                 recordPath_.toStdString(), file.errorString().toStdString());
        return makeUnexpected(StoreError{StoreError::Kind::IOFailure, file.errorString()});
    }

    Logger::instance().trace("FileProgressStore: committed {} records", states_.size());
    return {};
}

QJsonObject FileProgressStore::toJson() const {
    QJsonObject transfers;
    for (auto it = states_.constBegin(); it != states_.constEnd(); ++it) {
        const TransferState& state = it.value();
        QJsonObject entry;
        entry["total_size"] = state.totalSize;
        entry["bytes_received"] = state.bytesReceived;
        entry["completed"] = state.completed;
        entry["last_updated"] = state.lastUpdated.toString(Qt::ISODateWithMs);
        transfers[it.key()] = entry;
    }

    QJsonObject session;
    session["series_id"] = session_.seriesId;
    session["title"] = session_.title;
    session["page_url"] = session_.pageUrl;
    session["selection"] = session_.selection;

    QJsonObject root;
    root["version"] = RecordVersion;
    root["session"] = session;
    root["transfers"] = transfers;
    return root;
}

Expected<void, StoreError> FileProgressStore::fromJson(const QJsonObject& root) {
    const int version = root.value("version").toInt(0);
    if (version != RecordVersion) {
        return makeUnexpected(StoreError{StoreError::Kind::Corrupt,
            QString("unsupported record version %1").arg(version)});
    }

    const QJsonObject session = root.value("session").toObject();
    session_.seriesId = session.value("series_id").toInt();
    session_.title = session.value("title").toString();
    session_.pageUrl = session.value("page_url").toString();
    session_.selection = session.value("selection").toString();

    const QJsonObject transfers = root.value("transfers").toObject();
    for (auto it = transfers.constBegin(); it != transfers.constEnd(); ++it) {
        if (!it.value().isObject()) {
            return makeUnexpected(StoreError{StoreError::Kind::Corrupt,
                QString("entry %1 is not an object").arg(it.key())});
        }
        const QJsonObject entry = it.value().toObject();

        TransferState state;
        state.destPath = normalizeKey(it.key());
        state.totalSize = entry.value("total_size").toVariant().toLongLong();
        state.bytesReceived = entry.value("bytes_received").toVariant().toLongLong();
        state.completed = entry.value("completed").toBool();
        state.lastUpdated = QDateTime::fromString(entry.value("last_updated").toString(), Qt::ISODateWithMs);

        if (state.bytesReceived < 0 || (state.hasKnownTotal() && state.bytesReceived > state.totalSize)) {
            return makeUnexpected(StoreError{StoreError::Kind::Corrupt,
                QString("entry %1 has inconsistent sizes").arg(it.key())});
        }
        states_.insert(state.destPath, state);
    }
    return {};
}

} // namespace Episodic
