#include "ProgressStore.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <algorithm>

namespace Episodic {

QString ProgressStore::normalizeKey(const QString& destPath) {
    return QDir::cleanPath(QFileInfo(destPath).absoluteFilePath());
}

Expected<void, StoreError> ProgressStore::applyUpdate(TransferState& state,
                                                      qint64 bytesReceived,
                                                      bool completed,
                                                      qint64 totalSize) {
    if (bytesReceived < 0) {
        return makeUnexpected(StoreError{StoreError::Kind::InvalidState,
            QString("negative byte count %1").arg(bytesReceived)});
    }

    const qint64 total = totalSize >= 0 ? totalSize : state.totalSize;
    if (total >= 0 && bytesReceived > total) {
        return makeUnexpected(StoreError{StoreError::Kind::InvalidState,
            QString("%1 bytes received exceeds total %2").arg(bytesReceived).arg(total)});
    }
    if (completed && total >= 0 && bytesReceived != total) {
        return makeUnexpected(StoreError{StoreError::Kind::InvalidState,
            QString("completed with %1 of %2 bytes").arg(bytesReceived).arg(total)});
    }

    state.totalSize = total;
    state.bytesReceived = bytesReceived;
    state.completed = completed;
    state.lastUpdated = QDateTime::currentDateTimeUtc();
    return {};
}

std::optional<TransferState> MemoryProgressStore::load(const QString& destPath) const {
    QMutexLocker locker(&mutex_);
    auto it = states_.constFind(normalizeKey(destPath));
    if (it == states_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

Expected<void, StoreError> MemoryProgressStore::update(const QString& destPath,
                                                       qint64 bytesReceived,
                                                       bool completed,
                                                       qint64 totalSize) {
    QMutexLocker locker(&mutex_);
    const QString key = normalizeKey(destPath);

    TransferState state = states_.value(key);
    state.destPath = key;
    auto applied = applyUpdate(state, bytesReceived, completed, totalSize);
    if (applied.hasError()) {
        return applied;
    }
    states_.insert(key, state);
    ++updateCount_;
    return {};
}

Expected<void, StoreError> MemoryProgressStore::clear(const QString& destPath) {
    QMutexLocker locker(&mutex_);
    states_.remove(normalizeKey(destPath));
    return {};
}

QList<TransferState> MemoryProgressStore::entries() const {
    QMutexLocker locker(&mutex_);
    QList<TransferState> result = states_.values();
    std::sort(result.begin(), result.end(), [](const TransferState& a, const TransferState& b) {
        return a.destPath < b.destPath;
    });
    return result;
}

SessionRecord MemoryProgressStore::session() const {
    QMutexLocker locker(&mutex_);
    return session_;
}

Expected<void, StoreError> MemoryProgressStore::setSession(const SessionRecord& record) {
    QMutexLocker locker(&mutex_);
    session_ = record;
    return {};
}

int MemoryProgressStore::updateCount() const {
    QMutexLocker locker(&mutex_);
    return updateCount_;
}

} // namespace Episodic
