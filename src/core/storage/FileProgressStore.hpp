#pragma once

#include <QtCore/QJsonObject>

#include "ProgressStore.hpp"

namespace Episodic {

/**
 * @brief ProgressStore backed by a single JSON record file
 *
 * Every mutation rewrites the whole record through QSaveFile (temporary file
 * plus rename), so a crash mid-write leaves the previously committed record
 * intact. A failed commit rolls the in-memory table back to match the disk.
 *
 * Record layout:
 * @code
 * {
 *   "version": 1,
 *   "session": { "series_id": 941, "title": "...", "page_url": "...", "selection": "1-3" },
 *   "transfers": {
 *     "/abs/path/ep_01.mp4": { "total_size": 1048576, "bytes_received": 524288,
 *                              "completed": false, "last_updated": "2026-01-01T00:00:00Z" }
 *   }
 * }
 * @endcode
 */
class FileProgressStore : public ProgressStore {
public:
    static constexpr int RecordVersion = 1;

    FileProgressStore() = default;
    ~FileProgressStore() override = default;

    // Loads an existing record or starts an empty one. A record that cannot be parsed is Corrupt.
    Expected<void, StoreError> open(const QString& recordPath);
    bool isOpen() const;
    QString recordPath() const;

    std::optional<TransferState> load(const QString& destPath) const override;
    Expected<void, StoreError> update(const QString& destPath,
                                      qint64 bytesReceived,
                                      bool completed,
                                      qint64 totalSize = KeepTotal) override;
    Expected<void, StoreError> clear(const QString& destPath) override;
    QList<TransferState> entries() const override;
    SessionRecord session() const override;
    Expected<void, StoreError> setSession(const SessionRecord& record) override;

    // Removes the record file and forgets every entry.
    Expected<void, StoreError> reset();

private:
    Expected<void, StoreError> commitLocked();
    QJsonObject toJson() const;
    Expected<void, StoreError> fromJson(const QJsonObject& root);

    mutable QMutex mutex_;
    QString recordPath_;
    bool open_ = false;
    QHash<QString, TransferState> states_;
    SessionRecord session_;
};

} // namespace Episodic
