#pragma once

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <optional>

#include "../common/Expected.hpp"
#include "../pipeline/PipelineTypes.hpp"

namespace Episodic {

/**
 * @brief Owner of every TransferState record
 *
 * The transfer engine and the orchestrator receive a store by reference and
 * mutate records only through update()/clear(). Implementations serialize
 * concurrent calls.
 */
class ProgressStore {
public:
    // Passed as totalSize to keep the stored value.
    static constexpr qint64 KeepTotal = -1;

    virtual ~ProgressStore() = default;

    // Absent for a path the store has never seen.
    virtual std::optional<TransferState> load(const QString& destPath) const = 0;

    virtual Expected<void, StoreError> update(const QString& destPath,
                                              qint64 bytesReceived,
                                              bool completed,
                                              qint64 totalSize = KeepTotal) = 0;

    virtual Expected<void, StoreError> clear(const QString& destPath) = 0;

    virtual QList<TransferState> entries() const = 0;

    virtual SessionRecord session() const = 0;
    virtual Expected<void, StoreError> setSession(const SessionRecord& record) = 0;

    static QString normalizeKey(const QString& destPath);

protected:
    // Applies an update to a record, enforcing bytes <= total and completed => bytes == total.
    static Expected<void, StoreError> applyUpdate(TransferState& state,
                                                  qint64 bytesReceived,
                                                  bool completed,
                                                  qint64 totalSize);
};

// Non-persistent store for tests and for runs without a record file.
class MemoryProgressStore : public ProgressStore {
public:
    MemoryProgressStore() = default;

    std::optional<TransferState> load(const QString& destPath) const override;
    Expected<void, StoreError> update(const QString& destPath,
                                      qint64 bytesReceived,
                                      bool completed,
                                      qint64 totalSize = KeepTotal) override;
    Expected<void, StoreError> clear(const QString& destPath) override;
    QList<TransferState> entries() const override;
    SessionRecord session() const override;
    Expected<void, StoreError> setSession(const SessionRecord& record) override;

    int updateCount() const;

private:
    mutable QMutex mutex_;
    QHash<QString, TransferState> states_;
    SessionRecord session_;
    int updateCount_ = 0;
};

} // namespace Episodic
