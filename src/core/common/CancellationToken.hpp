#pragma once

#include <atomic>
#include <memory>

namespace Episodic {

/**
 * @brief Shared cooperative cancellation flag
 *
 * Copies share the same flag. Long-running operations poll isCancelled()
 * at their natural boundaries (chunk writes, event loop ticks).
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    void reset() { flag_->store(false); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace Episodic
