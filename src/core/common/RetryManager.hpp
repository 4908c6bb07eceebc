#pragma once

#include <QtCore/QObject>
#include <QtCore/QElapsedTimer>
#include <QtCore/QThread>
#include <QtCore/QString>
#include <functional>
#include <chrono>
#include "Expected.hpp"
#include "CancellationToken.hpp"

namespace Episodic {

enum class RetryPolicy {
    None,           // Single attempt
    Linear,         // Fixed delay between retries
    Exponential     // Exponentially increasing delay
};

struct RetryConfig {
    RetryPolicy policy = RetryPolicy::Exponential;
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    double backoffMultiplier = 2.0;
    double jitterFactor = 0.1; // 10% jitter
    bool enableJitter = true;
};

/**
 * @brief Synchronous retry loop with configurable backoff
 *
 * Runs an operation until it succeeds, returns a non-retryable error, or
 * the attempt budget is spent. The last error is returned unchanged so the
 * caller can still tell the failure kinds apart. The delay between attempts
 * is interruptible through the cancellation token.
 */
class RetryManager : public QObject {
    Q_OBJECT

public:
    explicit RetryManager(QObject* parent = nullptr);
    explicit RetryManager(const RetryConfig& config, QObject* parent = nullptr);

    template<typename T, typename ErrorType>
    Expected<T, ErrorType> execute(
        std::function<Expected<T, ErrorType>()> operation,
        std::function<bool(const ErrorType&)> isRetryable = nullptr
    );

    void setConfig(const RetryConfig& config);
    RetryConfig getConfig() const;

    void setCancellationToken(const CancellationToken& token);

    int getCurrentAttempt() const;
    std::chrono::milliseconds getElapsedTime() const;

    std::chrono::milliseconds calculateDelayForAttempt(int attempt) const;

signals:
    void attemptStarted(int attempt);
    void attemptFailed(int attempt);
    void retryScheduled(int nextAttempt, int delayMs);

private:
    // Returns false when cancelled during the wait.
    bool sleepInterruptibly(std::chrono::milliseconds delay) const;

    RetryConfig config_;
    CancellationToken cancellation_;
    QElapsedTimer elapsedTimer_;
    int currentAttempt_ = 0;
};

template<typename T, typename ErrorType>
Expected<T, ErrorType> RetryManager::execute(
    std::function<Expected<T, ErrorType>()> operation,
    std::function<bool(const ErrorType&)> isRetryable
) {
    elapsedTimer_.start();
    const int attempts = config_.policy == RetryPolicy::None ? 1 : qMax(1, config_.maxAttempts);

    for (currentAttempt_ = 1; ; ++currentAttempt_) {
        emit attemptStarted(currentAttempt_);

        auto result = operation();
        if (result.hasValue()) {
            return result;
        }

        emit attemptFailed(currentAttempt_);

        const bool retryable = !isRetryable || isRetryable(result.error());
        if (!retryable || currentAttempt_ >= attempts || cancellation_.isCancelled()) {
            return result;
        }

        auto delay = calculateDelayForAttempt(currentAttempt_);
        emit retryScheduled(currentAttempt_ + 1, static_cast<int>(delay.count()));
        if (!sleepInterruptibly(delay)) {
            return result;
        }
    }
}

} // namespace Episodic
