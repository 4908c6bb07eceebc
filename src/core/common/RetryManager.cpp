#include "RetryManager.hpp"
#include "Logger.hpp"
#include <QtCore/QRandomGenerator>
#include <algorithm>
#include <cmath>

namespace Episodic {

RetryManager::RetryManager(QObject* parent)
    : QObject(parent) {
}

RetryManager::RetryManager(const RetryConfig& config, QObject* parent)
    : QObject(parent)
    , config_(config) {
}

void RetryManager::setConfig(const RetryConfig& config) {
    config_ = config;
}

RetryConfig RetryManager::getConfig() const {
    return config_;
}

void RetryManager::setCancellationToken(const CancellationToken& token) {
    cancellation_ = token;
}

int RetryManager::getCurrentAttempt() const {
    return currentAttempt_;
}

std::chrono::milliseconds RetryManager::getElapsedTime() const {
    if (elapsedTimer_.isValid()) {
        return std::chrono::milliseconds(elapsedTimer_.elapsed());
    }
    return std::chrono::milliseconds(0);
}

std::chrono::milliseconds RetryManager::calculateDelayForAttempt(int attempt) const {
    qint64 baseDelay = config_.initialDelay.count();

    switch (config_.policy) {
        case RetryPolicy::None:
            return std::chrono::milliseconds(0);
        case RetryPolicy::Linear:
            break;
        case RetryPolicy::Exponential:
            baseDelay = static_cast<qint64>(
                baseDelay * std::pow(config_.backoffMultiplier, std::max(0, attempt - 1)));
            break;
    }

    baseDelay = std::clamp<qint64>(baseDelay, 0, config_.maxDelay.count());

    if (config_.enableJitter && config_.jitterFactor > 0.0 && baseDelay > 0) {
        const double jitterRange = baseDelay * config_.jitterFactor;
        const double jitter = (QRandomGenerator::global()->generateDouble() * 2.0 - 1.0) * jitterRange;
        baseDelay = std::max<qint64>(0, baseDelay + static_cast<qint64>(jitter));
    }

    return std::chrono::milliseconds(baseDelay);
}

bool RetryManager::sleepInterruptibly(std::chrono::milliseconds delay) const {
    constexpr qint64 sliceMs = 50;
    qint64 remaining = delay.count();
    while (remaining > 0) {
        if (cancellation_.isCancelled()) {
            Logger::instance().debug("Retry wait interrupted by cancellation");
            return false;
        }
        const qint64 step = std::min(sliceMs, remaining);
        QThread::msleep(static_cast<unsigned long>(step));
        remaining -= step;
    }
    return !cancellation_.isCancelled();
}

} // namespace Episodic
