#include "RetryManager.hpp"
#include "Logger.hpp"
#include <QtCore/QRandomGenerator>
#include <algorithm>
#include <cmath>
#include <vector>

namespace Sluice {

QString toString(RetryError error) {
    switch (error) {
        case RetryError::MaxAttemptsExceeded: return QStringLiteral("maximum attempts exceeded");
        case RetryError::TimeoutExceeded: return QStringLiteral("retry timeout exceeded");
        case RetryError::NonRetryableError: return QStringLiteral("non-retryable error");
    }
    return QStringLiteral("unknown retry error");
}

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
    std::chrono::milliseconds delay{0};

    switch (config_.policy) {
        case RetryPolicy::None:
            delay = std::chrono::milliseconds(0);
            break;

        case RetryPolicy::Linear:
            delay = config_.initialDelay;
            break;

        case RetryPolicy::Exponential: {
            double multiplier = std::pow(config_.backoffMultiplier, attempt - 1);
            delay = std::chrono::milliseconds(
                static_cast<long long>(config_.initialDelay.count() * multiplier)
            );
            break;
        }

        case RetryPolicy::Fibonacci: {
            std::vector<long long> fib = {1, 1};
            for (int i = 2; i <= attempt; ++i) {
                fib.push_back(fib[i - 1] + fib[i - 2]);
            }
            delay = std::chrono::milliseconds(
                config_.initialDelay.count() * fib[std::min(attempt, static_cast<int>(fib.size() - 1))]
            );
            break;
        }

        case RetryPolicy::Custom:
            delay = config_.calculateDelay ? config_.calculateDelay(attempt) : config_.initialDelay;
            break;
    }

    if (config_.enableJitter && config_.jitterFactor > 0.0) {
        double jitterRange = delay.count() * config_.jitterFactor;
        double jitter = (QRandomGenerator::global()->generateDouble() - 0.5) * 2.0 * jitterRange;
        delay = std::chrono::milliseconds(
            static_cast<long long>(std::max(0.0, delay.count() + jitter))
        );
    }

    if (delay > config_.maxDelay) {
        delay = config_.maxDelay;
    }

    return delay;
}

void RetryManager::logAttemptFailure(int attempt) const {
    SLUICE_WARN("Attempt {}/{} failed", attempt, config_.maxAttempts);
}

void RetryManager::reset() {
    currentAttempt_ = 0;
    elapsedTimer_.invalidate();
}

} // namespace Sluice
