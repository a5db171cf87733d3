#pragma once

#include <QtCore/QObject>
#include <QtCore/QElapsedTimer>
#include <QtCore/QThread>
#include <QtCore/QString>
#include <algorithm>
#include <functional>
#include <type_traits>
#include <chrono>
#include "Expected.hpp"

namespace Sluice {

enum class RetryPolicy {
    None,           // No retries
    Linear,         // Fixed delay between retries
    Exponential,    // Exponentially increasing delay
    Fibonacci,      // Fibonacci sequence delays
    Custom          // User-defined delay
};

enum class RetryError {
    MaxAttemptsExceeded,
    TimeoutExceeded,
    NonRetryableError
};

QString toString(RetryError error);

struct RetryConfig {
    RetryPolicy policy = RetryPolicy::Exponential;
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    std::chrono::milliseconds timeout{0}; // 0 = no timeout
    double backoffMultiplier = 2.0;
    double jitterFactor = 0.1; // 10% jitter
    bool enableJitter = true;

    // Custom delay calculation, used with RetryPolicy::Custom
    std::function<std::chrono::milliseconds(int attempt)> calculateDelay = nullptr;
};

/**
 * @brief Runs a fallible operation until it succeeds or the retry budget is spent
 *
 * Attempts run synchronously in the calling thread; backoff sleeps that
 * thread. Used for engine start attempts and for opening the task store.
 */
class RetryManager : public QObject {
    Q_OBJECT

public:
    explicit RetryManager(QObject* parent = nullptr);
    explicit RetryManager(const RetryConfig& config, QObject* parent = nullptr);

    template<typename T, typename ErrorType>
    Expected<T, RetryError> execute(
        std::function<Expected<T, ErrorType>()> operation,
        std::function<bool(const ErrorType&)> isRetryable = nullptr
    );

    void setConfig(const RetryConfig& config);
    RetryConfig getConfig() const;

    int getCurrentAttempt() const;
    std::chrono::milliseconds getElapsedTime() const;
    std::chrono::milliseconds calculateDelayForAttempt(int attempt) const;

signals:
    void attemptStarted(int attempt);
    void attemptFailed(int attempt, const QString& error);
    void retryScheduled(int nextAttempt, int delayMs);
    void operationCompleted(bool success);

private:
    void reset();
    void logAttemptFailure(int attempt) const;

    RetryConfig config_;
    QElapsedTimer elapsedTimer_;
    int currentAttempt_ = 0;
};

template<typename T, typename ErrorType>
Expected<T, RetryError> RetryManager::execute(
    std::function<Expected<T, ErrorType>()> operation,
    std::function<bool(const ErrorType&)> isRetryable
) {
    reset();
    elapsedTimer_.start();
    const int attempts = config_.policy == RetryPolicy::None ? 1 : std::max(1, config_.maxAttempts);

    for (currentAttempt_ = 1; currentAttempt_ <= attempts; ++currentAttempt_) {
        if (config_.timeout.count() > 0 &&
            elapsedTimer_.elapsed() > config_.timeout.count()) {
            emit operationCompleted(false);
            return makeUnexpected(RetryError::TimeoutExceeded);
        }

        emit attemptStarted(currentAttempt_);

        auto result = operation();
        if (result.hasValue()) {
            emit operationCompleted(true);
            if constexpr (std::is_void_v<T>) {
                return {};
            } else {
                return std::move(result).value();
            }
        }

        if (isRetryable && !isRetryable(result.error())) {
            emit operationCompleted(false);
            return makeUnexpected(RetryError::NonRetryableError);
        }

        logAttemptFailure(currentAttempt_);
        emit attemptFailed(currentAttempt_, QString("Attempt %1 failed").arg(currentAttempt_));

        // Don't delay after the last attempt
        if (currentAttempt_ < attempts) {
            auto delay = calculateDelayForAttempt(currentAttempt_);
            emit retryScheduled(currentAttempt_ + 1, static_cast<int>(delay.count()));
            QThread::msleep(static_cast<unsigned long>(delay.count()));
        }
    }

    emit operationCompleted(false);
    return makeUnexpected(RetryError::MaxAttemptsExceeded);
}

namespace RetryConfigs {
    // Engine start attempts: retries is the number of attempts after the first
    inline RetryConfig engineStart(int retries, std::chrono::milliseconds backoff) {
        RetryConfig config;
        config.policy = retries > 0 ? RetryPolicy::Exponential : RetryPolicy::None;
        config.maxAttempts = retries + 1;
        config.initialDelay = backoff;
        config.maxDelay = backoff * 16;
        config.backoffMultiplier = 2.0;
        config.enableJitter = false;
        return config;
    }

    inline RetryConfig database() {
        RetryConfig config;
        config.policy = RetryPolicy::Exponential;
        config.maxAttempts = 3;
        config.initialDelay = std::chrono::milliseconds(100);
        config.maxDelay = std::chrono::milliseconds(1000);
        config.timeout = std::chrono::milliseconds(10000);
        config.backoffMultiplier = 1.5;
        config.enableJitter = false;
        return config;
    }
}

} // namespace Sluice
