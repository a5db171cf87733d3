#pragma once

#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QSemaphore>
#include <QtCore/QThreadPool>
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include "Expected.hpp"
#include "Logger.hpp"

namespace Sluice {

/**
 * @brief A call running on a thread pool that the caller waits on with a deadline
 *
 * The caller may give up waiting while the call keeps running; the shared
 * state outlives both sides. A late result is dropped unless the caller
 * registered onLateResult().
 */
template<typename T, typename E>
class PendingCall {
public:
    using Result = Expected<T, E>;

    // failureError is reported when the operation throws
    static PendingCall launch(QThreadPool* pool, std::function<Result()> operation, E failureError) {
        auto state = std::make_shared<State>();
        pool->start([state, operation, failureError]() {
            std::optional<Result> result;
            try {
                result.emplace(operation());
            } catch (const std::exception& e) {
                SLUICE_ERROR("Pooled call threw: {}", e.what());
                result.emplace(makeUnexpected(failureError));
            }
            std::function<void(const Result&)> onLate;
            {
                QMutexLocker locker(&state->mutex);
                state->result = result;
                onLate = std::move(state->onLate);
            }
            state->done.release();
            if (onLate) {
                try {
                    onLate(*result);
                } catch (const std::exception& e) {
                    SLUICE_ERROR("Late result handler threw: {}", e.what());
                }
            }
        });
        return PendingCall(std::move(state));
    }

    // Blocks for at most timeout; a zero timeout only polls.
    Result waitFor(std::chrono::milliseconds timeout, E timeoutError) const {
        const int waitMs = static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, timeout.count()));
        if (!state_->done.tryAcquire(1, waitMs)) {
            return makeUnexpected(timeoutError);
        }
        // Leave the permit for isFinished()
        state_->done.release();
        QMutexLocker locker(&state_->mutex);
        return *state_->result;
    }

    // Hands the result to onLate once it arrives, in the thread that produced
    // it. Runs onLate at once if the result is already in.
    void onLateResult(std::function<void(const Result&)> onLate) const {
        std::optional<Result> ready;
        {
            QMutexLocker locker(&state_->mutex);
            if (!state_->result) {
                state_->onLate = std::move(onLate);
                return;
            }
            ready = state_->result;
        }
        onLate(*ready);
    }

    bool isFinished() const {
        QMutexLocker locker(&state_->mutex);
        return state_->result.has_value();
    }

private:
    struct State {
        QSemaphore done;
        QMutex mutex;
        std::optional<Result> result;
        std::function<void(const Result&)> onLate;
    };

    explicit PendingCall(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

template<typename T, typename E>
Expected<T, E> callWithTimeout(QThreadPool* pool,
                               std::function<Expected<T, E>()> operation,
                               std::chrono::milliseconds timeout,
                               E timeoutError,
                               E failureError) {
    return PendingCall<T, E>::launch(pool, std::move(operation), failureError)
        .waitFor(timeout, timeoutError);
}

} // namespace Sluice
