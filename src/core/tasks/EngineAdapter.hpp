#pragma once

#include <QtCore/QHash>
#include <QtCore/QReadWriteLock>
#include <QtCore/QStringList>
#include <QtCore/QThreadPool>
#include <chrono>
#include <functional>
#include <memory>
#include "TaskTypes.hpp"
#include "../common/Expected.hpp"
#include "../common/TimedCall.hpp"

namespace Sluice {

enum class EngineError {
    Unreachable,
    Rejected,
    InvalidSpec,
    HandleNotFound,
    Timeout,
    Internal
};

QString toString(EngineError error);

// Rejected and InvalidSpec will fail the same way on every attempt
bool isRetryable(EngineError error);

/**
 * @brief Backend that actually moves bytes for one kind of task
 *
 * Implementations must be callable from any thread. Calls may block;
 * the core always invokes them through callEngine() with a deadline.
 */
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    virtual QString kind() const = 0;
    virtual Expected<EngineHandle, EngineError> start(const TaskSpec& spec) = 0;
    virtual Expected<EngineProgress, EngineError> progress(const EngineHandle& handle) = 0;
    virtual Expected<void, EngineError> cancel(const EngineHandle& handle) = 0;
};

class EngineRegistry {
public:
    void registerAdapter(const std::shared_ptr<EngineAdapter>& adapter);
    std::shared_ptr<EngineAdapter> adapterFor(const QString& kind) const;
    bool hasAdapter(const QString& kind) const;
    QStringList kinds() const;

private:
    mutable QReadWriteLock lock_;
    QHash<QString, std::shared_ptr<EngineAdapter>> adapters_;
};

// Runs an adapter call on pool; expiry of timeout yields EngineError::Timeout
template<typename T>
Expected<T, EngineError> callEngine(QThreadPool* pool,
                                    std::function<Expected<T, EngineError>()> call,
                                    std::chrono::milliseconds timeout) {
    return callWithTimeout<T, EngineError>(pool, std::move(call), timeout,
                                           EngineError::Timeout, EngineError::Internal);
}

} // namespace Sluice
