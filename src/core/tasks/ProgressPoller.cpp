#include "ProgressPoller.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QSet>
#include <algorithm>
#include <vector>

namespace Sluice {

ProgressPoller::ProgressPoller(const Config::EngineSettings& engine,
                               const Config::QueueSettings& queue,
                               std::chrono::milliseconds interval,
                               TaskRegistry* registry,
                               EngineRegistry* engines,
                               AdmissionController* admission,
                               CancellationCoordinator* coordinator,
                               const Clock* clock,
                               QObject* parent)
    : QObject(parent)
    , engine_(engine)
    , sizeLimits_(queue.sizeLimitBytes)
    , registry_(registry)
    , engines_(engines)
    , admission_(admission)
    , coordinator_(coordinator)
    , clock_(clock)
    , timer_(new QTimer(this))
    , pool_(std::make_unique<QThreadPool>()) {
    pool_->setMaxThreadCount(std::max(1, engine.pollConcurrency));
    timer_->setInterval(static_cast<int>(interval.count()));
    connect(timer_, &QTimer::timeout, this, &ProgressPoller::tick);
}

ProgressPoller::~ProgressPoller() {
    timer_->stop();
    pool_->waitForDone();
}

void ProgressPoller::start() {
    timer_->start();
    SLUICE_INFO("Progress poller started, interval {}ms", timer_->interval());
}

void ProgressPoller::stop() {
    timer_->stop();
    SLUICE_INFO("Progress poller stopped");
}

bool ProgressPoller::isRunning() const {
    return timer_->isActive();
}

int ProgressPoller::consecutiveFailures(TaskId id) const {
    return failures_.value(id, 0);
}

void ProgressPoller::tick() {
    for (auto it = inFlight_.begin(); it != inFlight_.end();) {
        if (it->second.isFinished()) {
            it = inFlight_.erase(it);
        } else {
            ++it;
        }
    }

    struct Poll {
        std::shared_ptr<Task> task;
        ProgressCall call;
    };
    std::vector<Poll> polls;
    QSet<TaskId> running;

    const QList<std::shared_ptr<Task>> tasks = registry_->runningTasks();
    for (const auto& task : tasks) {
        running.insert(task->id());
        if (inFlight_.count(task->id()) > 0) {
            SLUICE_DEBUG("Task {}: previous progress call still running, skipping", task->id());
            continue;
        }
        const auto handle = task->engineHandle();
        if (!handle) {
            continue;
        }
        auto adapter = engines_->adapterFor(task->kind());
        if (!adapter) {
            SLUICE_WARN("Task {}: no engine for kind '{}'", task->id(), task->kind().toStdString());
            continue;
        }
        const EngineHandle engineHandle = *handle;
        polls.push_back({task, ProgressCall::launch(
            pool_.get(), [adapter, engineHandle]() { return adapter->progress(engineHandle); },
            EngineError::Internal)});
    }

    const auto deadline = std::chrono::steady_clock::now() + engine_.progressTimeout;
    for (Poll& poll : polls) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto result = poll.call.waitFor(remaining, EngineError::Timeout);
        if (result.hasError()) {
            if (result.error() == EngineError::Timeout) {
                inFlight_.emplace(poll.task->id(), poll.call);
            }
            handleFailure(poll.task, result.error());
            continue;
        }
        failures_.remove(poll.task->id());
        handleProgress(poll.task, result.value());
    }

    for (auto it = failures_.begin(); it != failures_.end();) {
        if (!running.contains(it.key())) {
            it = failures_.erase(it);
        } else {
            ++it;
        }
    }

    emit tickFinished(static_cast<int>(polls.size()));
}

void ProgressPoller::handleProgress(const std::shared_ptr<Task>& task, const EngineProgress& progress) {
    const QDateTime now = clock_->now();
    if (task->applyProgress(progress, now).hasError()) {
        return;  // left the running phases meanwhile
    }

    const TaskSnapshot snapshot = task->snapshot();
    const qint64 sizeLimit = sizeLimits_.value(snapshot.kind, 0);
    if (sizeLimit > 0 && snapshot.sizeBytes && *snapshot.sizeBytes > sizeLimit) {
        SLUICE_WARN("Task {}: size {} exceeds the {} limit of {}", snapshot.id, *snapshot.sizeBytes,
                    snapshot.kind.toStdString(), sizeLimit);
        auto cancelled = coordinator_->cancel(snapshot.id, CancelReason::SizeLimitExceeded,
            QStringLiteral("%1 bytes, limit %2").arg(*snapshot.sizeBytes).arg(sizeLimit));
        if (cancelled.hasError()) {
            SLUICE_WARN("Task {}: size limit escalation failed: {}", snapshot.id,
                        toString(cancelled.error()).toStdString());
        }
        return;
    }

    const bool reachedSize = snapshot.sizeBytes && *snapshot.sizeBytes > 0 &&
                             snapshot.transferredBytes >= *snapshot.sizeBytes;
    if (!progress.finished && !reachedSize) {
        return;
    }

    if (task->markCompleted(now).hasError()) {
        return;  // a concurrent cancellation won
    }

    SLUICE_INFO("Task {} completed ({} bytes)", snapshot.id, task->transferredBytes());
    admission_->release(snapshot.id, task->transferredBytes());

    StatusEvent event;
    event.taskId = snapshot.id;
    event.phase = TaskPhase::Completed;
    event.chatRef = snapshot.chatRef;
    event.message = QStringLiteral("Task completed");
    event.timestamp = now;
    registry_->publish(event);

    event.type = StatusEventType::Retiring;
    registry_->publish(event);

    emit taskCompleted(snapshot.id);
}

void ProgressPoller::handleFailure(const std::shared_ptr<Task>& task, EngineError error) {
    const TaskId id = task->id();
    const int count = ++failures_[id];
    SLUICE_WARN("Task {}: progress call failed ({}), {} consecutive", id, toString(error).toStdString(), count);

    if (count < engine_.maxProgressFailures) {
        return;
    }

    failures_.remove(id);
    SLUICE_ERROR("Task {}: escalating after {} failed progress calls", id, count);
    auto cancelled = coordinator_->cancel(id, CancelReason::EngineUnreachable,
        QStringLiteral("%1 consecutive progress failures, last: %2").arg(count).arg(toString(error)));
    if (cancelled.hasError()) {
        SLUICE_WARN("Task {}: escalation failed: {}", id, toString(cancelled.error()).toStdString());
    }
}

} // namespace Sluice
