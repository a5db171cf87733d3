#include "Task.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QMutexLocker>
#include <algorithm>

namespace Sluice {

QString toString(TaskError error) {
    switch (error) {
        case TaskError::InvalidTransition: return QStringLiteral("invalid phase transition");
        case TaskError::CancellationPending: return QStringLiteral("cancellation pending");
        case TaskError::NotRunning: return QStringLiteral("task is not running");
    }
    return QStringLiteral("unknown task error");
}

bool isValidTransition(TaskPhase from, TaskPhase to) {
    switch (from) {
        case TaskPhase::Queued:
            return to == TaskPhase::Active || to == TaskPhase::Cancelled || to == TaskPhase::Failed;
        case TaskPhase::Active:
            return to == TaskPhase::Stalled || to == TaskPhase::Completed ||
                   to == TaskPhase::Failed || to == TaskPhase::Cancelled;
        case TaskPhase::Stalled:
            return to == TaskPhase::Active || to == TaskPhase::Cancelled ||
                   to == TaskPhase::Completed || to == TaskPhase::Failed;
        case TaskPhase::Completed:
        case TaskPhase::Failed:
        case TaskPhase::Cancelled:
            return false;
    }
    return false;
}

Task::Task(TaskId id, const TaskSpec& spec, const QDateTime& createdAt)
    : id_(id)
    , spec_(spec)
    , createdAt_(createdAt)
    , sizeBytes_(spec.sizeBytes) {
}

std::shared_ptr<Task> Task::restore(const TaskSnapshot& snapshot) {
    auto task = std::make_shared<Task>(snapshot.id, snapshot.spec(), snapshot.createdAt);
    task->sizeBytes_ = snapshot.sizeBytes;
    task->transferredBytes_ = snapshot.transferredBytes;
    task->retryCount_ = snapshot.retryCount;
    task->priority_ = snapshot.priority;
    return task;
}

TaskPhase Task::phase() const {
    QMutexLocker locker(&mutex_);
    return phase_;
}

std::optional<EngineHandle> Task::engineHandle() const {
    QMutexLocker locker(&mutex_);
    return engineHandle_;
}

qint64 Task::transferredBytes() const {
    QMutexLocker locker(&mutex_);
    return transferredBytes_;
}

int Task::priority() const {
    QMutexLocker locker(&mutex_);
    return priority_;
}

bool Task::isCancellationClaimed() const {
    QMutexLocker locker(&mutex_);
    return cancellationClaimed_;
}

TaskSnapshot Task::snapshot() const {
    TaskSnapshot snapshot;
    snapshot.id = id_;
    snapshot.ownerId = spec_.ownerId;
    snapshot.chatRef = spec_.chatRef;
    snapshot.category = spec_.category;
    snapshot.kind = spec_.kind;
    snapshot.name = spec_.name;
    snapshot.source = spec_.source;
    snapshot.destination = spec_.destination;
    snapshot.options = spec_.options;
    snapshot.createdAt = createdAt_;

    QMutexLocker locker(&mutex_);
    snapshot.phase = phase_;
    snapshot.engineHandle = engineHandle_;
    snapshot.sizeBytes = sizeBytes_;
    snapshot.transferredBytes = transferredBytes_;
    snapshot.speedBps = speedBps_;
    snapshot.etaSeconds = etaSeconds_;
    snapshot.admittedAt = admittedAt_;
    snapshot.lastProgressAt = lastProgressAt_;
    snapshot.retryCount = retryCount_;
    snapshot.priority = priority_;
    snapshot.error = error_;
    snapshot.cancelReason = cancelReason_;
    return snapshot;
}

Expected<void, TaskError> Task::transitionLocked(TaskPhase to) {
    if (!isValidTransition(phase_, to)) {
        SLUICE_WARN("Task {}: rejected transition {} -> {}", id_,
                    toString(phase_).toStdString(), toString(to).toStdString());
        return makeUnexpected(TaskError::InvalidTransition);
    }
    SLUICE_DEBUG("Task {}: {} -> {}", id_, toString(phase_).toStdString(), toString(to).toStdString());
    phase_ = to;
    return {};
}

Expected<void, TaskError> Task::markActive(const EngineHandle& handle, const QDateTime& now) {
    QMutexLocker locker(&mutex_);
    if (cancellationClaimed_) {
        return makeUnexpected(TaskError::CancellationPending);
    }
    auto result = transitionLocked(TaskPhase::Active);
    if (result.hasError()) {
        return result;
    }
    engineHandle_ = handle;
    admittedAt_ = now;
    lastProgressAt_ = now;
    return {};
}

Expected<void, TaskError> Task::applyProgress(const EngineProgress& progress, const QDateTime& now) {
    QMutexLocker locker(&mutex_);
    if (!isRunning(phase_) || cancellationClaimed_) {
        return makeUnexpected(TaskError::NotRunning);
    }
    if (progress.sizeBytes && *progress.sizeBytes >= 0) {
        sizeBytes_ = progress.sizeBytes;
    }
    transferredBytes_ = std::max<qint64>(0, progress.transferredBytes);
    if (sizeBytes_) {
        transferredBytes_ = std::min(transferredBytes_, *sizeBytes_);
    }
    speedBps_ = std::max<qint64>(0, progress.speedBps);
    etaSeconds_ = progress.etaSeconds;
    lastProgressAt_ = now;
    return {};
}

Expected<void, TaskError> Task::markStalled() {
    QMutexLocker locker(&mutex_);
    if (cancellationClaimed_) {
        return makeUnexpected(TaskError::CancellationPending);
    }
    if (phase_ != TaskPhase::Active) {
        return makeUnexpected(TaskError::InvalidTransition);
    }
    return transitionLocked(TaskPhase::Stalled);
}

Expected<void, TaskError> Task::markRecovered() {
    QMutexLocker locker(&mutex_);
    if (cancellationClaimed_) {
        return makeUnexpected(TaskError::CancellationPending);
    }
    if (phase_ != TaskPhase::Stalled) {
        return makeUnexpected(TaskError::InvalidTransition);
    }
    return transitionLocked(TaskPhase::Active);
}

Expected<void, TaskError> Task::markCompleted(const QDateTime& now) {
    QMutexLocker locker(&mutex_);
    if (cancellationClaimed_) {
        return makeUnexpected(TaskError::CancellationPending);
    }
    auto result = transitionLocked(TaskPhase::Completed);
    if (result.hasError()) {
        return result;
    }
    engineHandle_.reset();
    if (sizeBytes_) {
        transferredBytes_ = *sizeBytes_;
    }
    speedBps_ = 0;
    etaSeconds_ = 0;
    lastProgressAt_ = now;
    return {};
}

Task::CancellationClaim Task::claimCancellation() {
    QMutexLocker locker(&mutex_);
    CancellationClaim claim;
    claim.previousPhase = phase_;
    if (cancellationClaimed_ || isTerminal(phase_)) {
        return claim;
    }
    cancellationClaimed_ = true;
    claim.claimed = true;
    claim.handle = engineHandle_;
    return claim;
}

Expected<void, TaskError> Task::finishCancellation(TaskPhase terminal, CancelReason reason,
                                                   const QString& error) {
    QMutexLocker locker(&mutex_);
    if (!cancellationClaimed_ || terminal == TaskPhase::Completed || !isTerminal(terminal)) {
        return makeUnexpected(TaskError::InvalidTransition);
    }
    auto result = transitionLocked(terminal);
    if (result.hasError()) {
        return result;
    }
    engineHandle_.reset();
    speedBps_ = 0;
    etaSeconds_ = -1;
    error_ = error;
    cancelReason_ = reason;
    return {};
}

void Task::recordRetry() {
    QMutexLocker locker(&mutex_);
    ++retryCount_;
}

void Task::boostPriority() {
    QMutexLocker locker(&mutex_);
    ++priority_;
}

} // namespace Sluice
