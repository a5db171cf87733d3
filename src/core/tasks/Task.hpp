#pragma once

#include <QtCore/QMutex>
#include <memory>
#include <optional>
#include "TaskTypes.hpp"
#include "../common/Expected.hpp"

namespace Sluice {

enum class TaskError {
    InvalidTransition,
    CancellationPending,
    NotRunning
};

QString toString(TaskError error);

// Transition table of the per-task state machine. Terminal phases are absorbing.
bool isValidTransition(TaskPhase from, TaskPhase to);

/**
 * @brief One tracked transfer job
 *
 * Identity and spec are immutable. Everything else is guarded by the
 * task's own mutex and only changes through the methods below, which
 * enforce the state machine and the handle invariant (a handle is held
 * exactly while the task is Active or Stalled).
 */
class Task {
public:
    Task(TaskId id, const TaskSpec& spec, const QDateTime& createdAt);

    // Re-creates a persisted task as Queued with a cleared handle
    static std::shared_ptr<Task> restore(const TaskSnapshot& snapshot);

    TaskId id() const { return id_; }
    const TaskSpec& spec() const { return spec_; }
    TaskCategory category() const { return spec_.category; }
    const QString& kind() const { return spec_.kind; }
    const QString& ownerId() const { return spec_.ownerId; }
    const QDateTime& createdAt() const { return createdAt_; }

    TaskPhase phase() const;
    std::optional<EngineHandle> engineHandle() const;
    qint64 transferredBytes() const;
    int priority() const;
    bool isCancellationClaimed() const;
    TaskSnapshot snapshot() const;

    Expected<void, TaskError> markActive(const EngineHandle& handle, const QDateTime& now);
    Expected<void, TaskError> applyProgress(const EngineProgress& progress, const QDateTime& now);
    Expected<void, TaskError> markStalled();
    Expected<void, TaskError> markRecovered();
    Expected<void, TaskError> markCompleted(const QDateTime& now);

    struct CancellationClaim {
        bool claimed = false;
        TaskPhase previousPhase = TaskPhase::Queued;
        std::optional<EngineHandle> handle;
    };

    // Only the first caller on a non-terminal task gets claimed == true
    CancellationClaim claimCancellation();
    Expected<void, TaskError> finishCancellation(TaskPhase terminal, CancelReason reason,
                                                 const QString& error);

    void recordRetry();
    void boostPriority();

private:
    Expected<void, TaskError> transitionLocked(TaskPhase to);

    const TaskId id_;
    const TaskSpec spec_;
    const QDateTime createdAt_;

    mutable QMutex mutex_;
    TaskPhase phase_ = TaskPhase::Queued;
    std::optional<EngineHandle> engineHandle_;
    std::optional<qint64> sizeBytes_;
    qint64 transferredBytes_ = 0;
    qint64 speedBps_ = 0;
    qint64 etaSeconds_ = -1;
    QDateTime admittedAt_;
    QDateTime lastProgressAt_;
    int retryCount_ = 0;
    int priority_ = 0;
    QString error_;
    std::optional<CancelReason> cancelReason_;
    bool cancellationClaimed_ = false;
};

} // namespace Sluice
