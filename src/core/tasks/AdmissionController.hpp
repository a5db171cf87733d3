#pragma once

#include <QtCore/QDate>
#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QThreadPool>
#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include "EngineAdapter.hpp"
#include "TaskRegistry.hpp"
#include "../common/Clock.hpp"
#include "../common/Config.hpp"

namespace Sluice {

enum class AdmissionError {
    UnknownEngine,
    CapacityReached,
    DailyTaskLimitReached,
    DailyByteLimitReached,
    TaskNotFound,
    NotQueued
};

QString toString(AdmissionError error);

enum class ForceStartResult {
    Admitted,
    StillQueued
};

struct SlotCounters {
    int activeDownload = 0;
    int activeUpload = 0;
    int activeTotal = 0;
};

struct UserQuota {
    int activeTaskCount = 0;
    int tasksToday = 0;
    qint64 downloadBytesToday = 0;
    qint64 uploadBytesToday = 0;
    QDate day;
    QDateTime lastTaskStartedAt;
};

/**
 * @brief Decides Queued vs. Active under the configured quotas
 *
 * Slot counters, category queues and user quotas are private and only
 * touched under one mutex. Granting a slot happens under that mutex and
 * returns at once; the engine start that follows runs on a launch pool,
 * retried with backoff, so callers never wait on a backend. A start that
 * exhausts its budget is reported through startFailed() from the launch
 * thread, and the orchestrator routes it to the cancellation coordinator.
 * A start attempt answered after its deadline has its handle cancelled.
 */
class AdmissionController : public QObject {
    Q_OBJECT

public:
    AdmissionController(const Config::QueueSettings& queue,
                        const Config::EngineSettings& engine,
                        TaskRegistry* registry,
                        EngineRegistry* engines,
                        const Clock* clock,
                        QObject* parent = nullptr);
    ~AdmissionController() override;

    Expected<TaskId, AdmissionError> submit(const TaskSpec& spec);
    // Appends a restored task to its queue without admitting it
    void enqueueRestored(const std::shared_ptr<Task>& task);

    // Frees the task's slot if it holds one, or drops it from its queue.
    // Safe to call more than once.
    void release(TaskId id, qint64 transferredBytes = 0);

    Expected<ForceStartResult, AdmissionError> forceStart(TaskId id);
    // Fills every free slot from the queues; returns the number admitted
    int promotePending();

    void setPaused(bool paused);
    bool isPaused() const;

    // Blocks until no engine start is in flight; false if msecs ran out
    bool waitForStarts(int msecs = -1);

    SlotCounters counters() const;
    std::optional<UserQuota> userQuota(const QString& ownerId) const;
    QList<TaskId> queueOrder(TaskCategory category) const;
    bool holdsSlot(TaskId id) const;

signals:
    void taskAdmitted(TaskId id);
    void startFailed(TaskId id, const QString& message);
    void pausedChanged(bool paused);

private:
    struct QueueEntry {
        TaskId id;
        QString ownerId;
    };

    struct Ticket {
        TaskId id;
        TaskCategory category;
        QString ownerId;
    };

    bool hasCapacityLocked(TaskCategory category) const;
    bool ownerEligibleLocked(const QString& ownerId, const QDateTime& now) const;
    std::optional<Ticket> admitNextLocked(TaskCategory category, const QDateTime& now);
    QList<Ticket> fillLocked(TaskCategory category, const QDateTime& now);
    void grantLocked(const Ticket& ticket, const QDateTime& now);
    bool removeQueuedLocked(TaskId id);
    int liveCountLocked() const;
    UserQuota& quotaLocked(const QString& ownerId, const QDate& today);

    void launch(const Ticket& ticket);
    void launchAll(const QList<Ticket>& tickets);
    void startEngine(const Ticket& ticket);

    const Config::QueueSettings queue_;
    const Config::EngineSettings engine_;
    TaskRegistry* registry_;
    EngineRegistry* engines_;
    const Clock* clock_;

    mutable QMutex mutex_;
    SlotCounters counters_;
    std::deque<QueueEntry> queues_[2];
    QHash<TaskId, Ticket> holders_;
    QHash<QString, UserQuota> users_;
    bool paused_ = false;

    std::atomic<bool> stopping_{false};
    std::unique_ptr<QThreadPool> launchPool_;
    std::unique_ptr<QThreadPool> enginePool_;
};

} // namespace Sluice
