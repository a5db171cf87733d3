#pragma once

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QThreadPool>
#include <QtCore/QTimer>
#include <chrono>
#include <memory>
#include <unordered_map>
#include "AdmissionController.hpp"
#include "CancellationCoordinator.hpp"
#include "EngineAdapter.hpp"
#include "TaskRegistry.hpp"

namespace Sluice {

/**
 * @brief Periodic worker that keeps running tasks' progress current
 *
 * Each tick fans out one progress call per Active or Stalled task onto a
 * bounded pool and waits for all of them against a shared deadline.
 * Completion moves the task to Completed and releases its slot; repeated
 * failures escalate to the cancellation coordinator.
 */
class ProgressPoller : public QObject {
    Q_OBJECT

public:
    ProgressPoller(const Config::EngineSettings& engine,
                   const Config::QueueSettings& queue,
                   std::chrono::milliseconds interval,
                   TaskRegistry* registry,
                   EngineRegistry* engines,
                   AdmissionController* admission,
                   CancellationCoordinator* coordinator,
                   const Clock* clock,
                   QObject* parent = nullptr);
    ~ProgressPoller() override;

    void start();
    void stop();
    bool isRunning() const;

    int consecutiveFailures(TaskId id) const;

public slots:
    void tick();

signals:
    void taskCompleted(TaskId id);
    void tickFinished(int polled);

private:
    using ProgressCall = PendingCall<EngineProgress, EngineError>;

    void handleProgress(const std::shared_ptr<Task>& task, const EngineProgress& progress);
    void handleFailure(const std::shared_ptr<Task>& task, EngineError error);

    const Config::EngineSettings engine_;
    const QHash<QString, qint64> sizeLimits_;
    TaskRegistry* registry_;
    EngineRegistry* engines_;
    AdmissionController* admission_;
    CancellationCoordinator* coordinator_;
    const Clock* clock_;

    QTimer* timer_;
    std::unique_ptr<QThreadPool> pool_;
    QHash<TaskId, int> failures_;
    // Calls that outlived their tick; the task is skipped until they finish
    std::unordered_map<TaskId, ProgressCall> inFlight_;
};

} // namespace Sluice
