#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QPair>
#include <QtCore/QTimer>
#include <deque>
#include <memory>
#include <optional>
#include "ResourceSampler.hpp"
#include "../tasks/AdmissionController.hpp"
#include "../tasks/CancellationCoordinator.hpp"
#include "../tasks/TaskRegistry.hpp"

namespace Sluice {

// Rolling per-task history, never persisted
struct MonitorSample {
    std::deque<QPair<QDateTime, qint64>> window;  // (timestamp, transferred bytes)
    int consecutiveLowSpeed = 0;
    QDateTime stalledSince;
    bool etaWarned = false;
};

/**
 * @brief Periodic watchdog for stuck tasks and host pressure
 *
 * Marks slow tasks Stalled, cancels them when they stay slow for the wait
 * time, cancels tasks past the completion threshold and warns about long
 * ETAs. Admission is paused once CPU or memory stays above its high mark
 * for consecutiveChecks readings, and resumed once both stay below their
 * low marks as long.
 */
class HealthMonitor : public QObject {
    Q_OBJECT

public:
    HealthMonitor(const Config::MonitorSettings& settings,
                  TaskRegistry* registry,
                  AdmissionController* admission,
                  CancellationCoordinator* coordinator,
                  ResourceSampler* sampler,
                  const Clock* clock,
                  QObject* parent = nullptr);

    void start();
    void stop();
    bool isRunning() const;

    std::optional<MonitorSample> sample(TaskId id) const;
    bool isPressurePaused() const;

public slots:
    void tick();

signals:
    void taskStalled(TaskId id);
    void taskRecovered(TaskId id);
    void etaWarning(TaskId id, qint64 etaSeconds);
    void pressureChanged(bool paused);

private:
    void checkResourcePressure(const QDateTime& now);
    void inspect(const std::shared_ptr<Task>& task, const QDateTime& now);
    qint64 measuredSpeed(const MonitorSample& sample) const;
    void escalate(TaskId id, CancelReason reason, const QString& detail);
    void publish(const TaskSnapshot& snapshot, TaskPhase phase, StatusEventType type,
                 const QString& message, const QDateTime& now);

    const Config::MonitorSettings settings_;
    TaskRegistry* registry_;
    AdmissionController* admission_;
    CancellationCoordinator* coordinator_;
    ResourceSampler* sampler_;
    const Clock* clock_;

    QTimer* timer_;
    mutable QMutex samplesMutex_;
    QHash<TaskId, MonitorSample> samples_;
    std::deque<ResourceUsage> pressureWindow_;
    bool pausedByPressure_ = false;
};

} // namespace Sluice
