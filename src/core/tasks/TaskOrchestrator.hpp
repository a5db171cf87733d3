#pragma once

#include <QtCore/QObject>
#include <QtCore/QTimer>
#include <memory>
#include "AdmissionController.hpp"
#include "CancellationCoordinator.hpp"
#include "EngineAdapter.hpp"
#include "ProgressPoller.hpp"
#include "StatusAggregator.hpp"
#include "TaskRegistry.hpp"
#include "../common/Clock.hpp"
#include "../common/Config.hpp"
#include "../monitor/HealthMonitor.hpp"
#include "../monitor/ResourceSampler.hpp"
#include "../storage/TaskStore.hpp"

namespace Sluice {

/**
 * @brief Owns and wires the queue engine
 *
 * Builds every component from one settings object, persists a snapshot
 * on each phase change, restores incomplete tasks at startup and drives
 * the periodic workers. All status events leave through statusEvent().
 */
class TaskOrchestrator : public QObject {
    Q_OBJECT

public:
    TaskOrchestrator(const Config::OrchestratorSettings& settings,
                     TaskStore* store,
                     std::shared_ptr<ResourceSampler> sampler = nullptr,
                     std::shared_ptr<const Clock> clock = nullptr,
                     QObject* parent = nullptr);
    ~TaskOrchestrator() override;

    void registerEngine(const std::shared_ptr<EngineAdapter>& adapter);

    // Re-inserts every stored incomplete task as Queued; returns how many
    Expected<int, StorageError> restoreIncomplete();

    void start();
    void stop();
    bool isRunning() const;

    Expected<TaskId, AdmissionError> submit(const TaskSpec& spec);
    Expected<void, CancelError> cancel(TaskId id, const QString& detail = QString());
    Expected<ForceStartResult, AdmissionError> forceStart(TaskId id);
    // Retires a terminal task from the registry and the store
    Expected<void, RegistryError> acknowledge(TaskId id);

    Expected<StatusPage, StatusError> status(const StatusFilter& filter,
                                             const QString& cursor = QString(),
                                             int pageSize = 0) const;
    StatusSummary summary(const StatusFilter& filter = StatusFilter()) const;

    TaskRegistry* registry() const { return registry_.get(); }
    AdmissionController* admission() const { return admission_.get(); }
    CancellationCoordinator* coordinator() const { return coordinator_.get(); }
    ProgressPoller* poller() const { return poller_.get(); }
    HealthMonitor* monitor() const { return monitor_.get(); }

signals:
    void statusEvent(const Sluice::StatusEvent& event);

private slots:
    void onStatusEvent(const Sluice::StatusEvent& event);

private:
    void persist(TaskId id);

    const Config::OrchestratorSettings settings_;
    TaskStore* store_;
    std::shared_ptr<ResourceSampler> sampler_;
    std::shared_ptr<const Clock> clock_;

    std::unique_ptr<TaskRegistry> registry_;
    std::unique_ptr<EngineRegistry> engines_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<CancellationCoordinator> coordinator_;
    std::unique_ptr<ProgressPoller> poller_;
    std::unique_ptr<HealthMonitor> monitor_;
    std::unique_ptr<StatusAggregator> aggregator_;
    QTimer* sweepTimer_;
};

} // namespace Sluice
