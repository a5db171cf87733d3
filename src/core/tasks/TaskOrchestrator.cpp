#include "TaskOrchestrator.hpp"
#include "../common/Logger.hpp"
#include <algorithm>

namespace Sluice {

TaskOrchestrator::TaskOrchestrator(const Config::OrchestratorSettings& settings,
                                   TaskStore* store,
                                   std::shared_ptr<ResourceSampler> sampler,
                                   std::shared_ptr<const Clock> clock,
                                   QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , store_(store)
    , sampler_(std::move(sampler))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , registry_(std::make_unique<TaskRegistry>())
    , engines_(std::make_unique<EngineRegistry>())
    , sweepTimer_(new QTimer(this)) {
    qRegisterMetaType<Sluice::StatusEvent>("Sluice::StatusEvent");

    const std::chrono::milliseconds statusInterval = settings_.status.updateInterval;

    admission_ = std::make_unique<AdmissionController>(settings_.queue, settings_.engine,
                                                       registry_.get(), engines_.get(), clock_.get());
    coordinator_ = std::make_unique<CancellationCoordinator>(settings_.engine, registry_.get(),
                                                             engines_.get(), admission_.get(), clock_.get());
    poller_ = std::make_unique<ProgressPoller>(settings_.engine, settings_.queue, statusInterval,
                                               registry_.get(), engines_.get(), admission_.get(),
                                               coordinator_.get(), clock_.get());
    monitor_ = std::make_unique<HealthMonitor>(settings_.monitor, registry_.get(), admission_.get(),
                                               coordinator_.get(), sampler_.get(), clock_.get());
    aggregator_ = std::make_unique<StatusAggregator>(registry_.get(), settings_.status.limit);

    // Engine starts finish on launch threads; the failure is recorded in this object's thread
    connect(admission_.get(), &AdmissionController::startFailed, this,
            [this](TaskId id, const QString& message) {
                if (!coordinator_) {
                    return;
                }
                auto result = coordinator_->cancel(id, CancelReason::EngineStartFailure, message);
                if (result.hasError()) {
                    SLUICE_WARN("Task {}: start failure not recorded: {}", id,
                                toString(result.error()).toStdString());
                }
            }, Qt::QueuedConnection);

    // Persistence happens in this object's thread
    connect(registry_.get(), &TaskRegistry::statusEvent, this, &TaskOrchestrator::onStatusEvent);

    sweepTimer_->setInterval(static_cast<int>(statusInterval.count()));
    connect(sweepTimer_, &QTimer::timeout, admission_.get(), &AdmissionController::promotePending);

    SLUICE_INFO("Task orchestrator created");
}

TaskOrchestrator::~TaskOrchestrator() {
    stop();
    // Workers first; they reference the admission controller and the registry
    monitor_.reset();
    poller_.reset();
    coordinator_.reset();
    admission_.reset();
}

void TaskOrchestrator::registerEngine(const std::shared_ptr<EngineAdapter>& adapter) {
    engines_->registerAdapter(adapter);
}

Expected<int, StorageError> TaskOrchestrator::restoreIncomplete() {
    if (!store_) {
        return 0;
    }

    auto loaded = store_->loadIncomplete();
    if (loaded.hasError()) {
        SLUICE_ERROR("Could not load incomplete tasks: {}", toString(loaded.error()).toStdString());
        return makeUnexpected(loaded.error());
    }

    QList<TaskSnapshot> snapshots = loaded.value();
    // Force-started tasks keep their place ahead of the rest
    std::sort(snapshots.begin(), snapshots.end(), [](const TaskSnapshot& a, const TaskSnapshot& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        const qint64 left = a.createdAt.toMSecsSinceEpoch();
        const qint64 right = b.createdAt.toMSecsSinceEpoch();
        return left < right || (left == right && a.id < b.id);
    });

    TaskId highest = 0;
    int restored = 0;
    for (const TaskSnapshot& snapshot : snapshots) {
        highest = std::max(highest, snapshot.id);
        if (isTerminal(snapshot.phase)) {
            continue;
        }
        auto task = Task::restore(snapshot);
        if (!registry_->insert(task)) {
            continue;
        }
        admission_->enqueueRestored(task);
        ++restored;

        StatusEvent event;
        event.taskId = task->id();
        event.phase = TaskPhase::Queued;
        event.type = StatusEventType::Restored;
        event.chatRef = snapshot.chatRef;
        event.message = QStringLiteral("Restored after restart (was %1)").arg(toString(snapshot.phase));
        event.timestamp = clock_->now();
        registry_->publish(event);
    }
    registry_->reserveIds(highest);

    SLUICE_INFO("Restored {} incomplete task(s)", restored);
    return restored;
}

void TaskOrchestrator::start() {
    poller_->start();
    if (settings_.monitor.enabled) {
        monitor_->start();
    }
    sweepTimer_->start();
    const int admitted = admission_->promotePending();
    SLUICE_INFO("Task orchestrator started, {} task(s) admitted", admitted);
}

void TaskOrchestrator::stop() {
    if (!isRunning()) {
        return;
    }
    sweepTimer_->stop();
    poller_->stop();
    monitor_->stop();
    SLUICE_INFO("Task orchestrator stopped");
}

bool TaskOrchestrator::isRunning() const {
    return sweepTimer_->isActive();
}

Expected<TaskId, AdmissionError> TaskOrchestrator::submit(const TaskSpec& spec) {
    return admission_->submit(spec);
}

Expected<void, CancelError> TaskOrchestrator::cancel(TaskId id, const QString& detail) {
    return coordinator_->cancel(id, CancelReason::UserCancelled, detail);
}

Expected<ForceStartResult, AdmissionError> TaskOrchestrator::forceStart(TaskId id) {
    return admission_->forceStart(id);
}

Expected<void, RegistryError> TaskOrchestrator::acknowledge(TaskId id) {
    auto retired = registry_->retire(id);
    if (retired.hasError()) {
        return retired;
    }
    if (store_) {
        auto removed = store_->remove(id);
        if (removed.hasError()) {
            SLUICE_ERROR("Task {}: could not delete stored snapshot: {}", id,
                         toString(removed.error()).toStdString());
        }
    }
    SLUICE_INFO("Task {} acknowledged and retired", id);
    return {};
}

Expected<StatusPage, StatusError> TaskOrchestrator::status(const StatusFilter& filter,
                                                           const QString& cursor,
                                                           int pageSize) const {
    return aggregator_->list(filter, cursor, pageSize);
}

StatusSummary TaskOrchestrator::summary(const StatusFilter& filter) const {
    return aggregator_->summary(filter);
}

void TaskOrchestrator::onStatusEvent(const StatusEvent& event) {
    if (event.type == StatusEventType::PhaseChanged || event.type == StatusEventType::Restored) {
        persist(event.taskId);
    }
    emit statusEvent(event);
}

void TaskOrchestrator::persist(TaskId id) {
    if (!store_ || id == 0) {
        return;
    }
    auto task = registry_->find(id);
    if (!task) {
        return;
    }
    auto saved = store_->save(task->snapshot());
    if (saved.hasError()) {
        SLUICE_ERROR("Task {}: could not persist snapshot: {}", id, toString(saved.error()).toStdString());
    }
}

} // namespace Sluice
