#include "HealthMonitor.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QMutexLocker>
#include <QtCore/QSet>
#include <algorithm>
#include <functional>

namespace Sluice {

HealthMonitor::HealthMonitor(const Config::MonitorSettings& settings,
                             TaskRegistry* registry,
                             AdmissionController* admission,
                             CancellationCoordinator* coordinator,
                             ResourceSampler* sampler,
                             const Clock* clock,
                             QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , registry_(registry)
    , admission_(admission)
    , coordinator_(coordinator)
    , sampler_(sampler)
    , clock_(clock)
    , timer_(new QTimer(this)) {
    timer_->setInterval(static_cast<int>(std::chrono::milliseconds(settings.interval).count()));
    connect(timer_, &QTimer::timeout, this, &HealthMonitor::tick);
}

void HealthMonitor::start() {
    timer_->start();
    SLUICE_INFO("Health monitor started, interval {}s, speed threshold {} B/s, {} checks",
                settings_.interval.count(), settings_.speedThresholdBps, settings_.consecutiveChecks);
}

void HealthMonitor::stop() {
    timer_->stop();
    SLUICE_INFO("Health monitor stopped");
}

bool HealthMonitor::isRunning() const {
    return timer_->isActive();
}

std::optional<MonitorSample> HealthMonitor::sample(TaskId id) const {
    QMutexLocker locker(&samplesMutex_);
    auto it = samples_.constFind(id);
    if (it == samples_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool HealthMonitor::isPressurePaused() const {
    return pausedByPressure_;
}

void HealthMonitor::tick() {
    const QDateTime now = clock_->now();
    checkResourcePressure(now);

    const QList<std::shared_ptr<Task>> tasks = registry_->runningTasks();
    QSet<TaskId> running;
    for (const auto& task : tasks) {
        running.insert(task->id());
        inspect(task, now);
    }

    QMutexLocker locker(&samplesMutex_);
    for (auto it = samples_.begin(); it != samples_.end();) {
        if (!running.contains(it.key())) {
            it = samples_.erase(it);
        } else {
            ++it;
        }
    }
}

void HealthMonitor::checkResourcePressure(const QDateTime& now) {
    if (!sampler_ || (settings_.cpuHigh <= 0 && settings_.memoryHigh <= 0)) {
        return;
    }

    auto usage = sampler_->sample();
    if (usage.hasError()) {
        SLUICE_DEBUG("Resource sampling failed: {}", toString(usage.error()).toStdString());
        return;
    }

    const ResourceUsage current = usage.value();
    const size_t windowSize = static_cast<size_t>(std::max(1, settings_.consecutiveChecks));
    pressureWindow_.push_back(current);
    while (pressureWindow_.size() > windowSize) {
        pressureWindow_.pop_front();
    }
    if (pressureWindow_.size() < windowSize) {
        return;
    }

    const auto every = [this](const std::function<bool(const ResourceUsage&)>& predicate) {
        return std::all_of(pressureWindow_.begin(), pressureWindow_.end(), predicate);
    };
    const bool cpuHigh = settings_.cpuHigh > 0 &&
        every([this](const ResourceUsage& u) { return u.cpuPercent >= settings_.cpuHigh; });
    const bool memoryHigh = settings_.memoryHigh > 0 &&
        every([this](const ResourceUsage& u) { return u.memoryPercent >= settings_.memoryHigh; });
    const bool cpuLow = settings_.cpuHigh <= 0 ||
        every([this](const ResourceUsage& u) { return u.cpuPercent <= settings_.cpuLow; });
    const bool memoryLow = settings_.memoryHigh <= 0 ||
        every([this](const ResourceUsage& u) { return u.memoryPercent <= settings_.memoryLow; });

    StatusEvent event;
    event.timestamp = now;

    if (!pausedByPressure_ && (cpuHigh || memoryHigh)) {
        SLUICE_WARN("Host under pressure for {} checks (cpu {:.1f}%, memory {:.1f}%), pausing admission",
                    windowSize, current.cpuPercent, current.memoryPercent);
        pausedByPressure_ = true;
        admission_->setPaused(true);
        event.type = StatusEventType::AdmissionPaused;
        event.message = QStringLiteral("Admission paused: cpu %1%, memory %2%")
                            .arg(current.cpuPercent, 0, 'f', 1).arg(current.memoryPercent, 0, 'f', 1);
        registry_->publish(event);
        emit pressureChanged(true);
    } else if (pausedByPressure_ && cpuLow && memoryLow) {
        SLUICE_INFO("Host pressure cleared (cpu {:.1f}%, memory {:.1f}%), resuming admission",
                    current.cpuPercent, current.memoryPercent);
        pausedByPressure_ = false;
        event.type = StatusEventType::AdmissionResumed;
        event.message = QStringLiteral("Admission resumed");
        registry_->publish(event);
        admission_->setPaused(false);
        emit pressureChanged(false);
    }
}

void HealthMonitor::inspect(const std::shared_ptr<Task>& task, const QDateTime& now) {
    if (task->isCancellationClaimed()) {
        return;
    }

    const TaskSnapshot snapshot = task->snapshot();
    const qint64 age = snapshot.createdAt.secsTo(now);

    if (settings_.completionThreshold.count() > 0 && age >= settings_.completionThreshold.count()) {
        SLUICE_WARN("Task {} exceeded the completion threshold ({}s)", snapshot.id, age);
        escalate(snapshot.id, CancelReason::Timeout, QStringLiteral("running for %1s").arg(age));
        return;
    }

    QMutexLocker locker(&samplesMutex_);
    MonitorSample& sample = samples_[snapshot.id];
    sample.window.emplace_back(now, snapshot.transferredBytes);
    const size_t windowSize = static_cast<size_t>(std::max(2, settings_.consecutiveChecks));
    while (sample.window.size() > windowSize) {
        sample.window.pop_front();
    }

    const qint64 speed = std::max(snapshot.speedBps, measuredSpeed(sample));
    const bool lowSpeed = settings_.speedThresholdBps > 0 && speed < settings_.speedThresholdBps;
    sample.consecutiveLowSpeed = lowSpeed ? sample.consecutiveLowSpeed + 1 : 0;

    if (snapshot.phase == TaskPhase::Active) {
        if (lowSpeed && sample.consecutiveLowSpeed >= settings_.consecutiveChecks &&
            age >= settings_.elapsedThreshold.count()) {
            if (task->markStalled().hasValue()) {
                sample.stalledSince = now;
                locker.unlock();
                SLUICE_WARN("Task {} stalled: {} B/s for {} checks", snapshot.id, speed,
                            settings_.consecutiveChecks);
                publish(snapshot, TaskPhase::Stalled, StatusEventType::PhaseChanged,
                        QStringLiteral("Transfer stalled at %1 B/s").arg(speed), now);
                emit taskStalled(snapshot.id);
                return;
            }
        }
    } else if (snapshot.phase == TaskPhase::Stalled) {
        if (!lowSpeed) {
            if (task->markRecovered().hasValue()) {
                sample.consecutiveLowSpeed = 0;
                sample.stalledSince = QDateTime();
                sample.window.clear();
                sample.window.emplace_back(now, snapshot.transferredBytes);
                locker.unlock();
                SLUICE_INFO("Task {} recovered at {} B/s", snapshot.id, speed);
                publish(snapshot, TaskPhase::Active, StatusEventType::PhaseChanged,
                        QStringLiteral("Transfer recovered"), now);
                emit taskRecovered(snapshot.id);
                return;
            }
        } else {
            if (!sample.stalledSince.isValid()) {
                sample.stalledSince = now;
            }
            const qint64 stalledFor = sample.stalledSince.secsTo(now);
            if (stalledFor >= settings_.waitTime.count()) {
                locker.unlock();
                SLUICE_WARN("Task {} still stalled after {}s, cancelling", snapshot.id, stalledFor);
                escalate(snapshot.id, CancelReason::StalledDownload,
                         QStringLiteral("stalled for %1s").arg(stalledFor));
                return;
            }
        }
    }

    if (settings_.etaThreshold.count() > 0 && snapshot.etaSeconds > settings_.etaThreshold.count()) {
        if (!sample.etaWarned) {
            sample.etaWarned = true;
            locker.unlock();
            SLUICE_INFO("Task {} ETA {}s exceeds threshold", snapshot.id, snapshot.etaSeconds);
            publish(snapshot, snapshot.phase, StatusEventType::Warning,
                    QStringLiteral("Estimated time remaining is %1s").arg(snapshot.etaSeconds), now);
            emit etaWarning(snapshot.id, snapshot.etaSeconds);
        }
    } else {
        sample.etaWarned = false;
    }
}

qint64 HealthMonitor::measuredSpeed(const MonitorSample& sample) const {
    if (sample.window.size() < 2) {
        return 0;
    }
    const auto& first = sample.window.front();
    const auto& last = sample.window.back();
    const qint64 elapsedMs = first.first.msecsTo(last.first);
    if (elapsedMs <= 0 || last.second <= first.second) {
        return 0;
    }
    return (last.second - first.second) * 1000 / elapsedMs;
}

void HealthMonitor::escalate(TaskId id, CancelReason reason, const QString& detail) {
    {
        QMutexLocker locker(&samplesMutex_);
        samples_.remove(id);
    }
    auto cancelled = coordinator_->cancel(id, reason, detail);
    if (cancelled.hasError()) {
        SLUICE_WARN("Task {}: {} escalation failed: {}", id, toString(reason).toStdString(),
                    toString(cancelled.error()).toStdString());
    }
}

void HealthMonitor::publish(const TaskSnapshot& snapshot, TaskPhase phase, StatusEventType type,
                            const QString& message, const QDateTime& now) {
    StatusEvent event;
    event.taskId = snapshot.id;
    event.phase = phase;
    event.type = type;
    event.chatRef = snapshot.chatRef;
    event.message = message;
    event.timestamp = now;
    registry_->publish(event);
}

} // namespace Sluice
