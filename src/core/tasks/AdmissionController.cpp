#include "AdmissionController.hpp"
#include "../common/Logger.hpp"
#include "../common/RetryManager.hpp"
#include <QtCore/QMutexLocker>
#include <algorithm>

namespace Sluice {

namespace {

TaskCategory otherCategory(TaskCategory category) {
    return category == TaskCategory::Download ? TaskCategory::Upload : TaskCategory::Download;
}

} // namespace

QString toString(AdmissionError error) {
    switch (error) {
        case AdmissionError::UnknownEngine: return QStringLiteral("no engine registered for this kind");
        case AdmissionError::CapacityReached: return QStringLiteral("task capacity reached");
        case AdmissionError::DailyTaskLimitReached: return QStringLiteral("daily task limit reached");
        case AdmissionError::DailyByteLimitReached: return QStringLiteral("daily transfer limit reached");
        case AdmissionError::TaskNotFound: return QStringLiteral("task not found");
        case AdmissionError::NotQueued: return QStringLiteral("task is not queued");
    }
    return QStringLiteral("unknown admission error");
}

AdmissionController::AdmissionController(const Config::QueueSettings& queue,
                                         const Config::EngineSettings& engine,
                                         TaskRegistry* registry,
                                         EngineRegistry* engines,
                                         const Clock* clock,
                                         QObject* parent)
    : QObject(parent)
    , queue_(queue)
    , engine_(engine)
    , registry_(registry)
    , engines_(engines)
    , clock_(clock)
    , launchPool_(std::make_unique<QThreadPool>())
    , enginePool_(std::make_unique<QThreadPool>()) {
    launchPool_->setMaxThreadCount(std::max(2, engine.pollConcurrency));
    enginePool_->setMaxThreadCount(std::max(2, engine.pollConcurrency));
    SLUICE_INFO("Admission controller: limit_all={} limit_download={} limit_upload={} user_max_tasks={}",
                queue_.limitAll, queue_.limitDownload, queue_.limitUpload, queue_.userMaxTasks);
}

AdmissionController::~AdmissionController() {
    stopping_ = true;
    launchPool_->waitForDone();
    enginePool_->waitForDone();
}

Expected<TaskId, AdmissionError> AdmissionController::submit(const TaskSpec& spec) {
    if (!engines_->hasAdapter(spec.kind)) {
        SLUICE_WARN("Rejected submission from {}: no engine for kind '{}'",
                    spec.ownerId.toStdString(), spec.kind.toStdString());
        return makeUnexpected(AdmissionError::UnknownEngine);
    }

    const QDateTime now = clock_->now();
    std::shared_ptr<Task> task;
    QList<Ticket> tickets;
    {
        QMutexLocker locker(&mutex_);
        if (queue_.botMaxTasks > 0 && liveCountLocked() >= queue_.botMaxTasks) {
            SLUICE_WARN("Rejected submission from {}: {} live tasks", spec.ownerId.toStdString(),
                        liveCountLocked());
            return makeUnexpected(AdmissionError::CapacityReached);
        }

        UserQuota& user = quotaLocked(spec.ownerId, now.date());
        if (queue_.dailyTaskLimit > 0 && user.tasksToday >= queue_.dailyTaskLimit) {
            SLUICE_INFO("Rejected submission from {}: daily task limit", spec.ownerId.toStdString());
            return makeUnexpected(AdmissionError::DailyTaskLimitReached);
        }
        const bool download = spec.category == TaskCategory::Download;
        const qint64 byteLimit = download ? queue_.dailyDownloadLimitBytes : queue_.dailyUploadLimitBytes;
        const qint64 bytesToday = download ? user.downloadBytesToday : user.uploadBytesToday;
        if (byteLimit > 0 && bytesToday >= byteLimit) {
            SLUICE_INFO("Rejected submission from {}: daily {} limit", spec.ownerId.toStdString(),
                        toString(spec.category).toStdString());
            return makeUnexpected(AdmissionError::DailyByteLimitReached);
        }
        ++user.tasksToday;

        task = std::make_shared<Task>(registry_->allocateId(), spec, now);
        registry_->insert(task);
        queues_[categoryIndex(spec.category)].push_back({task->id(), spec.ownerId});

        if (!paused_) {
            tickets = fillLocked(spec.category, now);
        }
    }

    SLUICE_INFO("Task {} ({} '{}') submitted by {}", task->id(), spec.kind.toStdString(),
                spec.name.toStdString(), spec.ownerId.toStdString());

    StatusEvent event;
    event.taskId = task->id();
    event.phase = TaskPhase::Queued;
    event.chatRef = spec.chatRef;
    event.message = QStringLiteral("Task queued");
    event.timestamp = now;
    registry_->publish(event);

    launchAll(tickets);
    return task->id();
}

void AdmissionController::enqueueRestored(const std::shared_ptr<Task>& task) {
    QMutexLocker locker(&mutex_);
    queues_[categoryIndex(task->category())].push_back({task->id(), task->ownerId()});
}

void AdmissionController::release(TaskId id, qint64 transferredBytes) {
    const QDateTime now = clock_->now();
    QList<Ticket> tickets;
    {
        QMutexLocker locker(&mutex_);
        if (removeQueuedLocked(id)) {
            SLUICE_DEBUG("Task {} removed from queue", id);
            return;
        }

        auto it = holders_.find(id);
        if (it == holders_.end()) {
            return;
        }
        const Ticket holder = it.value();
        holders_.erase(it);

        if (holder.category == TaskCategory::Download) {
            --counters_.activeDownload;
        } else {
            --counters_.activeUpload;
        }
        --counters_.activeTotal;

        UserQuota& user = quotaLocked(holder.ownerId, now.date());
        user.activeTaskCount = std::max(0, user.activeTaskCount - 1);
        if (holder.category == TaskCategory::Download) {
            user.downloadBytesToday += std::max<qint64>(0, transferredBytes);
        } else {
            user.uploadBytesToday += std::max<qint64>(0, transferredBytes);
        }

        SLUICE_DEBUG("Task {} released its {} slot (active {}/{}/{})", id,
                     toString(holder.category).toStdString(), counters_.activeDownload,
                     counters_.activeUpload, counters_.activeTotal);

        // Exactly one slot was freed
        if (!paused_) {
            auto next = admitNextLocked(holder.category, now);
            if (!next) {
                next = admitNextLocked(otherCategory(holder.category), now);
            }
            if (next) {
                tickets.append(*next);
            }
        }
    }

    launchAll(tickets);
}

Expected<ForceStartResult, AdmissionError> AdmissionController::forceStart(TaskId id) {
    auto task = registry_->find(id);
    if (!task) {
        return makeUnexpected(AdmissionError::TaskNotFound);
    }

    const QDateTime now = clock_->now();
    std::optional<Ticket> ticket;
    {
        QMutexLocker locker(&mutex_);
        if (holders_.contains(id)) {
            return ForceStartResult::Admitted;
        }

        auto& queue = queues_[categoryIndex(task->category())];
        auto it = std::find_if(queue.begin(), queue.end(),
                               [id](const QueueEntry& entry) { return entry.id == id; });
        if (it == queue.end()) {
            return makeUnexpected(AdmissionError::NotQueued);
        }
        const QueueEntry entry = *it;
        queue.erase(it);
        queue.push_front(entry);
        task->boostPriority();

        if (!paused_ && hasCapacityLocked(task->category()) &&
            ownerEligibleLocked(entry.ownerId, now)) {
            queue.pop_front();
            ticket = Ticket{entry.id, task->category(), entry.ownerId};
            grantLocked(*ticket, now);
        }
    }

    if (!ticket) {
        SLUICE_INFO("Task {} force-started to the front of the {} queue", id,
                    toString(task->category()).toStdString());
        return ForceStartResult::StillQueued;
    }

    SLUICE_INFO("Task {} force-started", id);
    launch(*ticket);
    return ForceStartResult::Admitted;
}

int AdmissionController::promotePending() {
    const QDateTime now = clock_->now();
    QList<Ticket> tickets;
    {
        QMutexLocker locker(&mutex_);
        if (paused_) {
            return 0;
        }
        // Uploads first: they finish work already on disk
        tickets = fillLocked(TaskCategory::Upload, now);
        tickets += fillLocked(TaskCategory::Download, now);
    }

    if (!tickets.isEmpty()) {
        SLUICE_DEBUG("Promotion sweep admitted {} tasks", tickets.size());
    }
    launchAll(tickets);
    return static_cast<int>(tickets.size());
}

void AdmissionController::setPaused(bool paused) {
    {
        QMutexLocker locker(&mutex_);
        if (paused_ == paused) {
            return;
        }
        paused_ = paused;
    }

    SLUICE_INFO("Admission {}", paused ? "paused" : "resumed");
    emit pausedChanged(paused);
    if (!paused) {
        promotePending();
    }
}

bool AdmissionController::isPaused() const {
    QMutexLocker locker(&mutex_);
    return paused_;
}

bool AdmissionController::waitForStarts(int msecs) {
    return launchPool_->waitForDone(msecs);
}

SlotCounters AdmissionController::counters() const {
    QMutexLocker locker(&mutex_);
    return counters_;
}

std::optional<UserQuota> AdmissionController::userQuota(const QString& ownerId) const {
    QMutexLocker locker(&mutex_);
    auto it = users_.constFind(ownerId);
    if (it == users_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QList<TaskId> AdmissionController::queueOrder(TaskCategory category) const {
    QMutexLocker locker(&mutex_);
    QList<TaskId> order;
    for (const QueueEntry& entry : queues_[categoryIndex(category)]) {
        order.append(entry.id);
    }
    return order;
}

bool AdmissionController::holdsSlot(TaskId id) const {
    QMutexLocker locker(&mutex_);
    return holders_.contains(id);
}

bool AdmissionController::hasCapacityLocked(TaskCategory category) const {
    const bool download = category == TaskCategory::Download;
    const int limit = download ? queue_.limitDownload : queue_.limitUpload;
    const int active = download ? counters_.activeDownload : counters_.activeUpload;
    if (limit > 0 && active >= limit) {
        return false;
    }
    if (queue_.limitAll > 0 && counters_.activeTotal >= queue_.limitAll) {
        return false;
    }
    return true;
}

bool AdmissionController::ownerEligibleLocked(const QString& ownerId, const QDateTime& now) const {
    auto it = users_.constFind(ownerId);
    if (it == users_.constEnd()) {
        return true;
    }
    if (queue_.userMaxTasks > 0 && it->activeTaskCount >= queue_.userMaxTasks) {
        return false;
    }
    if (queue_.userTimeInterval.count() > 0 && it->lastTaskStartedAt.isValid() &&
        it->lastTaskStartedAt.secsTo(now) < queue_.userTimeInterval.count()) {
        return false;
    }
    return true;
}

std::optional<AdmissionController::Ticket> AdmissionController::admitNextLocked(TaskCategory category,
                                                                                 const QDateTime& now) {
    if (!hasCapacityLocked(category)) {
        return std::nullopt;
    }
    auto& queue = queues_[categoryIndex(category)];
    for (auto it = queue.begin(); it != queue.end(); ++it) {
        if (!ownerEligibleLocked(it->ownerId, now)) {
            continue;
        }
        Ticket ticket{it->id, category, it->ownerId};
        queue.erase(it);
        grantLocked(ticket, now);
        return ticket;
    }
    return std::nullopt;
}

QList<AdmissionController::Ticket> AdmissionController::fillLocked(TaskCategory category,
                                                                   const QDateTime& now) {
    QList<Ticket> tickets;
    while (auto ticket = admitNextLocked(category, now)) {
        tickets.append(*ticket);
    }
    return tickets;
}

void AdmissionController::grantLocked(const Ticket& ticket, const QDateTime& now) {
    if (ticket.category == TaskCategory::Download) {
        ++counters_.activeDownload;
    } else {
        ++counters_.activeUpload;
    }
    ++counters_.activeTotal;
    holders_.insert(ticket.id, ticket);

    UserQuota& user = quotaLocked(ticket.ownerId, now.date());
    ++user.activeTaskCount;
    user.lastTaskStartedAt = now;

    SLUICE_DEBUG("Task {} granted a {} slot (active {}/{}/{})", ticket.id,
                 toString(ticket.category).toStdString(), counters_.activeDownload,
                 counters_.activeUpload, counters_.activeTotal);
}

bool AdmissionController::removeQueuedLocked(TaskId id) {
    for (auto& queue : queues_) {
        auto it = std::find_if(queue.begin(), queue.end(),
                               [id](const QueueEntry& entry) { return entry.id == id; });
        if (it != queue.end()) {
            queue.erase(it);
            return true;
        }
    }
    return false;
}

int AdmissionController::liveCountLocked() const {
    return static_cast<int>(queues_[0].size() + queues_[1].size() + static_cast<size_t>(holders_.size()));
}

UserQuota& AdmissionController::quotaLocked(const QString& ownerId, const QDate& today) {
    UserQuota& user = users_[ownerId];
    if (user.day != today) {
        user.day = today;
        user.tasksToday = 0;
        user.downloadBytesToday = 0;
        user.uploadBytesToday = 0;
    }
    return user;
}

void AdmissionController::launchAll(const QList<Ticket>& tickets) {
    for (const Ticket& ticket : tickets) {
        launch(ticket);
    }
}

void AdmissionController::launch(const Ticket& ticket) {
    if (stopping_) {
        return;
    }
    launchPool_->start([this, ticket]() { startEngine(ticket); });
}

void AdmissionController::startEngine(const Ticket& ticket) {
    auto task = registry_->find(ticket.id);
    if (!task) {
        SLUICE_WARN("Admitted task {} vanished before start", ticket.id);
        release(ticket.id);
        return;
    }

    if (task->isCancellationClaimed()) {
        return;
    }

    auto adapter = engines_->adapterFor(task->kind());
    if (!adapter) {
        emit startFailed(ticket.id, QStringLiteral("No engine registered for kind '%1'").arg(task->kind()));
        return;
    }

    const TaskSpec spec = task->spec();
    const TaskId id = ticket.id;
    const std::chrono::milliseconds startTimeout = engine_.startTimeout;
    QThreadPool* pool = enginePool_.get();
    std::optional<EngineError> lastError;
    int attempt = 0;

    RetryManager retry(RetryConfigs::engineStart(engine_.startRetries, engine_.startBackoff));
    auto started = retry.execute<EngineHandle, EngineError>(
        [&]() -> Expected<EngineHandle, EngineError> {
            if (attempt++ > 0) {
                task->recordRetry();
            }
            auto call = PendingCall<EngineHandle, EngineError>::launch(
                pool, [adapter, spec]() { return adapter->start(spec); }, EngineError::Internal);
            auto result = call.waitFor(startTimeout, EngineError::Timeout);
            if (result.hasError() && result.error() == EngineError::Timeout) {
                // The backend may still answer; nothing owns that transfer
                call.onLateResult([adapter, id](const Expected<EngineHandle, EngineError>& late) {
                    if (late.hasError()) {
                        return;
                    }
                    SLUICE_WARN("Task {}: start answered after its deadline, stopping handle {}", id,
                                late.value().toStdString());
                    auto stopped = adapter->cancel(late.value());
                    if (stopped.hasError()) {
                        SLUICE_WARN("Task {}: cancel of late handle failed: {}", id,
                                    toString(stopped.error()).toStdString());
                    }
                });
            }
            return result;
        },
        [&](const EngineError& error) {
            lastError = error;
            SLUICE_WARN("Task {}: engine start attempt {} failed: {}", id, attempt,
                        toString(error).toStdString());
            return isRetryable(error) && !task->isCancellationClaimed() && !stopping_;
        });

    if (started.hasError()) {
        const QString detail = lastError ? toString(*lastError) : toString(started.error());
        const QString message = QStringLiteral("Engine start failed after %1 attempt(s): %2")
                                    .arg(attempt).arg(detail);
        SLUICE_ERROR("Task {}: {}", id, message.toStdString());
        emit startFailed(id, message);
        return;
    }

    const EngineHandle handle = started.value();
    auto marked = task->markActive(handle, clock_->now());
    if (marked.hasError()) {
        // Cancelled while the engine was starting; the slot is already released
        SLUICE_INFO("Task {} was cancelled during start, stopping engine handle {}", id,
                    handle.toStdString());
        auto ack = callEngine<void>(pool, [adapter, handle]() { return adapter->cancel(handle); },
                                    engine_.cancelAckTimeout);
        if (ack.hasError()) {
            SLUICE_WARN("Task {}: cancel of late handle failed: {}", id,
                        toString(ack.error()).toStdString());
        }
        return;
    }

    SLUICE_INFO("Task {} active with handle {}", id, handle.toStdString());

    StatusEvent event;
    event.taskId = id;
    event.phase = TaskPhase::Active;
    event.chatRef = spec.chatRef;
    event.message = QStringLiteral("Task started");
    event.timestamp = clock_->now();
    registry_->publish(event);
    emit taskAdmitted(id);
}

} // namespace Sluice
