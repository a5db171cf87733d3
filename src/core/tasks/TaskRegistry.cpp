#include "TaskRegistry.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QReadLocker>
#include <QtCore/QWriteLocker>

namespace Sluice {

QString toString(RegistryError error) {
    switch (error) {
        case RegistryError::TaskNotFound: return QStringLiteral("task not found");
        case RegistryError::NotTerminal: return QStringLiteral("task has not reached a terminal phase");
    }
    return QStringLiteral("unknown registry error");
}

TaskRegistry::TaskRegistry(QObject* parent)
    : QObject(parent) {
}

TaskId TaskRegistry::allocateId() {
    return nextId_.fetch_add(1);
}

void TaskRegistry::reserveIds(TaskId highest) {
    TaskId current = nextId_.load();
    while (current <= highest && !nextId_.compare_exchange_weak(current, highest + 1)) {
    }
}

bool TaskRegistry::insert(const std::shared_ptr<Task>& task) {
    QWriteLocker locker(&lock_);
    if (tasks_.contains(task->id())) {
        SLUICE_WARN("Task {} already registered", task->id());
        return false;
    }
    tasks_.insert(task->id(), task);
    return true;
}

std::shared_ptr<Task> TaskRegistry::find(TaskId id) const {
    QReadLocker locker(&lock_);
    return tasks_.value(id);
}

bool TaskRegistry::contains(TaskId id) const {
    QReadLocker locker(&lock_);
    return tasks_.contains(id);
}

Expected<void, RegistryError> TaskRegistry::retire(TaskId id) {
    QWriteLocker locker(&lock_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return makeUnexpected(RegistryError::TaskNotFound);
    }
    if (!isTerminal(it.value()->phase())) {
        return makeUnexpected(RegistryError::NotTerminal);
    }
    tasks_.erase(it);
    SLUICE_DEBUG("Task {} retired", id);
    return {};
}

QList<std::shared_ptr<Task>> TaskRegistry::tasks() const {
    QReadLocker locker(&lock_);
    return tasks_.values();
}

QList<std::shared_ptr<Task>> TaskRegistry::runningTasks() const {
    const QList<std::shared_ptr<Task>> all = tasks();
    QList<std::shared_ptr<Task>> running;
    for (const auto& task : all) {
        if (isRunning(task->phase())) {
            running.append(task);
        }
    }
    return running;
}

int TaskRegistry::size() const {
    QReadLocker locker(&lock_);
    return tasks_.size();
}

void TaskRegistry::publish(const StatusEvent& event) {
    StatusEvent stamped = event;
    if (!stamped.timestamp.isValid()) {
        stamped.timestamp = QDateTime::currentDateTimeUtc();
    }
    SLUICE_DEBUG("Status event: task {} {} {} {}", stamped.taskId,
                 toString(stamped.type).toStdString(), toString(stamped.phase).toStdString(),
                 stamped.message.toStdString());
    emit statusEvent(stamped);
}

} // namespace Sluice
