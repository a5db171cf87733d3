#pragma once

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QReadWriteLock>
#include <atomic>
#include <memory>
#include "Task.hpp"

namespace Sluice {

enum class RegistryError {
    TaskNotFound,
    NotTerminal
};

QString toString(RegistryError error);

/**
 * @brief Authoritative in-memory map of live tasks
 *
 * Lookups hand out shared ownership, so a task stays valid for a caller
 * even after it was retired concurrently. Also the single publication
 * point for status events.
 */
class TaskRegistry : public QObject {
    Q_OBJECT

public:
    explicit TaskRegistry(QObject* parent = nullptr);

    TaskId allocateId();
    // Ensures future ids are greater than highest
    void reserveIds(TaskId highest);

    bool insert(const std::shared_ptr<Task>& task);
    std::shared_ptr<Task> find(TaskId id) const;
    bool contains(TaskId id) const;
    Expected<void, RegistryError> retire(TaskId id);

    QList<std::shared_ptr<Task>> tasks() const;
    // Tasks currently Active or Stalled
    QList<std::shared_ptr<Task>> runningTasks() const;
    int size() const;

    void publish(const StatusEvent& event);

signals:
    void statusEvent(const Sluice::StatusEvent& event);

private:
    mutable QReadWriteLock lock_;
    QHash<TaskId, std::shared_ptr<Task>> tasks_;
    std::atomic<TaskId> nextId_{1};
};

} // namespace Sluice
