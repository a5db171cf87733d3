#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include "../common/Expected.hpp"
#include "../tasks/TaskTypes.hpp"

namespace Sluice {

enum class StorageError {
    DatabaseNotOpen,
    ConnectionFailed,
    QueryFailed,
    InvalidData,
    ConstraintViolation,
    TransactionFailed,
    MigrationFailed
};

QString toString(StorageError error);

// Durable snapshots of tasks that have not been retired
class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Inserts or replaces the snapshot with the same id
    virtual Expected<void, StorageError> save(const TaskSnapshot& snapshot) = 0;
    virtual Expected<void, StorageError> remove(TaskId id) = 0;
    // Non-terminal snapshots ordered by creation time, then id
    virtual Expected<QList<TaskSnapshot>, StorageError> loadIncomplete() = 0;
};

} // namespace Sluice
