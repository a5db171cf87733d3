#pragma once

#include <QtCore/QList>
#include <QtCore/QStringList>
#include <map>
#include <optional>
#include "TaskRegistry.hpp"

namespace Sluice {

enum class StatusError {
    InvalidCursor
};

QString toString(StatusError error);

// Empty members match everything
struct StatusFilter {
    QList<TaskPhase> phases;
    QStringList kinds;
    std::optional<TaskCategory> category;
    QString ownerId;

    bool matches(const TaskSnapshot& snapshot) const;
};

struct StatusPage {
    QList<TaskSnapshot> tasks;
    QString nextCursor;  // empty on the last page
};

struct StatusSummary {
    std::map<TaskPhase, int> phaseCounts;
    int total = 0;
    qint64 downloadSpeedBps = 0;
    qint64 uploadSpeedBps = 0;
};

/**
 * @brief Read-only paginated views of the registry
 *
 * Tasks are ordered by (created_at, id). The cursor names the last key
 * returned, so a traversal sees every task that was live when it began
 * exactly once, however the registry changes in between.
 */
class StatusAggregator {
public:
    StatusAggregator(const TaskRegistry* registry, int defaultPageSize);

    Expected<StatusPage, StatusError> list(const StatusFilter& filter,
                                           const QString& cursor = QString(),
                                           int pageSize = 0) const;
    StatusSummary summary(const StatusFilter& filter = StatusFilter()) const;

private:
    struct Key {
        qint64 createdMs = 0;
        TaskId id = 0;
        bool operator<(const Key& other) const {
            return createdMs < other.createdMs || (createdMs == other.createdMs && id < other.id);
        }
    };

    static Key keyOf(const TaskSnapshot& snapshot);
    static QString encodeCursor(const Key& key);
    static std::optional<Key> decodeCursor(const QString& cursor);

    QList<TaskSnapshot> matching(const StatusFilter& filter) const;

    const TaskRegistry* registry_;
    const int defaultPageSize_;
};

} // namespace Sluice
