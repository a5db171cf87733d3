#include "StatusAggregator.hpp"
#include "../common/Logger.hpp"
#include <algorithm>

namespace Sluice {

QString toString(StatusError error) {
    switch (error) {
        case StatusError::InvalidCursor: return QStringLiteral("invalid cursor");
    }
    return QStringLiteral("unknown status error");
}

bool StatusFilter::matches(const TaskSnapshot& snapshot) const {
    if (!phases.isEmpty() && !phases.contains(snapshot.phase)) {
        return false;
    }
    if (!kinds.isEmpty() && !kinds.contains(snapshot.kind)) {
        return false;
    }
    if (category && *category != snapshot.category) {
        return false;
    }
    if (!ownerId.isEmpty() && ownerId != snapshot.ownerId) {
        return false;
    }
    return true;
}

StatusAggregator::StatusAggregator(const TaskRegistry* registry, int defaultPageSize)
    : registry_(registry)
    , defaultPageSize_(std::max(1, defaultPageSize)) {
}

Expected<StatusPage, StatusError> StatusAggregator::list(const StatusFilter& filter,
                                                         const QString& cursor,
                                                         int pageSize) const {
    std::optional<Key> after;
    if (!cursor.isEmpty()) {
        after = decodeCursor(cursor);
        if (!after) {
            SLUICE_DEBUG("Rejected status cursor '{}'", cursor.toStdString());
            return makeUnexpected(StatusError::InvalidCursor);
        }
    }

    const int limit = pageSize > 0 ? pageSize : defaultPageSize_;
    QList<TaskSnapshot> candidates = matching(filter);
    std::sort(candidates.begin(), candidates.end(),
              [](const TaskSnapshot& a, const TaskSnapshot& b) { return keyOf(a) < keyOf(b); });

    StatusPage page;
    bool more = false;
    for (const TaskSnapshot& snapshot : candidates) {
        if (after && !(*after < keyOf(snapshot))) {
            continue;
        }
        if (page.tasks.size() == limit) {
            more = true;
            break;
        }
        page.tasks.append(snapshot);
    }

    if (more && !page.tasks.isEmpty()) {
        page.nextCursor = encodeCursor(keyOf(page.tasks.last()));
    }
    return page;
}

StatusSummary StatusAggregator::summary(const StatusFilter& filter) const {
    StatusSummary summary;
    const QList<TaskSnapshot> snapshots = matching(filter);
    for (const TaskSnapshot& snapshot : snapshots) {
        ++summary.phaseCounts[snapshot.phase];
        ++summary.total;
        if (!isRunning(snapshot.phase)) {
            continue;
        }
        if (snapshot.category == TaskCategory::Download) {
            summary.downloadSpeedBps += snapshot.speedBps;
        } else {
            summary.uploadSpeedBps += snapshot.speedBps;
        }
    }
    return summary;
}

QList<TaskSnapshot> StatusAggregator::matching(const StatusFilter& filter) const {
    QList<TaskSnapshot> result;
    const QList<std::shared_ptr<Task>> tasks = registry_->tasks();
    for (const auto& task : tasks) {
        TaskSnapshot snapshot = task->snapshot();
        if (filter.matches(snapshot)) {
            result.append(std::move(snapshot));
        }
    }
    return result;
}

StatusAggregator::Key StatusAggregator::keyOf(const TaskSnapshot& snapshot) {
    return Key{snapshot.createdAt.toMSecsSinceEpoch(), snapshot.id};
}

QString StatusAggregator::encodeCursor(const Key& key) {
    return QStringLiteral("%1.%2").arg(key.createdMs).arg(key.id);
}

std::optional<StatusAggregator::Key> StatusAggregator::decodeCursor(const QString& cursor) {
    const QStringList parts = cursor.split('.');
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool msOk = false;
    bool idOk = false;
    Key key;
    key.createdMs = parts.at(0).toLongLong(&msOk);
    key.id = parts.at(1).toULongLong(&idOk);
    if (!msOk || !idOk) {
        return std::nullopt;
    }
    return key;
}

} // namespace Sluice
