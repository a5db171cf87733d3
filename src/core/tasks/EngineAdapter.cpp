#include "EngineAdapter.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QReadLocker>
#include <QtCore/QWriteLocker>

namespace Sluice {

QString toString(EngineError error) {
    switch (error) {
        case EngineError::Unreachable: return QStringLiteral("engine unreachable");
        case EngineError::Rejected: return QStringLiteral("engine rejected the task");
        case EngineError::InvalidSpec: return QStringLiteral("invalid task spec");
        case EngineError::HandleNotFound: return QStringLiteral("engine handle not found");
        case EngineError::Timeout: return QStringLiteral("engine call timed out");
        case EngineError::Internal: return QStringLiteral("internal engine error");
    }
    return QStringLiteral("unknown engine error");
}

bool isRetryable(EngineError error) {
    return error != EngineError::Rejected && error != EngineError::InvalidSpec;
}

void EngineRegistry::registerAdapter(const std::shared_ptr<EngineAdapter>& adapter) {
    const QString kind = adapter->kind();
    QWriteLocker locker(&lock_);
    if (adapters_.contains(kind)) {
        SLUICE_WARN("Replacing engine adapter for kind '{}'", kind.toStdString());
    }
    adapters_.insert(kind, adapter);
    SLUICE_INFO("Engine adapter registered: {}", kind.toStdString());
}

std::shared_ptr<EngineAdapter> EngineRegistry::adapterFor(const QString& kind) const {
    QReadLocker locker(&lock_);
    return adapters_.value(kind);
}

bool EngineRegistry::hasAdapter(const QString& kind) const {
    QReadLocker locker(&lock_);
    return adapters_.contains(kind);
}

QStringList EngineRegistry::kinds() const {
    QReadLocker locker(&lock_);
    return adapters_.keys();
}

} // namespace Sluice
