#include "TaskTypes.hpp"

namespace Sluice {

TaskSpec TaskSnapshot::spec() const {
    TaskSpec spec;
    spec.ownerId = ownerId;
    spec.chatRef = chatRef;
    spec.category = category;
    spec.kind = kind;
    spec.name = name;
    spec.source = source;
    spec.destination = destination;
    spec.options = options;
    spec.sizeBytes = sizeBytes;
    return spec;
}

bool isTerminal(TaskPhase phase) {
    return phase == TaskPhase::Completed || phase == TaskPhase::Failed ||
           phase == TaskPhase::Cancelled;
}

bool isRunning(TaskPhase phase) {
    return phase == TaskPhase::Active || phase == TaskPhase::Stalled;
}

TaskPhase terminalPhaseFor(CancelReason reason) {
    switch (reason) {
        case CancelReason::UserCancelled:
        case CancelReason::StalledDownload:
        case CancelReason::Timeout:
            return TaskPhase::Cancelled;
        case CancelReason::EngineStartFailure:
        case CancelReason::EngineUnreachable:
        case CancelReason::SizeLimitExceeded:
            return TaskPhase::Failed;
    }
    return TaskPhase::Failed;
}

int categoryIndex(TaskCategory category) {
    return category == TaskCategory::Download ? 0 : 1;
}

QString toString(TaskCategory category) {
    switch (category) {
        case TaskCategory::Download: return QStringLiteral("Download");
        case TaskCategory::Upload: return QStringLiteral("Upload");
    }
    return QString();
}

QString toString(TaskPhase phase) {
    switch (phase) {
        case TaskPhase::Queued: return QStringLiteral("Queued");
        case TaskPhase::Active: return QStringLiteral("Active");
        case TaskPhase::Stalled: return QStringLiteral("Stalled");
        case TaskPhase::Completed: return QStringLiteral("Completed");
        case TaskPhase::Failed: return QStringLiteral("Failed");
        case TaskPhase::Cancelled: return QStringLiteral("Cancelled");
    }
    return QString();
}

QString toString(CancelReason reason) {
    switch (reason) {
        case CancelReason::UserCancelled: return QStringLiteral("UserCancelled");
        case CancelReason::StalledDownload: return QStringLiteral("StalledDownload");
        case CancelReason::Timeout: return QStringLiteral("Timeout");
        case CancelReason::EngineStartFailure: return QStringLiteral("EngineStartFailure");
        case CancelReason::EngineUnreachable: return QStringLiteral("EngineUnreachable");
        case CancelReason::SizeLimitExceeded: return QStringLiteral("SizeLimitExceeded");
    }
    return QString();
}

QString toString(StatusEventType type) {
    switch (type) {
        case StatusEventType::PhaseChanged: return QStringLiteral("PhaseChanged");
        case StatusEventType::Warning: return QStringLiteral("Warning");
        case StatusEventType::Retiring: return QStringLiteral("Retiring");
        case StatusEventType::Restored: return QStringLiteral("Restored");
        case StatusEventType::AdmissionPaused: return QStringLiteral("AdmissionPaused");
        case StatusEventType::AdmissionResumed: return QStringLiteral("AdmissionResumed");
    }
    return QString();
}

std::optional<TaskCategory> categoryFromString(const QString& name) {
    for (TaskCategory category : {TaskCategory::Download, TaskCategory::Upload}) {
        if (toString(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

std::optional<TaskPhase> phaseFromString(const QString& name) {
    for (TaskPhase phase : {TaskPhase::Queued, TaskPhase::Active, TaskPhase::Stalled,
                            TaskPhase::Completed, TaskPhase::Failed, TaskPhase::Cancelled}) {
        if (toString(phase) == name) {
            return phase;
        }
    }
    return std::nullopt;
}

std::optional<CancelReason> cancelReasonFromString(const QString& name) {
    for (CancelReason reason : {CancelReason::UserCancelled, CancelReason::StalledDownload,
                                CancelReason::Timeout, CancelReason::EngineStartFailure,
                                CancelReason::EngineUnreachable, CancelReason::SizeLimitExceeded}) {
        if (toString(reason) == name) {
            return reason;
        }
    }
    return std::nullopt;
}

} // namespace Sluice
