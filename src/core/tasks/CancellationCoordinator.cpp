#include "CancellationCoordinator.hpp"
#include "../common/Logger.hpp"
#include <algorithm>

namespace Sluice {

QString toString(CancelError error) {
    switch (error) {
        case CancelError::TaskNotFound: return QStringLiteral("task not found");
    }
    return QStringLiteral("unknown cancel error");
}

CancellationCoordinator::CancellationCoordinator(const Config::EngineSettings& engine,
                                                 TaskRegistry* registry,
                                                 EngineRegistry* engines,
                                                 AdmissionController* admission,
                                                 const Clock* clock,
                                                 QObject* parent)
    : QObject(parent)
    , engine_(engine)
    , registry_(registry)
    , engines_(engines)
    , admission_(admission)
    , clock_(clock)
    , cancelPool_(std::make_unique<QThreadPool>()) {
    cancelPool_->setMaxThreadCount(std::max(2, engine.pollConcurrency));
}

CancellationCoordinator::~CancellationCoordinator() {
    cancelPool_->waitForDone();
}

Expected<void, CancelError> CancellationCoordinator::cancel(TaskId id, CancelReason reason,
                                                            const QString& detail) {
    auto task = registry_->find(id);
    if (!task) {
        SLUICE_WARN("Cancel requested for unknown task {}", id);
        return makeUnexpected(CancelError::TaskNotFound);
    }

    const Task::CancellationClaim claim = task->claimCancellation();
    if (!claim.claimed) {
        SLUICE_DEBUG("Task {} already terminating or terminal, ignoring {}", id,
                     toString(reason).toStdString());
        return {};
    }

    SLUICE_INFO("Cancelling task {} ({}) from phase {}", id, toString(reason).toStdString(),
                toString(claim.previousPhase).toStdString());

    if (claim.handle) {
        auto adapter = engines_->adapterFor(task->kind());
        if (adapter) {
            const EngineHandle handle = *claim.handle;
            auto ack = callEngine<void>(cancelPool_.get(),
                                        [adapter, handle]() { return adapter->cancel(handle); },
                                        engine_.cancelAckTimeout);
            if (ack.hasError()) {
                SLUICE_WARN("Task {}: engine did not acknowledge cancel ({}), proceeding", id,
                            toString(ack.error()).toStdString());
            }
        } else {
            SLUICE_WARN("Task {}: no engine for kind '{}' to cancel handle", id,
                        task->kind().toStdString());
        }
    }

    const TaskPhase terminal = terminalPhaseFor(reason);
    const QString message = describe(reason, detail);
    auto finished = task->finishCancellation(terminal, reason, message);
    if (finished.hasError()) {
        SLUICE_ERROR("Task {}: could not enter {}: {}", id, toString(terminal).toStdString(),
                     toString(finished.error()).toStdString());
    }

    admission_->release(id, task->transferredBytes());

    StatusEvent event;
    event.taskId = id;
    event.phase = task->phase();
    event.chatRef = task->spec().chatRef;
    event.message = message;
    event.timestamp = clock_->now();
    registry_->publish(event);

    event.type = StatusEventType::Retiring;
    registry_->publish(event);

    emit taskTerminated(id, event.phase, reason);
    return {};
}

QString CancellationCoordinator::describe(CancelReason reason, const QString& detail) {
    QString message;
    switch (reason) {
        case CancelReason::UserCancelled: message = QStringLiteral("Cancelled by user"); break;
        case CancelReason::StalledDownload: message = QStringLiteral("Cancelled: transfer stalled"); break;
        case CancelReason::Timeout: message = QStringLiteral("Cancelled: task exceeded its time limit"); break;
        case CancelReason::EngineStartFailure: message = QStringLiteral("Failed: engine could not start the task"); break;
        case CancelReason::EngineUnreachable: message = QStringLiteral("Failed: engine unreachable"); break;
        case CancelReason::SizeLimitExceeded: message = QStringLiteral("Failed: size limit exceeded"); break;
    }
    if (!detail.isEmpty()) {
        message += QStringLiteral(" (%1)").arg(detail);
    }
    return message;
}

} // namespace Sluice
