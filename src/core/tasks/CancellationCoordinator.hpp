#pragma once

#include <QtCore/QObject>
#include <QtCore/QThreadPool>
#include <memory>
#include "AdmissionController.hpp"
#include "EngineAdapter.hpp"
#include "TaskRegistry.hpp"

namespace Sluice {

enum class CancelError {
    TaskNotFound
};

QString toString(CancelError error);

/**
 * @brief The only path that terminates a task early
 *
 * cancel() claims the task, asks the engine to stop (bounded by the
 * acknowledgement timeout), moves the task to Cancelled or Failed,
 * releases its slot and announces the retirement. Repeated calls for
 * the same task are no-ops.
 */
class CancellationCoordinator : public QObject {
    Q_OBJECT

public:
    CancellationCoordinator(const Config::EngineSettings& engine,
                            TaskRegistry* registry,
                            EngineRegistry* engines,
                            AdmissionController* admission,
                            const Clock* clock,
                            QObject* parent = nullptr);
    ~CancellationCoordinator() override;

    Expected<void, CancelError> cancel(TaskId id, CancelReason reason, const QString& detail = QString());

signals:
    void taskTerminated(TaskId id, Sluice::TaskPhase phase, Sluice::CancelReason reason);

private:
    static QString describe(CancelReason reason, const QString& detail);

    const Config::EngineSettings engine_;
    TaskRegistry* registry_;
    EngineRegistry* engines_;
    AdmissionController* admission_;
    const Clock* clock_;
    std::unique_ptr<QThreadPool> cancelPool_;
};

} // namespace Sluice
