#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVariantMap>
#include <optional>

namespace Sluice {

using TaskId = quint64;
using EngineHandle = QString;

enum class TaskCategory {
    Download,
    Upload
};

enum class TaskPhase {
    Queued,
    Active,
    Stalled,
    Completed,
    Failed,
    Cancelled
};

enum class CancelReason {
    UserCancelled,
    StalledDownload,
    Timeout,
    EngineStartFailure,
    EngineUnreachable,
    SizeLimitExceeded
};

enum class StatusEventType {
    PhaseChanged,
    Warning,
    Retiring,
    Restored,
    AdmissionPaused,
    AdmissionResumed
};

struct TaskSpec {
    QString ownerId;
    QString chatRef;
    TaskCategory category = TaskCategory::Download;
    QString kind;
    QString name;
    QString source;
    QString destination;
    QVariantMap options;
    std::optional<qint64> sizeBytes;
};

// What an engine reports for one handle
struct EngineProgress {
    qint64 transferredBytes = 0;
    std::optional<qint64> sizeBytes;
    qint64 speedBps = 0;
    qint64 etaSeconds = -1;  // -1 = unknown
    bool finished = false;
};

struct TaskSnapshot {
    TaskId id = 0;
    QString ownerId;
    QString chatRef;
    TaskCategory category = TaskCategory::Download;
    QString kind;
    QString name;
    QString source;
    QString destination;
    QVariantMap options;
    TaskPhase phase = TaskPhase::Queued;
    std::optional<EngineHandle> engineHandle;
    std::optional<qint64> sizeBytes;
    qint64 transferredBytes = 0;
    qint64 speedBps = 0;
    qint64 etaSeconds = -1;
    QDateTime createdAt;
    QDateTime admittedAt;
    QDateTime lastProgressAt;
    int retryCount = 0;
    int priority = 0;
    QString error;
    std::optional<CancelReason> cancelReason;

    TaskSpec spec() const;
};

struct StatusEvent {
    TaskId taskId = 0;  // 0 for engine-wide events
    TaskPhase phase = TaskPhase::Queued;
    StatusEventType type = StatusEventType::PhaseChanged;
    QString chatRef;
    QString message;
    QDateTime timestamp;
};

bool isTerminal(TaskPhase phase);
bool isRunning(TaskPhase phase);
TaskPhase terminalPhaseFor(CancelReason reason);
int categoryIndex(TaskCategory category);

QString toString(TaskCategory category);
QString toString(TaskPhase phase);
QString toString(CancelReason reason);
QString toString(StatusEventType type);

std::optional<TaskCategory> categoryFromString(const QString& name);
std::optional<TaskPhase> phaseFromString(const QString& name);
std::optional<CancelReason> cancelReasonFromString(const QString& name);

} // namespace Sluice

Q_DECLARE_METATYPE(Sluice::StatusEvent)
