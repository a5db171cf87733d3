#pragma once

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QSocketNotifier>
#include <signal.h>
#include "Expected.hpp"

namespace Sluice {

enum class SignalError {
    SocketPairFailed,
    HandlerInstallFailed,
    AlreadyWatching
};

QString toString(SignalError error);

/**
 * @brief Delivers POSIX termination signals through the Qt event loop
 *
 * The handler only writes the signal number to one end of a socket pair.
 * A QSocketNotifier on the other end reads it in the watcher's thread and
 * emits terminationRequested(). Only one watcher may be active per process;
 * destroying it restores the previous handlers.
 */
class SignalWatcher : public QObject {
    Q_OBJECT

public:
    explicit SignalWatcher(QObject* parent = nullptr);
    ~SignalWatcher() override;

    Expected<void, SignalError> watch(const QList<int>& signalNumbers);
    bool isWatching() const { return notifier_ != nullptr; }

signals:
    void terminationRequested(int signalNumber);

private slots:
    void readSignal();

private:
    static void handleSignal(int signalNumber);
    void restoreHandlers();

    int sockets_[2] = {-1, -1};
    QSocketNotifier* notifier_ = nullptr;
    QHash<int, struct sigaction> previous_;
};

} // namespace Sluice
