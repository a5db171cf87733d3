#include "SignalWatcher.hpp"
#include "Logger.hpp"
#include <csignal>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace Sluice {

namespace {

volatile std::sig_atomic_t g_writeSocket = -1;

} // namespace

QString toString(SignalError error) {
    switch (error) {
        case SignalError::SocketPairFailed: return QStringLiteral("could not create signal socket pair");
        case SignalError::HandlerInstallFailed: return QStringLiteral("could not install signal handler");
        case SignalError::AlreadyWatching: return QStringLiteral("signals are already being watched");
    }
    return QStringLiteral("unknown signal error");
}

SignalWatcher::SignalWatcher(QObject* parent)
    : QObject(parent) {
}

SignalWatcher::~SignalWatcher() {
    restoreHandlers();
    if (sockets_[0] >= 0 && g_writeSocket == sockets_[0]) {
        g_writeSocket = -1;
    }
    delete notifier_;
    for (int& fd : sockets_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

Expected<void, SignalError> SignalWatcher::watch(const QList<int>& signalNumbers) {
    if (notifier_ || g_writeSocket >= 0) {
        return makeUnexpected(SignalError::AlreadyWatching);
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sockets_) != 0) {
        SLUICE_ERROR("socketpair failed: {}", std::strerror(errno));
        return makeUnexpected(SignalError::SocketPairFailed);
    }
    g_writeSocket = sockets_[0];

    notifier_ = new QSocketNotifier(sockets_[1], QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &SignalWatcher::readSignal);

    for (int signalNumber : signalNumbers) {
        struct sigaction action = {};
        action.sa_handler = &SignalWatcher::handleSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;

        struct sigaction old = {};
        if (::sigaction(signalNumber, &action, &old) != 0) {
            SLUICE_ERROR("sigaction({}) failed: {}", signalNumber, std::strerror(errno));
            restoreHandlers();
            g_writeSocket = -1;
            delete notifier_;
            notifier_ = nullptr;
            for (int& fd : sockets_) {
                ::close(fd);
                fd = -1;
            }
            return makeUnexpected(SignalError::HandlerInstallFailed);
        }
        previous_.insert(signalNumber, old);
    }

    SLUICE_DEBUG("Watching {} signal(s)", signalNumbers.size());
    return {};
}

void SignalWatcher::handleSignal(int signalNumber) {
    const unsigned char number = static_cast<unsigned char>(signalNumber);
    const int fd = g_writeSocket;
    if (fd < 0) {
        return;
    }
    // Nothing async-signal-safe can report a failed write from here
    const ssize_t written = ::write(fd, &number, sizeof(number));
    static_cast<void>(written);
}

void SignalWatcher::readSignal() {
    notifier_->setEnabled(false);
    unsigned char number = 0;
    const ssize_t got = ::read(sockets_[1], &number, sizeof(number));
    notifier_->setEnabled(true);

    if (got != sizeof(number)) {
        SLUICE_WARN("Signal socket read failed: {}", got < 0 ? std::strerror(errno) : "short read");
        return;
    }

    SLUICE_INFO("Received signal {}", static_cast<int>(number));
    emit terminationRequested(static_cast<int>(number));
}

void SignalWatcher::restoreHandlers() {
    for (auto it = previous_.cbegin(); it != previous_.cend(); ++it) {
        if (::sigaction(it.key(), &it.value(), nullptr) != 0) {
            SLUICE_WARN("Could not restore handler for signal {}: {}", it.key(), std::strerror(errno));
        }
    }
    previous_.clear();
}

} // namespace Sluice
