#include "ShutdownSignalNotifier.h"
#include "../logging/LoggingCategories.h"

#include <QtCore/QSocketNotifier>
#include <QtCore/QTimer>
#include <csignal>

#if defined(Q_OS_UNIX)
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace {

// 只在主线程访问
ShutdownSignalNotifier* s_owner = nullptr;

#if defined(Q_OS_UNIX)
int s_pipeFds[2] = { -1, -1 };

bool setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    return flags != -1
           && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1
           && ::fcntl(fd, F_SETFD, FD_CLOEXEC) != -1;
}
#else
constexpr int SIGNAL_POLL_INTERVAL_MS = 100;
volatile std::sig_atomic_t s_pendingSignal = 0;
#endif

} // namespace

ShutdownSignalNotifier::ShutdownSignalNotifier(QObject* parent)
    : QObject(parent)
    , m_notifier(nullptr)
    , m_pollTimer(nullptr)
    , m_installed(false) {
}

ShutdownSignalNotifier::~ShutdownSignalNotifier() {
    uninstall();
}

void ShutdownSignalNotifier::handleSignal(int signalNumber) {
#if defined(Q_OS_UNIX)
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signalNumber);
    // 管道已满时写入失败，此时已有未处理的信号
    const bool written = ::write(s_pipeFds[1], &byte, 1) == 1;
    Q_UNUSED(written);
    errno = savedErrno;
#else
    s_pendingSignal = signalNumber;
    // Windows 在调用处理函数前会恢复默认处理
    std::signal(signalNumber, &ShutdownSignalNotifier::handleSignal);
#endif
}

bool ShutdownSignalNotifier::install(const QList<int>& signalNumbers) {
    if ( m_installed || s_owner ) {
        qCWarning(lcApp) << "Signal handlers are already installed";
        return false;
    }

#if defined(Q_OS_UNIX)
    if ( ::pipe(s_pipeFds) != 0 ) {
        qCWarning(lcApp) << "Cannot create signal pipe:" << std::strerror(errno);
        s_pipeFds[0] = s_pipeFds[1] = -1;
        return false;
    }
    if ( !setNonBlocking(s_pipeFds[0]) || !setNonBlocking(s_pipeFds[1]) ) {
        qCWarning(lcApp) << "Cannot configure signal pipe:" << std::strerror(errno);
        ::close(s_pipeFds[0]);
        ::close(s_pipeFds[1]);
        s_pipeFds[0] = s_pipeFds[1] = -1;
        return false;
    }

    m_notifier = new QSocketNotifier(s_pipeFds[0], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &ShutdownSignalNotifier::drainPending);
#else
    s_pendingSignal = 0;
    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(SIGNAL_POLL_INTERVAL_MS);
    connect(m_pollTimer, &QTimer::timeout, this, &ShutdownSignalNotifier::drainPending);
    m_pollTimer->start();
#endif

    s_owner = this;
    m_installed = true;

    for ( int signalNumber : signalNumbers ) {
#if defined(Q_OS_UNIX)
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = &ShutdownSignalNotifier::handleSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        const bool ok = ::sigaction(signalNumber, &action, nullptr) == 0;
#else
        const bool ok = std::signal(signalNumber, &ShutdownSignalNotifier::handleSignal) != SIG_ERR;
#endif
        if ( !ok ) {
            qCWarning(lcApp, "Cannot install handler for signal %d", signalNumber);
            uninstall();
            return false;
        }
        m_signalNumbers.append(signalNumber);
    }

    qCDebug(lcApp) << "Signal handlers installed for" << m_signalNumbers;
    return true;
}

void ShutdownSignalNotifier::uninstall() {
    if ( !m_installed ) {
        return;
    }

    for ( int signalNumber : m_signalNumbers ) {
        std::signal(signalNumber, SIG_DFL);
    }
    m_signalNumbers.clear();

    delete m_notifier;
    m_notifier = nullptr;
    delete m_pollTimer;
    m_pollTimer = nullptr;

#if defined(Q_OS_UNIX)
    ::close(s_pipeFds[0]);
    ::close(s_pipeFds[1]);
    s_pipeFds[0] = s_pipeFds[1] = -1;
#else
    s_pendingSignal = 0;
#endif

    s_owner = nullptr;
    m_installed = false;
}

void ShutdownSignalNotifier::drainPending() {
    QList<int> received;

#if defined(Q_OS_UNIX)
    unsigned char buffer[16];
    ssize_t count = 0;
    while ( (count = ::read(s_pipeFds[0], buffer, sizeof(buffer))) > 0 ) {
        for ( ssize_t i = 0; i < count; ++i ) {
            received.append(buffer[i]);
        }
    }
#else
    const int pending = s_pendingSignal;
    if ( pending != 0 ) {
        s_pendingSignal = 0;
        received.append(pending);
    }
#endif

    // 接收方可能在槽函数中卸载处理函数，先读完再发出
    for ( int signalNumber : received ) {
        qCInfo(lcApp, "Received signal: %d", signalNumber);
        emit signalReceived(signalNumber);
    }
}
