#include "Worker.h"
#include "../logging/LoggingCategories.h"
#include <QtCore/QMutexLocker>
#include <QtCore/QDebug>
#include <exception>

Worker::Worker(QObject* parent)
    : QObject(parent)
    , m_state(State::Stopped)
    , m_stopRequested(false)
    , m_name("Worker") {
}

Worker::~Worker() {
    // 正常情况下派生类析构时已经停止；这里仅做检查，不能在此调用纯虚函数相关的路径
    if ( m_thread ) {
        qCWarning(lcThreading) << "Worker" << m_name << "destroyed while running, joining thread";
        {
            QMutexLocker locker(&m_wakeMutex);
            m_stopRequested.store(true);
            m_wakeCondition.wakeAll();
        }
        m_thread->wait();
    }
}

Worker::State Worker::state() const {
    return m_state.load();
}

bool Worker::isRunning() const {
    return m_state.load() == State::Running;
}

bool Worker::isStopped() const {
    return m_state.load() == State::Stopped;
}

QString Worker::name() const {
    QMutexLocker locker(&m_nameMutex);
    return m_name;
}

void Worker::setName(const QString& name) {
    QMutexLocker locker(&m_nameMutex);
    m_name = name;
}

Worker::PerformanceStats Worker::getPerformanceStats() const {
    QMutexLocker locker(&m_statsMutex);
    PerformanceStats stats = m_stats;

    // 更新运行时间
    if ( m_uptimeTimer.isValid() ) {
        stats.uptime = static_cast<quint64>(m_uptimeTimer.elapsed());
    }

    return stats;
}

void Worker::resetPerformanceStats() {
    QMutexLocker locker(&m_statsMutex);
    m_stats = PerformanceStats();
}

bool Worker::start() {
    QMutexLocker lifecycle(&m_lifecycleMutex);

    if ( m_thread ) {
        return true;
    }

    const QString workerName = name();
    qCDebug(lcThreading) << "Starting worker:" << workerName;

    if ( !initialize() ) {
        emitError(QString("Failed to initialize worker %1").arg(workerName));
        return false;
    }

    m_stopRequested.store(false);
    resetPerformanceStats();

    m_thread.reset(QThread::create([this]() { workLoop(); }));
    m_thread->setObjectName(workerName);
    m_thread->start();

    // QThread::start 在线程创建失败时不会置为运行状态，也不会置为已结束
    if ( !m_thread->isRunning() && !m_thread->isFinished() ) {
        m_thread.reset();
        cleanup();
        emitError(QString("Failed to create thread for worker %1").arg(workerName));
        return false;
    }

    {
        QMutexLocker locker(&m_statsMutex);
        m_uptimeTimer.start();
    }
    setState(State::Running);
    emit started();
    return true;
}

void Worker::stop() {
    QMutexLocker lifecycle(&m_lifecycleMutex);

    if ( !m_thread ) {
        return;
    }

    if ( QThread::currentThread() == m_thread.get() ) {
        // 在工作线程内部无法等待自身退出，只设置标志
        qCWarning(lcThreading) << "Worker" << name() << "stop() called from its own thread, request only";
        m_stopRequested.store(true);
        return;
    }

    qCDebug(lcThreading) << "Stopping worker:" << name();

    {
        QMutexLocker locker(&m_wakeMutex);
        m_stopRequested.store(true);
        m_wakeCondition.wakeAll();
    }

    m_thread->wait();
    m_thread.reset();

    {
        QMutexLocker locker(&m_statsMutex);
        m_stats.uptime = m_uptimeTimer.isValid() ? static_cast<quint64>(m_uptimeTimer.elapsed()) : 0;
        m_uptimeTimer.invalidate();
    }

    cleanup();
    setState(State::Stopped);
    emit stopped();
}

void Worker::setState(State newState) {
    State oldState = m_state.exchange(newState);
    if ( oldState != newState ) {
        emit stateChanged(newState, oldState);
    }
}

bool Worker::shouldStop() const {
    return m_stopRequested.load();
}

void Worker::emitError(const QString& error) {
    qCWarning(lcThreading) << "Worker error in" << name() << ":" << error;
    emit errorOccurred(error);
}

bool Worker::initialize() {
    // 默认实现：什么都不做，返回成功
    return true;
}

void Worker::cleanup() {
    // 默认实现：什么都不做
}

void Worker::workLoop() {
    qCDebug(lcThreading) << "Worker" << name() << "work loop started";

    while ( !shouldStop() ) {
        QElapsedTimer processingTimer;
        processingTimer.start();

        bool failed = false;
        try {
            processTask();
        } catch ( const std::exception& e ) {
            // 单次任务失败不终止循环
            failed = true;
            emitError(QString("Exception in work loop: %1").arg(e.what()));
        } catch ( ... ) {
            failed = true;
            emitError("Unknown exception in work loop");
        }

        updatePerformanceStats(static_cast<quint64>(processingTimer.elapsed()), failed);

        QMutexLocker locker(&m_wakeMutex);
        if ( m_stopRequested.load() ) {
            break;
        }
        const int interval = qMax(0, sleepIntervalMs());
        m_wakeCondition.wait(&m_wakeMutex, static_cast<unsigned long>(interval));
    }

    qCDebug(lcThreading) << "Worker" << name() << "work loop finished";
}

void Worker::updatePerformanceStats(quint64 processingTime, bool failed) {
    QMutexLocker locker(&m_statsMutex);
    m_stats.totalIterations++;
    if ( failed ) {
        m_stats.failedIterations++;
    }
    m_stats.totalProcessingTime += processingTime;
    if ( processingTime > m_stats.maxProcessingTime ) {
        m_stats.maxProcessingTime = processingTime;
    }
}
