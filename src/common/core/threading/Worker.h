#ifndef WORKER_H
#define WORKER_H

#include <QtCore/QObject>
#include <QtCore/QMutex>
#include <QtCore/QWaitCondition>
#include <QtCore/QElapsedTimer>
#include <QtCore/QThread>
#include <atomic>
#include <memory>

/**
 * @brief 工作线程基类
 *
 * 持有一个专用线程，在线程中周期性调用 processTask()，两次调用之间休眠 sleepIntervalMs()。
 * 停止是协作式的：stop() 设置停止标志并唤醒休眠，循环在顶部检查标志后退出，
 * stop() 阻塞到线程完全退出后才返回，因此返回时不存在正在执行的任务。
 */
class Worker : public QObject {
    Q_OBJECT

public:
    /**
     * @brief 工作线程状态枚举
     */
    enum class State {
        Stopped,    ///< 已停止（无线程）
        Running     ///< 运行中（线程存在）
    };
    Q_ENUM(State)

    /**
     * @brief 性能统计信息
     */
    struct PerformanceStats {
        quint64 totalIterations = 0;        ///< 总迭代次数
        quint64 failedIterations = 0;       ///< 抛出异常的迭代次数
        quint64 totalProcessingTime = 0;    ///< 总处理时间（毫秒）
        quint64 maxProcessingTime = 0;      ///< 最大处理时间（毫秒）
        quint64 uptime = 0;                 ///< 运行时间（毫秒）
    };

    explicit Worker(QObject* parent = nullptr);

    /**
     * @brief 析构函数
     *
     * 派生类必须在自己的析构函数中调用 stop()，保证线程不再调用派生类的虚函数。
     */
    ~Worker() override;

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    State state() const;
    bool isRunning() const;
    bool isStopped() const;

    QString name() const;
    void setName(const QString& name);

    PerformanceStats getPerformanceStats() const;
    void resetPerformanceStats();

public slots:
    /**
     * @brief 启动工作线程
     *
     * 先在调用线程执行 initialize()，再创建线程。已在运行时直接返回 true。
     * @return 初始化或线程创建失败时返回 false，状态保持 Stopped，并发出 errorOccurred
     */
    virtual bool start();

    /**
     * @brief 停止工作线程并等待其退出
     *
     * 最长等待时间为一次任务处理时间；休眠会被立即唤醒。已停止时无操作。
     */
    virtual void stop();

signals:
    void started();
    void stopped();

    /**
     * @brief 错误信号，可能从工作线程发出
     */
    void errorOccurred(const QString& error);

    void stateChanged(Worker::State newState, Worker::State oldState);

protected:
    /**
     * @brief 单次任务，在工作线程中调用
     */
    virtual void processTask() = 0;

    /**
     * @brief 两次任务之间的休眠时长（毫秒），每次迭代重新读取
     */
    virtual int sleepIntervalMs() const = 0;

    /**
     * @brief 启动前的初始化，在调用 start() 的线程中执行
     * @return false 表示初始化失败，线程不会被创建
     */
    virtual bool initialize();

    /**
     * @brief 线程退出后的清理，在调用 stop() 的线程中执行
     */
    virtual void cleanup();

    bool shouldStop() const;
    void emitError(const QString& error);

private:
    void workLoop();
    void setState(State newState);
    void updatePerformanceStats(quint64 processingTime, bool failed);

private:
    QMutex m_lifecycleMutex;            ///< 串行化 start/stop
    std::unique_ptr<QThread> m_thread;  ///< 工作线程
    std::atomic<State> m_state;         ///< 当前状态
    std::atomic<bool> m_stopRequested;  ///< 停止请求标志

    QMutex m_wakeMutex;                 ///< 休眠互斥锁
    QWaitCondition m_wakeCondition;     ///< 休眠条件变量，stop() 时唤醒

    mutable QMutex m_nameMutex;
    QString m_name;                     ///< 线程名称

    // 性能统计相关
    mutable QMutex m_statsMutex;        ///< 统计互斥锁
    PerformanceStats m_stats;           ///< 性能统计数据
    QElapsedTimer m_uptimeTimer;        ///< 运行时间计时器
};

#endif // WORKER_H
