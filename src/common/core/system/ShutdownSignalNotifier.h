#ifndef SHUTDOWNSIGNALNOTIFIER_H
#define SHUTDOWNSIGNALNOTIFIER_H

#include <QtCore/QObject>
#include <QtCore/QList>

class QSocketNotifier;
class QTimer;

/**
 * @brief 把进程信号（SIGINT、SIGTERM）转发为 Qt 信号
 *
 * 信号处理函数只做异步信号安全的操作：Unix 上向自管道写入一个字节，
 * 由 QSocketNotifier 在事件循环中读取；其他平台写入 sig_atomic_t 标志，由定时器轮询。
 * 同一时刻只能有一个实例处于安装状态，析构时恢复默认处理。
 */
class ShutdownSignalNotifier : public QObject {
    Q_OBJECT

public:
    explicit ShutdownSignalNotifier(QObject* parent = nullptr);
    ~ShutdownSignalNotifier() override;

    /**
     * @brief 为给定的信号安装处理函数
     * @return 已有其他实例安装或系统调用失败时返回 false
     */
    bool install(const QList<int>& signalNumbers);

    void uninstall();

    bool isInstalled() const { return m_installed; }

signals:
    /// 在事件循环线程中发出
    void signalReceived(int signalNumber);

private slots:
    void drainPending();

private:
    static void handleSignal(int signalNumber);

    QList<int> m_signalNumbers;
    QSocketNotifier* m_notifier;
    QTimer* m_pollTimer;
    bool m_installed;
};

#endif // SHUTDOWNSIGNALNOTIFIER_H
