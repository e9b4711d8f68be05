#ifndef POLLINGENGINE_H
#define POLLINGENGINE_H

#include "../common/core/threading/Worker.h"
#include "keystate/KeyStateTracker.h"
#include "MotionIntegrator.h"

#include <QtCore/QElapsedTimer>
#include <atomic>

class SimulatorConfig;
class KeyStateSource;
class InputInjector;

/**
 * @brief 轮询引擎
 *
 * 在专用线程中按配置的间隔循环：读取配置，采样全部按键，
 * 对按住的方向键注入与经过时间成正比的位移，对点击键的按下/抬起边沿注入按键事件。
 *
 * 配置、按键源和注入器均为借用指针，生命周期由调用方保证长于引擎。
 * 注入和按键查询失败只记录日志并计数，不会停止循环。
 */
class PollingEngine : public Worker {
    Q_OBJECT

public:
    /**
     * @brief tick 统计，每次启动时清零，可从任意线程读取
     */
    struct TickStats {
        quint64 ticks = 0;              ///< 总 tick 数
        quint64 idleTicks = 0;          ///< 禁用状态下的空 tick 数
        quint64 moveEvents = 0;         ///< 成功注入的移动事件数
        quint64 buttonEvents = 0;       ///< 成功注入的按键事件数
        quint64 injectionFailures = 0;  ///< 注入失败次数
        quint64 keyQueryFailures = 0;   ///< 按键查询失败次数
    };

    PollingEngine(SimulatorConfig* config, KeyStateSource* source, InputInjector* injector,
                  QObject* parent = nullptr);
    ~PollingEngine() override;

    TickStats statistics() const;

    /**
     * @brief 执行一次 tick
     *
     * 由工作线程调用；引擎未运行时也可以直接调用以驱动单个 tick。
     * 位移的亚像素余量在 tick 之间累积，启动时清零。
     * @param elapsedNanos 距上一个 tick 的纳秒数
     */
    void processTick(qint64 elapsedNanos);

protected:
    void processTask() override;
    int sleepIntervalMs() const override;
    bool initialize() override;
    void cleanup() override;

private:
    void inject(bool ok, std::atomic<quint64>& successCounter);
    void resetStatistics();

    SimulatorConfig* m_config;
    KeyStateSource* m_source;
    InputInjector* m_injector;

    KeyStateTracker m_tracker;
    MotionIntegrator m_integrator;

    // 注入失败日志限流，仅在工作线程访问
    QElapsedTimer m_failureLogTimer;
    quint64 m_suppressedFailures;

    std::atomic<quint64> m_ticks{0};
    std::atomic<quint64> m_idleTicks{0};
    std::atomic<quint64> m_moveEvents{0};
    std::atomic<quint64> m_buttonEvents{0};
    std::atomic<quint64> m_injectionFailures{0};
};

#endif // POLLINGENGINE_H
