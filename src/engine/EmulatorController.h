#ifndef EMULATORCONTROLLER_H
#define EMULATORCONTROLLER_H

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

#include "../common/core/config/SimulatorConfig.h"
#include "../common/types/KeyBindings.h"

class KeyStateSource;
class InputInjector;
class PollingEngine;

/**
 * @brief 模拟器控制器
 *
 * 持有配置、按键源、注入器和轮询引擎，对外提供控制接口。
 * 启用标志与引擎生命周期绑定：启用时启动引擎线程，禁用时停止并等待线程退出。
 * 其余设置直接写入配置，下一个 tick 生效。
 *
 * 只能在主线程调用。
 */
class EmulatorController : public QObject
{
    Q_OBJECT

public:
    explicit EmulatorController(QObject *parent = nullptr);

    /**
     * @brief 使用指定的按键源和注入器构造（测试用）
     */
    EmulatorController(std::unique_ptr<KeyStateSource> source,
                       std::unique_ptr<InputInjector> injector,
                       QObject *parent = nullptr);
    ~EmulatorController() override;

    SimulatorConfig *config() const { return m_config.get(); }
    PollingEngine *engine() const { return m_engine.get(); }

    // 配置持久化
    SimulatorConfig::LoadStatus loadConfiguration(const QString &filePath = QString());
    bool saveConfiguration();

    /**
     * @brief 启用或禁用模拟
     * @return 引擎启动失败时返回 false，启用标志恢复为 false
     */
    bool setEnabled(bool enabled);
    bool isEnabled() const;

    void setKeyBinding(KeyMouse::KeySlot slot, int qtKey);
    void setMovementMagnitude(int amount);
    void setPollingInterval(int intervalMs);

    /// 停止引擎，可重复调用
    void shutdown();

    QString lastError() const { return m_lastError; }

signals:
    void enabledChanged(bool enabled);
    void errorOccurred(const QString &error);

private slots:
    void onEngineError(const QString &error);

private:
    void setupEngine();

    std::unique_ptr<SimulatorConfig> m_config;
    std::unique_ptr<KeyStateSource> m_source;
    std::unique_ptr<InputInjector> m_injector;
    std::unique_ptr<PollingEngine> m_engine;   ///< 最后创建，最先销毁
    QString m_lastError;
};

#endif // EMULATORCONTROLLER_H
