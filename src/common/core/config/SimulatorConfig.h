#ifndef SIMULATORCONFIG_H
#define SIMULATORCONFIG_H

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QMutex>
#include <array>
#include <atomic>

#include "../../types/KeyBindings.h"

/**
 * @brief 模拟器配置
 *
 * 保存六个按键绑定、移动量、轮询间隔和启用标志。
 * 每个字段都是独立的原子变量：轮询线程每个 tick 无锁读取，界面线程随时写入，
 * 跨字段的组合可能不一致（例如新按键配旧移动量），这一点是允许的。
 *
 * 持久化格式为 XML，文件不存在时使用默认值，内容损坏时回退到默认值并报告。
 */
class SimulatorConfig : public QObject
{
    Q_OBJECT

public:
    // 加载结果
    enum class LoadStatus {
        Loaded,         ///< 成功读取
        FileMissing,    ///< 文件不存在，使用默认值
        Malformed       ///< 文件损坏，使用默认值
    };
    Q_ENUM(LoadStatus)

    explicit SimulatorConfig(QObject *parent = nullptr);
    ~SimulatorConfig() override;

    // 配置文件管理
    void setConfigFile(const QString &filePath);
    QString configFile() const;
    static QString defaultConfigFile();

    /**
     * @brief 从配置文件读取
     *
     * 先解析到临时对象，成功后整体应用；失败时全部字段回退为默认值。
     */
    LoadStatus load();

    /**
     * @brief 原子地写入配置文件
     * @return 失败返回 false，错误信息见 lastError()，不重试
     */
    bool save();

    QString lastError() const;

    // 按键绑定
    int key(KeyMouse::KeySlot slot) const;
    void setKey(KeyMouse::KeySlot slot, int qtKey);
    KeyMouse::KeyBindings keyBindings() const;

    // 移动参数，超出范围时钳制并记录警告
    int moveAmount() const { return m_moveAmount.load(); }
    void setMoveAmount(int amount);

    int pollingInterval() const { return m_pollingInterval.load(); }
    void setPollingInterval(int intervalMs);

    bool isEnabled() const { return m_enabled.load(); }
    void setEnabled(bool enabled);

    static int clampMoveAmount(int amount);
    static int clampPollingInterval(int intervalMs);

signals:
    void configChanged();
    void keyBindingChanged(int slot, int qtKey);
    void configLoaded();
    void configSaved();

private:
    std::array<std::atomic<int>, KeyMouse::KeySlotCount> m_keys;
    std::atomic<int> m_moveAmount;
    std::atomic<int> m_pollingInterval;
    std::atomic<bool> m_enabled;

    mutable QMutex m_fileMutex;     ///< 保护文件路径、错误信息和读写过程
    QString m_configFilePath;
    QString m_lastError;
};

#endif // SIMULATORCONFIG_H
