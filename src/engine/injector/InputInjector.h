#ifndef INPUTINJECTOR_H
#define INPUTINJECTOR_H

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

/**
 * @brief 输入注入抽象基类
 *
 * 定义跨平台的相对光标移动和鼠标按键注入接口。
 * 注入是同步、尽力而为的：失败时返回 false 并设置 lastError()，由调用方决定如何处理。
 */
class InputInjector : public QObject {
    Q_OBJECT

public:
    explicit InputInjector(QObject* parent = nullptr);
    ~InputInjector() override;

    // 初始化和清理
    virtual bool initialize() = 0;
    virtual void cleanup() = 0;

    /**
     * @brief 注入一次相对光标移动
     */
    virtual bool moveRelative(int dx, int dy) = 0;

    /**
     * @brief 注入一次按键变化
     * @param isPrimary true 为左键，false 为右键
     * @param isDown true 为按下，false 为抬起
     */
    virtual bool setButton(bool isPrimary, bool isDown) = 0;

    // 错误处理
    QString lastError() const { return m_lastError; }

    /**
     * @brief 创建当前平台的实现，不支持的平台返回空指针
     */
    static std::unique_ptr<InputInjector> createForPlatform();

protected:
    void setLastError(const QString& error);

    bool m_initialized;
    QString m_lastError;
};

#endif // INPUTINJECTOR_H
