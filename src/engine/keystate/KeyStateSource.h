#ifndef KEYSTATESOURCE_H
#define KEYSTATESOURCE_H

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

/**
 * @brief 物理按键状态查询抽象基类
 *
 * 定义跨平台的全局按键状态查询接口。查询是同步、非阻塞的，
 * 与窗口焦点和消息分发无关。按键使用 Qt::Key 取值。
 */
class KeyStateSource : public QObject {
    Q_OBJECT

public:
    explicit KeyStateSource(QObject* parent = nullptr);
    ~KeyStateSource() override;

    // 初始化和清理
    virtual bool initialize() = 0;
    virtual void cleanup() = 0;

    /**
     * @brief 查询按键当前是否被按下
     * @param qtKey Qt::Key 取值；0 表示未绑定，始终返回未按下
     * @param held 输出：是否按下
     * @return 查询失败时返回 false，原因见 lastError()
     */
    virtual bool queryKeyState(int qtKey, bool& held) = 0;

    // 错误处理
    QString lastError() const { return m_lastError; }

    /**
     * @brief 创建当前平台的实现，不支持的平台返回空指针
     */
    static std::unique_ptr<KeyStateSource> createForPlatform();

protected:
    void setLastError(const QString& error);

    bool m_initialized;
    QString m_lastError;
};

#endif // KEYSTATESOURCE_H
