#ifndef LOGGING_CATEGORIES_H
#define LOGGING_CATEGORIES_H

#include <QtCore/QLoggingCategory>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

/**
 * @brief 日志分类管理类
 *
 * 提供统一的日志分类定义和管理功能，支持动态日志级别控制。
 * 按功能模块组织日志分类，便于调试和问题定位。
 */
class LoggingCategories : public QObject {
    Q_OBJECT

public:
    /**
     * @brief 日志级别枚举
     */
    enum LogLevel {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Critical = 3,
        Fatal = 4
    };
    Q_ENUM(LogLevel)

    /**
     * @brief 设置全局日志级别
     *
     * 低于该级别的消息在所有分类中被过滤；已设置的分类级别会被清除。
     * @param level 日志级别
     */
    static void setGlobalLogLevel(LogLevel level);

    /**
     * @brief 设置特定分类的日志级别
     * @param categoryName 分类名称
     * @param level 日志级别
     */
    static void setCategoryLogLevel(const QString& categoryName, LogLevel level);

    /**
     * @brief 获取所有日志分类名称
     * @return 分类名称列表
     */
    static QStringList getAllCategoryNames();

    /**
     * @brief 生成当前级别设置对应的 Qt 过滤规则
     */
    static QString currentFilterRules();

private:
    explicit LoggingCategories(QObject* parent = nullptr);
    static void applyRules();
};

// ============================================================================
// 核心模块日志分类
// ============================================================================

/// 应用程序主模块日志
Q_DECLARE_LOGGING_CATEGORY(lcApp)

/// 配置管理日志
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

/// 线程通信日志
Q_DECLARE_LOGGING_CATEGORY(lcThreading)

// ============================================================================
// 输入模拟引擎日志分类
// ============================================================================

/// 轮询引擎日志
Q_DECLARE_LOGGING_CATEGORY(lcEngine)

/// 按键状态查询日志
Q_DECLARE_LOGGING_CATEGORY(lcKeyState)

/// 输入注入日志
Q_DECLARE_LOGGING_CATEGORY(lcInjector)

// ============================================================================
// 用户界面模块日志分类
// ============================================================================

/// UI主模块日志
Q_DECLARE_LOGGING_CATEGORY(lcUI)

/// 主窗口日志
Q_DECLARE_LOGGING_CATEGORY(lcMainWindow)

// ============================================================================
// 测试模块日志分类
// ============================================================================

/// 测试主模块日志
Q_DECLARE_LOGGING_CATEGORY(lcTest)

#endif // LOGGING_CATEGORIES_H
