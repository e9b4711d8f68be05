#include "LoggingCategories.h"
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QMap>

namespace {

QMutex s_rulesMutex;
LoggingCategories::LogLevel s_globalLevel = LoggingCategories::Debug;
QMap<QString, LoggingCategories::LogLevel> s_categoryLevels;

const QStringList& messageTypes() {
    static const QStringList types = { "debug", "info", "warning", "critical" };
    return types;
}

// 某一级别下需要关闭的 Qt 消息类型
QStringList disabledTypesFor(LoggingCategories::LogLevel level) {
    return messageTypes().mid(0, qMin<int>(level, messageTypes().size()));
}

} // namespace

// ============================================================================
// 核心模块日志分类定义
// ============================================================================

/// 应用程序主模块日志
Q_LOGGING_CATEGORY(lcApp, "app", QtDebugMsg)

/// 配置管理日志
Q_LOGGING_CATEGORY(lcConfig, "core.config", QtDebugMsg)

/// 线程通信日志
Q_LOGGING_CATEGORY(lcThreading, "core.threading", QtDebugMsg)

// ============================================================================
// 输入模拟引擎日志分类定义
// ============================================================================

/// 轮询引擎日志
Q_LOGGING_CATEGORY(lcEngine, "engine", QtDebugMsg)

/// 按键状态查询日志
Q_LOGGING_CATEGORY(lcKeyState, "engine.keystate", QtDebugMsg)

/// 输入注入日志
Q_LOGGING_CATEGORY(lcInjector, "engine.injector", QtDebugMsg)

// ============================================================================
// 用户界面模块日志分类定义
// ============================================================================

/// UI主模块日志
Q_LOGGING_CATEGORY(lcUI, "ui", QtDebugMsg)

/// 主窗口日志
Q_LOGGING_CATEGORY(lcMainWindow, "ui.mainwindow", QtDebugMsg)

// ============================================================================
// 测试模块日志分类定义
// ============================================================================

/// 测试主模块日志
Q_LOGGING_CATEGORY(lcTest, "test", QtDebugMsg)

// ============================================================================
// LoggingCategories类实现
// ============================================================================

LoggingCategories::LoggingCategories(QObject* parent)
    : QObject(parent) {
}

void LoggingCategories::setGlobalLogLevel(LogLevel level) {
    {
        QMutexLocker locker(&s_rulesMutex);
        s_globalLevel = level;
        s_categoryLevels.clear();
    }
    applyRules();
}

void LoggingCategories::setCategoryLogLevel(const QString& categoryName, LogLevel level) {
    {
        QMutexLocker locker(&s_rulesMutex);
        s_categoryLevels.insert(categoryName, level);
    }
    applyRules();
}

QStringList LoggingCategories::getAllCategoryNames() {
    static QStringList categories = {
        // 核心模块
        "app", "core.config", "core.threading",

        // 引擎模块
        "engine", "engine.keystate", "engine.injector",

        // UI模块
        "ui", "ui.mainwindow",

        // 测试模块
        "test"
    };

    return categories;
}

QString LoggingCategories::currentFilterRules() {
    QMutexLocker locker(&s_rulesMutex);

    // QLoggingCategory 规则按顺序匹配，后写的规则优先
    QStringList rules;
    for ( const QString& type : disabledTypesFor(s_globalLevel) ) {
        rules << QString("*.%1=false").arg(type);
    }

    for ( auto it = s_categoryLevels.constBegin(); it != s_categoryLevels.constEnd(); ++it ) {
        const QStringList disabled = disabledTypesFor(it.value());
        for ( const QString& type : messageTypes() ) {
            rules << QString("%1.%2=%3").arg(it.key(), type,
                                             disabled.contains(type) ? "false" : "true");
        }
    }

    return rules.join('\n');
}

void LoggingCategories::applyRules() {
    QLoggingCategory::setFilterRules(currentFilterRules());
}
