#ifndef LOGGER_H
#define LOGGER_H

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QDateTime>
#include <QtCore/QFile>
#include <QtCore/QTextStream>
#include <QtCore/QMutex>
#include <QtCore/QPair>
#include <memory>

/**
 * @brief 日志输出器
 *
 * 接管 Qt 消息处理器，把 qCDebug/qCWarning 等分类日志统一格式化后写入控制台和/或日志文件。
 * 日志文件超过大小上限时按序号轮转。
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    // 日志级别
    enum LogLevel {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3,
        Fatal = 4
    };
    Q_ENUM(LogLevel)

    // 日志输出目标
    enum LogTarget {
        Console = 0x01,
        File = 0x02,
        All = Console | File
    };
    Q_DECLARE_FLAGS(LogTargets, LogTarget)

    // 日志格式
    enum LogFormat {
        Simple,     // [LEVEL] Message
        Standard,   // [YYYY-MM-DD hh:mm:ss] [LEVEL] [category] Message
        Detailed    // [YYYY-MM-DD hh:mm:ss.zzz] [LEVEL] [category] [TID:id] [File:Line] Message
    };

    // 单例模式
    static Logger* instance();

    // 配置
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;

    void setLogTargets(LogTargets targets);
    LogTargets logTargets() const;

    void setLogFormat(LogFormat format);
    LogFormat logFormat() const;

    // 文件日志配置
    void setLogFile(const QString &filePath);
    QString logFile() const;

    void setMaxFileSize(qint64 maxSize); // 字节
    qint64 maxFileSize() const;

    void setMaxFileCount(int maxCount);
    int maxFileCount() const;

    // 日志记录
    void log(LogLevel level, const QString &message, const QString &category = QString());
    void debug(const QString &message, const QString &category = QString());
    void info(const QString &message, const QString &category = QString());
    void warning(const QString &message, const QString &category = QString());
    void error(const QString &message, const QString &category = QString());

    // 控制
    void flush();
    void rotate();

    // 状态
    bool isEnabled() const;
    void setEnabled(bool enabled);

    qint64 totalLogCount() const;

    // 工具函数
    static QString levelToString(LogLevel level);
    static LogLevel stringToLevel(const QString &levelStr);

    // Qt消息处理器集成
    static void installMessageHandler();
    static void uninstallMessageHandler();

    // Qt logging rules（QLoggingCategory::setFilterRules）
    static void applyQtLoggingRules(const QString &rules);

signals:
    void logMessage(LogLevel level, const QString &message, const QString &category, const QDateTime &timestamp);
    void fileRotated(const QString &oldFile, const QString &newFile);
    void errorOccurred(const QString &error);

protected:
    explicit Logger(QObject *parent = nullptr);
    ~Logger() override;

private:
    struct LogEntry {
        LogLevel level;
        QString message;
        QString category;
        QDateTime timestamp;
        quintptr threadId;
        QString fileName;
        int lineNumber;
    };

    void write(const LogEntry &entry);

    // 格式化
    QString formatMessage(const LogEntry &entry) const;

    // 输出
    void writeToConsole(const QString &formattedMessage);
    // 返回轮转事件（旧文件、新文件），未轮转时为空
    QPair<QString, QString> writeToFile(const QString &formattedMessage);

    // 文件管理（调用方持有 m_mutex）
    QString openLogFile();
    void closeLogFile();
    QPair<QString, QString> rotateLogFile();

    // Qt消息处理器
    static void qtMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);

    static Logger *s_instance;
    static QMutex s_instanceMutex;

    LogLevel m_logLevel;
    LogTargets m_logTargets;
    LogFormat m_logFormat;

    // 文件相关
    QString m_logFilePath;
    std::unique_ptr<QFile> m_logFile;
    std::unique_ptr<QTextStream> m_logStream;
    qint64 m_maxFileSize;
    int m_maxFileCount;

    // 状态
    bool m_enabled;
    qint64 m_totalLogCount;

    // 线程安全
    mutable QMutex m_mutex;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(Logger::LogTargets)

#endif // LOGGER_H
