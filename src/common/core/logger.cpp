#include "logger.h"
#include "config/Constants.h"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>
#include <QtCore/QLoggingCategory>
#include <cstdio>

// 静态成员变量定义
Logger* Logger::s_instance = nullptr;
QMutex Logger::s_instanceMutex;

Logger::Logger(QObject *parent)
    : QObject(parent)
    , m_logLevel(LogLevel::Info)
    , m_logTargets(LogTarget::Console)
    , m_logFormat(LogFormat::Standard)
    , m_maxFileSize(EmulatorConstants::Logging::DEFAULT_MAX_FILE_SIZE)
    , m_maxFileCount(EmulatorConstants::Logging::DEFAULT_MAX_FILE_COUNT)
    , m_enabled(true)
    , m_totalLogCount(0)
{
    // 设置默认日志文件路径
    const QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/logs";
    m_logFilePath = logDir + "/" + EmulatorConstants::Logging::FILE_NAME;
}

Logger::~Logger()
{
    QMutexLocker locker(&m_mutex);
    closeLogFile();
}

Logger* Logger::instance()
{
    QMutexLocker locker(&s_instanceMutex);
    if (s_instance == nullptr) {
        s_instance = new Logger();
    }
    return s_instance;
}

void Logger::applyQtLoggingRules(const QString &rules)
{
    // 直接交由 Qt 处理分类日志规则，例如：
    // "engine.debug=false\n*.info=true"
    QLoggingCategory::setFilterRules(rules);
}

void Logger::setLogLevel(LogLevel level)
{
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
}

Logger::LogLevel Logger::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

void Logger::setLogTargets(LogTargets targets)
{
    QString openError;
    {
        QMutexLocker locker(&m_mutex);
        m_logTargets = targets;

        if (targets & LogTarget::File) {
            openError = openLogFile();
        } else {
            closeLogFile();
        }
    }

    if (!openError.isEmpty()) {
        emit errorOccurred(openError);
    }
}

Logger::LogTargets Logger::logTargets() const
{
    QMutexLocker locker(&m_mutex);
    return m_logTargets;
}

void Logger::setLogFormat(LogFormat format)
{
    QMutexLocker locker(&m_mutex);
    m_logFormat = format;
}

Logger::LogFormat Logger::logFormat() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFormat;
}

void Logger::setLogFile(const QString &filePath)
{
    QString openError;
    {
        QMutexLocker locker(&m_mutex);
        m_logFilePath = filePath;

        if (m_logTargets & LogTarget::File) {
            openError = openLogFile();
        }
    }

    if (!openError.isEmpty()) {
        emit errorOccurred(openError);
    }
}

QString Logger::logFile() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

void Logger::setMaxFileSize(qint64 maxSize)
{
    QMutexLocker locker(&m_mutex);
    m_maxFileSize = maxSize;
}

qint64 Logger::maxFileSize() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxFileSize;
}

void Logger::setMaxFileCount(int maxCount)
{
    QMutexLocker locker(&m_mutex);
    m_maxFileCount = qMax(1, maxCount);
}

int Logger::maxFileCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxFileCount;
}

void Logger::log(LogLevel level, const QString &message, const QString &category)
{
    LogEntry entry;
    entry.timestamp = QDateTime::currentDateTime();
    entry.level = level;
    entry.message = message;
    entry.category = category;
    entry.lineNumber = 0;
    entry.threadId = reinterpret_cast<quintptr>(QThread::currentThreadId());

    write(entry);
}

void Logger::write(const LogEntry &entry)
{
    QPair<QString, QString> rotation;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_enabled || entry.level < m_logLevel) {
            return;
        }

        m_totalLogCount++;
        const QString formattedMessage = formatMessage(entry);

        if (m_logTargets & LogTarget::Console) {
            writeToConsole(formattedMessage);
        }

        if (m_logTargets & LogTarget::File) {
            rotation = writeToFile(formattedMessage);
        }
    }

    // 信号在锁外发射，避免槽函数再次写日志时死锁
    if (!rotation.first.isEmpty()) {
        emit fileRotated(rotation.first, rotation.second);
    }
    emit logMessage(entry.level, entry.message, entry.category, entry.timestamp);
}

void Logger::flush()
{
    QMutexLocker locker(&m_mutex);

    if (m_logStream) {
        m_logStream->flush();
    }
    fflush(stderr);
}

void Logger::rotate()
{
    QPair<QString, QString> rotation;
    {
        QMutexLocker locker(&m_mutex);
        rotation = rotateLogFile();
    }

    if (!rotation.first.isEmpty()) {
        emit fileRotated(rotation.first, rotation.second);
    }
}

bool Logger::isEnabled() const
{
    QMutexLocker locker(&m_mutex);
    return m_enabled;
}

void Logger::setEnabled(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_enabled = enabled;
}

qint64 Logger::totalLogCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_totalLogCount;
}

QString Logger::openLogFile()
{
    closeLogFile();

    QDir().mkpath(QFileInfo(m_logFilePath).absolutePath());

    auto file = std::make_unique<QFile>(m_logFilePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // 此处不能走 Qt 消息处理器，否则会重入本对象
        const QString err = QStringLiteral("Failed to open log file: %1 (%2)")
                                .arg(m_logFilePath, file->errorString());
        fprintf(stderr, "%s\n", err.toLocal8Bit().constData());
        return err;
    }

    m_logFile = std::move(file);
    m_logStream = std::make_unique<QTextStream>(m_logFile.get());
    return QString();
}

void Logger::closeLogFile()
{
    if (m_logStream) {
        m_logStream->flush();
        m_logStream.reset();
    }
    if (m_logFile) {
        m_logFile->close();
        m_logFile.reset();
    }
}

void Logger::writeToConsole(const QString &formattedMessage)
{
    fprintf(stderr, "%s\n", formattedMessage.toLocal8Bit().constData());
}

QPair<QString, QString> Logger::writeToFile(const QString &formattedMessage)
{
    if (!m_logStream) {
        return {};
    }

    *m_logStream << formattedMessage << Qt::endl;

    // 检查文件大小并轮转
    if (m_logFile->size() > m_maxFileSize) {
        return rotateLogFile();
    }
    return {};
}

QString Logger::formatMessage(const LogEntry &entry) const
{
    const QString category = entry.category.isEmpty() ? QStringLiteral("default") : entry.category;

    switch (m_logFormat) {
    case LogFormat::Simple:
        return QString("[%1] %2").arg(levelToString(entry.level), entry.message);
    case LogFormat::Standard:
        return QString("[%1] [%2] [%3] %4")
               .arg(entry.timestamp.toString("yyyy-MM-dd hh:mm:ss"),
                    levelToString(entry.level),
                    category,
                    entry.message);
    case LogFormat::Detailed:
        return QString("[%1] [%2] [%3] [TID:%4] [%5:%6] %7")
               .arg(entry.timestamp.toString("yyyy-MM-dd hh:mm:ss.zzz"),
                    levelToString(entry.level),
                    category,
                    QString::number(entry.threadId),
                    entry.fileName.isEmpty() ? QStringLiteral("-") : QFileInfo(entry.fileName).fileName(),
                    QString::number(entry.lineNumber),
                    entry.message);
    }
    return entry.message;
}

QString Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

Logger::LogLevel Logger::stringToLevel(const QString &levelStr)
{
    const QString s = levelStr.trimmed().toLower();
    if (s == "debug") return Debug;
    if (s == "info") return Info;
    if (s == "warn" || s == "warning") return Warning;
    if (s == "error" || s == "critical") return Error;
    if (s == "fatal") return Fatal;
    return Info;
}

QPair<QString, QString> Logger::rotateLogFile()
{
    if (!m_logFile) {
        return {};
    }

    closeLogFile();

    QFileInfo fileInfo(m_logFilePath);
    const QString basePath = fileInfo.absolutePath() + "/" + fileInfo.completeBaseName();
    const QString extension = fileInfo.suffix();

    // 删除最旧的备份文件
    QFile::remove(QString("%1.%2.%3").arg(basePath).arg(m_maxFileCount).arg(extension));

    // 重命名现有备份文件
    for (int i = m_maxFileCount - 1; i >= 1; --i) {
        const QString oldName = QString("%1.%2.%3").arg(basePath).arg(i).arg(extension);
        const QString newName = QString("%1.%2.%3").arg(basePath).arg(i + 1).arg(extension);
        QFile::rename(oldName, newName);
    }

    // 重命名当前日志文件
    const QString backupFile = QString("%1.1.%2").arg(basePath, extension);
    const bool renamed = QFile::rename(m_logFilePath, backupFile);

    // 重新打开日志文件
    openLogFile();

    if (!renamed) {
        return {};
    }
    return qMakePair(m_logFilePath, backupFile);
}

void Logger::qtMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    LogLevel level;
    switch (type) {
    case QtDebugMsg: level = LogLevel::Debug; break;
    case QtInfoMsg: level = LogLevel::Info; break;
    case QtWarningMsg: level = LogLevel::Warning; break;
    case QtCriticalMsg: level = LogLevel::Error; break;
    case QtFatalMsg: level = LogLevel::Fatal; break;
    default: level = LogLevel::Info; break;
    }

    LogEntry entry;
    entry.timestamp = QDateTime::currentDateTime();
    entry.level = level;
    entry.message = msg;
    entry.category = context.category ? QString::fromUtf8(context.category) : QString();
    entry.fileName = context.file ? QString::fromUtf8(context.file) : QString();
    entry.lineNumber = context.line;
    entry.threadId = reinterpret_cast<quintptr>(QThread::currentThreadId());

    Logger* logger = Logger::instance();
    logger->write(entry);

    if (type == QtFatalMsg) {
        logger->flush();
    }
}

void Logger::debug(const QString &message, const QString &category)
{
    log(Debug, message, category);
}

void Logger::info(const QString &message, const QString &category)
{
    log(Info, message, category);
}

void Logger::warning(const QString &message, const QString &category)
{
    log(Warning, message, category);
}

void Logger::error(const QString &message, const QString &category)
{
    log(Error, message, category);
}

void Logger::installMessageHandler()
{
    qInstallMessageHandler(Logger::qtMessageHandler);
}

void Logger::uninstallMessageHandler()
{
    qInstallMessageHandler(nullptr);
}
