#include <QtWidgets/QApplication>
#include <QtWidgets/QMessageBox>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCommandLineOption>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>
#include <csignal>

#include "common/core/logging/LoggingCategories.h"
#include "common/core/logger.h"
#include "common/core/config/Constants.h"
#include "common/core/config/SimulatorConfig.h"
#include "common/core/system/ShutdownSignalNotifier.h"
#include "common/windows/MainWindow.h"
#include "engine/EmulatorController.h"

// 应用程序信息
const QString APP_NAME = "KeyMouse";
const QString APP_ORGANIZATION = "KeyMouse";

// 初始化应用程序设置
void initializeApplication(QApplication& app) {
    app.setApplicationName(APP_NAME);
    app.setApplicationVersion(EmulatorConstants::getVersionString());
    app.setOrganizationName(APP_ORGANIZATION);
}

// 初始化日志系统
void initializeLogging(const QString& logFile, const QString& logRules) {
    // 默认屏蔽逐 tick 的调试输出
    LoggingCategories::setGlobalLogLevel(LoggingCategories::Info);

    // 命令行规则使用分号分隔，与 QT_LOGGING_RULES 一致；环境变量优先级更高
    if ( !logRules.isEmpty() ) {
        QString rules = logRules;
        rules.replace(';', '\n');
        Logger::applyQtLoggingRules(LoggingCategories::currentFilterRules() + '\n' + rules);
    }

    Logger* logger = Logger::instance();
    // 级别过滤交给分类规则，Logger 只负责输出
    logger->setLogLevel(Logger::Debug);
    if ( !logFile.isEmpty() ) {
        QDir().mkpath(QFileInfo(logFile).absolutePath());
        logger->setLogFile(logFile);
        logger->setLogTargets(Logger::All);
    }
    Logger::installMessageHandler();

    qCInfo(lcApp, "Application started");
    qCInfo(lcApp, "Version: %s", qPrintable(EmulatorConstants::getVersionString()));
    qCInfo(lcApp, "Qt Version: %s", qVersion());
    const QByteArray envRules = qgetenv("QT_LOGGING_RULES");
    if ( !envRules.isEmpty() ) {
        qCInfo(lcApp, "Effective QT_LOGGING_RULES: %s", envRules.constData());
    }
}

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    initializeApplication(app);

    // 解析命令行参数
    QCommandLineParser parser;
    parser.setApplicationDescription("KeyMouse - keyboard driven mouse emulator");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList() << "c" << "config",
        "Configuration file to load and save.", "path");
    parser.addOption(configOption);

    QCommandLineOption logFileOption(QStringList() << "log-file",
        "Also write log output to this file.", "path");
    parser.addOption(logFileOption);

    QCommandLineOption logRulesOption(QStringList() << "log-rules",
        "Qt logging filter rules, separated by ';' (e.g. \"engine.*.debug=true\").", "rules");
    parser.addOption(logRulesOption);

    QCommandLineOption enableOption(QStringList() << "e" << "enable",
        "Enable mouse simulation on startup regardless of the saved setting.");
    parser.addOption(enableOption);

    parser.process(app);

    initializeLogging(parser.value(logFileOption), parser.value(logRulesOption));

    int result = 0;
    {
        EmulatorController controller;

        const SimulatorConfig::LoadStatus status = controller.loadConfiguration(parser.value(configOption));
        qCInfo(lcApp, "Configuration file: %s", qPrintable(controller.config()->configFile()));

        MainWindow window(&controller);

        // 通过 close() 触发 closeEvent，走正常的停止流程
        ShutdownSignalNotifier signalNotifier;
        QObject::connect(&signalNotifier, &ShutdownSignalNotifier::signalReceived, &window, &QWidget::close);
        if ( !signalNotifier.install({ SIGINT, SIGTERM }) ) {
            qCWarning(lcApp, "Continuing without SIGINT/SIGTERM handling");
        }

        window.show();
        qCInfo(lcUI, "Main window shown");

        if ( status == SimulatorConfig::LoadStatus::Malformed ) {
            QMessageBox::warning(&window, APP_NAME,
                QString("The configuration file could not be read and defaults are in use.\n\n%1")
                    .arg(controller.config()->lastError()));
        }

        if ( controller.config()->isEnabled() || parser.isSet(enableOption) ) {
            controller.setEnabled(true);
        }

        result = app.exec();

        signalNotifier.uninstall();
        controller.shutdown();
    }

    qCInfo(lcApp, "Application exited with code %d", result);
    Logger::instance()->flush();
    Logger::uninstallMessageHandler();
    return result;
}
