#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QtCore/QTemporaryDir>
#include "../src/common/core/logger.h"
#include "../src/common/core/logging/LoggingCategories.h"

class TestLogger : public QObject {
    Q_OBJECT
private slots:
    void initTestCase() {
        Logger::instance()->setEnabled(true);
        Logger::instance()->setLogTargets(Logger::Console); // 避免实际写文件
        Logger::instance()->setLogLevel(Logger::Debug);
        Logger::instance()->setLogFormat(Logger::Standard);
    }

    void cleanupTestCase() {
        Logger::uninstallMessageHandler();
        Logger::instance()->setLogTargets(Logger::Console);
    }

    void emits_logMessage_signal_on_log() {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);
        Logger::instance()->info("hello-observer", "test-cat");
        QCOMPARE(spy.count(), 1);
        const auto args = spy.takeFirst();
        QCOMPARE(args.at(0).toInt(), (int)Logger::Info);
        QCOMPARE(args.at(1).toString(), QString("hello-observer"));
        QCOMPARE(args.at(2).toString(), QString("test-cat"));
    }

    void filters_below_log_level() {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);
        const qint64 before = Logger::instance()->totalLogCount();

        Logger::instance()->setLogLevel(Logger::Warning);
        Logger::instance()->debug("dropped");
        Logger::instance()->info("dropped");
        Logger::instance()->warning("kept");
        Logger::instance()->error("kept");
        Logger::instance()->setLogLevel(Logger::Debug);

        QCOMPARE(spy.count(), 2);
        QCOMPARE(Logger::instance()->totalLogCount(), before + 2);
    }

    void disabled_logger_drops_everything() {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);
        Logger::instance()->setEnabled(false);
        Logger::instance()->error("silent");
        Logger::instance()->setEnabled(true);
        QCOMPARE(spy.count(), 0);
    }

    void level_string_conversion() {
        QCOMPARE(Logger::levelToString(Logger::Warning), QString("WARNING"));
        QCOMPARE(Logger::stringToLevel("debug"), Logger::Debug);
        QCOMPARE(Logger::stringToLevel(" WARN "), Logger::Warning);
        QCOMPARE(Logger::stringToLevel("critical"), Logger::Error);
        QCOMPARE(Logger::stringToLevel("bogus"), Logger::Info);
    }

    void routes_categorized_qt_messages() {
        Logger::installMessageHandler();
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);

        qCWarning(lcTest) << "routed-through-handler";

        Logger::uninstallMessageHandler();
        QCOMPARE(spy.count(), 1);
        const auto args = spy.takeFirst();
        QCOMPARE(args.at(0).toInt(), (int)Logger::Warning);
        QCOMPARE(args.at(1).toString(), QString("routed-through-handler"));
        QCOMPARE(args.at(2).toString(), QString("test"));
    }

    void category_level_rules() {
        LoggingCategories::setGlobalLogLevel(LoggingCategories::Warning);
        QVERIFY(!lcEngine().isInfoEnabled());
        QVERIFY(lcEngine().isWarningEnabled());

        LoggingCategories::setCategoryLogLevel("engine", LoggingCategories::Debug);
        QVERIFY(lcEngine().isDebugEnabled());
        QVERIFY(!lcConfig().isInfoEnabled());
        QVERIFY(LoggingCategories::currentFilterRules().contains("engine.debug=true"));

        LoggingCategories::setGlobalLogLevel(LoggingCategories::Debug);
        QVERIFY(lcConfig().isDebugEnabled());
        QVERIFY(LoggingCategories::getAllCategoryNames().contains("engine.keystate"));
    }

    void writes_to_file_target() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("logs/keymouse.log");

        Logger::instance()->setMaxFileSize(1024 * 1024);
        Logger::instance()->setLogFile(path);
        Logger::instance()->setLogTargets(Logger::File);
        Logger::instance()->info("file-line", "test");
        Logger::instance()->flush();
        Logger::instance()->setLogTargets(Logger::Console);

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QString content = QString::fromUtf8(file.readAll());
        QVERIFY(content.contains("[INFO] [test] file-line"));
    }

    void emits_fileRotated_on_rotate() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString tmp = dir.filePath("rotate.log");
        Logger::instance()->setLogFile(tmp);
        Logger::instance()->setMaxFileSize(1); // 极小阈值触发
        Logger::instance()->setMaxFileCount(2);
        Logger::instance()->setLogTargets(Logger::Console | Logger::File);

        QSignalSpy rotSpy(Logger::instance(), &Logger::fileRotated);
        // 连续写多条，触发轮转（极小阈值）
        for (int i=0; i<20; ++i) Logger::instance()->info(QString("line %1").arg(i));
        QVERIFY(rotSpy.count() >= 1);
        QVERIFY(QFile::exists(dir.filePath("rotate.1.log")));
        QVERIFY(QFile::exists(dir.filePath("rotate.2.log")));
        QVERIFY(!QFile::exists(dir.filePath("rotate.3.log")));

        Logger::instance()->setLogTargets(Logger::Console);
        Logger::instance()->setMaxFileSize(1024 * 1024);
    }
};

QTEST_APPLESS_MAIN(TestLogger)
#include "test_logger.moc"
