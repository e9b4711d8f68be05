#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QFile>
#include <QtCore/QStandardPaths>
#include <QtCore/QTemporaryDir>
#include <memory>

#include "../src/engine/EmulatorController.h"
#include "../src/engine/PollingEngine.h"
#include "TestDoubles.h"

using KeyMouse::KeySlot;

class TestEmulatorController : public QObject {
    Q_OBJECT

    ScriptedKeyStateSource* m_source = nullptr;
    RecordingInjector* m_injector = nullptr;

    std::unique_ptr<EmulatorController> makeController() {
        auto source = std::make_unique<ScriptedKeyStateSource>();
        auto injector = std::make_unique<RecordingInjector>();
        m_source = source.get();
        m_injector = injector.get();
        return std::make_unique<EmulatorController>(std::move(source), std::move(injector));
    }

private slots:
    void initTestCase() {
        QStandardPaths::setTestModeEnabled(true);
    }

    void enableStartsAndDisableStopsEngine() {
        auto controller = makeController();
        QSignalSpy enabledSpy(controller.get(), &EmulatorController::enabledChanged);

        QVERIFY(!controller->isEnabled());
        QVERIFY(controller->setEnabled(true));
        QVERIFY(controller->isEnabled());
        QVERIFY(controller->config()->isEnabled());
        QVERIFY(controller->engine()->isRunning());

        QVERIFY(controller->setEnabled(false));
        QVERIFY(!controller->isEnabled());
        QVERIFY(!controller->config()->isEnabled());
        QVERIFY(controller->engine()->isStopped());

        QCOMPARE(enabledSpy.count(), 2);
        QCOMPARE(enabledSpy.at(0).at(0).toBool(), true);
        QCOMPARE(enabledSpy.at(1).at(0).toBool(), false);
    }

    void startFailureRevertsEnabledFlag() {
        EmulatorController controller(std::make_unique<ScriptedKeyStateSource>(), nullptr);
        QSignalSpy errorSpy(&controller, &EmulatorController::errorOccurred);
        QSignalSpy enabledSpy(&controller, &EmulatorController::enabledChanged);

        QVERIFY(!controller.setEnabled(true));
        QVERIFY(!controller.config()->isEnabled());
        QVERIFY(controller.engine()->isStopped());
        QCOMPARE(errorSpy.count(), 1);
        QVERIFY(!controller.lastError().isEmpty());
        QCOMPARE(enabledSpy.count(), 1);
        QCOMPARE(enabledSpy.at(0).at(0).toBool(), false);
    }

    void settingsReachRunningEngine() {
        auto controller = makeController();
        controller->setPollingInterval(1);
        QVERIFY(controller->setEnabled(true));

        controller->setKeyBinding(KeySlot::MoveRight, Qt::Key_L);
        controller->setMovementMagnitude(50);
        m_source->press(Qt::Key_L);

        QTRY_VERIFY(m_injector->countMoves() >= 2);
        controller->setEnabled(false);

        for ( const InjectedEvent& e : m_injector->events() ) {
            QCOMPARE(e.kind, InjectedEvent::Move);
            QVERIFY(e.dx >= 0);
            QCOMPARE(e.dy, 0);
        }
        QCOMPARE(controller->config()->moveAmount(), 50);
        QCOMPARE(controller->config()->pollingInterval(), 1);
    }

    void settersClampThroughController() {
        auto controller = makeController();
        controller->setMovementMagnitude(0);
        controller->setPollingInterval(100000);
        QCOMPARE(controller->config()->moveAmount(), 1);
        QCOMPARE(controller->config()->pollingInterval(), 1000);
    }

    void shutdownIsIdempotent() {
        auto controller = makeController();
        QVERIFY(controller->setEnabled(true));
        controller->shutdown();
        QVERIFY(controller->engine()->isStopped());
        controller->shutdown();
        QVERIFY(controller->engine()->isStopped());
    }

    void saveAndLoadThroughController() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("config.xml");

        {
            auto controller = makeController();
            QCOMPARE(controller->loadConfiguration(path), SimulatorConfig::LoadStatus::FileMissing);
            controller->setKeyBinding(KeySlot::ClickLeft, Qt::Key_Z);
            controller->setMovementMagnitude(33);
            QVERIFY(controller->saveConfiguration());
        }

        auto controller = makeController();
        QCOMPARE(controller->loadConfiguration(path), SimulatorConfig::LoadStatus::Loaded);
        QCOMPARE(controller->config()->key(KeySlot::ClickLeft), int(Qt::Key_Z));
        QCOMPARE(controller->config()->moveAmount(), 33);
    }

    void malformedConfigurationReportsError() {
        QTemporaryDir dir;
        const QString path = dir.filePath("config.xml");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("<Configuration><MoveAmount>");
        file.close();

        auto controller = makeController();
        QSignalSpy errorSpy(controller.get(), &EmulatorController::errorOccurred);
        QCOMPARE(controller->loadConfiguration(path), SimulatorConfig::LoadStatus::Malformed);
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(controller->config()->moveAmount(), 10);
    }

    void destructorStopsRunningEngine() {
        auto controller = makeController();
        controller->setPollingInterval(1);
        m_source->press(Qt::Key_A);
        QVERIFY(controller->setEnabled(true));
        QTRY_VERIFY(controller->engine()->statistics().ticks >= 2);

        controller.reset();
        m_source = nullptr;
        m_injector = nullptr;
    }
};

QTEST_GUILESS_MAIN(TestEmulatorController)
#include "test_emulatorcontroller.moc"
