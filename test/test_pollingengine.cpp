#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QStandardPaths>

#include "../src/engine/PollingEngine.h"
#include "../src/common/core/config/SimulatorConfig.h"
#include "TestDoubles.h"

using KeyMouse::KeySlot;

namespace {

/**
 * @brief 引擎及其依赖，按声明逆序销毁，引擎最先停止
 */
struct EngineFixture {
    SimulatorConfig config;
    ScriptedKeyStateSource source;
    RecordingInjector injector;
    PollingEngine engine{&config, &source, &injector};

    EngineFixture() {
        config.setEnabled(true);
    }
};

qint64 msToNs(qint64 ms) {
    return ms * 1000000;
}

int sumDx(const QList<InjectedEvent>& events) {
    int total = 0;
    for ( const InjectedEvent& e : events ) {
        total += e.dx;
    }
    return total;
}

} // namespace

class TestPollingEngine : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        QStandardPaths::setTestModeEnabled(true);
    }

    // 单个 tick 的行为

    void referenceTickMovesTwelvePixelsLeft() {
        EngineFixture f;
        f.source.press(Qt::Key_A);

        f.engine.processTick(msToNs(20));

        const QList<InjectedEvent> events = f.injector.events();
        QCOMPARE(events.size(), 1);
        QVERIFY(events.first() == InjectedEvent::move(-12, 0));
    }

    void eachHeldDirectionMovesWithSign() {
        EngineFixture f;
        f.source.press(Qt::Key_A);
        f.source.press(Qt::Key_D);
        f.source.press(Qt::Key_W);
        f.source.press(Qt::Key_S);

        f.engine.processTick(msToNs(20));

        const QList<InjectedEvent> expected = {
            InjectedEvent::move(-12, 0), InjectedEvent::move(12, 0),
            InjectedEvent::move(0, -12), InjectedEvent::move(0, 12)
        };
        QVERIFY(f.injector.events() == expected);
    }

    void oppositeDirectionsIssueTwoCancellingMoves() {
        EngineFixture f;
        f.source.press(Qt::Key_A);
        f.source.press(Qt::Key_D);

        f.engine.processTick(msToNs(20));

        const QList<InjectedEvent> events = f.injector.events();
        QCOMPARE(events.size(), 2);
        QCOMPARE(sumDx(events), 0);
        QCOMPARE(f.engine.statistics().moveEvents, quint64(2));
    }

    void sharedDirectionKeyFiresEverySlot() {
        EngineFixture f;
        f.config.setKey(KeySlot::MoveDown, Qt::Key_A);
        f.source.press(Qt::Key_A);

        f.engine.processTick(msToNs(20));

        const QList<InjectedEvent> expected = { InjectedEvent::move(-12, 0), InjectedEvent::move(0, 12) };
        QVERIFY(f.injector.events() == expected);
    }

    void disabledTickStaysIdle() {
        EngineFixture f;
        f.config.setEnabled(false);
        f.source.press(Qt::Key_A);
        f.source.press(Qt::Key_E);

        f.engine.processTick(msToNs(20));

        QCOMPARE(f.injector.count(), 0);
        QCOMPARE(f.source.queryCount(), 0);
        const PollingEngine::TickStats stats = f.engine.statistics();
        QCOMPARE(stats.ticks, quint64(1));
        QCOMPARE(stats.idleTicks, quint64(1));
    }

    void clickKeyProducesOneDownAndOneUp() {
        EngineFixture f;
        f.source.press(Qt::Key_E);
        for ( int i = 0; i < 3; ++i ) {
            f.engine.processTick(msToNs(20));
        }
        QCOMPARE(f.injector.countButtons(true, true), 1);
        QCOMPARE(f.injector.countButtons(true, false), 0);

        f.source.release(Qt::Key_E);
        for ( int i = 0; i < 3; ++i ) {
            f.engine.processTick(msToNs(20));
        }
        QCOMPARE(f.injector.countButtons(true, true), 1);
        QCOMPARE(f.injector.countButtons(true, false), 1);
        QCOMPARE(f.engine.statistics().buttonEvents, quint64(2));
    }

    void rightClickKeyUsesSecondaryButton() {
        EngineFixture f;
        f.source.press(Qt::Key_Q);
        f.engine.processTick(msToNs(20));
        f.source.release(Qt::Key_Q);
        f.engine.processTick(msToNs(20));

        const QList<InjectedEvent> expected = {
            InjectedEvent::button(false, true), InjectedEvent::button(false, false)
        };
        QVERIFY(f.injector.events() == expected);
    }

    void settingsApplyOnNextTick() {
        EngineFixture f;
        f.source.press(Qt::Key_J);
        f.engine.processTick(msToNs(20));
        QCOMPARE(f.injector.count(), 0);

        f.config.setKey(KeySlot::MoveRight, Qt::Key_J);
        f.config.setMoveAmount(20);
        f.engine.processTick(msToNs(20));

        const QList<InjectedEvent> events = f.injector.events();
        QCOMPARE(events.size(), 1);
        QVERIFY(events.first() == InjectedEvent::move(24, 0));
    }

    void cumulativeMovementIndependentOfInterval_data() {
        QTest::addColumn<int>("magnitude");
        QTest::addColumn<int>("intervalMs");

        QTest::newRow("default") << 10 << 20;
        QTest::newRow("sub-pixel-fast") << 10 << 1;
        QTest::newRow("sub-pixel-slow-amount") << 1 << 10;
        QTest::newRow("fractional") << 7 << 20;
        QTest::newRow("odd-interval") << 3 << 7;
    }

    void cumulativeMovementIndependentOfInterval() {
        QFETCH(int, magnitude);
        QFETCH(int, intervalMs);

        const int durationMs = 1400;
        const qint64 exact = static_cast<qint64>(magnitude) * durationMs * 60 / 1000;

        // 同样时长分别以间隔和两倍间隔轮询
        int totals[2] = {0, 0};
        for ( int pass = 0; pass < 2; ++pass ) {
            EngineFixture f;
            f.config.setMoveAmount(magnitude);
            f.source.press(Qt::Key_D);

            const int tickMs = intervalMs * (pass + 1);
            for ( int elapsed = 0; elapsed < durationMs; elapsed += tickMs ) {
                f.engine.processTick(msToNs(tickMs));
            }
            totals[pass] = sumDx(f.injector.events());
        }

        QVERIFY2(exact - totals[0] >= 0 && exact - totals[0] <= 1,
                 qPrintable(QString("short total %1, exact %2").arg(totals[0]).arg(exact)));
        QVERIFY2(exact - totals[1] >= 0 && exact - totals[1] <= 1,
                 qPrintable(QString("long total %1, exact %2").arg(totals[1]).arg(exact)));
        QVERIFY(qAbs(totals[0] - totals[1]) <= 1);
    }

    void subPixelStepsAccumulateAcrossTicks() {
        EngineFixture f;
        f.source.press(Qt::Key_D);

        // 10 px/帧、1ms 每 tick 为 0.6 像素
        f.engine.processTick(msToNs(1));
        f.engine.processTick(msToNs(1));

        const QList<InjectedEvent> expected = { InjectedEvent::move(0, 0), InjectedEvent::move(1, 0) };
        QVERIFY(f.injector.events() == expected);
    }

    void fastPollingMovesAtReferenceSpeed() {
        EngineFixture f;
        f.source.press(Qt::Key_D);

        for ( int i = 0; i < 1000; ++i ) {
            f.engine.processTick(msToNs(1));
        }
        QCOMPARE(sumDx(f.injector.events()), 600);

        f.injector.clear();
        for ( int i = 0; i < 500; ++i ) {
            f.engine.processTick(msToNs(2));
        }
        QCOMPARE(sumDx(f.injector.events()), 600);
    }

    void injectionFailuresAreCountedAndSwallowed() {
        EngineFixture f;
        f.injector.setFailing(true);
        f.source.press(Qt::Key_A);
        f.source.press(Qt::Key_E);

        for ( int i = 0; i < 3; ++i ) {
            f.engine.processTick(msToNs(20));
        }

        // 每个 tick 都继续尝试注入
        QCOMPARE(f.injector.countMoves(), 3);
        const PollingEngine::TickStats stats = f.engine.statistics();
        QCOMPARE(stats.injectionFailures, quint64(4));
        QCOMPARE(stats.moveEvents, quint64(0));
        QCOMPARE(stats.buttonEvents, quint64(0));
    }

    void keyQueryFailuresProduceNoEvents() {
        EngineFixture f;
        f.source.press(Qt::Key_A);
        f.source.setFailing(true);

        f.engine.processTick(msToNs(20));

        QCOMPARE(f.injector.count(), 0);
        QCOMPARE(f.engine.statistics().keyQueryFailures, quint64(KeyMouse::KeySlotCount));
    }

    // 线程生命周期

    void startAndStopLifecycle() {
        EngineFixture f;
        QSignalSpy startedSpy(&f.engine, &Worker::started);
        QSignalSpy stoppedSpy(&f.engine, &Worker::stopped);

        QVERIFY(f.engine.isStopped());
        QVERIFY(f.engine.start());
        QVERIFY(f.engine.isRunning());
        QCOMPARE(f.engine.state(), Worker::State::Running);

        // 已运行时再次启动无操作
        QVERIFY(f.engine.start());
        QCOMPARE(startedSpy.count(), 1);

        QTRY_VERIFY(f.engine.statistics().ticks >= 3);

        f.engine.stop();
        QVERIFY(f.engine.isStopped());
        QCOMPARE(stoppedSpy.count(), 1);

        f.engine.stop();
        QCOMPARE(stoppedSpy.count(), 1);
    }

    void stopBeforeStartIsNoop() {
        EngineFixture f;
        QSignalSpy stoppedSpy(&f.engine, &Worker::stopped);
        f.engine.stop();
        QVERIFY(f.engine.isStopped());
        QCOMPARE(stoppedSpy.count(), 0);
    }

    void noEventsAfterStopReturns() {
        EngineFixture f;
        f.config.setPollingInterval(1);
        f.source.press(Qt::Key_A);

        QVERIFY(f.engine.start());
        QTRY_VERIFY(f.injector.countMoves() >= 3);
        f.engine.stop();

        const int countAtStop = f.injector.count();
        QTest::qWait(50);
        QCOMPARE(f.injector.count(), countAtStop);
    }

    void restartTreatsHeldClickAsFreshPress() {
        EngineFixture f;
        f.config.setPollingInterval(1);
        f.source.press(Qt::Key_E);

        QVERIFY(f.engine.start());
        QTRY_COMPARE(f.injector.countButtons(true, true), 1);
        f.engine.stop();

        // 停止时不补发抬起
        QCOMPARE(f.injector.countButtons(true, false), 0);

        QVERIFY(f.engine.start());
        QTRY_COMPARE(f.injector.countButtons(true, true), 2);
        f.engine.stop();
        QCOMPARE(f.injector.countButtons(true, false), 0);
    }

    void failuresDoNotStopTheLoop() {
        EngineFixture f;
        f.config.setPollingInterval(1);
        f.injector.setFailing(true);
        f.source.press(Qt::Key_A);

        QVERIFY(f.engine.start());
        QTRY_VERIFY(f.engine.statistics().injectionFailures >= 5);
        QVERIFY(f.engine.isRunning());
        f.engine.stop();
    }

    void disabledEngineKeepsTicking() {
        EngineFixture f;
        f.config.setEnabled(false);
        f.config.setPollingInterval(1);
        f.source.press(Qt::Key_A);

        QVERIFY(f.engine.start());
        QTRY_VERIFY(f.engine.statistics().idleTicks >= 3);
        f.engine.stop();
        QCOMPARE(f.injector.count(), 0);
    }

    void startFailsWithoutInjector() {
        SimulatorConfig config;
        ScriptedKeyStateSource source;
        PollingEngine engine(&config, &source, nullptr);
        QSignalSpy errorSpy(&engine, &Worker::errorOccurred);
        QSignalSpy startedSpy(&engine, &Worker::started);

        QVERIFY(!engine.start());
        QVERIFY(engine.isStopped());
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(startedSpy.count(), 0);
    }

    void unavailableSourceStillRuns() {
        EngineFixture f;
        f.source.setInitializeResult(false);
        f.config.setPollingInterval(1);

        QVERIFY(f.engine.start());
        QTRY_VERIFY(f.engine.statistics().ticks >= 2);
        f.engine.stop();
    }
};

QTEST_GUILESS_MAIN(TestPollingEngine)
#include "test_pollingengine.moc"
