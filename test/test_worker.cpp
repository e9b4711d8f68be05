#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QElapsedTimer>
#include <atomic>
#include <stdexcept>

#include "../src/common/core/threading/Worker.h"

/**
 * @brief 测试用Worker类
 */
class TestWorkerImpl : public Worker
{
public:
    explicit TestWorkerImpl(int intervalMs = 1)
        : m_interval(intervalMs)
    {
        setName("TestWorker");
    }

    ~TestWorkerImpl() override
    {
        stop();
    }

    std::atomic<int> taskCount{0};
    std::atomic<int> initializeCount{0};
    std::atomic<int> cleanupCount{0};
    std::atomic<bool> throwOnTask{false};
    std::atomic<bool> throwNonStandard{false};
    bool initializeResult = true;

protected:
    void processTask() override
    {
        taskCount.fetch_add(1);
        if ( throwOnTask.load() ) {
            throw std::runtime_error("scripted failure");
        }
        if ( throwNonStandard.load() ) {
            throw 42;
        }
    }

    int sleepIntervalMs() const override
    {
        return m_interval;
    }

    bool initialize() override
    {
        initializeCount.fetch_add(1);
        return initializeResult;
    }

    void cleanup() override
    {
        cleanupCount.fetch_add(1);
    }

private:
    int m_interval;
};

/**
 * @brief Worker 生命周期测试
 */
class TestWorker : public QObject
{
    Q_OBJECT

private slots:
    void test_startStop();
    void test_stateSignals();
    void test_initializeFailure();
    void test_exceptionDoesNotStopLoop();
    void test_nonStandardExceptionDoesNotStopLoop();
    void test_stopWakesSleep();
    void test_performanceStats();
};

void TestWorker::test_startStop()
{
    TestWorkerImpl worker;
    QVERIFY(worker.isStopped());

    QVERIFY(worker.start());
    QVERIFY(worker.isRunning());
    QCOMPARE(worker.initializeCount.load(), 1);
    QTRY_VERIFY(worker.taskCount.load() >= 3);

    worker.stop();
    QVERIFY(worker.isStopped());
    QCOMPARE(worker.cleanupCount.load(), 1);

    // 停止返回后不再执行任务
    const int count = worker.taskCount.load();
    QTest::qWait(30);
    QCOMPARE(worker.taskCount.load(), count);

    // 可以再次启动
    QVERIFY(worker.start());
    QCOMPARE(worker.initializeCount.load(), 2);
    worker.stop();
    QCOMPARE(worker.cleanupCount.load(), 2);
}

void TestWorker::test_stateSignals()
{
    TestWorkerImpl worker;
    QSignalSpy stateSpy(&worker, &Worker::stateChanged);
    QSignalSpy startedSpy(&worker, &Worker::started);
    QSignalSpy stoppedSpy(&worker, &Worker::stopped);

    QVERIFY(worker.start());
    worker.stop();

    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(stoppedSpy.count(), 1);
    QCOMPARE(stateSpy.count(), 2);
    QCOMPARE(stateSpy.at(0).at(0).value<Worker::State>(), Worker::State::Running);
    QCOMPARE(stateSpy.at(1).at(0).value<Worker::State>(), Worker::State::Stopped);
}

void TestWorker::test_initializeFailure()
{
    TestWorkerImpl worker;
    worker.initializeResult = false;
    QSignalSpy errorSpy(&worker, &Worker::errorOccurred);

    QVERIFY(!worker.start());
    QVERIFY(worker.isStopped());
    QCOMPARE(errorSpy.count(), 1);
    QCOMPARE(worker.taskCount.load(), 0);
    QCOMPARE(worker.cleanupCount.load(), 0);
}

void TestWorker::test_exceptionDoesNotStopLoop()
{
    TestWorkerImpl worker;
    worker.throwOnTask.store(true);

    QVERIFY(worker.start());
    QTRY_VERIFY(worker.getPerformanceStats().failedIterations >= 3);
    QVERIFY(worker.isRunning());

    worker.throwOnTask.store(false);
    const int count = worker.taskCount.load();
    QTRY_VERIFY(worker.taskCount.load() > count + 2);
    worker.stop();
}

void TestWorker::test_nonStandardExceptionDoesNotStopLoop()
{
    TestWorkerImpl worker;
    worker.throwNonStandard.store(true);
    QSignalSpy errorSpy(&worker, &Worker::errorOccurred);

    QVERIFY(worker.start());
    QTRY_VERIFY(worker.getPerformanceStats().failedIterations >= 3);
    QVERIFY(worker.isRunning());

    worker.throwNonStandard.store(false);
    const int count = worker.taskCount.load();
    QTRY_VERIFY(worker.taskCount.load() > count + 2);
    worker.stop();

    // 停止后线程已退出，可以安全读取
    QVERIFY(errorSpy.count() >= 3);
    QCOMPARE(errorSpy.first().at(0).toString(), QString("Unknown exception in work loop"));
}

void TestWorker::test_stopWakesSleep()
{
    TestWorkerImpl worker(60000);
    QVERIFY(worker.start());
    QTRY_COMPARE(worker.taskCount.load(), 1);

    QElapsedTimer timer;
    timer.start();
    worker.stop();
    QVERIFY2(timer.elapsed() < 5000, qPrintable(QString("stop took %1 ms").arg(timer.elapsed())));
    QCOMPARE(worker.taskCount.load(), 1);
}

void TestWorker::test_performanceStats()
{
    TestWorkerImpl worker;
    QVERIFY(worker.start());
    QTRY_VERIFY(worker.getPerformanceStats().totalIterations >= 5);
    worker.stop();

    const Worker::PerformanceStats stats = worker.getPerformanceStats();
    QVERIFY(stats.totalIterations >= 5);
    QCOMPARE(stats.failedIterations, quint64(0));
    QVERIFY(stats.maxProcessingTime <= stats.totalProcessingTime);

    worker.resetPerformanceStats();
    QCOMPARE(worker.getPerformanceStats().totalIterations, quint64(0));
}

QTEST_GUILESS_MAIN(TestWorker)
#include "test_worker.moc"
