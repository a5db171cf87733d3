#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QElapsedTimer>
#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "core/tasks/ProgressPoller.hpp"

using namespace Sluice;
using namespace Sluice::Test;

class TestProgressPoller : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testProgressApplied();
    void testFinishedFlagCompletesTask();
    void testReachingSizeCompletesTask();
    void testQueuedTasksAreNotPolled();
    void testRepeatedFailuresEscalate();
    void testFailureCountResetsOnSuccess();
    void testSlowCallDoesNotBlockTick();
    void testCallsRunInParallel();
    void testSizeLimitExceeded();
    void testTimerDrivesTicks();

private:
    void build(const Config::QueueSettings& queue = Config::QueueSettings());
    TaskId submit(const QString& name, std::optional<qint64> size = std::nullopt);
    EngineProgress progressOf(qint64 transferred, qint64 size, bool finished = false) const;

    std::unique_ptr<ManualClock> clock_;
    std::unique_ptr<TaskRegistry> registry_;
    std::unique_ptr<EngineRegistry> engines_;
    std::shared_ptr<MockEngineAdapter> engine_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<CancellationCoordinator> coordinator_;
    std::unique_ptr<ProgressPoller> poller_;
    Config::EngineSettings engineSettings_;
};

void TestProgressPoller::initTestCase() {
    qRegisterMetaType<Sluice::StatusEvent>("Sluice::StatusEvent");
}

void TestProgressPoller::init() {
    clock_ = std::make_unique<ManualClock>();
    registry_ = std::make_unique<TaskRegistry>();
    engines_ = std::make_unique<EngineRegistry>();
    engine_ = std::make_shared<MockEngineAdapter>("mock");
    engines_->registerAdapter(engine_);

    engineSettings_ = Config::EngineSettings();
    engineSettings_.startRetries = 0;
    engineSettings_.progressTimeout = std::chrono::milliseconds(200);
    engineSettings_.cancelAckTimeout = std::chrono::milliseconds(200);
    engineSettings_.maxProgressFailures = 3;
    engineSettings_.pollConcurrency = 4;
}

void TestProgressPoller::cleanup() {
    poller_.reset();
    coordinator_.reset();
    admission_.reset();
    engine_.reset();
    engines_.reset();
    registry_.reset();
    clock_.reset();
}

void TestProgressPoller::build(const Config::QueueSettings& queue) {
    admission_ = std::make_unique<AdmissionController>(queue, engineSettings_, registry_.get(),
                                                       engines_.get(), clock_.get());
    coordinator_ = std::make_unique<CancellationCoordinator>(engineSettings_, registry_.get(), engines_.get(),
                                                             admission_.get(), clock_.get());
    poller_ = std::make_unique<ProgressPoller>(engineSettings_, queue, std::chrono::milliseconds(2000),
                                               registry_.get(), engines_.get(), admission_.get(),
                                               coordinator_.get(), clock_.get());
}

TaskId TestProgressPoller::submit(const QString& name, std::optional<qint64> size) {
    TaskSpec spec;
    spec.ownerId = "alice";
    spec.chatRef = "chat-1";
    spec.kind = "mock";
    spec.name = name;
    spec.source = "mock://" + name;
    spec.sizeBytes = size;
    auto result = admission_->submit(spec);
    if (!admission_->waitForStarts(5000)) {
        qWarning() << "engine start still running for" << name;
    }
    return result.hasValue() ? result.value() : 0;
}

EngineProgress TestProgressPoller::progressOf(qint64 transferred, qint64 size, bool finished) const {
    EngineProgress progress;
    progress.transferredBytes = transferred;
    progress.sizeBytes = size;
    progress.speedBps = 64 * 1024;
    progress.etaSeconds = 30;
    progress.finished = finished;
    return progress;
}

void TestProgressPoller::testProgressApplied() {
    build();
    const TaskId id = submit("a");
    engine_->setProgress(*engine_->handleFor("a"), progressOf(300, 1000));
    QSignalSpy tickSpy(poller_.get(), &ProgressPoller::tickFinished);

    clock_->advanceSeconds(5);
    poller_->tick();

    QCOMPARE(tickSpy.count(), 1);
    QCOMPARE(tickSpy.first().at(0).toInt(), 1);
    const TaskSnapshot snapshot = registry_->find(id)->snapshot();
    QCOMPARE(snapshot.phase, TaskPhase::Active);
    QCOMPARE(snapshot.transferredBytes, qint64(300));
    QCOMPARE(*snapshot.sizeBytes, qint64(1000));
    QCOMPARE(snapshot.speedBps, qint64(64 * 1024));
    QCOMPARE(snapshot.etaSeconds, qint64(30));
    QCOMPARE(snapshot.lastProgressAt, clock_->now());
}

void TestProgressPoller::testFinishedFlagCompletesTask() {
    Config::QueueSettings queue;
    queue.limitAll = 1;
    queue.limitDownload = 1;
    queue.limitUpload = 1;
    build(queue);

    const TaskId first = submit("first");
    const TaskId second = submit("second");
    engine_->setProgress(*engine_->handleFor("first"), progressOf(700, 800, true));

    QSignalSpy completedSpy(poller_.get(), &ProgressPoller::taskCompleted);
    QSignalSpy eventSpy(registry_.get(), &TaskRegistry::statusEvent);
    poller_->tick();

    QCOMPARE(completedSpy.count(), 1);
    const TaskSnapshot snapshot = registry_->find(first)->snapshot();
    QCOMPARE(snapshot.phase, TaskPhase::Completed);
    QCOMPARE(snapshot.transferredBytes, qint64(800));
    QVERIFY(!snapshot.engineHandle.has_value());

    // The freed slot went to the queued task
    QVERIFY(admission_->holdsSlot(second));
    QVERIFY(admission_->waitForStarts(5000));
    QCOMPARE(registry_->find(second)->phase(), TaskPhase::Active);
    QCOMPARE(admission_->userQuota("alice")->downloadBytesToday, qint64(800));

    bool sawCompleted = false;
    bool sawRetiring = false;
    for (const auto& args : eventSpy) {
        const auto event = args.at(0).value<StatusEvent>();
        if (event.taskId != first) {
            continue;
        }
        if (event.type == StatusEventType::PhaseChanged && event.phase == TaskPhase::Completed) {
            sawCompleted = true;
        }
        if (event.type == StatusEventType::Retiring) {
            QVERIFY(sawCompleted);
            sawRetiring = true;
        }
    }
    QVERIFY(sawRetiring);
}

void TestProgressPoller::testReachingSizeCompletesTask() {
    build();
    const TaskId id = submit("exact", 500);
    engine_->setProgress(*engine_->handleFor("exact"), progressOf(500, 500));

    poller_->tick();
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Completed);
    QCOMPARE(admission_->counters().activeTotal, 0);
}

void TestProgressPoller::testQueuedTasksAreNotPolled() {
    build();
    admission_->setPaused(true);
    submit("waiting");
    QSignalSpy tickSpy(poller_.get(), &ProgressPoller::tickFinished);

    poller_->tick();

    QCOMPARE(engine_->progressCalls(), 0);
    QCOMPARE(tickSpy.first().at(0).toInt(), 0);
}

void TestProgressPoller::testRepeatedFailuresEscalate() {
    build();
    const TaskId id = submit("broken");
    engine_->setProgressFailing(true, EngineError::Unreachable);

    poller_->tick();
    poller_->tick();
    QCOMPARE(poller_->consecutiveFailures(id), 2);
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Active);

    poller_->tick();
    const TaskSnapshot snapshot = registry_->find(id)->snapshot();
    QCOMPARE(snapshot.phase, TaskPhase::Failed);
    QCOMPARE(*snapshot.cancelReason, CancelReason::EngineUnreachable);
    QVERIFY(snapshot.error.contains("3 consecutive progress failures"));
    QCOMPARE(poller_->consecutiveFailures(id), 0);
    QCOMPARE(admission_->counters().activeTotal, 0);
}

void TestProgressPoller::testFailureCountResetsOnSuccess() {
    build();
    const TaskId id = submit("flaky");
    engine_->setProgressFailing(true);

    poller_->tick();
    poller_->tick();
    QCOMPARE(poller_->consecutiveFailures(id), 2);

    engine_->setProgressFailing(false);
    poller_->tick();
    QCOMPARE(poller_->consecutiveFailures(id), 0);

    engine_->setProgressFailing(true);
    poller_->tick();
    poller_->tick();
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Active);
}

void TestProgressPoller::testSlowCallDoesNotBlockTick() {
    build();
    const TaskId id = submit("slow");
    engine_->setProgressDelayMs(600);
    QSignalSpy tickSpy(poller_.get(), &ProgressPoller::tickFinished);

    QElapsedTimer timer;
    timer.start();
    poller_->tick();
    QVERIFY(timer.elapsed() < 500);
    QCOMPARE(poller_->consecutiveFailures(id), 1);

    // The first call is still running, so the task is skipped
    poller_->tick();
    QCOMPARE(tickSpy.last().at(0).toInt(), 0);
    QCOMPARE(poller_->consecutiveFailures(id), 1);
    QCOMPARE(engine_->progressCalls(), 1);

    engine_->setProgressDelayMs(0);
    QTest::qWait(700);
    poller_->tick();
    QCOMPARE(tickSpy.last().at(0).toInt(), 1);
    QCOMPARE(poller_->consecutiveFailures(id), 0);
}

void TestProgressPoller::testCallsRunInParallel() {
    engineSettings_.progressTimeout = std::chrono::milliseconds(2000);
    build();
    for (int i = 0; i < 4; ++i) {
        submit(QString("p%1").arg(i));
    }
    engine_->setProgressDelayMs(200);

    QElapsedTimer timer;
    timer.start();
    poller_->tick();
    const qint64 elapsed = timer.elapsed();

    QCOMPARE(engine_->progressCalls(), 4);
    // Sequential polling would take at least 800ms
    QVERIFY(elapsed < 700);
    engine_->setProgressDelayMs(0);
}

void TestProgressPoller::testSizeLimitExceeded() {
    Config::QueueSettings queue;
    queue.sizeLimitBytes.insert("mock", 500);
    build(queue);

    const TaskId id = submit("huge");
    engine_->setProgress(*engine_->handleFor("huge"), progressOf(10, 1000));

    poller_->tick();

    const TaskSnapshot snapshot = registry_->find(id)->snapshot();
    QCOMPARE(snapshot.phase, TaskPhase::Failed);
    QCOMPARE(*snapshot.cancelReason, CancelReason::SizeLimitExceeded);
    QVERIFY(engine_->cancelledHandles().size() == 1);
}

void TestProgressPoller::testTimerDrivesTicks() {
    build();
    submit("timed");
    QVERIFY(!poller_->isRunning());

    QSignalSpy tickSpy(poller_.get(), &ProgressPoller::tickFinished);
    poller_->start();
    QVERIFY(poller_->isRunning());
    QVERIFY(tickSpy.wait(3000));

    poller_->stop();
    QVERIFY(!poller_->isRunning());
}

int runTestProgressPoller(int argc, char** argv) {
    TestProgressPoller test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_progress_poller.moc"
