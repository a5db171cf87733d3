#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtConcurrent/QtConcurrent>
#include <QtCore/QElapsedTimer>
#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "core/tasks/AdmissionController.hpp"
#include "core/tasks/CancellationCoordinator.hpp"

using namespace Sluice;
using namespace Sluice::Test;

class TestCancellationCoordinator : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testCancelQueuedTask();
    void testCancelActiveTaskPromotesNext();
    void testCancelIsIdempotent();
    void testCancelTerminalTaskIsNoOp();
    void testCancelUnknownTask();
    void testReasonDecidesTerminalPhase();
    void testSlowEngineAckIsBounded();
    void testEngineCancelFailureStillTerminates();
    void testRetiringEventFollowsPhaseChange();
    void testConcurrentCancelsClaimOnce();
    void testCancelDuringStartStopsLateHandle();

private:
    TaskSpec makeSpec(const QString& name) const;
    TaskId submit(const QString& name);

    std::unique_ptr<ManualClock> clock_;
    std::unique_ptr<TaskRegistry> registry_;
    std::unique_ptr<EngineRegistry> engines_;
    std::shared_ptr<MockEngineAdapter> engine_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<CancellationCoordinator> coordinator_;
};

void TestCancellationCoordinator::initTestCase() {
    qRegisterMetaType<Sluice::StatusEvent>("Sluice::StatusEvent");
    qRegisterMetaType<Sluice::TaskPhase>("Sluice::TaskPhase");
    qRegisterMetaType<Sluice::CancelReason>("Sluice::CancelReason");
}

void TestCancellationCoordinator::init() {
    clock_ = std::make_unique<ManualClock>();
    registry_ = std::make_unique<TaskRegistry>();
    engines_ = std::make_unique<EngineRegistry>();
    engine_ = std::make_shared<MockEngineAdapter>("mock");
    engines_->registerAdapter(engine_);

    Config::QueueSettings queue;
    queue.limitAll = 1;
    queue.limitDownload = 1;
    queue.limitUpload = 1;

    Config::EngineSettings engine;
    engine.startRetries = 0;
    engine.startTimeout = std::chrono::milliseconds(500);
    engine.cancelAckTimeout = std::chrono::milliseconds(150);

    admission_ = std::make_unique<AdmissionController>(queue, engine, registry_.get(), engines_.get(),
                                                       clock_.get());
    coordinator_ = std::make_unique<CancellationCoordinator>(engine, registry_.get(), engines_.get(),
                                                             admission_.get(), clock_.get());
}

void TestCancellationCoordinator::cleanup() {
    coordinator_.reset();
    admission_.reset();
    engine_.reset();
    engines_.reset();
    registry_.reset();
    clock_.reset();
}

TaskSpec TestCancellationCoordinator::makeSpec(const QString& name) const {
    TaskSpec spec;
    spec.ownerId = "alice";
    spec.chatRef = "chat-1";
    spec.kind = "mock";
    spec.name = name;
    spec.source = "mock://" + name;
    return spec;
}

TaskId TestCancellationCoordinator::submit(const QString& name) {
    auto result = admission_->submit(makeSpec(name));
    if (!admission_->waitForStarts(5000)) {
        qWarning() << "engine start still running for" << name;
    }
    return result.hasValue() ? result.value() : 0;
}

void TestCancellationCoordinator::testCancelQueuedTask() {
    const TaskId active = submit("active");
    const TaskId queued = submit("queued");
    QCOMPARE(registry_->find(queued)->phase(), TaskPhase::Queued);

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(queued, CancelReason::UserCancelled));

    QCOMPARE(registry_->find(queued)->phase(), TaskPhase::Cancelled);
    QVERIFY(admission_->queueOrder(TaskCategory::Download).isEmpty());
    QCOMPARE(admission_->counters().activeTotal, 1);
    QVERIFY(admission_->holdsSlot(active));
    // No handle, so the engine is never asked
    QCOMPARE(engine_->cancelCalls(), 0);
}

void TestCancellationCoordinator::testCancelActiveTaskPromotesNext() {
    const TaskId first = submit("first");
    const TaskId second = submit("second");
    const EngineHandle handle = *engine_->handleFor("first");

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(first, CancelReason::UserCancelled, "no longer needed"));

    const TaskSnapshot snapshot = registry_->find(first)->snapshot();
    QCOMPARE(snapshot.phase, TaskPhase::Cancelled);
    QVERIFY(!snapshot.engineHandle.has_value());
    QCOMPARE(snapshot.error, QString("Cancelled by user (no longer needed)"));
    QVERIFY(engine_->cancelledHandles().contains(handle));

    QVERIFY(admission_->waitForStarts(5000));
    QCOMPARE(registry_->find(second)->phase(), TaskPhase::Active);
    QCOMPARE(admission_->counters().activeTotal, 1);
}

void TestCancellationCoordinator::testCancelIsIdempotent() {
    const TaskId id = submit("twice");
    QSignalSpy terminatedSpy(coordinator_.get(), &CancellationCoordinator::taskTerminated);

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::UserCancelled));
    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::Timeout));

    QCOMPARE(terminatedSpy.count(), 1);
    QCOMPARE(engine_->cancelCalls(), 1);
    QCOMPARE(*registry_->find(id)->snapshot().cancelReason, CancelReason::UserCancelled);
    QCOMPARE(admission_->counters().activeTotal, 0);
}

void TestCancellationCoordinator::testCancelTerminalTaskIsNoOp() {
    const TaskId id = submit("done");
    auto task = registry_->find(id);
    QVERIFY(task->markCompleted(clock_->now()).hasValue());

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::UserCancelled));
    QCOMPARE(task->phase(), TaskPhase::Completed);
    QCOMPARE(engine_->cancelCalls(), 0);
}

void TestCancellationCoordinator::testCancelUnknownTask() {
    ASSERT_EXPECTED_ERROR(coordinator_->cancel(12345, CancelReason::UserCancelled), CancelError::TaskNotFound);
}

void TestCancellationCoordinator::testReasonDecidesTerminalPhase() {
    const TaskId stalled = submit("stalled");
    ASSERT_EXPECTED_VALUE(coordinator_->cancel(stalled, CancelReason::StalledDownload));
    QCOMPARE(registry_->find(stalled)->phase(), TaskPhase::Cancelled);

    const TaskId unreachable = submit("unreachable");
    ASSERT_EXPECTED_VALUE(coordinator_->cancel(unreachable, CancelReason::EngineUnreachable));
    const TaskSnapshot snapshot = registry_->find(unreachable)->snapshot();
    QCOMPARE(snapshot.phase, TaskPhase::Failed);
    QCOMPARE(snapshot.error, QString("Failed: engine unreachable"));
}

void TestCancellationCoordinator::testSlowEngineAckIsBounded() {
    const TaskId id = submit("slow");
    const TaskId next = submit("next");
    engine_->setCancelDelayMs(1000);

    QElapsedTimer timer;
    timer.start();
    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::UserCancelled));
    const qint64 elapsed = timer.elapsed();

    QVERIFY(elapsed < 900);
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Cancelled);
    // The slot was released without waiting for the engine
    QVERIFY(admission_->holdsSlot(next));
    QVERIFY(admission_->waitForStarts(5000));
    QCOMPARE(registry_->find(next)->phase(), TaskPhase::Active);
    engine_->setCancelDelayMs(0);
}

void TestCancellationCoordinator::testEngineCancelFailureStillTerminates() {
    const TaskId id = submit("gone");
    const EngineHandle handle = *engine_->handleFor("gone");
    // Make the engine forget the handle so its cancel reports HandleNotFound
    QVERIFY(engine_->cancel(handle).hasValue());

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::UserCancelled));
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Cancelled);
    QCOMPARE(admission_->counters().activeTotal, 0);
}

void TestCancellationCoordinator::testRetiringEventFollowsPhaseChange() {
    const TaskId id = submit("events");
    QSignalSpy eventSpy(registry_.get(), &TaskRegistry::statusEvent);

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::Timeout, "running for 90000s"));

    QCOMPARE(eventSpy.count(), 2);
    const auto changed = eventSpy.at(0).at(0).value<StatusEvent>();
    const auto retiring = eventSpy.at(1).at(0).value<StatusEvent>();
    QCOMPARE(changed.type, StatusEventType::PhaseChanged);
    QCOMPARE(changed.phase, TaskPhase::Cancelled);
    QCOMPARE(changed.chatRef, QString("chat-1"));
    QVERIFY(changed.message.contains("running for 90000s"));
    QCOMPARE(retiring.type, StatusEventType::Retiring);
    QCOMPARE(retiring.taskId, id);
}

void TestCancellationCoordinator::testConcurrentCancelsClaimOnce() {
    const TaskId id = submit("contended");
    submit("waiting");
    QSignalSpy terminatedSpy(coordinator_.get(), &CancellationCoordinator::taskTerminated);

    QList<QFuture<bool>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.append(QtConcurrent::run([this, id]() {
            return coordinator_->cancel(id, CancelReason::UserCancelled).hasValue();
        }));
    }
    for (auto& future : futures) {
        QVERIFY(future.result());
    }

    QCOMPARE(terminatedSpy.count(), 1);
    QCOMPARE(engine_->cancelCalls(), 1);
    const SlotCounters counters = admission_->counters();
    QCOMPARE(counters.activeTotal, 1);
    QCOMPARE(counters.activeDownload, 1);
}

void TestCancellationCoordinator::testCancelDuringStartStopsLateHandle() {
    engine_->setStartDelayMs(300);
    auto submitted = admission_->submit(makeSpec("starting"));
    QVERIFY(submitted.hasValue());
    const TaskId id = submitted.value();
    QTRY_COMPARE(engine_->startCalls(), 1);

    ASSERT_EXPECTED_VALUE(coordinator_->cancel(id, CancelReason::UserCancelled));
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Cancelled);
    QCOMPARE(admission_->counters().activeTotal, 0);

    // The start still returns a handle, which is stopped rather than adopted
    QVERIFY(admission_->waitForStarts(5000));
    QCOMPARE(engine_->cancelledHandles(), QStringList{"mock-1"});
    QVERIFY(engine_->liveHandles().isEmpty());
    QCOMPARE(registry_->find(id)->phase(), TaskPhase::Cancelled);
    engine_->setStartDelayMs(0);
}

int runTestCancellationCoordinator(int argc, char** argv) {
    TestCancellationCoordinator test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_cancellation_coordinator.moc"
