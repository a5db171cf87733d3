#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QElapsedTimer>
#include <atomic>
#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "core/tasks/AdmissionController.hpp"

using namespace Sluice;
using namespace Sluice::Test;

class TestAdmissionController : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // Slot limits
    void testFillsUpToCategoryLimit();
    void testTotalLimitSharedAcrossCategories();
    void testQueuedReleaseLeavesCountersUnchanged();
    void testReleasePromotesSameCategoryFirst();
    void testReleaseIsIdempotent();

    // Per-user quotas
    void testUserMaxTasks();
    void testUserTimeInterval();
    void testBotMaxTasks();
    void testDailyTaskLimit();
    void testDailyByteLimit();
    void testUnknownEngineRejected();

    // Force start and pause
    void testForceStartMovesToFront();
    void testForceStartAdmitsWhenCapacityFree();
    void testForceStartErrors();
    void testPauseBlocksAdmission();

    // Engine start
    void testStartRetriesThenSucceeds();
    void testStartFailureReported();
    void testNonRetryableStartFailsFast();
    void testLateStartHandleStopped();
    void testStatusEventsPublished();

    void testCountersUnderConcurrency();

private:
    std::unique_ptr<AdmissionController> makeController(const Config::QueueSettings& queue);
    TaskSpec makeSpec(const QString& name, TaskCategory category = TaskCategory::Download,
                      const QString& owner = "alice") const;
    TaskId submitOk(AdmissionController& controller, const TaskSpec& spec);
    TaskPhase phaseOf(TaskId id) const;

    std::unique_ptr<ManualClock> clock_;
    std::unique_ptr<TaskRegistry> registry_;
    std::unique_ptr<EngineRegistry> engines_;
    std::shared_ptr<MockEngineAdapter> engine_;
    Config::EngineSettings engineSettings_;
    AdmissionController* current_ = nullptr;
};

void TestAdmissionController::initTestCase() {
    qRegisterMetaType<Sluice::StatusEvent>("Sluice::StatusEvent");
}

void TestAdmissionController::init() {
    clock_ = std::make_unique<ManualClock>();
    registry_ = std::make_unique<TaskRegistry>();
    engines_ = std::make_unique<EngineRegistry>();
    engine_ = std::make_shared<MockEngineAdapter>("mock");
    engines_->registerAdapter(engine_);

    engineSettings_ = Config::EngineSettings();
    engineSettings_.startRetries = 2;
    engineSettings_.startBackoff = std::chrono::milliseconds(1);
    engineSettings_.startTimeout = std::chrono::milliseconds(500);
    engineSettings_.cancelAckTimeout = std::chrono::milliseconds(200);
    engineSettings_.pollConcurrency = 4;
}

void TestAdmissionController::cleanup() {
    current_ = nullptr;
    engine_.reset();
    engines_.reset();
    registry_.reset();
    clock_.reset();
}

std::unique_ptr<AdmissionController> TestAdmissionController::makeController(const Config::QueueSettings& queue) {
    auto controller = std::make_unique<AdmissionController>(queue, engineSettings_, registry_.get(),
                                                            engines_.get(), clock_.get());
    current_ = controller.get();
    return controller;
}

TaskSpec TestAdmissionController::makeSpec(const QString& name, TaskCategory category,
                                           const QString& owner) const {
    TaskSpec spec;
    spec.ownerId = owner;
    spec.chatRef = "chat-" + owner;
    spec.category = category;
    spec.kind = "mock";
    spec.name = name;
    spec.source = "mock://" + name;
    return spec;
}

TaskId TestAdmissionController::submitOk(AdmissionController& controller, const TaskSpec& spec) {
    auto result = controller.submit(spec);
    if (result.hasError()) {
        qWarning() << "submit failed for" << spec.name << toString(result.error());
        return 0;
    }
    return result.value();
}

// Engine starts run on the launch pool; let them land first
TaskPhase TestAdmissionController::phaseOf(TaskId id) const {
    if (current_ && !current_->waitForStarts(10000)) {
        qWarning() << "engine starts still running";
    }
    auto task = registry_->find(id);
    return task ? task->phase() : TaskPhase::Failed;
}

void TestAdmissionController::testFillsUpToCategoryLimit() {
    Config::QueueSettings queue;
    queue.limitAll = 5;
    queue.limitDownload = 5;
    queue.limitUpload = 5;
    auto controller = makeController(queue);

    QList<TaskId> ids;
    for (int i = 0; i < 8; ++i) {
        ids.append(submitOk(*controller, makeSpec(QString("d%1").arg(i))));
    }

    int active = 0;
    int queued = 0;
    for (TaskId id : ids) {
        QVERIFY(id != 0);
        if (phaseOf(id) == TaskPhase::Active) {
            ++active;
        } else if (phaseOf(id) == TaskPhase::Queued) {
            ++queued;
        }
    }
    QCOMPARE(active, 5);
    QCOMPARE(queued, 3);

    const SlotCounters counters = controller->counters();
    QCOMPARE(counters.activeDownload, 5);
    QCOMPARE(counters.activeUpload, 0);
    QCOMPARE(counters.activeTotal, 5);
    QCOMPARE(controller->queueOrder(TaskCategory::Download), ids.mid(5));
    QCOMPARE(engine_->startCalls(), 5);
}

void TestAdmissionController::testTotalLimitSharedAcrossCategories() {
    Config::QueueSettings queue;
    queue.limitAll = 4;
    queue.limitDownload = 3;
    queue.limitUpload = 3;
    auto controller = makeController(queue);

    for (int i = 0; i < 3; ++i) {
        submitOk(*controller, makeSpec(QString("d%1").arg(i), TaskCategory::Download));
    }
    QList<TaskId> uploads;
    for (int i = 0; i < 3; ++i) {
        uploads.append(submitOk(*controller, makeSpec(QString("u%1").arg(i), TaskCategory::Upload)));
    }

    const SlotCounters counters = controller->counters();
    QCOMPARE(counters.activeDownload, 3);
    QCOMPARE(counters.activeUpload, 1);
    QCOMPARE(counters.activeTotal, 4);
    QCOMPARE(phaseOf(uploads[0]), TaskPhase::Active);
    QCOMPARE(controller->queueOrder(TaskCategory::Upload), uploads.mid(1));
}

void TestAdmissionController::testQueuedReleaseLeavesCountersUnchanged() {
    Config::QueueSettings queue;
    queue.limitAll = 1;
    queue.limitDownload = 1;
    queue.limitUpload = 1;
    auto controller = makeController(queue);

    const TaskId first = submitOk(*controller, makeSpec("first"));
    const TaskId second = submitOk(*controller, makeSpec("second"));
    const TaskId third = submitOk(*controller, makeSpec("third"));
    QCOMPARE(phaseOf(first), TaskPhase::Active);

    controller->release(second);

    const SlotCounters counters = controller->counters();
    QCOMPARE(counters.activeDownload, 1);
    QCOMPARE(counters.activeTotal, 1);
    QCOMPARE(controller->queueOrder(TaskCategory::Download), QList<TaskId>{third});
    QVERIFY(controller->holdsSlot(first));
    QCOMPARE(engine_->startCalls(), 1);
}

void TestAdmissionController::testReleasePromotesSameCategoryFirst() {
    Config::QueueSettings queue;
    queue.limitAll = 2;
    queue.limitDownload = 2;
    queue.limitUpload = 2;
    auto controller = makeController(queue);

    const TaskId d1 = submitOk(*controller, makeSpec("d1"));
    const TaskId d2 = submitOk(*controller, makeSpec("d2"));
    const TaskId u1 = submitOk(*controller, makeSpec("u1", TaskCategory::Upload));
    const TaskId d3 = submitOk(*controller, makeSpec("d3"));
    QCOMPARE(phaseOf(u1), TaskPhase::Queued);
    QCOMPARE(phaseOf(d3), TaskPhase::Queued);

    // The upload waited longer, but the freed slot was a download slot
    controller->release(d1, 100);
    QCOMPARE(phaseOf(d3), TaskPhase::Active);
    QCOMPARE(phaseOf(u1), TaskPhase::Queued);

    // No downloads left, so the other category gets the slot
    controller->release(d2, 100);
    QCOMPARE(phaseOf(u1), TaskPhase::Active);

    const SlotCounters counters = controller->counters();
    QCOMPARE(counters.activeDownload, 1);
    QCOMPARE(counters.activeUpload, 1);
    QCOMPARE(counters.activeTotal, 2);
}

void TestAdmissionController::testReleaseIsIdempotent() {
    Config::QueueSettings queue;
    queue.limitAll = 2;
    queue.limitDownload = 2;
    queue.limitUpload = 2;
    auto controller = makeController(queue);

    const TaskId id = submitOk(*controller, makeSpec("once"));
    controller->release(id, 10);
    controller->release(id, 10);
    controller->release(999);

    QCOMPARE(controller->counters().activeTotal, 0);
    QCOMPARE(controller->userQuota("alice")->downloadBytesToday, qint64(10));
}

void TestAdmissionController::testUserMaxTasks() {
    Config::QueueSettings queue;
    queue.userMaxTasks = 1;
    auto controller = makeController(queue);

    const TaskId alice1 = submitOk(*controller, makeSpec("a1", TaskCategory::Download, "alice"));
    const TaskId alice2 = submitOk(*controller, makeSpec("a2", TaskCategory::Download, "alice"));
    const TaskId bob1 = submitOk(*controller, makeSpec("b1", TaskCategory::Download, "bob"));

    QCOMPARE(phaseOf(alice1), TaskPhase::Active);
    QCOMPARE(phaseOf(alice2), TaskPhase::Queued);
    // Bob is not held up behind Alice's blocked task
    QCOMPARE(phaseOf(bob1), TaskPhase::Active);
    QCOMPARE(controller->userQuota("alice")->activeTaskCount, 1);

    controller->release(alice1);
    QCOMPARE(phaseOf(alice2), TaskPhase::Active);
    QCOMPARE(controller->userQuota("alice")->activeTaskCount, 1);
}

void TestAdmissionController::testUserTimeInterval() {
    Config::QueueSettings queue;
    queue.userTimeInterval = std::chrono::seconds(60);
    auto controller = makeController(queue);

    const TaskId first = submitOk(*controller, makeSpec("first"));
    const TaskId second = submitOk(*controller, makeSpec("second"));
    QCOMPARE(phaseOf(first), TaskPhase::Active);
    QCOMPARE(phaseOf(second), TaskPhase::Queued);

    clock_->advanceSeconds(30);
    QCOMPARE(controller->promotePending(), 0);

    clock_->advanceSeconds(31);
    QCOMPARE(controller->promotePending(), 1);
    QCOMPARE(phaseOf(second), TaskPhase::Active);
}

void TestAdmissionController::testBotMaxTasks() {
    Config::QueueSettings queue;
    queue.botMaxTasks = 2;
    queue.limitAll = 1;
    queue.limitDownload = 1;
    queue.limitUpload = 1;
    auto controller = makeController(queue);

    const TaskId first = submitOk(*controller, makeSpec("first"));
    submitOk(*controller, makeSpec("second"));
    ASSERT_EXPECTED_ERROR(controller->submit(makeSpec("third")), AdmissionError::CapacityReached);
    QCOMPARE(registry_->size(), 2);

    controller->release(first);
    QVERIFY(controller->submit(makeSpec("third")).hasValue());
}

void TestAdmissionController::testDailyTaskLimit() {
    Config::QueueSettings queue;
    queue.dailyTaskLimit = 2;
    auto controller = makeController(queue);

    submitOk(*controller, makeSpec("one"));
    submitOk(*controller, makeSpec("two"));
    ASSERT_EXPECTED_ERROR(controller->submit(makeSpec("three")), AdmissionError::DailyTaskLimitReached);
    QVERIFY(controller->submit(makeSpec("other", TaskCategory::Download, "bob")).hasValue());
    QCOMPARE(controller->userQuota("alice")->tasksToday, 2);

    clock_->advanceSeconds(24 * 3600);
    QVERIFY(controller->submit(makeSpec("three")).hasValue());
    QCOMPARE(controller->userQuota("alice")->tasksToday, 1);
}

void TestAdmissionController::testDailyByteLimit() {
    Config::QueueSettings queue;
    queue.dailyDownloadLimitBytes = 1000;
    auto controller = makeController(queue);

    const TaskId id = submitOk(*controller, makeSpec("big"));
    controller->release(id, 1500);

    ASSERT_EXPECTED_ERROR(controller->submit(makeSpec("more")), AdmissionError::DailyByteLimitReached);
    // Uploads have their own, unlimited, budget
    QVERIFY(controller->submit(makeSpec("up", TaskCategory::Upload)).hasValue());
}

void TestAdmissionController::testUnknownEngineRejected() {
    auto controller = makeController(Config::QueueSettings());
    TaskSpec spec = makeSpec("ftp");
    spec.kind = "ftp";

    ASSERT_EXPECTED_ERROR(controller->submit(spec), AdmissionError::UnknownEngine);
    QCOMPARE(registry_->size(), 0);
    QVERIFY(!controller->userQuota("alice").has_value());
}

void TestAdmissionController::testForceStartMovesToFront() {
    Config::QueueSettings queue;
    queue.limitAll = 1;
    queue.limitDownload = 1;
    queue.limitUpload = 1;
    auto controller = makeController(queue);

    const TaskId d1 = submitOk(*controller, makeSpec("d1"));
    const TaskId d2 = submitOk(*controller, makeSpec("d2"));
    const TaskId d3 = submitOk(*controller, makeSpec("d3"));

    auto result = controller->forceStart(d3);
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(result.value(), ForceStartResult::StillQueued);
    QCOMPARE(controller->queueOrder(TaskCategory::Download), (QList<TaskId>{d3, d2}));
    QCOMPARE(registry_->find(d3)->priority(), 1);

    controller->release(d1);
    QCOMPARE(phaseOf(d3), TaskPhase::Active);
    QCOMPARE(phaseOf(d2), TaskPhase::Queued);

    // Already running
    QCOMPARE(controller->forceStart(d3).value(), ForceStartResult::Admitted);
}

void TestAdmissionController::testForceStartAdmitsWhenCapacityFree() {
    Config::QueueSettings queue;
    queue.userTimeInterval = std::chrono::seconds(600);
    auto controller = makeController(queue);

    submitOk(*controller, makeSpec("first"));
    const TaskId second = submitOk(*controller, makeSpec("second"));
    QCOMPARE(phaseOf(second), TaskPhase::Queued);

    // Capacity is free but the owner is inside the pacing interval
    QCOMPARE(controller->forceStart(second).value(), ForceStartResult::StillQueued);

    clock_->advanceSeconds(601);
    QCOMPARE(controller->forceStart(second).value(), ForceStartResult::Admitted);
    QCOMPARE(phaseOf(second), TaskPhase::Active);
    QVERIFY(controller->holdsSlot(second));
}

void TestAdmissionController::testForceStartErrors() {
    Config::QueueSettings queue;
    queue.limitAll = 1;
    queue.limitDownload = 1;
    queue.limitUpload = 1;
    auto controller = makeController(queue);

    ASSERT_EXPECTED_ERROR(controller->forceStart(404), AdmissionError::TaskNotFound);

    const TaskId id = submitOk(*controller, makeSpec("released"));
    controller->release(id);
    ASSERT_EXPECTED_ERROR(controller->forceStart(id), AdmissionError::NotQueued);
}

void TestAdmissionController::testPauseBlocksAdmission() {
    auto controller = makeController(Config::QueueSettings());
    QSignalSpy pausedSpy(controller.get(), &AdmissionController::pausedChanged);

    controller->setPaused(true);
    controller->setPaused(true);
    QCOMPARE(pausedSpy.count(), 1);
    QVERIFY(controller->isPaused());

    const TaskId id = submitOk(*controller, makeSpec("waiting"));
    QCOMPARE(phaseOf(id), TaskPhase::Queued);
    QCOMPARE(controller->promotePending(), 0);
    QCOMPARE(controller->forceStart(id).value(), ForceStartResult::StillQueued);

    controller->setPaused(false);
    QCOMPARE(pausedSpy.count(), 2);
    QCOMPARE(phaseOf(id), TaskPhase::Active);
}

void TestAdmissionController::testStartRetriesThenSucceeds() {
    auto controller = makeController(Config::QueueSettings());
    engine_->setStartFailures(2, EngineError::Unreachable);
    QSignalSpy admittedSpy(controller.get(), &AdmissionController::taskAdmitted);

    const TaskId id = submitOk(*controller, makeSpec("flaky"));

    QCOMPARE(phaseOf(id), TaskPhase::Active);
    QCOMPARE(engine_->startCalls(), 3);
    QCOMPARE(registry_->find(id)->snapshot().retryCount, 2);
    QCOMPARE(admittedSpy.count(), 1);
}

void TestAdmissionController::testStartFailureReported() {
    auto controller = makeController(Config::QueueSettings());
    engine_->setStartFailures(-1, EngineError::Unreachable);
    QSignalSpy failedSpy(controller.get(), &AdmissionController::startFailed);

    const TaskId id = submitOk(*controller, makeSpec("dead"));
    QVERIFY(controller->waitForStarts(5000));

    QCOMPARE(engine_->startCalls(), 3);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().at(0).value<TaskId>(), id);
    QVERIFY(failedSpy.first().at(1).toString().contains("3 attempt"));
    // Terminating the task is the coordinator's job
    QCOMPARE(phaseOf(id), TaskPhase::Queued);
    QVERIFY(controller->holdsSlot(id));
}

void TestAdmissionController::testNonRetryableStartFailsFast() {
    auto controller = makeController(Config::QueueSettings());
    engine_->setStartFailures(-1, EngineError::InvalidSpec);
    QSignalSpy failedSpy(controller.get(), &AdmissionController::startFailed);

    submitOk(*controller, makeSpec("bad"));
    QVERIFY(controller->waitForStarts(5000));

    QCOMPARE(engine_->startCalls(), 1);
    QCOMPARE(failedSpy.count(), 1);
}

void TestAdmissionController::testLateStartHandleStopped() {
    engineSettings_.startRetries = 0;
    engineSettings_.startTimeout = std::chrono::milliseconds(100);
    auto controller = makeController(Config::QueueSettings());
    engine_->setStartDelayMs(400);
    QSignalSpy failedSpy(controller.get(), &AdmissionController::startFailed);

    QElapsedTimer timer;
    timer.start();
    const TaskId id = submitOk(*controller, makeSpec("late"));
    QVERIFY(timer.elapsed() < 100);
    QVERIFY(controller->waitForStarts(5000));
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().at(0).value<TaskId>(), id);

    // The backend answered after the deadline; that transfer must not keep running
    QTRY_VERIFY(engine_->cancelledHandles().contains("mock-1"));
    QVERIFY(engine_->liveHandles().isEmpty());
    QVERIFY(!registry_->find(id)->engineHandle().has_value());
    engine_->setStartDelayMs(0);
}

void TestAdmissionController::testStatusEventsPublished() {
    auto controller = makeController(Config::QueueSettings());
    QSignalSpy eventSpy(registry_.get(), &TaskRegistry::statusEvent);

    const TaskId id = submitOk(*controller, makeSpec("events"));
    QVERIFY(controller->waitForStarts(5000));

    QCOMPARE(eventSpy.count(), 2);
    const auto queued = eventSpy.at(0).at(0).value<StatusEvent>();
    const auto started = eventSpy.at(1).at(0).value<StatusEvent>();
    QCOMPARE(queued.taskId, id);
    QCOMPARE(queued.phase, TaskPhase::Queued);
    QCOMPARE(queued.chatRef, QString("chat-alice"));
    QCOMPARE(started.phase, TaskPhase::Active);
    QCOMPARE(started.type, StatusEventType::PhaseChanged);
}

void TestAdmissionController::testCountersUnderConcurrency() {
    Config::QueueSettings queue;
    queue.limitAll = 4;
    queue.limitDownload = 3;
    queue.limitUpload = 3;
    auto controller = makeController(queue);
    AdmissionController* raw = controller.get();

    std::atomic<bool> violated{false};
    TestUtils::testThreadSafety([&](int thread, int iteration) {
        const TaskCategory category = (thread + iteration) % 2 == 0 ? TaskCategory::Download
                                                                      : TaskCategory::Upload;
        auto submitted = raw->submit(makeSpec(QString("t%1-%2").arg(thread).arg(iteration), category,
                                              QString("user%1").arg(thread)));
        if (submitted.hasValue() && iteration % 2 == 0) {
            raw->release(submitted.value(), 1);
        }
        const SlotCounters counters = raw->counters();
        if (counters.activeDownload > 3 || counters.activeUpload > 3 || counters.activeTotal > 4 ||
            counters.activeTotal != counters.activeDownload + counters.activeUpload ||
            counters.activeDownload < 0 || counters.activeUpload < 0) {
            violated = true;
        }
    }, 8, 20);

    QVERIFY(!violated);

    const SlotCounters counters = controller->counters();
    int holders = 0;
    int activeDownloads = 0;
    const auto tasks = registry_->tasks();
    for (const auto& task : tasks) {
        if (controller->holdsSlot(task->id())) {
            ++holders;
            if (task->category() == TaskCategory::Download) {
                ++activeDownloads;
            }
        }
    }
    QCOMPARE(holders, counters.activeTotal);
    QCOMPARE(activeDownloads, counters.activeDownload);
    QCOMPARE(registry_->size(), 160);
    const int queued = static_cast<int>(controller->queueOrder(TaskCategory::Download).size() +
                                        controller->queueOrder(TaskCategory::Upload).size());
    // Every slot that could be filled was filled
    QVERIFY(queued == 0 || counters.activeTotal == 4 ||
            (counters.activeDownload == 3 && controller->queueOrder(TaskCategory::Upload).isEmpty()) ||
            (counters.activeUpload == 3 && controller->queueOrder(TaskCategory::Download).isEmpty()));
}

int runTestAdmissionController(int argc, char** argv) {
    TestAdmissionController test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_admission_controller.moc"
