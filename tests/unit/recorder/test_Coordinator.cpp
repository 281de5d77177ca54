#include <QtTest>
#include <atomic>
#include <future>
#include <new>
#include <stdexcept>
#include "TestAudio.hpp"
#include "recorder/Coordinator.hpp"

using namespace mc;

namespace {

Delivery makeDelivery(u64 session, f64 pts) {
    return Delivery{session,
                    SourceKind::System,
                    SampleBuffer(test::kTestFormat, std::vector<i16>(80, 0), Seconds(pts))};
}

} // namespace

class TestCoordinator : public QObject {
    Q_OBJECT

private slots:
    void testInvokeRunsOnWorker() {
        Coordinator coordinator(8, [](Delivery&&) {});
        QVERIFY(!coordinator.isWorkerThread());

        bool onWorker = coordinator.invoke([&] { return coordinator.isWorkerThread(); });
        QVERIFY(onWorker);
        QCOMPARE(coordinator.invoke([] { return 42; }), 42);
    }

    void testNestedInvokeRunsInline() {
        Coordinator coordinator(8, [](Delivery&&) {});
        int value = coordinator.invoke([&] {
            return coordinator.invoke([] { return 7; }) + 1;
        });
        QCOMPARE(value, 8);
    }

    void testDeliveriesHandledInOrderBeforeLaterTasks() {
        std::vector<f64> seen;
        Coordinator coordinator(16, [&](Delivery&& d) {
            seen.push_back(d.buffer.presentationTime().count());
        });

        for (int i = 0; i < 10; ++i)
            QVERIFY(coordinator.deliver(makeDelivery(1, i)));

        auto count = coordinator.invoke([&] { return seen.size(); });
        QCOMPARE(count, usize(10));
        for (usize i = 0; i < seen.size(); ++i)
            QCOMPARE(seen[i], static_cast<f64>(i));
    }

    void testThrowingTaskKeepsWorkerAlive() {
        Coordinator coordinator(8, [](Delivery&&) {});
        coordinator.post([] { throw std::bad_alloc(); });

        // Exceptions from invoke() reach the caller through the future
        bool threw = false;
        try {
            coordinator.invoke([]() -> int { throw std::runtime_error("boom"); });
        } catch (const std::runtime_error&) {
            threw = true;
        }
        QVERIFY(threw);
        QCOMPARE(coordinator.invoke([] { return 5; }), 5);
    }

    void testOverflowIsDroppedAndCounted() {
        std::atomic<int> handled{0};
        Coordinator coordinator(4, [&](Delivery&&) { ++handled; });

        std::promise<void> running;
        std::promise<void> release;
        auto releaseFuture = release.get_future().share();
        coordinator.post([&running, releaseFuture] {
            running.set_value();
            releaseFuture.wait();
        });
        running.get_future().wait();

        // Worker is busy: only the queue capacity is accepted
        int accepted = 0;
        for (int i = 0; i < 7; ++i)
            accepted += coordinator.deliver(makeDelivery(1, i)) ? 1 : 0;

        QCOMPARE(accepted, 4);
        QCOMPARE(coordinator.droppedDeliveries(), u64(3));

        release.set_value();
        coordinator.invoke([] {});
        QCOMPARE(handled.load(), 4);
    }

    void testDrainDeliveriesFromWorker() {
        int handled = 0;
        Coordinator coordinator(8, [&](Delivery&&) { ++handled; });

        std::promise<void> running;
        std::promise<void> release;
        auto releaseFuture = release.get_future().share();
        auto result = std::make_shared<std::promise<int>>();
        auto resultFuture = result->get_future();

        coordinator.post([&, releaseFuture, result] {
            running.set_value();
            releaseFuture.wait();
            coordinator.drainDeliveries();
            result->set_value(handled);
        });
        running.get_future().wait();

        for (int i = 0; i < 3; ++i)
            QVERIFY(coordinator.deliver(makeDelivery(1, i)));
        release.set_value();

        QCOMPARE(resultFuture.get(), 3);
    }
};

int runTestCoordinator(int argc, char** argv) {
    TestCoordinator tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Coordinator.moc"
