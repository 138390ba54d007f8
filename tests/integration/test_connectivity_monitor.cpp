#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>
#include <QTest>
#include <QThread>

#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/queue_store.hpp"
#include "support/fake_sink.hpp"
#include "sync/connectivity_monitor.hpp"
#include "sync/mutation_queue.hpp"
#include "sync/sync_coordinator.hpp"

using namespace offgrid;
using namespace offgrid::sync;
using offgrid::testing::FakeSink;
using namespace std::chrono_literals;

namespace {

struct MonitorFixture {
    storage::Database db = storage::Database::open_memory().unwrap();
    std::unique_ptr<storage::QueueStore> store;
    std::unique_ptr<MutationQueue> queue;
    FakeSink sink;
    std::unique_ptr<SyncCoordinator> coordinator;
    std::unique_ptr<ConnectivityMonitor> monitor;

    explicit MonitorFixture(RetryPolicy policy = RetryPolicy{10s, 60s}) {
        REQUIRE(storage::initialize_database(db).is_ok());
        store = std::make_unique<storage::QueueStore>(db);
        queue = std::make_unique<MutationQueue>(*store);
        REQUIRE(queue->load().is_ok());
        coordinator = std::make_unique<SyncCoordinator>(*queue, sink);
        monitor = std::make_unique<ConnectivityMonitor>(*queue, *coordinator, policy);
    }

    void enqueue(const std::string& id) {
        REQUIRE(queue->enqueue(make_mutation(EntityType::Link, id, MutationOp::Create)).is_ok());
    }
};

} // namespace

TEST_CASE("ConnectivityMonitor: going online drains the queue once", "[integration][connectivity]") {
    MonitorFixture f;
    f.enqueue("l1");
    f.enqueue("l2");

    QSignalSpy online(f.monitor.get(), &ConnectivityMonitor::onlineChanged);
    QSignalSpy passes(f.coordinator.get(), &SyncCoordinator::syncStarted);

    REQUIRE_FALSE(f.monitor->is_online());
    f.monitor->deliver(ConnectivityChanged{true});
    REQUIRE(f.monitor->is_online());
    REQUIRE(f.sink.calls.size() == 2);
    REQUIRE(f.queue->pending_count() == 0);

    // Repeated online events are not transitions.
    f.monitor->deliver(ConnectivityChanged{true});
    REQUIRE(passes.count() == 1);
    REQUIRE(online.count() == 1);

    f.monitor->deliver(ConnectivityChanged{false});
    f.enqueue("l3");
    REQUIRE(f.sink.calls.size() == 2);

    f.monitor->deliver(ConnectivityChanged{true});
    REQUIRE(passes.count() == 2);
    REQUIRE(f.sink.calls.size() == 3);
    REQUIRE(online.count() == 3);
}

TEST_CASE("ConnectivityMonitor: nothing is sent while offline", "[integration][connectivity]") {
    MonitorFixture f;
    f.enqueue("l1");
    f.monitor->deliver(ConnectivityChanged{false});
    REQUIRE(f.sink.calls.empty());
    REQUIRE(f.queue->pending_count() == 1);
}

TEST_CASE("ConnectivityMonitor: background flush reloads the queue", "[integration][connectivity]") {
    MonitorFixture f;
    f.enqueue("l1");
    f.enqueue("l2");
    QSignalSpy background(f.monitor.get(), &ConnectivityMonitor::backgroundSyncCompleted);

    // Another agent replayed and removed the rows.
    REQUIRE(f.store->clear().is_ok());
    f.monitor->deliver(RemoteSyncCompleted{2});

    REQUIRE(f.queue->pending_count() == 0);
    REQUIRE(background.count() == 1);
    REQUIRE(f.monitor->last_background_result().has_value());
    REQUIRE(f.monitor->last_background_result()->synced == 2);
    REQUIRE(f.monitor->last_background_result()->origin == SyncOrigin::Background);
    REQUIRE(f.sink.calls.empty());

    f.monitor->deliver(RemoteSyncCompleted{});
    REQUIRE(f.monitor->last_background_result()->synced == 0);
}

TEST_CASE("ConnectivityMonitor: backoff doubles up to the cap", "[connectivity]") {
    const RetryPolicy policy{100ms, 1000ms};
    REQUIRE(ConnectivityMonitor::backoff_delay(1, policy) == 100ms);
    REQUIRE(ConnectivityMonitor::backoff_delay(2, policy) == 200ms);
    REQUIRE(ConnectivityMonitor::backoff_delay(3, policy) == 400ms);
    REQUIRE(ConnectivityMonitor::backoff_delay(4, policy) == 800ms);
    REQUIRE(ConnectivityMonitor::backoff_delay(5, policy) == 1000ms);
    REQUIRE(ConnectivityMonitor::backoff_delay(40, policy) == 1000ms);
}

TEST_CASE("ConnectivityMonitor: leftovers are retried after a delay", "[integration][connectivity]") {
    MonitorFixture f(RetryPolicy{20ms, 40ms});
    f.enqueue("l1");
    f.sink.respond = [](const MutationRecord&, std::size_t index) {
        return index == 0 ? SinkOutcome::retryable("HTTP 503", 503) : SinkOutcome::applied();
    };

    QSignalSpy scheduled(f.monitor.get(), &ConnectivityMonitor::retryScheduled);
    QSignalSpy finished(f.coordinator.get(), &SyncCoordinator::syncFinished);

    f.monitor->deliver(ConnectivityChanged{true});
    REQUIRE(finished.count() == 1);
    REQUIRE(scheduled.count() == 1);
    REQUIRE(scheduled.at(0).at(0).toInt() == 20);
    REQUIRE(f.monitor->retry_scheduled());
    REQUIRE(f.monitor->retry_round() == 1);

    REQUIRE(finished.wait(2000));
    REQUIRE(f.queue->pending_count() == 0);
    REQUIRE(f.sink.calls.size() == 2);
    REQUIRE_FALSE(f.monitor->retry_scheduled());
    REQUIRE(f.monitor->retry_round() == 0);
}

TEST_CASE("ConnectivityMonitor: going offline cancels the retry", "[integration][connectivity]") {
    MonitorFixture f;
    f.enqueue("l1");
    f.sink.respond = [](const MutationRecord&, std::size_t) {
        return SinkOutcome::retryable("Network error");
    };

    f.monitor->deliver(ConnectivityChanged{true});
    REQUIRE(f.monitor->retry_scheduled());

    f.monitor->deliver(ConnectivityChanged{false});
    REQUIRE_FALSE(f.monitor->retry_scheduled());
    REQUIRE(f.monitor->retry_round() == 0);
    REQUIRE(f.queue->pending_count() == 1);
}

TEST_CASE("ConnectivityMonitor: events from another thread", "[integration][connectivity]") {
    MonitorFixture f;
    f.enqueue("l1");
    QSignalSpy online(f.monitor.get(), &ConnectivityMonitor::onlineChanged);

    std::unique_ptr<QThread> worker(QThread::create([&f]() {
        f.monitor->deliver(ConnectivityChanged{true});
    }));
    worker->start();
    REQUIRE(worker->wait(2000));

    // Handled on the monitor's thread once its event loop runs.
    REQUIRE(f.sink.calls.empty());
    REQUIRE(online.wait(2000));
    REQUIRE(f.monitor->is_online());
    REQUIRE(f.sink.calls.size() == 1);
}
