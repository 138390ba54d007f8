#include <catch2/catch_test_macros.hpp>

#include <QSignalSpy>

#include "storage/database.hpp"
#include "support/fake_sink.hpp"
#include "sync/offline_engine.hpp"

using namespace offgrid;
using namespace offgrid::sync;
using offgrid::testing::FakeSink;
using namespace std::chrono_literals;

namespace {

EngineOptions quiet_options() {
    EngineOptions options;
    options.retry = RetryPolicy{30s, 60s};
    return options;
}

MutationRecord link_create(const std::string& id) {
    return make_mutation(EntityType::Link, id, MutationOp::Create,
                         R"({"title":")" + id + R"(","url":"https://)" + id + R"(.example"})");
}

} // namespace

TEST_CASE("OfflineEngine: offline edits replay when the device comes online", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    sink.respond = [](const MutationRecord&, std::size_t index) {
        return index == 1 ? SinkOutcome::retryable("HTTP 503", 503) : SinkOutcome::applied();
    };

    OfflineEngine engine(db, sink, quiet_options());
    REQUIRE(engine.initialize().is_ok());
    REQUIRE_FALSE(engine.isOnline());

    REQUIRE(engine.enqueue(link_create("a")).unwrap() == 1);
    REQUIRE(engine.enqueue(link_create("b")).unwrap() == 1);
    REQUIRE(engine.enqueue(link_create("c")).unwrap() == 1);
    REQUIRE(engine.pendingCount() == 3);
    REQUIRE(sink.calls.empty());

    QSignalSpy finished(&engine, &OfflineEngine::syncFinished);
    QSignalSpy online(&engine, &OfflineEngine::onlineChanged);

    engine.deliver(ConnectivityChanged{true});

    REQUIRE(online.count() == 1);
    REQUIRE(finished.count() == 1);
    REQUIRE(sink.calls.size() == 3);

    const auto result = engine.last_sync_result();
    REQUIRE(result.has_value());
    REQUIRE(result->synced == 2);
    REQUIRE(result->failed == 0);
    REQUIRE(result->retrying == 1);
    REQUIRE(engine.pendingCount() == 1);
    REQUIRE(engine.pending_mutations().front().entity_id == "b");
    REQUIRE_FALSE(engine.isSyncing());
}

TEST_CASE("OfflineEngine: sync_now while offline reports an empty result", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    OfflineEngine engine(db, sink, quiet_options());
    REQUIRE(engine.initialize().is_ok());
    REQUIRE(engine.enqueue(link_create("a")).is_ok());

    std::optional<SyncResult> result;
    engine.sync_now([&](const SyncResult& r) { result = r; });

    REQUIRE(result.has_value());
    REQUIRE(result->synced == 0);
    REQUIRE(result->failed == 0);
    REQUIRE(sink.calls.empty());
    REQUIRE(engine.pendingCount() == 1);
}

TEST_CASE("OfflineEngine: sync_now online drains and reports", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    sink.deferred = true;
    auto options = quiet_options();
    options.start_online = true;
    OfflineEngine engine(db, sink, options);
    REQUIRE(engine.initialize().is_ok());
    REQUIRE(engine.enqueue(link_create("a")).is_ok());

    QSignalSpy syncing(&engine, &OfflineEngine::syncingChanged);
    std::optional<SyncResult> result;
    engine.sync_now([&](const SyncResult& r) { result = r; });

    REQUIRE(engine.isSyncing());
    REQUIRE_FALSE(result.has_value());

    sink.complete(0);
    REQUIRE(result.has_value());
    REQUIRE(result->synced == 1);
    REQUIRE(engine.pendingCount() == 0);
    REQUIRE_FALSE(engine.isSyncing());
    REQUIRE(syncing.count() == 2);
}

TEST_CASE("OfflineEngine: shutdown during sync_now still completes it", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    sink.deferred = true;
    auto options = quiet_options();
    options.start_online = true;
    {
        OfflineEngine engine(db, sink, options);
        REQUIRE(engine.initialize().is_ok());
        REQUIRE(engine.enqueue(link_create("a")).is_ok());

        std::optional<SyncResult> result;
        engine.sync_now([&](const SyncResult& r) { result = r; });
        REQUIRE(engine.isSyncing());

        engine.shutdown();
        REQUIRE(result.has_value());
        REQUIRE(result->synced == 0);
        REQUIRE(result->retrying == 1);
        REQUIRE_FALSE(engine.isSyncing());
    }

    // The unanswered create stays queued, marked as possibly delivered.
    sink.deferred = false;
    OfflineEngine restarted(db, sink, quiet_options());
    REQUIRE(restarted.initialize().is_ok());
    const auto pending = restarted.pending_mutations();
    REQUIRE(pending.size() == 1);
    REQUIRE(pending[0].entity_id == "a");
    REQUIRE(pending[0].attempts == 1);
}

TEST_CASE("OfflineEngine: queue survives a restart", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    {
        OfflineEngine engine(db, sink, quiet_options());
        REQUIRE(engine.initialize().is_ok());
        REQUIRE(engine.enqueue(link_create("a")).is_ok());
        REQUIRE(engine.enqueue(make_mutation(EntityType::Tag, "t1", MutationOp::Delete)).is_ok());
        engine.shutdown();
        REQUIRE_FALSE(engine.is_initialized());
    }

    auto options = quiet_options();
    options.start_online = true;
    OfflineEngine restarted(db, sink, options);
    REQUIRE(restarted.initialize().is_ok());

    // Starting online with a backlog drains it right away.
    REQUIRE(sink.calls.size() == 2);
    REQUIRE(sink.calls[0].record.entity_id == "a");
    REQUIRE(sink.calls[1].record.entity_id == "t1");
    REQUIRE(restarted.pendingCount() == 0);
}

TEST_CASE("OfflineEngine: nothing works before initialize", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    OfflineEngine engine(db, sink);

    auto queued = engine.enqueue(link_create("a"));
    REQUIRE(queued.is_err());
    REQUIRE(queued.unwrap_err().is(ErrorKind::Internal));
    REQUIRE(engine.pendingCount() == 0);
    REQUIRE(engine.clear_pending().is_err());

    db.close();
    auto init = engine.initialize();
    REQUIRE(init.is_err());
    REQUIRE(init.unwrap_err().is(ErrorKind::Storage));
}

TEST_CASE("OfflineEngine: widget placement uses the host layout", "[integration][engine][layout]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    OfflineEngine engine(db, sink, quiet_options());

    Widget clock;
    clock.id = "clock";
    clock.type = "clock";
    clock.position = {0, 0};
    clock.size = {2, 2};
    engine.set_layout_source([clock]() {
        return LayoutSnapshot{{clock}, GridBounds::fixed(4, 4)};
    });
    REQUIRE(engine.initialize().is_ok());

    QSignalSpy pending(&engine, &OfflineEngine::pendingCountChanged);

    auto clash = engine.enqueue(make_mutation(EntityType::Widget, "notes", MutationOp::Create,
        R"({"type":"notes","position":{"x":1,"y":0},"size":{"width":2,"height":2}})"));
    REQUIRE(clash.is_err());
    REQUIRE(clash.unwrap_err().is(ErrorKind::PlacementConflict));
    REQUIRE(engine.pendingCount() == 0);
    REQUIRE(pending.count() == 0);

    REQUIRE(engine.enqueue(make_mutation(EntityType::Widget, "notes", MutationOp::Create,
        R"({"type":"notes","position":{"x":2,"y":0},"size":{"width":2,"height":2}})")).is_ok());
    REQUIRE(pending.count() == 1);

    const auto layout = engine.effective_layout();
    REQUIRE(layout.widgets.size() == 2);
    REQUIRE(layout.widgets[1].id == "notes");
    REQUIRE(layout.widgets[1].type == "notes");
}

TEST_CASE("OfflineEngine: background sync results are surfaced", "[integration][engine]") {
    auto db = storage::Database::open_memory().unwrap();
    FakeSink sink;
    OfflineEngine engine(db, sink, quiet_options());
    REQUIRE(engine.initialize().is_ok());
    REQUIRE(engine.enqueue(link_create("a")).is_ok());

    REQUIRE(db.execute("DELETE FROM pending_mutations;").is_ok());
    QSignalSpy finished(&engine, &OfflineEngine::syncFinished);
    engine.deliver(RemoteSyncCompleted{1});

    REQUIRE(finished.count() == 1);
    REQUIRE(engine.pendingCount() == 0);
    REQUIRE(engine.last_sync_result()->origin == SyncOrigin::Background);
    REQUIRE(engine.last_sync_result()->synced == 1);
}
