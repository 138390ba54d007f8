#pragma once

#include "core/mutation.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include "storage/queue_store.hpp"
#include "sync/connectivity_monitor.hpp"
#include "sync/mutation_queue.hpp"
#include "sync/remote_sink.hpp"
#include "sync/sync_coordinator.hpp"
#include "sync/sync_result.hpp"
#include <QObject>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace offgrid::sync {

struct EngineOptions {
    CoordinatorOptions coordinator;
    RetryPolicy retry;
    bool start_online = false;
};

/**
 * OfflineEngine - Buffers dashboard edits while offline and replays them.
 *
 * Storage and sink are injected and must outlive the engine. Nothing runs
 * before initialize(), which migrates the schema and loads the persisted
 * queue; shutdown() stops scheduled retries and releases the components.
 *
 *   OfflineEngine engine(db, sink);
 *   engine.initialize();
 *   engine.enqueue(make_mutation(EntityType::Link, id, MutationOp::Create, json));
 *   engine.deliver(ConnectivityChanged{true});
 */
class OfflineEngine : public QObject {
    Q_OBJECT

    Q_PROPERTY(int pendingCount READ pendingCount NOTIFY pendingCountChanged)
    Q_PROPERTY(bool online READ isOnline NOTIFY onlineChanged)
    Q_PROPERTY(bool syncing READ isSyncing NOTIFY syncingChanged)

public:
    OfflineEngine(storage::Database& db,
                  RemoteSink& sink,
                  EngineOptions options = {},
                  QObject* parent = nullptr);
    ~OfflineEngine() override;

    [[nodiscard]] Result<void> initialize();
    void shutdown();
    [[nodiscard]] bool is_initialized() const { return queue_ != nullptr; }

    /**
     * Queue an edit. Returns the change in pending count; widget geometry
     * errors and storage failures are returned without touching the queue.
     */
    [[nodiscard]] Result<int> enqueue(MutationRecord record);

    /**
     * Run a sync pass now, or join the running one. Offline, the
     * completion is called at once with an empty result. A shutdown during
     * the pass completes it with the partial result.
     */
    void sync_now(SyncCompletion completion = {});

    void deliver(ConnectivityEvent event);

    void set_layout_source(LayoutSource source);

    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] bool isOnline() const;
    [[nodiscard]] bool isSyncing() const;

    [[nodiscard]] std::optional<SyncResult> last_sync_result() const { return last_result_; }
    [[nodiscard]] std::vector<MutationRecord> pending_mutations() const;
    [[nodiscard]] LayoutSnapshot effective_layout() const;
    [[nodiscard]] Result<void> clear_pending();

    [[nodiscard]] const EngineOptions& options() const { return options_; }

signals:
    void pendingCountChanged();
    void onlineChanged();
    void syncingChanged();
    void syncFinished(const offgrid::sync::SyncResult& result);

private:
    storage::Database& db_;
    RemoteSink& sink_;
    EngineOptions options_;
    LayoutSource layout_source_;
    std::optional<SyncResult> last_result_;

    std::unique_ptr<storage::QueueStore> store_;
    std::unique_ptr<MutationQueue> queue_;
    std::unique_ptr<SyncCoordinator> coordinator_;
    std::unique_ptr<ConnectivityMonitor> monitor_;

    void record_result(const SyncResult& result);
};

} // namespace offgrid::sync
