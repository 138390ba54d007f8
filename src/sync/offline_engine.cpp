#include "sync/offline_engine.hpp"
#include "storage/migrations.hpp"
#include "support/logging.hpp"
#include <QString>

namespace offgrid::sync {

OfflineEngine::OfflineEngine(storage::Database& db,
                             RemoteSink& sink,
                             EngineOptions options,
                             QObject* parent)
    : QObject(parent)
    , db_(db)
    , sink_(sink)
    , options_(options)
{
}

OfflineEngine::~OfflineEngine() {
    shutdown();
}

Result<void> OfflineEngine::initialize() {
    if (is_initialized()) {
        return Result<void>::ok();
    }
    if (!db_.is_open()) {
        return Result<void>::err(Error::storage("Queue database is not open"));
    }

    auto migrated = storage::initialize_database(db_);
    if (migrated.is_err()) {
        qCCritical(offgridStorageLog) << "schema migration failed:"
                                      << QString::fromStdString(migrated.unwrap_err().describe());
        return migrated;
    }

    auto store = std::make_unique<storage::QueueStore>(db_);
    auto queue = std::make_unique<MutationQueue>(*store);
    auto loaded = queue->load();
    if (loaded.is_err()) {
        return loaded;
    }
    if (layout_source_) {
        queue->set_layout_source(layout_source_);
    }

    store_ = std::move(store);
    queue_ = std::move(queue);
    coordinator_ = std::make_unique<SyncCoordinator>(*queue_, sink_, options_.coordinator);
    monitor_ = std::make_unique<ConnectivityMonitor>(*queue_, *coordinator_, options_.retry,
                                                     options_.start_online);

    connect(queue_.get(), &MutationQueue::pendingCountChanged,
            this, [this](int) { emit pendingCountChanged(); });
    connect(coordinator_.get(), &SyncCoordinator::stateChanged,
            this, [this](CoordinatorState) { emit syncingChanged(); });
    connect(coordinator_.get(), &SyncCoordinator::syncFinished,
            this, [this](const SyncResult& result) { record_result(result); });
    connect(monitor_.get(), &ConnectivityMonitor::onlineChanged,
            this, [this](bool) { emit onlineChanged(); });
    connect(monitor_.get(), &ConnectivityMonitor::backgroundSyncCompleted,
            this, [this](const SyncResult& result) { record_result(result); });

    qCInfo(offgridSyncLog) << "engine ready, pending=" << queue_->pending_count()
                           << "online=" << monitor_->is_online();
    emit pendingCountChanged();

    if (monitor_->is_online() && queue_->pending_count() > 0) {
        coordinator_->process_pending_mutations();
    }
    return Result<void>::ok();
}

void OfflineEngine::shutdown() {
    if (!is_initialized()) {
        return;
    }
    monitor_->stop();
    if (coordinator_->is_draining()) {
        qCWarning(offgridSyncLog) << "shutdown during a sync pass; unsent records stay queued";
        coordinator_->abort();
    }

    monitor_.reset();
    coordinator_.reset();
    queue_.reset();
    store_.reset();
    qCInfo(offgridSyncLog) << "engine stopped";
}

Result<int> OfflineEngine::enqueue(MutationRecord record) {
    if (!is_initialized()) {
        return Result<int>::err(Error{ErrorKind::Internal, "Engine is not initialized"});
    }
    return queue_->enqueue(std::move(record));
}

void OfflineEngine::sync_now(SyncCompletion completion) {
    if (!is_initialized() || !monitor_->is_online()) {
        qCInfo(offgridSyncLog) << "sync requested while offline or stopped";
        SyncResult empty;
        empty.finished_at = Timestamp::now();
        if (completion) {
            completion(empty);
        }
        return;
    }
    coordinator_->process_pending_mutations(std::move(completion));
}

void OfflineEngine::deliver(ConnectivityEvent event) {
    if (!is_initialized()) {
        qCWarning(offgridSyncLog) << "event dropped, engine is not initialized";
        return;
    }
    monitor_->deliver(std::move(event));
}

void OfflineEngine::set_layout_source(LayoutSource source) {
    layout_source_ = std::move(source);
    if (queue_) {
        queue_->set_layout_source(layout_source_);
    }
}

int OfflineEngine::pendingCount() const {
    return queue_ ? queue_->pending_count() : 0;
}

bool OfflineEngine::isOnline() const {
    return monitor_ ? monitor_->is_online() : options_.start_online;
}

bool OfflineEngine::isSyncing() const {
    return coordinator_ && coordinator_->is_draining();
}

std::vector<MutationRecord> OfflineEngine::pending_mutations() const {
    return queue_ ? queue_->drain() : std::vector<MutationRecord>{};
}

LayoutSnapshot OfflineEngine::effective_layout() const {
    if (queue_) {
        return queue_->effective_layout();
    }
    return layout_source_ ? layout_source_() : LayoutSnapshot{};
}

Result<void> OfflineEngine::clear_pending() {
    if (!is_initialized()) {
        return Result<void>::err(Error{ErrorKind::Internal, "Engine is not initialized"});
    }
    return queue_->clear();
}

void OfflineEngine::record_result(const SyncResult& result) {
    last_result_ = result;
    emit syncFinished(result);
}

} // namespace offgrid::sync
