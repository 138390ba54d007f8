#pragma once

#include "sync/mutation_queue.hpp"
#include "sync/sync_coordinator.hpp"
#include "sync/sync_result.hpp"
#include <QObject>
#include <QTimer>
#include <chrono>
#include <optional>
#include <variant>

namespace offgrid::sync {

/**
 * The device gained or lost network reachability.
 */
struct ConnectivityChanged {
    bool online = false;
};

/**
 * Something other than this process flushed the persisted queue (a
 * background sync agent). `synced` is the count it reported, if any.
 */
struct RemoteSyncCompleted {
    std::optional<int> synced;
};

using ConnectivityEvent = std::variant<ConnectivityChanged, RemoteSyncCompleted>;

struct RetryPolicy {
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{60000};
};

/**
 * ConnectivityMonitor - Turns connectivity events into sync passes.
 *
 * Going online starts one pass; repeated online events are ignored. While
 * online, a pass that leaves records behind schedules another one after an
 * exponential backoff. The backoff resets when the queue empties or the
 * device goes offline.
 */
class ConnectivityMonitor : public QObject {
    Q_OBJECT

public:
    ConnectivityMonitor(MutationQueue& queue,
                        SyncCoordinator& coordinator,
                        RetryPolicy policy = {},
                        bool initially_online = false,
                        QObject* parent = nullptr);

    /**
     * Entry point for all events. May be called from any thread; events
     * from other threads are handled on the monitor's thread.
     */
    void deliver(ConnectivityEvent event);

    [[nodiscard]] bool is_online() const { return online_; }
    [[nodiscard]] const std::optional<SyncResult>& last_background_result() const {
        return last_background_result_;
    }

    [[nodiscard]] bool retry_scheduled() const { return retry_timer_.isActive(); }
    [[nodiscard]] int retry_round() const { return retry_round_; }

    /**
     * Stop scheduled retries. Events delivered afterwards still work.
     */
    void stop();

    [[nodiscard]] static std::chrono::milliseconds backoff_delay(int round,
                                                                 const RetryPolicy& policy);

signals:
    void onlineChanged(bool online);
    void backgroundSyncCompleted(const offgrid::sync::SyncResult& result);
    void retryScheduled(int delay_ms);

private:
    MutationQueue& queue_;
    SyncCoordinator& coordinator_;
    RetryPolicy policy_;
    bool online_;
    int retry_round_ = 0;
    QTimer retry_timer_;
    std::optional<SyncResult> last_background_result_;

    void handle(const ConnectivityEvent& event);
    void handle_connectivity(const ConnectivityChanged& event);
    void handle_remote_sync(const RemoteSyncCompleted& event);
    void on_sync_finished(const SyncResult& result);
    void reset_backoff();
};

} // namespace offgrid::sync
