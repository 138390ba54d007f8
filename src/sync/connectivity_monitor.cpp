#include "sync/connectivity_monitor.hpp"
#include "support/logging.hpp"
#include <QMetaObject>
#include <QString>
#include <QThread>
#include <algorithm>
#include <type_traits>

namespace offgrid::sync {

ConnectivityMonitor::ConnectivityMonitor(MutationQueue& queue,
                                         SyncCoordinator& coordinator,
                                         RetryPolicy policy,
                                         bool initially_online,
                                         QObject* parent)
    : QObject(parent)
    , queue_(queue)
    , coordinator_(coordinator)
    , policy_(policy)
    , online_(initially_online)
{
    retry_timer_.setSingleShot(true);
    connect(&retry_timer_, &QTimer::timeout, this, [this]() {
        if (!online_) return;
        qCInfo(offgridSyncLog) << "retry pass, round" << retry_round_;
        coordinator_.process_pending_mutations();
    });
    connect(&coordinator_, &SyncCoordinator::syncFinished,
            this, &ConnectivityMonitor::on_sync_finished);
}

void ConnectivityMonitor::deliver(ConnectivityEvent event) {
    if (QThread::currentThread() == thread()) {
        handle(event);
        return;
    }
    QMetaObject::invokeMethod(this, [this, event = std::move(event)]() {
        handle(event);
    }, Qt::QueuedConnection);
}

void ConnectivityMonitor::handle(const ConnectivityEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ConnectivityChanged>) {
            handle_connectivity(e);
        } else {
            handle_remote_sync(e);
        }
    }, event);
}

void ConnectivityMonitor::handle_connectivity(const ConnectivityChanged& event) {
    if (event.online == online_) {
        return;
    }

    online_ = event.online;
    emit onlineChanged(online_);

    if (!online_) {
        qCInfo(offgridSyncLog) << "offline," << queue_.pending_count() << "pending";
        reset_backoff();
        return;
    }

    qCInfo(offgridSyncLog) << "online," << queue_.pending_count() << "pending";
    coordinator_.process_pending_mutations();
}

void ConnectivityMonitor::handle_remote_sync(const RemoteSyncCompleted& event) {
    auto reloaded = queue_.reload();
    if (reloaded.is_err()) {
        qCWarning(offgridSyncLog) << "reload after background sync failed:"
                                  << QString::fromStdString(reloaded.unwrap_err().describe());
    }

    SyncResult result;
    result.origin = SyncOrigin::Background;
    result.synced = event.synced.value_or(0);
    result.finished_at = Timestamp::now();
    last_background_result_ = result;

    qCInfo(offgridSyncLog) << "background sync reported, synced=" << result.synced
                           << "pending=" << queue_.pending_count();

    if (queue_.pending_count() == 0) {
        reset_backoff();
    }
    emit backgroundSyncCompleted(result);
}

void ConnectivityMonitor::on_sync_finished(const SyncResult&) {
    if (!online_) {
        return;
    }
    if (queue_.pending_count() == 0) {
        reset_backoff();
        return;
    }

    ++retry_round_;
    const auto delay = backoff_delay(retry_round_, policy_);
    retry_timer_.start(delay);
    qCDebug(offgridSyncLog) << "next pass in" << delay.count() << "ms,"
                            << queue_.pending_count() << "pending";
    emit retryScheduled(static_cast<int>(delay.count()));
}

void ConnectivityMonitor::reset_backoff() {
    retry_timer_.stop();
    retry_round_ = 0;
}

void ConnectivityMonitor::stop() {
    reset_backoff();
}

std::chrono::milliseconds ConnectivityMonitor::backoff_delay(int round, const RetryPolicy& policy) {
    auto delay = policy.base_delay;
    for (int i = 1; i < round && delay < policy.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.max_delay);
}

} // namespace offgrid::sync
