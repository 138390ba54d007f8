#include "sync/sync_coordinator.hpp"
#include "support/logging.hpp"
#include <QMetaObject>
#include <QString>
#include <QThread>
#include <algorithm>

namespace offgrid::sync {

namespace {

QString lane_name(EntityType type, const std::string& id) {
    return QStringLiteral("%1/%2").arg(QString::fromUtf8(to_string(type).data()),
                                       QString::fromStdString(id));
}

} // namespace

SyncCoordinator::SyncCoordinator(MutationQueue& queue,
                                 RemoteSink& sink,
                                 CoordinatorOptions options,
                                 QObject* parent)
    : QObject(parent)
    , queue_(queue)
    , sink_(sink)
    , options_(options)
{
    qRegisterMetaType<offgrid::sync::SyncResult>();
    qRegisterMetaType<offgrid::sync::SinkStatus>();
    qRegisterMetaType<offgrid::sync::CoordinatorState>();
}

SyncCoordinator::~SyncCoordinator() {
    abort();
}

void SyncCoordinator::abort() {
    for (auto& [ticket, send] : sends_) {
        if (send.timer) {
            send.timer->stop();
            send.timer->deleteLater();
        }
        queue_.set_in_flight(send.record_id, false);
        // The request may still land; later coalescing must not assume it did not.
        auto marked = queue_.mark_failed(send.record_id, "Sync aborted before the sink answered");
        if (marked.is_err() && !marked.unwrap_err().is(ErrorKind::NotFound)) {
            qCWarning(offgridSyncLog) << "cannot record abort of" << send.record_id << ":"
                                      << QString::fromStdString(marked.unwrap_err().describe());
        }
    }
    if (!pass_) {
        sends_.clear();
        return;
    }

    Pass aborted = std::move(*pass_);
    pass_.reset();
    aborted.result.retrying += static_cast<int>(sends_.size());
    aborted.result.origin = SyncOrigin::Foreground;
    aborted.result.finished_at = Timestamp::now();
    sends_.clear();
    last_result_ = aborted.result;

    qCWarning(offgridSyncLog) << "pass aborted, synced=" << aborted.result.synced
                              << "failed=" << aborted.result.failed
                              << "retrying=" << aborted.result.retrying
                              << "waiters=" << aborted.waiters.size();

    set_state(CoordinatorState::Idle);
    for (auto& waiter : aborted.waiters) {
        waiter(aborted.result);
    }
}

void SyncCoordinator::set_state(CoordinatorState state) {
    if (state_ == state) return;
    state_ = state;
    emit stateChanged(state_);
}

void SyncCoordinator::process_pending_mutations(SyncCompletion completion) {
    if (pass_) {
        if (completion) {
            pass_->waiters.push_back(std::move(completion));
        }
        qCDebug(offgridSyncLog) << "trigger joined running pass";
        return;
    }

    pass_.emplace();
    if (completion) {
        pass_->waiters.push_back(std::move(completion));
    }
    for (const auto& record : queue_.drain()) {
        pass_->pending_ids.push_back(record.id);
    }

    const int pending = static_cast<int>(pass_->pending_ids.size());
    qCInfo(offgridSyncLog) << "pass started, pending=" << pending;
    set_state(CoordinatorState::Draining);
    emit syncStarted(pending);

    pump();
}

void SyncCoordinator::pump() {
    if (pumping_) {
        repump_ = true;
        return;
    }

    pumping_ = true;
    do {
        repump_ = false;
        if (!pass_) break;

        const int limit = std::max(1, options_.max_in_flight);
        auto& ids = pass_->pending_ids;
        for (auto it = ids.begin(); it != ids.end() && pass_->outstanding < limit;) {
            auto current = queue_.find(*it);
            if (!current) {
                // Coalesced away or cleared since the snapshot.
                it = ids.erase(it);
                continue;
            }

            Lane lane{current->entity_type, current->entity_id};
            if (pass_->held_lanes.count(lane) > 0) {
                qCDebug(offgridSyncLog) << "holding back record" << current->id
                                        << "until next pass";
                it = ids.erase(it);
                continue;
            }
            if (pass_->busy_lanes.count(lane) > 0 || queue_.is_in_flight(current->id)) {
                ++it;
                continue;
            }

            it = ids.erase(it);
            // A synchronous completion re-enters pump() and only sets repump_,
            // so `ids` is not modified behind the iterator.
            dispatch(*current, lane);
        }
    } while (repump_);
    pumping_ = false;

    maybe_finish();
}

void SyncCoordinator::dispatch(const MutationRecord& record, const Lane& lane) {
    const uint64_t ticket = ++next_ticket_;

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(options_.request_timeout);
    connect(timer, &QTimer::timeout, this, [this, ticket]() {
        const auto ms = static_cast<long long>(options_.request_timeout.count());
        settle(ticket, SinkOutcome::retryable(
            "Request timed out after " + std::to_string(ms) + " ms"));
    });

    queue_.set_in_flight(record.id, true);
    pass_->busy_lanes.insert(lane);
    pass_->outstanding++;
    sends_[ticket] = Send{record.id, lane, timer};
    timer->start();

    if (support::sync_debug_enabled()) {
        qCDebug(offgridSyncLog) << "send record" << record.id
                                << QString::fromUtf8(to_string(record.operation).data())
                                << lane_name(lane.first, lane.second)
                                << "attempts=" << record.attempts;
    }

    QPointer<SyncCoordinator> self(this);
    sink_.apply_mutation(record, [self, ticket](SinkOutcome outcome) {
        if (!self) return;
        if (QThread::currentThread() != self->thread()) {
            QMetaObject::invokeMethod(self.data(), [self, ticket, outcome]() {
                if (self) self->settle(ticket, outcome);
            }, Qt::QueuedConnection);
            return;
        }
        self->settle(ticket, outcome);
    });
}

void SyncCoordinator::settle(uint64_t ticket, const SinkOutcome& outcome) {
    auto found = sends_.find(ticket);
    if (found == sends_.end()) {
        qCDebug(offgridSyncLog) << "ignoring late completion, ticket" << ticket;
        return;
    }

    const Send send = found->second;
    sends_.erase(found);
    if (send.timer) {
        send.timer->stop();
        send.timer->deleteLater();
    }
    queue_.set_in_flight(send.record_id, false);

    // Every send belongs to the running pass.
    auto& pass = *pass_;
    pass.busy_lanes.erase(send.lane);
    pass.outstanding--;

    switch (outcome.status) {
        case SinkStatus::Applied: {
            auto removed = queue_.remove(send.record_id);
            if (removed.is_err()) {
                // The sink has it; a replay later is absorbed by idempotency.
                qCWarning(offgridSyncLog) << "record" << send.record_id
                                          << "applied but not removed locally:"
                                          << QString::fromStdString(removed.unwrap_err().describe());
            }
            pass.result.synced++;
            break;
        }
        case SinkStatus::Retryable:
            settle_retryable(pass, send, outcome);
            break;
        case SinkStatus::Rejected:
            settle_rejected(pass, send,
                            Error{ErrorKind::RejectedSync, outcome.message, outcome.code});
            break;
    }

    emit recordSettled(static_cast<qint64>(send.record_id), outcome.status);
    pump();
}

void SyncCoordinator::settle_retryable(Pass& pass, const Send& send, const SinkOutcome& outcome) {
    const Error error{ErrorKind::RetryableSync, outcome.message, outcome.code};
    auto marked = queue_.mark_failed(send.record_id, error.describe());
    if (marked.is_err()) {
        if (marked.unwrap_err().is(ErrorKind::NotFound)) {
            // Cleared while the send was outstanding.
            return;
        }
        qCWarning(offgridSyncLog) << "cannot record failure of" << send.record_id << ":"
                                  << QString::fromStdString(marked.unwrap_err().describe());
        pass.held_lanes.insert(send.lane);
        pass.result.retrying++;
        return;
    }

    const int attempts = marked.unwrap().attempts;
    if (options_.max_attempts > 0 && attempts >= options_.max_attempts) {
        qCWarning(offgridSyncLog) << "record" << send.record_id << "gave up after"
                                  << attempts << "attempts";
        settle_rejected(pass, send, Error{ErrorKind::RetryableSync,
            outcome.message + " (gave up after " + std::to_string(attempts) + " attempts)",
            outcome.code});
        return;
    }

    qCInfo(offgridSyncLog) << "record" << send.record_id << "will retry, attempts=" << attempts
                           << QString::fromStdString(outcome.message);
    pass.held_lanes.insert(send.lane);
    pass.result.retrying++;
}

void SyncCoordinator::settle_rejected(Pass& pass, const Send& send, Error error) {
    auto removed = queue_.remove(send.record_id);
    if (removed.is_err()) {
        qCWarning(offgridSyncLog) << "failed record" << send.record_id << "not removed:"
                                  << QString::fromStdString(removed.unwrap_err().describe());
    }

    qCWarning(offgridSyncLog) << "record" << send.record_id
                              << lane_name(send.lane.first, send.lane.second) << "failed:"
                              << QString::fromStdString(error.describe());
    pass.result.failed++;
    pass.result.failures.push_back(
        SyncFailure{send.record_id, send.lane.first, send.lane.second, std::move(error)});
}

void SyncCoordinator::maybe_finish() {
    if (!pass_ || pass_->outstanding > 0 || !pass_->pending_ids.empty()) {
        return;
    }

    Pass done = std::move(*pass_);
    pass_.reset();
    done.result.origin = SyncOrigin::Foreground;
    done.result.finished_at = Timestamp::now();
    last_result_ = done.result;

    qCInfo(offgridSyncLog) << "pass finished, synced=" << done.result.synced
                           << "failed=" << done.result.failed
                           << "retrying=" << done.result.retrying
                           << "pending=" << queue_.pending_count();

    set_state(CoordinatorState::Idle);
    emit syncFinished(done.result);
    for (auto& waiter : done.waiters) {
        waiter(done.result);
    }
}

} // namespace offgrid::sync
