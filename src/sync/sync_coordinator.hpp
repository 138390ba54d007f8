#pragma once

#include "core/mutation.hpp"
#include "sync/mutation_queue.hpp"
#include "sync/remote_sink.hpp"
#include "sync/sync_result.hpp"
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace offgrid::sync {

enum class CoordinatorState {
    Idle,
    Draining
};

struct CoordinatorOptions {
    std::chrono::milliseconds request_timeout{15000};
    int max_in_flight = 4;
    int max_attempts = 0;  // 0 = retry forever
};

using SyncCompletion = std::function<void(const SyncResult&)>;

/**
 * SyncCoordinator - Drains the mutation queue against a RemoteSink.
 *
 * A pass works on a snapshot of the queue taken when it starts. Records of
 * one entity form a lane: a lane has at most one send outstanding and sends
 * strictly in queue order, while different lanes run concurrently up to
 * max_in_flight. Before each send the record is re-read, so one that was
 * coalesced away since the snapshot is skipped and a merged one is sent
 * with its latest payload.
 *
 * Settling a record:
 * - Applied: removed, counted as synced
 * - Retryable or timed out: attempts bumped, kept; the rest of its lane
 *   waits for the next pass. Reaching max_attempts turns it into a failure.
 * - Rejected: removed, counted as failed with its error
 *
 * Triggers that arrive while a pass runs join it and receive its result.
 */
class SyncCoordinator : public QObject {
    Q_OBJECT

public:
    SyncCoordinator(MutationQueue& queue,
                    RemoteSink& sink,
                    CoordinatorOptions options = {},
                    QObject* parent = nullptr);
    ~SyncCoordinator() override;

    void process_pending_mutations(SyncCompletion completion = {});

    /**
     * Give up the running pass. Outstanding sends are counted as retrying
     * and their records stay queued with attempts bumped; waiters receive
     * the partial result.
     * Completions that arrive later are ignored.
     */
    void abort();

    [[nodiscard]] CoordinatorState state() const { return state_; }
    [[nodiscard]] bool is_draining() const { return state_ == CoordinatorState::Draining; }
    [[nodiscard]] const std::optional<SyncResult>& last_result() const { return last_result_; }

    [[nodiscard]] const CoordinatorOptions& options() const { return options_; }
    void set_options(CoordinatorOptions options) { options_ = options; }

signals:
    void stateChanged(offgrid::sync::CoordinatorState state);
    void syncStarted(int pending);
    void recordSettled(qint64 id, offgrid::sync::SinkStatus status);
    void syncFinished(const offgrid::sync::SyncResult& result);

private:
    using Lane = std::pair<EntityType, std::string>;

    struct Pass {
        SyncResult result;
        std::vector<SyncCompletion> waiters;
        std::vector<int64_t> pending_ids;  // snapshot, replay order
        std::set<Lane> busy_lanes;
        std::set<Lane> held_lanes;
        int outstanding = 0;
    };

    struct Send {
        int64_t record_id = 0;
        Lane lane;
        QPointer<QTimer> timer;
    };

    MutationQueue& queue_;
    RemoteSink& sink_;
    CoordinatorOptions options_;
    CoordinatorState state_ = CoordinatorState::Idle;
    std::optional<Pass> pass_;
    std::map<uint64_t, Send> sends_;  // by ticket
    uint64_t next_ticket_ = 0;
    bool pumping_ = false;
    bool repump_ = false;
    std::optional<SyncResult> last_result_;

    void set_state(CoordinatorState state);
    void pump();
    void dispatch(const MutationRecord& record, const Lane& lane);
    void settle(uint64_t ticket, const SinkOutcome& outcome);
    void settle_retryable(Pass& pass, const Send& send, const SinkOutcome& outcome);
    void settle_rejected(Pass& pass, const Send& send, Error error);
    void maybe_finish();
};

} // namespace offgrid::sync

Q_DECLARE_METATYPE(offgrid::sync::CoordinatorState)
