#pragma once

#include "core/mutation.hpp"
#include "core/result.hpp"
#include "core/widget.hpp"
#include "storage/queue_store.hpp"
#include <QObject>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace offgrid::sync {

/**
 * LayoutSnapshot - The widget layout the host currently shows.
 */
struct LayoutSnapshot {
    std::vector<Widget> widgets;
    GridBounds bounds;
};

using LayoutSource = std::function<LayoutSnapshot()>;

/**
 * MutationQueue - Ordered, coalescing buffer of offline edits.
 *
 * The in-memory list mirrors the pending_mutations table. Every enqueue
 * computes the coalesced queue state first, persists it in one transaction
 * and only then updates memory, so a storage failure leaves both sides as
 * they were.
 *
 * Coalescing rules for a new record on entity E:
 * - update: merged into the latest pending create of E, or replaces the
 *   latest pending update of E with the merged payload at the tail
 * - reorder: folded into a pending create of E, or replaces the latest
 *   pending reorder of E with the merged payload at the tail
 * - delete: drops every pending record of E; when one of them was a
 *   create that was never sent and nothing of E is in flight or was
 *   sent before, the delete is dropped as well
 * Records marked in flight are never touched; the new record is appended.
 * A create with attempts > 0 may exist remotely, so nothing is folded into
 * it. Widget geometry merges position and size separately.
 */
class MutationQueue : public QObject {
    Q_OBJECT

public:
    explicit MutationQueue(storage::QueueStore& store, QObject* parent = nullptr);

    /**
     * Read the persisted queue. Called once before use.
     */
    [[nodiscard]] Result<void> load();

    /**
     * Validate, coalesce and persist `record`. Returns the change in
     * pending_count() (negative when a delete cancelled earlier records).
     */
    [[nodiscard]] Result<int> enqueue(MutationRecord record);

    [[nodiscard]] int pending_count() const { return static_cast<int>(records_.size()); }

    /**
     * All records in replay order. Nothing is removed.
     */
    [[nodiscard]] std::vector<MutationRecord> drain() const { return records_; }

    [[nodiscard]] std::optional<MutationRecord> find(int64_t id) const;

    [[nodiscard]] Result<void> remove(int64_t id);

    /**
     * Bump attempts and store `error` as last_error. Returns the updated
     * record.
     */
    [[nodiscard]] Result<MutationRecord> mark_failed(int64_t id, const std::string& error);

    /**
     * Replace the in-memory list with what is persisted. Used after the
     * queue was flushed by something other than this process.
     */
    [[nodiscard]] Result<void> reload();

    [[nodiscard]] Result<void> clear();

    void set_in_flight(int64_t id, bool in_flight);
    [[nodiscard]] bool is_in_flight(int64_t id) const { return in_flight_.count(id) > 0; }

    void set_layout_source(LayoutSource source) { layout_source_ = std::move(source); }

    /**
     * The host's layout with pending widget edits applied: queued creates
     * and geometry changes are placed, widgets with a pending delete are
     * left out.
     */
    [[nodiscard]] LayoutSnapshot effective_layout() const;

signals:
    void pendingCountChanged(int count);

private:
    storage::QueueStore& store_;
    std::vector<MutationRecord> records_;
    std::set<int64_t> in_flight_;
    LayoutSource layout_source_;

    [[nodiscard]] Result<void> validate(const MutationRecord& record) const;
    [[nodiscard]] Result<void> validate_widget_geometry(const MutationRecord& record) const;
    [[nodiscard]] Result<storage::QueueEdit> plan(const MutationRecord& record) const;
    void commit_edit(const storage::QueueEdit& edit, std::optional<int64_t> appended_id);
    void notify_if_changed(int before);
};

} // namespace offgrid::sync
