#include "sync/mutation_queue.hpp"
#include "layout/grid_layout.hpp"
#include "support/logging.hpp"
#include "sync/payload.hpp"
#include <QString>
#include <algorithm>

namespace offgrid::sync {

namespace {

QString describe(const MutationRecord& record) {
    return QStringLiteral("%1 %2/%3")
        .arg(QString::fromUtf8(to_string(record.operation).data()),
             QString::fromUtf8(to_string(record.entity_type).data()),
             QString::fromStdString(record.entity_id));
}

std::vector<Widget>::iterator find_widget(std::vector<Widget>& widgets, const std::string& id) {
    return std::find_if(widgets.begin(), widgets.end(),
                        [&](const Widget& w) { return w.id == id; });
}

bool was_sent(const MutationRecord& record) {
    return record.attempts > 0;
}

// Widget geometry merges per component so a partial edit keeps the rest.
Result<std::string> merge_record_payloads(const MutationRecord& older, const MutationRecord& newer) {
    if (newer.entity_type == EntityType::Widget) {
        return merge_widget_payloads(older.payload_json, newer.payload_json);
    }
    return merge_payloads(older.payload_json, newer.payload_json);
}

} // namespace

MutationQueue::MutationQueue(storage::QueueStore& store, QObject* parent)
    : QObject(parent)
    , store_(store)
{
}

Result<void> MutationQueue::load() {
    return reload();
}

Result<void> MutationQueue::reload() {
    auto loaded = store_.load_all();
    if (loaded.is_err()) {
        qCWarning(offgridQueueLog) << "reload failed:"
                                   << QString::fromStdString(loaded.unwrap_err().describe());
        return Result<void>::err(loaded.unwrap_err());
    }

    const int before = pending_count();
    records_ = std::move(loaded).unwrap();

    // Ids that vanished were settled elsewhere; forget their in-flight marks.
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        const bool present = std::any_of(records_.begin(), records_.end(),
                                         [&](const MutationRecord& r) { return r.id == *it; });
        it = present ? std::next(it) : in_flight_.erase(it);
    }

    qCDebug(offgridQueueLog) << "loaded" << pending_count() << "pending records";
    notify_if_changed(before);
    return Result<void>::ok();
}

std::optional<MutationRecord> MutationQueue::find(int64_t id) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const MutationRecord& r) { return r.id == id; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return *it;
}

void MutationQueue::set_in_flight(int64_t id, bool in_flight) {
    if (in_flight) {
        in_flight_.insert(id);
    } else {
        in_flight_.erase(id);
    }
}

Result<void> MutationQueue::validate(const MutationRecord& record) const {
    if (record.entity_id.empty()) {
        return Result<void>::err(Error::invalid_argument("Mutation has an empty entity id"));
    }
    if (record.entity_type == EntityType::LinkTag &&
        (record.operation == MutationOp::Update || record.operation == MutationOp::Reorder)) {
        return Result<void>::err(Error::invalid_argument(
            "Link-tag associations can only be created or deleted"));
    }

    auto payload = parse_payload(record.payload_json);
    if (payload.is_err()) {
        return Result<void>::err(payload.unwrap_err());
    }

    return validate_widget_geometry(record);
}

Result<void> MutationQueue::validate_widget_geometry(const MutationRecord& record) const {
    if (record.entity_type != EntityType::Widget || record.operation == MutationOp::Delete) {
        return Result<void>::ok();
    }

    auto payload = parse_payload(record.payload_json);
    if (payload.is_err()) {
        return Result<void>::err(payload.unwrap_err());
    }
    auto geometry_result = extract_geometry(payload.unwrap());
    if (geometry_result.is_err()) {
        return Result<void>::err(geometry_result.unwrap_err());
    }
    const auto geometry = geometry_result.unwrap();

    if (geometry.empty()) {
        if (record.operation == MutationOp::Reorder) {
            return Result<void>::err(Error::invalid_geometry(
                "Reorder of widget " + record.entity_id + " carries no geometry"));
        }
        return Result<void>::ok();
    }

    if (geometry.size) {
        auto size_ok = layout::validate_size(*geometry.size);
        if (size_ok.is_err()) {
            return size_ok;
        }
    }
    if (geometry.position && (geometry.position->x < 0 || geometry.position->y < 0)) {
        return Result<void>::err(Error::invalid_geometry(
            "Widget " + record.entity_id + " has a negative position"));
    }

    auto snapshot = effective_layout();
    std::optional<GridPosition> position = geometry.position;
    std::optional<GridSize> size = geometry.size;
    auto self = find_widget(snapshot.widgets, record.entity_id);
    if (self != snapshot.widgets.end()) {
        if (!position) position = self->position;
        if (!size) size = self->size;
        snapshot.widgets.erase(self);
    }

    if (!position || !size) {
        // Not enough known about the widget to test it against the grid.
        return Result<void>::ok();
    }

    if (!layout::is_within_bounds(*position, *size, snapshot.bounds)) {
        return Result<void>::err(Error::invalid_geometry(
            "Widget " + record.entity_id + " at (" + std::to_string(position->x) + "," +
            std::to_string(position->y) + ") size " + std::to_string(size->width) + "x" +
            std::to_string(size->height) + " is outside the grid"));
    }

    if (record.operation == MutationOp::Create && snapshot.bounds.is_finite() &&
        layout::total_area(snapshot.widgets) + size->area() > snapshot.bounds.capacity()) {
        return Result<void>::err(Error::placement_conflict(
            "Widget " + record.entity_id + " does not fit: grid capacity exceeded"));
    }

    for (const auto& other : snapshot.widgets) {
        if (layout::overlaps(*position, *size, other.position, other.size)) {
            return Result<void>::err(Error::placement_conflict(
                "Widget " + record.entity_id + " would overlap widget " + other.id));
        }
    }

    return Result<void>::ok();
}

LayoutSnapshot MutationQueue::effective_layout() const {
    LayoutSnapshot snapshot = layout_source_ ? layout_source_()
                                             : LayoutSnapshot{{}, GridBounds::unbounded()};

    for (const auto& record : records_) {
        if (record.entity_type != EntityType::Widget) continue;

        auto existing = find_widget(snapshot.widgets, record.entity_id);
        if (record.operation == MutationOp::Delete) {
            if (existing != snapshot.widgets.end()) {
                snapshot.widgets.erase(existing);
            }
            continue;
        }

        auto payload = parse_payload(record.payload_json);
        if (payload.is_err()) continue;
        auto geometry = extract_geometry(payload.unwrap());
        if (geometry.is_err() || geometry.unwrap().empty()) continue;
        const auto& g = geometry.unwrap();

        if (existing != snapshot.widgets.end()) {
            if (g.position) existing->position = *g.position;
            if (g.size) existing->size = *g.size;
        } else if (g.position && g.size) {
            Widget widget;
            widget.id = record.entity_id;
            widget.type = payload.unwrap().value(QStringLiteral("type")).toString().toStdString();
            widget.position = *g.position;
            widget.size = *g.size;
            widget.created_at = record.created_at;
            snapshot.widgets.push_back(std::move(widget));
        }
    }

    return snapshot;
}

Result<storage::QueueEdit> MutationQueue::plan(const MutationRecord& record) const {
    storage::QueueEdit edit;

    const bool entity_in_flight = std::any_of(
        records_.begin(), records_.end(),
        [&](const MutationRecord& r) { return r.same_entity(record) && is_in_flight(r.id); });

    switch (record.operation) {
        case MutationOp::Create:
            edit.append = record;
            break;

        case MutationOp::Delete: {
            bool cancels_create = false;
            bool maybe_on_sink = entity_in_flight;
            for (const auto& r : records_) {
                if (!r.same_entity(record) || is_in_flight(r.id)) continue;
                edit.removals.push_back(r.id);
                if (was_sent(r)) {
                    maybe_on_sink = true;
                } else if (r.operation == MutationOp::Create) {
                    cancels_create = true;
                }
            }
            // The entity never reached the sink: nothing to delete there.
            if (!cancels_create || maybe_on_sink) {
                edit.append = record;
            }
            break;
        }

        case MutationOp::Update:
        case MutationOp::Reorder: {
            const MutationRecord* target = nullptr;
            for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
                if (!it->same_entity(record)) continue;
                if (is_in_flight(it->id) || it->operation == MutationOp::Delete) break;
                if (it->operation == MutationOp::Create) {
                    // A create that was sent may already exist remotely; a
                    // replay of it is absorbed, so later fields must follow it.
                    if (!was_sent(*it)) target = &*it;
                    break;
                }
                if (it->operation == record.operation) {
                    target = &*it;
                    break;
                }
            }

            if (!target) {
                edit.append = record;
                break;
            }

            auto merged = merge_record_payloads(*target, record);
            if (merged.is_err()) {
                return Result<storage::QueueEdit>::err(merged.unwrap_err());
            }
            if (target->operation == MutationOp::Create) {
                MutationRecord folded = *target;
                folded.payload_json = std::move(merged).unwrap();
                edit.rewrites.push_back(std::move(folded));
            } else {
                MutationRecord appended = record;
                appended.payload_json = std::move(merged).unwrap();
                edit.removals.push_back(target->id);
                edit.append = std::move(appended);
            }
            break;
        }
    }

    return Result<storage::QueueEdit>::ok(std::move(edit));
}

Result<int> MutationQueue::enqueue(MutationRecord record) {
    record.id = 0;
    record.attempts = 0;
    record.last_error.reset();
    record.last_attempt_at.reset();
    if (record.payload_json.empty()) {
        record.payload_json = "{}";
    }
    if (record.created_at.is_epoch()) {
        record.created_at = Timestamp::now();
    }

    auto valid = validate(record);
    if (valid.is_err()) {
        qCInfo(offgridQueueLog) << "rejected" << describe(record) << "-"
                                << QString::fromStdString(valid.unwrap_err().describe());
        return Result<int>::err(valid.unwrap_err());
    }

    auto edit_result = plan(record);
    if (edit_result.is_err()) {
        return Result<int>::err(edit_result.unwrap_err());
    }
    const auto edit = std::move(edit_result).unwrap();

    auto applied = store_.apply(edit);
    if (applied.is_err()) {
        qCWarning(offgridQueueLog) << "enqueue of" << describe(record) << "not persisted:"
                                   << QString::fromStdString(applied.unwrap_err().describe());
        return Result<int>::err(applied.unwrap_err());
    }

    const int before = pending_count();
    commit_edit(edit, applied.unwrap());
    const int delta = pending_count() - before;

    if (!edit.removals.empty() || !edit.rewrites.empty() || !edit.append) {
        qCDebug(offgridQueueLog) << "coalesced" << describe(record)
                                 << "removed=" << edit.removals.size()
                                 << "rewritten=" << edit.rewrites.size()
                                 << "appended=" << edit.append.has_value();
    } else {
        qCDebug(offgridQueueLog) << "queued" << describe(record) << "id=" << applied.unwrap().value_or(0);
    }

    notify_if_changed(before);
    return Result<int>::ok(delta);
}

void MutationQueue::commit_edit(const storage::QueueEdit& edit, std::optional<int64_t> appended_id) {
    if (!edit.removals.empty()) {
        std::erase_if(records_, [&](const MutationRecord& r) {
            return std::find(edit.removals.begin(), edit.removals.end(), r.id) != edit.removals.end();
        });
    }
    for (const auto& rewritten : edit.rewrites) {
        auto it = std::find_if(records_.begin(), records_.end(),
                               [&](const MutationRecord& r) { return r.id == rewritten.id; });
        if (it != records_.end()) {
            *it = rewritten;
        }
    }
    if (edit.append && appended_id) {
        MutationRecord appended = *edit.append;
        appended.id = *appended_id;
        records_.push_back(std::move(appended));
    }
}

Result<void> MutationQueue::remove(int64_t id) {
    auto removed = store_.remove(id);
    if (removed.is_err()) {
        qCWarning(offgridQueueLog) << "remove of record" << id << "failed:"
                                   << QString::fromStdString(removed.unwrap_err().describe());
        return removed;
    }

    const int before = pending_count();
    std::erase_if(records_, [&](const MutationRecord& r) { return r.id == id; });
    in_flight_.erase(id);
    notify_if_changed(before);
    return Result<void>::ok();
}

Result<MutationRecord> MutationQueue::mark_failed(int64_t id, const std::string& error) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const MutationRecord& r) { return r.id == id; });
    if (it == records_.end()) {
        return Result<MutationRecord>::err(Error{ErrorKind::NotFound,
            "Queue record " + std::to_string(id) + " does not exist"});
    }

    const int attempts = it->attempts + 1;
    const auto at = Timestamp::now();
    auto stored = store_.record_failure(id, attempts, error, at);
    if (stored.is_err()) {
        return Result<MutationRecord>::err(stored.unwrap_err());
    }

    it->attempts = attempts;
    it->last_error = error;
    it->last_attempt_at = at;
    return Result<MutationRecord>::ok(*it);
}

Result<void> MutationQueue::clear() {
    auto cleared = store_.clear();
    if (cleared.is_err()) {
        return cleared;
    }

    const int before = pending_count();
    records_.clear();
    in_flight_.clear();
    qCInfo(offgridQueueLog) << "cleared" << before << "pending records";
    notify_if_changed(before);
    return Result<void>::ok();
}

void MutationQueue::notify_if_changed(int before) {
    if (pending_count() != before) {
        emit pendingCountChanged(pending_count());
    }
}

} // namespace offgrid::sync
