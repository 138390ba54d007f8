#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace offgrid {

/**
 * EntityType - Kinds of dashboard entities an offline edit can touch.
 */
enum class EntityType {
    Link,
    Category,
    Tag,
    Widget,
    LinkTag
};

/**
 * MutationOp - What the edit does to its entity.
 */
enum class MutationOp {
    Create,
    Update,
    Delete,
    Reorder
};

[[nodiscard]] constexpr std::string_view to_string(EntityType type) noexcept {
    switch (type) {
        case EntityType::Link: return "link";
        case EntityType::Category: return "category";
        case EntityType::Tag: return "tag";
        case EntityType::Widget: return "widget";
        case EntityType::LinkTag: return "link-tag";
    }
    return "link";
}

[[nodiscard]] constexpr std::string_view to_string(MutationOp op) noexcept {
    switch (op) {
        case MutationOp::Create: return "create";
        case MutationOp::Update: return "update";
        case MutationOp::Delete: return "delete";
        case MutationOp::Reorder: return "reorder";
    }
    return "create";
}

[[nodiscard]] inline std::optional<EntityType> parse_entity_type(std::string_view s) {
    if (s == "link") return EntityType::Link;
    if (s == "category") return EntityType::Category;
    if (s == "tag") return EntityType::Tag;
    if (s == "widget") return EntityType::Widget;
    if (s == "link-tag" || s == "link-tag-association") return EntityType::LinkTag;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<MutationOp> parse_mutation_op(std::string_view s) {
    if (s == "create") return MutationOp::Create;
    if (s == "update") return MutationOp::Update;
    if (s == "delete") return MutationOp::Delete;
    if (s == "reorder") return MutationOp::Reorder;
    return std::nullopt;
}

/**
 * MutationRecord - One pending offline edit.
 *
 * id is assigned by the queue store on first persistence (0 before that)
 * and defines replay order. payload_json is always a JSON object.
 */
struct MutationRecord {
    int64_t id{0};
    EntityType entity_type{EntityType::Link};
    std::string entity_id;
    MutationOp operation{MutationOp::Create};
    std::string payload_json{"{}"};
    Timestamp created_at;
    int attempts{0};
    std::optional<std::string> last_error;
    std::optional<Timestamp> last_attempt_at;

    [[nodiscard]] bool same_entity(const MutationRecord& other) const {
        return entity_type == other.entity_type && entity_id == other.entity_id;
    }
};

/**
 * Build a not-yet-persisted record stamped with the current time.
 */
[[nodiscard]] inline MutationRecord make_mutation(EntityType type,
                                                  std::string entity_id,
                                                  MutationOp op,
                                                  std::string payload_json = "{}") {
    MutationRecord record;
    record.entity_type = type;
    record.entity_id = std::move(entity_id);
    record.operation = op;
    record.payload_json = std::move(payload_json);
    record.created_at = Timestamp::now();
    return record;
}

} // namespace offgrid
