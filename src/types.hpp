#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace purgecord {

// Snowflake: 64-bit, time-ordered id
using Snowflake = uint64_t;

// Container sentinel for direct and group conversations
inline constexpr const char* kDirectContainer = "@me";

enum class TargetKind { Guild, Direct, Group };

inline const char* target_kind_to_string(TargetKind kind) {
    switch (kind) {
        case TargetKind::Guild: return "guild";
        case TargetKind::Direct: return "dm";
        case TargetKind::Group: return "group_dm";
    }
    return "guild";
}

struct Target {
    TargetKind kind = TargetKind::Guild;
    std::string container_id; // guild id, or "@me"
    std::string channel_id;
    std::string display_name;
    bool enabled = true;

    bool is_direct() const { return container_id == kDirectContainer; }
};

struct Message {
    Snowflake id = 0;
    std::string author_id;
    std::string content;
    bool pinned = false;
    std::string created_at; // ISO 8601 as delivered by the server
};

// Pagination state for one target. Lives only while the target is processed.
struct CursorState {
    std::optional<Snowflake> max_id; // exclusive upper bound; nullopt = newest
    uint32_t offset = 0;
    uint32_t empty_page_count = 0;

    // Move max_id below `oldest` and reset offset. Never moves the cursor
    // forward: the result is also below any previous max_id.
    // Returns false if nothing older than `oldest` can exist.
    bool advance_past(Snowflake oldest) {
        if (oldest == 0) return false;
        Snowflake next = oldest - 1;
        if (max_id && next >= *max_id) {
            if (*max_id == 0) return false;
            next = *max_id - 1;
        }
        max_id = next;
        offset = 0;
        return true;
    }
};

enum class ActionOutcome { Completed, AlreadyGone, Skipped, TransientFailure, PermanentFailure };

inline const char* outcome_to_string(ActionOutcome outcome) {
    switch (outcome) {
        case ActionOutcome::Completed: return "completed";
        case ActionOutcome::AlreadyGone: return "already_gone";
        case ActionOutcome::Skipped: return "skipped";
        case ActionOutcome::TransientFailure: return "transient_failure";
        case ActionOutcome::PermanentFailure: return "permanent_failure";
    }
    return "permanent_failure";
}

enum class ActionMode { DeleteOnly, MarkAndDelete, MarkOnly };

inline const char* mode_to_string(ActionMode mode) {
    switch (mode) {
        case ActionMode::DeleteOnly: return "off";
        case ActionMode::MarkAndDelete: return "mark_and_delete";
        case ActionMode::MarkOnly: return "mark_only";
    }
    return "off";
}

// Monotone counters for the whole run. Only the single execution flow mutates them.
struct RunStatistics {
    uint64_t completed = 0;
    uint64_t edited = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;
    uint64_t rate_limited_events = 0;
    uint64_t already_gone = 0;
    uint64_t search_failures = 0;
    uint64_t start_time = 0; // epoch seconds, 0 = not started
    uint64_t end_time = 0;
};

struct Checkpoint {
    size_t current_target_index = 0;
    RunStatistics statistics;
    std::string saved_at;
};

} // namespace purgecord
