#pragma once
#include "context.hpp"
#include "filter.hpp"
#include "../discord.hpp"
#include "../types.hpp"
#include <optional>
#include <vector>

namespace purgecord {

struct PageResult {
    enum class Status {
        Batch,     // candidates hold eligible messages
        Exhausted, // no more messages for this target
        Cancelled, // stop requested at a page boundary
        Failed     // search endpoint unusable for this target
    };

    Status status = Status::Exhausted;
    std::vector<Message> candidates;
    uint64_t total_estimate = 0;
};

// Walks one target backward through time with a max_id cursor. Pages that
// yield nothing actionable are absorbed here; only a non-empty eligible
// batch or a terminal status reaches the caller. Advancing the cursor past
// a delivered batch is the caller's job.
class CursorPaginator {
public:
    static constexpr uint32_t kMaxEmptyPages = 3;

    CursorPaginator(DiscordClient& client, RunContext& ctx);

    PageResult fetch_next_page(const Target& target, CursorState& cursor);

private:
    enum class SearchStatus { Ok, Retry, Failed };

    // One search request; throttles are waited out and reported as Retry
    SearchStatus search_once(const Target& target, const CursorState& cursor,
                             uint32_t& transient_failures, SearchPage& page);

    DiscordClient& client_;
    RunContext& ctx_;
    FilterOptions filter_;
};

} // namespace purgecord
