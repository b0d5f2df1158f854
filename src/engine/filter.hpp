#pragma once
#include "../config.hpp"
#include "../types.hpp"
#include <string>
#include <vector>

namespace purgecord {

struct FilterOptions {
    std::string author_id;
    bool skip_pinned = false;
    bool skip_marked = false;
    std::string marker_text;

    static FilterOptions from_settings(const Settings& settings, const std::string& author_id);
};

struct FilterResult {
    std::vector<Message> all_hits; // authored by the current user
    std::vector<Message> eligible; // all_hits minus pinned/marked exclusions
};

// Pure partition of one page of hits. Order is preserved.
FilterResult filter_messages(const std::vector<Message>& hits, const FilterOptions& options);

// Smallest id in a non-empty list
Snowflake oldest_id(const std::vector<Message>& messages);

} // namespace purgecord
