#include "filter.hpp"
#include <algorithm>

namespace purgecord {

FilterOptions FilterOptions::from_settings(const Settings& settings,
                                           const std::string& author_id) {
    FilterOptions opts;
    opts.author_id = author_id;
    opts.skip_pinned = settings.skip_pinned;
    opts.skip_marked = settings.skip_marked;
    opts.marker_text = settings.marker_text;
    return opts;
}

FilterResult filter_messages(const std::vector<Message>& hits, const FilterOptions& options) {
    FilterResult result;
    for (const auto& msg : hits) {
        if (msg.author_id != options.author_id) continue;
        result.all_hits.push_back(msg);

        if (options.skip_pinned && msg.pinned) continue;
        if (options.skip_marked && msg.content == options.marker_text) continue;
        result.eligible.push_back(msg);
    }
    return result;
}

Snowflake oldest_id(const std::vector<Message>& messages) {
    auto it = std::min_element(messages.begin(), messages.end(),
        [](const Message& a, const Message& b) { return a.id < b.id; });
    return it == messages.end() ? 0 : it->id;
}

} // namespace purgecord
