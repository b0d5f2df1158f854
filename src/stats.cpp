#include "stats.hpp"
#include "util.hpp"

#include <sstream>

namespace purgecord {

void to_json(nlohmann::json& j, const RunStatistics& stats) {
    j = nlohmann::json{
        {"completed", stats.completed},
        {"edited", stats.edited},
        {"failed", stats.failed},
        {"skipped", stats.skipped},
        {"rate_limited_events", stats.rate_limited_events},
        {"already_gone", stats.already_gone},
        {"search_failures", stats.search_failures},
        {"start_time", stats.start_time},
        {"end_time", stats.end_time}
    };
}

// Missing or non-numeric fields keep their zero default so older
// checkpoints still load.
void from_json(const nlohmann::json& j, RunStatistics& stats) {
    auto read = [&j](const char* key, uint64_t& out) {
        if (j.contains(key) && j[key].is_number_unsigned())
            out = j[key].get<uint64_t>();
    };
    read("completed", stats.completed);
    read("edited", stats.edited);
    read("failed", stats.failed);
    read("skipped", stats.skipped);
    read("rate_limited_events", stats.rate_limited_events);
    read("already_gone", stats.already_gone);
    read("search_failures", stats.search_failures);
    read("start_time", stats.start_time);
    read("end_time", stats.end_time);
}

uint64_t run_duration(const RunStatistics& stats) {
    if (stats.start_time == 0 || stats.end_time < stats.start_time) return 0;
    return stats.end_time - stats.start_time;
}

std::string format_summary(const RunStatistics& stats) {
    std::ostringstream out;
    out << "Duration:       " << format_duration(run_duration(stats)) << "\n";
    if (stats.edited)
        out << "Edited:         " << stats.edited << "\n";
    out << "Deleted:        " << stats.completed << "\n"
        << "Already gone:   " << stats.already_gone << " (stale index entries)\n"
        << "Skipped:        " << stats.skipped << "\n"
        << "Failed:         " << stats.failed << "\n"
        << "Rate limited:   " << stats.rate_limited_events << " times\n";
    if (stats.search_failures)
        out << "Search errors:  " << stats.search_failures << " targets\n";
    return out.str();
}

std::string BatchSummary::to_string() const {
    std::string out;
    auto append = [&out](uint32_t n, const char* label) {
        if (n == 0) return;
        if (!out.empty()) out += ", ";
        out += std::to_string(n) + " " + label;
    };
    append(edited, "marked");
    append(deleted, "deleted");
    append(skipped, "skipped");
    if (out.empty()) out = "nothing processed";
    return out;
}

} // namespace purgecord
