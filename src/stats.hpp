#pragma once
#include "types.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace purgecord {

// JSON (de)serialization, picked up by nlohmann::json via ADL
void to_json(nlohmann::json& j, const RunStatistics& stats);
void from_json(const nlohmann::json& j, RunStatistics& stats);

// Elapsed seconds between start_time and end_time (0 if either is unset)
uint64_t run_duration(const RunStatistics& stats);

// Multi-line end-of-run summary
std::string format_summary(const RunStatistics& stats);

// Per-batch line, e.g. "2 marked, 5 deleted, 1 skipped"
struct BatchSummary {
    uint32_t edited = 0;
    uint32_t deleted = 0; // completed + already gone
    uint32_t skipped = 0; // skipped + failed

    std::string to_string() const;
};

} // namespace purgecord
