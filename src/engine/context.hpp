#pragma once
#include "../backoff.hpp"
#include "../cancel.hpp"
#include "../config.hpp"
#include "../sleeper.hpp"
#include "../types.hpp"
#include <string>
#include <utility>

namespace purgecord {

// Mutable state of one run, owned by BatchRunner and lent by reference to
// the paginator and executor. Replaces process-wide counters and flags.
struct RunContext {
    RunContext(const Settings& settings, std::string author_id,
               CancelToken& cancel, Sleeper& sleeper)
        : settings(settings), author_id(std::move(author_id)),
          cancel(cancel), sleeper(sleeper), backoff(sleeper, stats) {}

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    const Settings& settings;
    std::string author_id;
    RunStatistics stats;
    CancelToken& cancel;
    Sleeper& sleeper;
    BackoffController backoff; // must follow stats
};

} // namespace purgecord
