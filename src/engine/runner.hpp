#pragma once
#include "context.hpp"
#include "executor.hpp"
#include "paginator.hpp"
#include "../config.hpp"
#include "../discord.hpp"
#include "../progress.hpp"
#include <string>
#include <vector>

namespace purgecord {

enum class RunnerState { Idle, Running, Checkpointed, AllDone, Cancelled };

enum class TargetResult { Exhausted, Cancelled, Failed };

const char* runner_state_to_string(RunnerState state);

// Drives the configured targets in order. A checkpoint is written after each
// finished target and on cancellation; a cancelled target is redone in full
// on the next resume.
class BatchRunner {
public:
    BatchRunner(DiscordClient& client, const Config& config, std::string author_id,
                ProgressStore& progress, Sleeper& sleeper, CancelToken& cancel);

    // Process targets from the checkpoint (resume) or from index 0.
    // Returns the final statistics.
    const RunStatistics& run(bool resume);

    // Page through one target until it is exhausted, fails or is cancelled
    TargetResult process_target(const Target& target);

    const RunStatistics& statistics() const { return ctx_.stats; }
    RunnerState state() const { return state_; }
    size_t current_target_index() const { return index_; }

private:
    void preview(const std::vector<Message>& batch) const;
    void checkpoint();

    const Config& config_;
    ProgressStore& progress_;
    RunContext ctx_;
    CursorPaginator paginator_;
    ActionExecutor executor_;
    RunnerState state_ = RunnerState::Idle;
    size_t index_ = 0;
};

} // namespace purgecord
