#include "runner.hpp"
#include "filter.hpp"
#include "../util.hpp"
#include <iostream>
#include <utility>

namespace purgecord {

const char* runner_state_to_string(RunnerState state) {
    switch (state) {
        case RunnerState::Idle: return "idle";
        case RunnerState::Running: return "running";
        case RunnerState::Checkpointed: return "checkpointed";
        case RunnerState::AllDone: return "all_done";
        case RunnerState::Cancelled: return "cancelled";
    }
    return "idle";
}

BatchRunner::BatchRunner(DiscordClient& client, const Config& config, std::string author_id,
                         ProgressStore& progress, Sleeper& sleeper, CancelToken& cancel)
    : config_(config), progress_(progress),
      ctx_(config.settings, std::move(author_id), cancel, sleeper),
      paginator_(client, ctx_), executor_(client, ctx_) {}

void BatchRunner::checkpoint() {
    // Dry runs change nothing server-side, so there is nothing to resume
    if (config_.settings.dry_run) return;
    progress_.save(index_, ctx_.stats);
}

const RunStatistics& BatchRunner::run(bool resume) {
    const auto& targets = config_.targets;
    index_ = 0;

    if (resume) {
        auto cp = progress_.load();
        if (cp) {
            index_ = cp->current_target_index;
            ctx_.stats = cp->statistics;
            std::cerr << "[runner] Resuming at target " << index_ << " (checkpoint from "
                      << (cp->saved_at.empty() ? "unknown time" : cp->saved_at) << ")\n";
            if (index_ > targets.size()) {
                std::cerr << "[runner] Checkpoint index " << index_ << " exceeds "
                          << targets.size() << " targets\n";
                index_ = targets.size();
            }
        } else {
            std::cerr << "[runner] No checkpoint at " << progress_.path()
                      << ", starting from the first target\n";
        }
    }

    ctx_.stats.start_time = epoch_seconds();
    ctx_.stats.end_time = 0;

    while (index_ < targets.size()) {
        if (ctx_.cancel.cancelled()) {
            state_ = RunnerState::Cancelled;
            break;
        }

        state_ = RunnerState::Running;
        std::cout << "\n[" << (index_ + 1) << "/" << targets.size()
                  << "] Processing target...\n";

        TargetResult result = process_target(targets[index_]);
        if (result == TargetResult::Cancelled) {
            state_ = RunnerState::Cancelled;
            break;
        }
        if (result == TargetResult::Failed) {
            ctx_.stats.search_failures++;
            std::cerr << "[runner] Giving up on " << targets[index_].display_name
                      << " after search errors\n";
        }

        index_++;
        checkpoint();
        state_ = RunnerState::Checkpointed;
    }

    ctx_.stats.end_time = epoch_seconds();
    if (state_ == RunnerState::Cancelled) {
        std::cerr << "[runner] Stop requested, saving progress at target " << index_ << "\n";
        checkpoint();
    } else {
        state_ = RunnerState::AllDone;
    }
    return ctx_.stats;
}

void BatchRunner::preview(const std::vector<Message>& batch) const {
    std::cout << "\n[DRY RUN] Would " << (config_.settings.mode == ActionMode::MarkOnly
                                             ? "mark:" : "delete:") << "\n";
    size_t shown = 0;
    for (const auto& msg : batch) {
        if (shown == 5) break;
        std::string date = msg.created_at.empty() ? "unknown" : msg.created_at.substr(0, 10);
        std::string content = msg.content.empty() ? "[no content]" : msg.content.substr(0, 50);
        std::cout << "  - " << date << ": " << content << "\n";
        shown++;
    }
    if (batch.size() > shown)
        std::cout << "  ... and " << (batch.size() - shown) << " more\n";
}

TargetResult BatchRunner::process_target(const Target& target) {
    const std::string rule(60, '-');
    std::cout << "\n" << rule << "\nTarget: " << target.display_name << " ("
              << target_kind_to_string(target.kind) << ")\n" << rule << "\n";

    CursorState cursor;
    uint64_t found = 0;

    while (true) {
        PageResult page = paginator_.fetch_next_page(target, cursor);
        switch (page.status) {
            case PageResult::Status::Exhausted:
                return TargetResult::Exhausted;
            case PageResult::Status::Cancelled:
                return TargetResult::Cancelled;
            case PageResult::Status::Failed:
                return TargetResult::Failed;
            case PageResult::Status::Batch:
                break;
        }

        found += page.candidates.size();
        std::cout << "Found " << page.candidates.size() << " messages to process\n"
                  << "Total found so far: " << found << " / ~" << page.total_estimate << "\n";

        bool more = true;
        if (config_.settings.dry_run) {
            preview(page.candidates);
            more = cursor.advance_past(oldest_id(page.candidates));
        } else {
            ExecutionResult result = executor_.execute(target, page.candidates);
            if (result.oldest_processed_id) {
                more = cursor.advance_past(*result.oldest_processed_id);
                if (more) {
                    std::cerr << "[runner] Cursor advanced: max_id=" << *cursor.max_id
                              << " (" << result.summary.to_string() << ")\n";
                }
            }
            std::cout << "Batch done: " << result.summary.to_string() << "\n";
            if (result.cancelled) return TargetResult::Cancelled;
        }
        if (!more) return TargetResult::Exhausted;

        std::cout << "Waiting " << config_.settings.search_delay << "s before next search...\n";
        ctx_.sleeper.sleep_for(config_.settings.search_delay);
    }
}

} // namespace purgecord
