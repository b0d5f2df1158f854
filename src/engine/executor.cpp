#include "executor.hpp"
#include <iostream>

namespace purgecord {

ActionExecutor::ActionExecutor(DiscordClient& client, RunContext& ctx)
    : client_(client), ctx_(ctx) {}

void ActionExecutor::pace() {
    ctx_.sleeper.sleep_for(ctx_.settings.delete_delay);
}

ActionOutcome ActionExecutor::with_retries(const char* operation, Snowflake message_id,
                                           const std::function<HttpResponse()>& call) {
    uint32_t max_attempts = ctx_.settings.max_retries;
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        auto resp = call();

        ActionOutcome outcome;
        if (ctx_.backoff.handle(resp, operation, BackoffController::kActionRateLimitFallback))
            outcome = ActionOutcome::TransientFailure;
        else
            outcome = DiscordClient::classify_action(resp);

        if (outcome != ActionOutcome::TransientFailure) {
            if (outcome == ActionOutcome::PermanentFailure) {
                std::cerr << "[executor] " << operation << " " << message_id << " "
                          << outcome_to_string(outcome) << " (HTTP " << resp.status_code
                          << "): " << resp.body << "\n";
            }
            return outcome;
        }

        std::cerr << "[executor] " << operation << " " << message_id << " attempt "
                  << attempt << "/" << max_attempts << " failed (HTTP "
                  << resp.status_code << ")\n";
        if (attempt < max_attempts) ctx_.sleeper.sleep_for(kTransientRetryDelay);
    }
    std::cerr << "[executor] " << operation << " " << message_id << " "
              << outcome_to_string(ActionOutcome::PermanentFailure)
              << " after " << max_attempts << " attempts\n";
    return ActionOutcome::PermanentFailure;
}

bool ActionExecutor::mark_message(const Target& target, const Message& msg,
                                  BatchSummary& summary) {
    if (msg.content == ctx_.settings.marker_text) {
        if (ctx_.settings.mode == ActionMode::MarkOnly) {
            // Nothing to do: the message already carries the marker
            ctx_.stats.skipped++;
            summary.skipped++;
        }
        return true;
    }

    auto outcome = with_retries("edit", msg.id, [&] {
        return client_.edit_message(target.channel_id, msg.id, ctx_.settings.marker_text);
    });

    switch (outcome) {
        case ActionOutcome::Completed:
            ctx_.stats.edited++;
            summary.edited++;
            if (ctx_.settings.mode == ActionMode::MarkAndDelete) pace();
            return true;
        case ActionOutcome::AlreadyGone:
            ctx_.stats.already_gone++;
            summary.deleted++;
            return false;
        case ActionOutcome::Skipped:
            std::cerr << "[executor] Cannot edit " << msg.id
                      << " (forbidden or archived thread), skipping\n";
            ctx_.stats.skipped++;
            summary.skipped++;
            pace();
            return false;
        case ActionOutcome::TransientFailure:
        case ActionOutcome::PermanentFailure:
            if (ctx_.settings.mode == ActionMode::MarkAndDelete) {
                // The delete's outcome is the one that gets counted
                std::cerr << "[executor] Edit of " << msg.id << " "
                          << outcome_to_string(outcome) << ", deleting anyway\n";
                return true;
            }
            ctx_.stats.failed++;
            summary.skipped++;
            pace();
            return false;
    }
    return false;
}

void ActionExecutor::delete_message(const Target& target, const Message& msg,
                                    BatchSummary& summary) {
    auto outcome = with_retries("delete", msg.id, [&] {
        return client_.delete_message(target.channel_id, msg.id);
    });

    switch (outcome) {
        case ActionOutcome::Completed:
            ctx_.stats.completed++;
            summary.deleted++;
            break;
        case ActionOutcome::AlreadyGone:
            // Stale index entry; no API cost worth pacing for
            ctx_.stats.already_gone++;
            summary.deleted++;
            return;
        case ActionOutcome::Skipped:
            std::cerr << "[executor] Cannot delete " << msg.id
                      << " (forbidden or archived thread), skipping\n";
            ctx_.stats.skipped++;
            summary.skipped++;
            break;
        case ActionOutcome::TransientFailure:
        case ActionOutcome::PermanentFailure:
            ctx_.stats.failed++;
            summary.skipped++;
            break;
    }
    pace();
}

void ActionExecutor::process_message(const Target& target, const Message& msg,
                                     BatchSummary& summary) {
    ActionMode mode = ctx_.settings.mode;

    if (mode != ActionMode::DeleteOnly) {
        if (!mark_message(target, msg, summary)) return;
        if (mode == ActionMode::MarkOnly) {
            pace();
            return;
        }
    }
    delete_message(target, msg, summary);
}

ExecutionResult ActionExecutor::execute(const Target& target,
                                        const std::vector<Message>& batch) {
    ExecutionResult result;
    for (const auto& msg : batch) {
        if (ctx_.cancel.cancelled()) {
            result.cancelled = true;
            break;
        }
        if (!result.oldest_processed_id || msg.id < *result.oldest_processed_id)
            result.oldest_processed_id = msg.id;

        process_message(target, msg, result.summary);
        result.processed++;
    }
    return result;
}

} // namespace purgecord
