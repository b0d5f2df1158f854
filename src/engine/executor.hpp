#pragma once
#include "context.hpp"
#include "../discord.hpp"
#include "../stats.hpp"
#include "../types.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace purgecord {

struct ExecutionResult {
    std::optional<Snowflake> oldest_processed_id; // unset if nothing was processed
    size_t processed = 0;
    bool cancelled = false;
    BatchSummary summary;
};

// Runs the mark/delete state machine over an eligible batch, in order.
// Every message ends in exactly one terminal statistic.
class ActionExecutor {
public:
    static constexpr double kTransientRetryDelay = 1.0;

    ActionExecutor(DiscordClient& client, RunContext& ctx);

    ExecutionResult execute(const Target& target, const std::vector<Message>& batch);

    // Up to max_retries attempts of one call. Throttle responses are waited
    // out by the backoff controller and count as a transient attempt.
    ActionOutcome with_retries(const char* operation, Snowflake message_id,
                               const std::function<HttpResponse()>& call);

private:
    void process_message(const Target& target, const Message& msg, BatchSummary& summary);

    // Returns false if the message reached a terminal state during marking
    bool mark_message(const Target& target, const Message& msg, BatchSummary& summary);
    void delete_message(const Target& target, const Message& msg, BatchSummary& summary);

    void pace();

    DiscordClient& client_;
    RunContext& ctx_;
};

} // namespace purgecord
