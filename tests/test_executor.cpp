#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include "engine/executor.hpp"
#include "discord_fixtures.hpp"
#include "fake_sleeper.hpp"
#include "mock_http_client.hpp"
#include <memory>

using namespace purgecord;
using namespace purgecord::fixtures;

namespace {

Message message(Snowflake id, const std::string& content = "hello") {
    Message m;
    m.id = id;
    m.author_id = kSelfId;
    m.content = content;
    return m;
}

struct ExecutorFixture {
    MockHttpClient http;
    FakeSleeper sleeper;
    CancelToken cancel;
    Settings settings;
    DiscordClient client{"tok", http, kApiBase};
    std::unique_ptr<RunContext> ctx;
    std::unique_ptr<ActionExecutor> executor;
    Target target = guild_target("900");

    explicit ExecutorFixture(ActionMode mode = ActionMode::DeleteOnly) {
        settings.mode = mode;
        ctx = std::make_unique<RunContext>(settings, kSelfId, cancel, sleeper);
        executor = std::make_unique<ActionExecutor>(client, *ctx);
    }

    ExecutionResult run(const std::vector<Message>& batch) {
        return executor->execute(target, batch);
    }

    const RunStatistics& stats() const { return ctx->stats; }
};

} // namespace

// ── delete_only ──────────────────────────────────────────────────

TEST_CASE("ActionExecutor: deletes a batch in order", "[executor]") {
    ExecutorFixture f;
    f.http.next_response = no_content();

    auto r = f.run({message(300), message(200), message(100)});

    REQUIRE(f.http.urls("DELETE") == std::vector<std::string>{
        "https://api.test/v9/channels/900/messages/300",
        "https://api.test/v9/channels/900/messages/200",
        "https://api.test/v9/channels/900/messages/100",
    });
    REQUIRE(f.stats().completed == 3);
    REQUIRE(r.oldest_processed_id == Snowflake{100});
    REQUIRE(r.processed == 3);
    REQUIRE_FALSE(r.cancelled);
    REQUIRE(r.summary.deleted == 3);
    REQUIRE(f.sleeper.waits == std::vector<double>{1, 1, 1});
}

TEST_CASE("ActionExecutor: already deleted messages cost no delay", "[executor]") {
    ExecutorFixture f;
    f.http.response_queue = {not_found(), no_content()};

    auto r = f.run({message(20), message(10)});
    REQUIRE(f.stats().already_gone == 1);
    REQUIRE(f.stats().completed == 1);
    REQUIRE(f.stats().failed == 0);
    REQUIRE(r.summary.deleted == 2);
    REQUIRE(f.sleeper.waits == std::vector<double>{1});
}

TEST_CASE("ActionExecutor: rate limited delete is retried and counted once", "[executor]") {
    ExecutorFixture f;
    f.http.response_queue = {rate_limited(5), no_content()};

    f.run({message(77)});

    auto deletes = f.http.urls("DELETE");
    REQUIRE(deletes.size() == 2);
    REQUIRE(deletes[0] == deletes[1]);
    REQUIRE(f.stats().completed == 1);
    REQUIRE(f.stats().rate_limited_events == 1);
    REQUIRE(f.stats().failed == 0);
    REQUIRE(f.sleeper.waits.at(0) >= 10);
}

TEST_CASE("ActionExecutor: transient failures exhaust into a failure", "[executor]") {
    ExecutorFixture f;
    f.http.next_response = {500, "oops"};

    auto r = f.run({message(5)});
    REQUIRE(f.http.count("DELETE") == 3);
    REQUIRE(f.stats().failed == 1);
    REQUIRE(f.stats().completed == 0);
    REQUIRE(r.summary.skipped == 1);
    // 1s between attempts, then the per-message delay
    REQUIRE(f.sleeper.waits == std::vector<double>{1, 1, 1});
}

TEST_CASE("ActionExecutor: transient failure then success", "[executor]") {
    ExecutorFixture f;
    f.http.response_queue = {{0, ""}, no_content()};

    f.run({message(5)});
    REQUIRE(f.stats().completed == 1);
    REQUIRE(f.stats().failed == 0);
}

TEST_CASE("ActionExecutor: forbidden and archived messages are skipped without retry", "[executor]") {
    ExecutorFixture f;
    f.http.response_queue = {
        {403, R"({"code":50013})"},
        {400, R"({"code":50083,"message":"Thread is archived"})"},
    };

    auto r = f.run({message(2), message(1)});
    REQUIRE(f.http.count("DELETE") == 2);
    REQUIRE(f.stats().skipped == 2);
    REQUIRE(r.summary.skipped == 2);
}

TEST_CASE("ActionExecutor: other bad requests fail without retry", "[executor]") {
    ExecutorFixture f;
    f.http.next_response = {400, R"({"code":50035})"};

    f.run({message(2)});
    REQUIRE(f.http.count("DELETE") == 1);
    REQUIRE(f.stats().failed == 1);
}

TEST_CASE("ActionExecutor: every message ends in exactly one counter", "[executor]") {
    ExecutorFixture f;
    f.http.response_queue = {
        no_content(), not_found(), {403, ""}, {400, "{}"},
        {500, ""}, {500, ""}, {500, ""},
    };

    f.run({message(5), message(4), message(3), message(2), message(1)});
    const auto& s = f.stats();
    REQUIRE(s.completed + s.already_gone + s.skipped + s.failed == 5);
    REQUIRE(s.completed == 1);
    REQUIRE(s.already_gone == 1);
    REQUIRE(s.skipped == 1);
    REQUIRE(s.failed == 2);
}

// ── mark_and_delete ──────────────────────────────────────────────

TEST_CASE("ActionExecutor: marks then deletes", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.response_queue = {edited(), no_content()};

    auto r = f.run({message(9)});
    REQUIRE(f.http.calls.size() == 2);
    REQUIRE(f.http.calls[0].method == "PATCH");
    REQUIRE(nlohmann::json::parse(f.http.calls[0].body)["content"] == kDefaultMarkerText);
    REQUIRE(f.http.calls[1].method == "DELETE");
    REQUIRE(f.stats().edited == 1);
    REQUIRE(f.stats().completed == 1);
    REQUIRE(r.summary.to_string() == "1 marked, 1 deleted");
    REQUIRE(f.sleeper.waits == std::vector<double>{1, 1});
}

TEST_CASE("ActionExecutor: already marked messages go straight to delete", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.next_response = no_content();

    f.run({message(9, kDefaultMarkerText)});
    REQUIRE(f.http.count("PATCH") == 0);
    REQUIRE(f.http.count("DELETE") == 1);
    REQUIRE(f.stats().edited == 0);
}

TEST_CASE("ActionExecutor: message gone during marking is not deleted", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.next_response = not_found();

    f.run({message(9)});
    REQUIRE(f.http.count("DELETE") == 0);
    REQUIRE(f.stats().already_gone == 1);
    REQUIRE(f.sleeper.waits.empty());
}

TEST_CASE("ActionExecutor: forbidden edit is terminal for the message", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.response_queue = {{403, ""}};

    f.run({message(9)});
    REQUIRE(f.http.count("PATCH") == 1);
    REQUIRE(f.http.count("DELETE") == 0);
    REQUIRE(f.stats().skipped == 1);
    REQUIRE(f.stats().failed == 0);
}

TEST_CASE("ActionExecutor: rejected edit still deletes the message", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.response_queue = {{403, ""}, {400, R"({"code":50035})"}, no_content()};

    f.run({message(9), message(8)});
    REQUIRE(f.http.count("PATCH") == 2);
    REQUIRE(f.http.urls("DELETE") == std::vector<std::string>{
        "https://api.test/v9/channels/900/messages/8",
    });
    REQUIRE(f.stats().skipped == 1);
    REQUIRE(f.stats().completed == 1);
    REQUIRE(f.stats().edited == 0);
    REQUIRE(f.stats().failed == 0);
    // one pace for the skipped message, one after the delete
    REQUIRE(f.sleeper.waits == std::vector<double>{1, 1});
}

TEST_CASE("ActionExecutor: edit retries exhausted falls through to delete", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.response_queue = {{500, ""}, {500, ""}, {500, ""}, no_content()};

    auto r = f.run({message(9)});
    REQUIRE(f.http.count("PATCH") == 3);
    REQUIRE(f.http.count("DELETE") == 1);
    REQUIRE(f.stats().completed == 1);
    REQUIRE(f.stats().failed == 0);
    REQUIRE(r.summary.deleted == 1);
    // two transient retry delays, then the delete pace
    REQUIRE(f.sleeper.waits == std::vector<double>{1, 1, 1});
}

TEST_CASE("ActionExecutor: failed edit and failed delete count once", "[executor]") {
    ExecutorFixture f(ActionMode::MarkAndDelete);
    f.http.response_queue = {{400, R"({"code":50035})"}, {400, R"({"code":50035})"}};

    f.run({message(9)});
    REQUIRE(f.http.count("DELETE") == 1);
    REQUIRE(f.stats().failed == 1);
    REQUIRE(f.stats().completed + f.stats().skipped + f.stats().already_gone == 0);
}

// ── mark_only ────────────────────────────────────────────────────

TEST_CASE("ActionExecutor: mark_only never deletes", "[executor]") {
    ExecutorFixture f(ActionMode::MarkOnly);
    f.http.response_queue = {edited(), not_found(), {503, ""}, {503, ""}, {503, ""}};

    auto r = f.run({message(30), message(20, kDefaultMarkerText), message(15), message(10)});
    REQUIRE(f.http.count("DELETE") == 0);
    REQUIRE(f.http.count("PATCH") == 5);
    REQUIRE(f.stats().edited == 1);
    REQUIRE(f.stats().skipped == 1);
    REQUIRE(f.stats().already_gone == 1);
    REQUIRE(f.stats().failed == 1);
    REQUIRE(r.oldest_processed_id == Snowflake{10});
}

TEST_CASE("ActionExecutor: mark_only applies one delay per message", "[executor]") {
    ExecutorFixture f(ActionMode::MarkOnly);
    f.http.next_response = edited();

    f.run({message(2), message(1)});
    REQUIRE(f.sleeper.waits == std::vector<double>{1, 1});
}

// ── with_retries ─────────────────────────────────────────────────

TEST_CASE("ActionExecutor: with_retries stops at the first resolved outcome", "[executor]") {
    ExecutorFixture f;
    int calls = 0;
    auto outcome = f.executor->with_retries("delete", 1, [&calls]() -> HttpResponse {
        calls++;
        return calls < 2 ? HttpResponse{502, ""} : HttpResponse{404, ""};
    });
    REQUIRE(outcome == ActionOutcome::AlreadyGone);
    REQUIRE(calls == 2);
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("ActionExecutor: cancellation stops between messages", "[executor]") {
    ExecutorFixture f;
    f.http.next_response = no_content();
    f.http.on_call = [&f](const RecordedCall&) { f.cancel.cancel(); };

    auto r = f.run({message(300), message(200), message(100)});
    REQUIRE(r.cancelled);
    REQUIRE(r.processed == 1);
    REQUIRE(r.oldest_processed_id == Snowflake{300});
    // The in-flight message is fully resolved
    REQUIRE(f.stats().completed == 1);
    REQUIRE(f.http.count("DELETE") == 1);
}

TEST_CASE("ActionExecutor: empty batch does nothing", "[executor]") {
    ExecutorFixture f;
    auto r = f.run({});
    REQUIRE_FALSE(r.oldest_processed_id.has_value());
    REQUIRE(r.summary.to_string() == "nothing processed");
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("ActionExecutor: outcome and target kind names", "[executor]") {
    REQUIRE(std::string(outcome_to_string(ActionOutcome::AlreadyGone)) == "already_gone");
    REQUIRE(std::string(outcome_to_string(ActionOutcome::PermanentFailure)) == "permanent_failure");
    REQUIRE(std::string(target_kind_to_string(TargetKind::Direct)) == "dm");
    REQUIRE(std::string(target_kind_to_string(TargetKind::Group)) == "group_dm");
}
