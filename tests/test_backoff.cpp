#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include "backoff.hpp"
#include "discord_fixtures.hpp"
#include "fake_sleeper.hpp"

using namespace purgecord;
using namespace purgecord::fixtures;

// ── classify ─────────────────────────────────────────────────────

TEST_CASE("BackoffController: classify recognises throttle statuses", "[backoff]") {
    REQUIRE(BackoffController::classify({429, ""}) == Throttle::RateLimited);
    REQUIRE(BackoffController::classify({202, ""}) == Throttle::NotIndexed);
    REQUIRE(BackoffController::classify({200, ""}) == Throttle::None);
    REQUIRE(BackoffController::classify({204, ""}) == Throttle::None);
    REQUIRE(BackoffController::classify({0, ""}) == Throttle::None);
}

// ── suggested_wait ───────────────────────────────────────────────

TEST_CASE("BackoffController: suggested_wait reads retry_after", "[backoff]") {
    REQUIRE(BackoffController::suggested_wait(rate_limited(2.5), 40) == 2.5);
}

TEST_CASE("BackoffController: suggested_wait falls back without a usable body", "[backoff]") {
    REQUIRE(BackoffController::suggested_wait({429, ""}, 40) == 40);
    REQUIRE(BackoffController::suggested_wait({429, "not json"}, 3) == 3);
    REQUIRE(BackoffController::suggested_wait({429, R"({"retry_after":"soon"})"}, 3) == 3);
    REQUIRE(BackoffController::suggested_wait({429, R"({"retry_after":-1})"}, 3) == 3);
    REQUIRE(BackoffController::suggested_wait({429, "[1,2]"}, 7) == 7);
}

TEST_CASE("BackoffController: huge retry_after is capped", "[backoff]") {
    HttpResponse huge{429, R"({"retry_after":1e300})"};
    REQUIRE(BackoffController::suggested_wait(huge, 3) == BackoffController::kMaxSuggestedWait);
    REQUIRE(BackoffController::wait_for(huge, 3) == 2 * BackoffController::kMaxSuggestedWait);
}

TEST_CASE("BackoffController: wait_for doubles rate limits only", "[backoff]") {
    REQUIRE(BackoffController::wait_for(rate_limited(5), 40) == 10);
    REQUIRE(BackoffController::wait_for(not_indexed(5), 40) == 5);
    REQUIRE(BackoffController::wait_for({202, ""}, 40) == BackoffController::kNotIndexedFallback);
    REQUIRE(BackoffController::wait_for({200, "{}"}, 40) == 0);
}

// ── handle ───────────────────────────────────────────────────────

TEST_CASE("BackoffController: rate limit blocks for twice the suggested wait", "[backoff]") {
    FakeSleeper sleeper;
    RunStatistics stats;
    BackoffController backoff(sleeper, stats);

    REQUIRE(backoff.handle(rate_limited(5), "delete", BackoffController::kActionRateLimitFallback));
    REQUIRE(sleeper.waits.size() == 1);
    REQUIRE(sleeper.waits[0] >= 10);
    REQUIRE(stats.rate_limited_events == 1);
}

TEST_CASE("BackoffController: rate limit without body uses the caller's fallback", "[backoff]") {
    FakeSleeper sleeper;
    RunStatistics stats;
    BackoffController backoff(sleeper, stats);

    REQUIRE(backoff.handle({429, ""}, "search", BackoffController::kSearchRateLimitFallback));
    REQUIRE(sleeper.waits == std::vector<double>{80});

    REQUIRE(backoff.handle({429, ""}, "edit", BackoffController::kActionRateLimitFallback));
    REQUIRE(sleeper.waits.back() == 6);
    REQUIRE(stats.rate_limited_events == 2);
}

TEST_CASE("BackoffController: not indexed waits without counting a rate limit", "[backoff]") {
    FakeSleeper sleeper;
    RunStatistics stats;
    BackoffController backoff(sleeper, stats);

    REQUIRE(backoff.handle(not_indexed(3), "search", BackoffController::kSearchRateLimitFallback));
    REQUIRE(sleeper.waits == std::vector<double>{3});
    REQUIRE(stats.rate_limited_events == 0);
}

TEST_CASE("BackoffController: ordinary responses pass through", "[backoff]") {
    FakeSleeper sleeper;
    RunStatistics stats;
    BackoffController backoff(sleeper, stats);

    REQUIRE_FALSE(backoff.handle({200, "{}"}, "search", 40));
    REQUIRE_FALSE(backoff.handle({404, ""}, "delete", 3));
    REQUIRE_FALSE(backoff.handle({0, ""}, "delete", 3));
    REQUIRE(sleeper.waits.empty());
    REQUIRE(stats.rate_limited_events == 0);
}
