#pragma once
#include "http.hpp"
#include "sleeper.hpp"
#include "types.hpp"

namespace purgecord {

enum class Throttle { None, RateLimited, NotIndexed };

// Interprets throttle responses (429 rate limited, 202 index not ready) and
// performs the wait. Never gives up: handle() either waits and asks for a
// retry or reports that the response was not a throttle signal. Retry caps
// belong to the caller.
class BackoffController {
public:
    static constexpr double kRateLimitMultiplier = 2.0;
    static constexpr double kNotIndexedFallback = 5.0;
    static constexpr double kSearchRateLimitFallback = 40.0;
    static constexpr double kActionRateLimitFallback = 3.0;
    static constexpr double kMaxSuggestedWait = 3600.0;

    BackoffController(Sleeper& sleeper, RunStatistics& stats);

    static Throttle classify(const HttpResponse& resp);

    // "retry_after" from the response body, or fallback if absent/invalid.
    // Capped at kMaxSuggestedWait.
    static double suggested_wait(const HttpResponse& resp, double fallback);

    // Wait the controller would block for on this response (0 if none)
    static double wait_for(const HttpResponse& resp, double rate_limit_fallback);

    // Returns true after blocking if resp was a throttle signal; the caller
    // must then reissue the identical request.
    bool handle(const HttpResponse& resp, const char* operation,
                double rate_limit_fallback);

private:
    Sleeper& sleeper_;
    RunStatistics& stats_;
};

} // namespace purgecord
