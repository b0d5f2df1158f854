#include "backoff.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>

namespace purgecord {

BackoffController::BackoffController(Sleeper& sleeper, RunStatistics& stats)
    : sleeper_(sleeper), stats_(stats) {}

Throttle BackoffController::classify(const HttpResponse& resp) {
    if (resp.status_code == 429) return Throttle::RateLimited;
    if (resp.status_code == 202) return Throttle::NotIndexed;
    return Throttle::None;
}

double BackoffController::suggested_wait(const HttpResponse& resp, double fallback) {
    try {
        auto j = nlohmann::json::parse(resp.body);
        if (j.is_object() && j.contains("retry_after") && j["retry_after"].is_number()) {
            double w = j["retry_after"].get<double>();
            if (w >= 0) return std::min(w, kMaxSuggestedWait);
        }
    } catch (const nlohmann::json::parse_error&) {
        return fallback;
    }
    return fallback;
}

double BackoffController::wait_for(const HttpResponse& resp, double rate_limit_fallback) {
    switch (classify(resp)) {
        case Throttle::RateLimited:
            return suggested_wait(resp, rate_limit_fallback) * kRateLimitMultiplier;
        case Throttle::NotIndexed:
            return suggested_wait(resp, kNotIndexedFallback);
        case Throttle::None:
            break;
    }
    return 0;
}

bool BackoffController::handle(const HttpResponse& resp, const char* operation,
                               double rate_limit_fallback) {
    Throttle kind = classify(resp);
    if (kind == Throttle::None) return false;

    double wait = wait_for(resp, rate_limit_fallback);
    if (kind == Throttle::RateLimited) {
        stats_.rate_limited_events++;
        std::cerr << "[backoff] Rate limited on " << operation << ", waiting "
                  << wait << "s (retry_after="
                  << suggested_wait(resp, rate_limit_fallback) << "s)\n";
    } else {
        std::cerr << "[backoff] Channel not indexed yet, waiting " << wait << "s\n";
    }
    sleeper_.sleep_for(wait);
    return true;
}

} // namespace purgecord
