#pragma once
#include <atomic>

namespace purgecord {

// Cooperative stop request. cancel() is async-signal-safe; the engine only
// polls cancelled() between messages, pages and targets.
class CancelToken {
public:
    void cancel() noexcept { flag_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

} // namespace purgecord
