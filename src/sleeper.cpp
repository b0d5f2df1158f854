#include "sleeper.hpp"

#include <chrono>
#include <thread>

namespace purgecord {

void ThreadSleeper::sleep_for(double seconds) {
    if (seconds <= 0) return;
    auto ms = static_cast<long>(seconds * 1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace purgecord
