#pragma once

namespace purgecord {

// Blocking wait, injectable so tests can record delays instead of taking them
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleep_for(double seconds) = 0;
};

class ThreadSleeper : public Sleeper {
public:
    void sleep_for(double seconds) override;
};

} // namespace purgecord
