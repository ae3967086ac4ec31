#ifndef P2PLINK_CLOCK_H
#define P2PLINK_CLOCK_H

#include <chrono>
#include <functional>

namespace p2plink {

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

// Source of time for everything that waits. Tests substitute a virtual clock.
class IClock {
public:
    virtual ~IClock() = default;
    virtual Clock::time_point now() const = 0;
    virtual void sleepFor(Millis duration) = 0;
};

class SteadyClock : public IClock {
public:
    Clock::time_point now() const override { return Clock::now(); }
    void sleepFor(Millis duration) override;
};

/**
 * Bounded poll loop: evaluates `condition` every `interval` until it returns
 * true or `deadline` (measured from the call) has elapsed.
 *
 * The condition is always evaluated at least once, and once more at the
 * deadline. Sleeps are clipped to the remaining time, so the call returns
 * no later than deadline + one condition evaluation.
 *
 * @return true if the condition was met, false on timeout.
 */
bool poll_until(IClock& clock, Millis interval, Millis deadline,
                const std::function<bool()>& condition);

} // namespace p2plink

#endif // P2PLINK_CLOCK_H
