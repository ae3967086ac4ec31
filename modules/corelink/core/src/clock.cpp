#include "clock.h"
#include <algorithm>
#include <thread>

namespace p2plink {

void SteadyClock::sleepFor(Millis duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

bool poll_until(IClock& clock, Millis interval, Millis deadline,
                const std::function<bool()>& condition) {
    if (interval.count() <= 0) {
        interval = Millis(1);
    }
    const auto start = clock.now();
    const auto end = start + deadline;

    for (;;) {
        if (condition()) {
            return true;
        }
        const auto now = clock.now();
        if (now >= end) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<Millis>(end - now);
        clock.sleepFor(std::max(Millis(1), std::min(interval, remaining)));
    }
}

} // namespace p2plink
