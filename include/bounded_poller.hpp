#pragma once
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "clock.hpp"

namespace mailhealth {

enum class PollStatus { Found, TimedOut };

struct PollResult {
    PollStatus status = PollStatus::TimedOut;
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
};

// Calls `attempt` at t=0, then every `interval`, with a last call at the
// deadline, until it returns true. Never sleeps past the deadline.
// Throws std::invalid_argument for a non-positive interval.
class BoundedPoller {
public:
    BoundedPoller(Clock& clock, std::chrono::milliseconds interval, std::chrono::milliseconds timeout)
        : clock_(clock), interval_(interval), timeout_(timeout) {
        if (interval_.count() <= 0) throw std::invalid_argument("poll interval must be positive");
    }

    template <typename Fn>
    PollResult run(Fn&& attempt) {
        return run_until(clock_.now() + timeout_, std::forward<Fn>(attempt));
    }

    template <typename Fn>
    PollResult run_until(SteadyTime deadline, Fn&& attempt) {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;

        const SteadyTime start = clock_.now();
        PollResult res;
        for (;;) {
            ++res.attempts;
            if (attempt()) {
                res.status = PollStatus::Found;
                break;
            }
            const SteadyTime now = clock_.now();
            if (now >= deadline) {
                res.status = PollStatus::TimedOut;
                break;
            }
            auto remain = duration_cast<milliseconds>(deadline - now);
            if (remain.count() <= 0) remain = milliseconds(1);
            clock_.sleep_for(std::min(interval_, remain));
        }
        res.elapsed = duration_cast<milliseconds>(clock_.now() - start);
        return res;
    }

private:
    Clock& clock_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds timeout_;
};

} // namespace mailhealth
