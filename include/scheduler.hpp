#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

#include "clock.hpp"
#include "metrics_registry.hpp"
#include "round_trip_probe.hpp"
#include "spam_score_probe.hpp"

namespace mailhealth {

class DiagLogger;

struct SchedulerOptions {
    std::chrono::milliseconds round_trip_interval{std::chrono::seconds(300)};
    std::chrono::milliseconds spam_interval{std::chrono::seconds(300)};
};

// First slot start + k*interval (k >= 1) strictly after now; start itself when
// now is still before it. A tick that overruns skips the slots it missed.
// Throws std::invalid_argument for a non-positive interval.
SteadyTime next_tick_after(SteadyTime start, std::chrono::milliseconds interval, SteadyTime now);

// Drives the round-trip check and the spam-score probe on two independent
// threads and folds every outcome into the registry. A check never overlaps
// with itself.
class Scheduler {
public:
    Scheduler(RoundTripCheck& round_trip, SpamScoreProbe& spam, MetricsRegistry& registry,
              Clock& clock, SchedulerOptions opts, DiagLogger* log = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // One guarded round trip. Anything escaping the check is recorded as a
    // failure of both directions.
    RoundTripResult run_round_trip_tick();

    // One guarded spam attempt. The attempt time is remembered whenever the
    // probe did I/O, whether or not it produced a score.
    SpamCheckOutcome run_spam_score_tick();

    std::optional<WallTime> last_spam_attempt() const;

    void start();
    // Wakes both loops and joins them; a tick in flight finishes first.
    void stop();
    bool running() const;

private:
    template <typename Tick>
    void loop(const char* name, std::chrono::milliseconds interval, Tick tick);

    RoundTripCheck& round_trip_;
    SpamScoreProbe& spam_;
    MetricsRegistry& registry_;
    Clock& clock_;
    SchedulerOptions opts_;
    DiagLogger* log_;

    mutable std::mutex state_mu_;
    std::optional<WallTime> last_spam_attempt_;

    mutable std::mutex loop_mu_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    bool started_ = false;
    std::thread round_trip_thread_;
    std::thread spam_thread_;
};

} // namespace mailhealth
