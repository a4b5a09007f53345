#include "scheduler.hpp"

#include "diag_logger.hpp"
#include "mail_health_metrics.hpp"

#include <stdexcept>

namespace mailhealth {

namespace {

long long to_seconds(std::chrono::milliseconds d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

} // namespace

SteadyTime next_tick_after(SteadyTime start, std::chrono::milliseconds interval, SteadyTime now) {
    if (interval.count() <= 0) throw std::invalid_argument("scheduler interval must be positive");
    if (now < start) return start;

    const auto step = std::chrono::duration_cast<SteadyTime::duration>(interval);
    const auto k = (now - start) / step + 1;
    return start + step * k;
}

Scheduler::Scheduler(RoundTripCheck& round_trip, SpamScoreProbe& spam, MetricsRegistry& registry,
                     Clock& clock, SchedulerOptions opts, DiagLogger* log)
    : round_trip_(round_trip), spam_(spam), registry_(registry), clock_(clock), opts_(opts), log_(log) {}

Scheduler::~Scheduler() {
    stop();
}

RoundTripResult Scheduler::run_round_trip_tick() {
    RoundTripResult r;
    try {
        r = round_trip_.run();
    } catch (const std::exception& e) {
        if (log_) log_->error(std::string("ROUNDTRIP_TICK_FAILED detail=\"") + e.what() + "\"");
        r = RoundTripResult::failed(e.what(), clock_.wall_now());
    }
    record_round_trip(registry_, r);
    return r;
}

SpamCheckOutcome Scheduler::run_spam_score_tick() {
    const WallTime now = clock_.wall_now();
    const std::optional<WallTime> last = last_spam_attempt();

    SpamCheckOutcome out;
    try {
        out = spam_.attempt(last, now);
    } catch (const std::exception& e) {
        if (log_) log_->error(std::string("SPAM_TICK_FAILED detail=\"") + e.what() + "\"");
        out = SpamCheckOutcome();
        out.status = SpamCheckOutcome::Status::Failed;
        out.detail = e.what();
    }

    if (out.performed_io()) {
        std::lock_guard<std::mutex> lock(state_mu_);
        last_spam_attempt_ = now;
    }
    if (out.scored() && out.result) record_spam_score(registry_, *out.result);
    return out;
}

std::optional<WallTime> Scheduler::last_spam_attempt() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return last_spam_attempt_;
}

template <typename Tick>
void Scheduler::loop(const char* name, std::chrono::milliseconds interval, Tick tick) {
    const SteadyTime start = clock_.now();
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(loop_mu_);
            if (stop_requested_) break;
        }
        tick();

        const SteadyTime next = next_tick_after(start, interval, clock_.now());
        if (log_ && log_->enabled(LogLevel::Debug))
            log_->debug(std::string("SCHEDULER_WAIT loop=") + name + " next_in_ms=" +
                        std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(next - clock_.now()).count()));

        std::unique_lock<std::mutex> lock(loop_mu_);
        if (wake_.wait_until(lock, next, [this] { return stop_requested_; })) break;
    }
    if (log_) log_->info(std::string("SCHEDULER_LOOP_EXIT loop=") + name);
}

void Scheduler::start() {
    {
        std::lock_guard<std::mutex> lock(loop_mu_);
        if (started_) return;
        started_ = true;
        stop_requested_ = false;
    }
    if (log_)
        log_->info("SCHEDULER_START round_trip_interval_s=" + std::to_string(to_seconds(opts_.round_trip_interval)) +
                   " spam_interval_s=" + std::to_string(to_seconds(opts_.spam_interval)));

    round_trip_thread_ = std::thread([this] {
        loop("round_trip", opts_.round_trip_interval, [this] { run_round_trip_tick(); });
    });
    spam_thread_ = std::thread([this] {
        loop("spam_score", opts_.spam_interval, [this] { run_spam_score_tick(); });
    });
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mu_);
        if (!started_) return;
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (round_trip_thread_.joinable()) round_trip_thread_.join();
    if (spam_thread_.joinable()) spam_thread_.join();

    std::lock_guard<std::mutex> lock(loop_mu_);
    started_ = false;
}

bool Scheduler::running() const {
    std::lock_guard<std::mutex> lock(loop_mu_);
    return started_ && !stop_requested_;
}

} // namespace mailhealth
