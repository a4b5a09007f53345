#include "round_trip_probe.hpp"

#include "bounded_poller.hpp"
#include "diag_logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mailhealth {

namespace {

// A mailbox attempt made at the deadline still gets this long.
constexpr std::chrono::milliseconds kFinalAttemptBudget{1000};

std::string fmt_seconds(double s) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << s;
    return oss.str();
}

double seconds_between(SteadyTime a, SteadyTime b) {
    return std::chrono::duration<double>(b - a).count();
}

ProbeOutcome outcome_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Authentication: return ProbeOutcome::AuthenticationFailed;
    case ErrorKind::Connection:     return ProbeOutcome::ConnectionFailed;
    case ErrorKind::Timeout:        return ProbeOutcome::Timeout;
    default:                        return ProbeOutcome::Error;
    }
}

} // namespace

const char* to_string(ProbeDirection d) {
    return d == ProbeDirection::InternalToExternal ? "internal_to_external" : "external_to_internal";
}

const char* to_string(ProbeOutcome o) {
    switch (o) {
    case ProbeOutcome::Success:              return "success";
    case ProbeOutcome::SendFailed:           return "send_failed";
    case ProbeOutcome::Timeout:              return "timeout";
    case ProbeOutcome::ConnectionFailed:     return "connection_failed";
    case ProbeOutcome::AuthenticationFailed: return "authentication_failed";
    case ProbeOutcome::Error:                return "error";
    }
    return "error";
}

RoundTripProbe::RoundTripProbe(ProbeDirection direction, MailSender& sender, MailboxProbe& receiver,
                               std::string from_address, std::string to_address,
                               Clock& clock, RoundTripOptions opts, DiagLogger* log)
    : direction_(direction),
      sender_(sender),
      receiver_(receiver),
      from_(std::move(from_address)),
      to_(std::move(to_address)),
      clock_(clock),
      opts_(opts),
      log_(log) {
    if (opts_.poll_interval.count() <= 0) throw std::invalid_argument("poll interval must be positive");
    if (opts_.timeout.count() <= 0) throw std::invalid_argument("round-trip timeout must be positive");
}

ProbeMessage RoundTripProbe::build_message(const ProbeAttempt& a) const {
    ProbeMessage msg;
    msg.from = from_;
    msg.to = to_;
    msg.subject = probe_subject(a.token);
    msg.body =
        "This is an automated test email from the mail health exporter service.\r\n"
        "\r\n"
        "Test ID: " + a.token.str() + "\r\n"
        "Direction: " + to_string(direction_) + "\r\n"
        "Timestamp: " + to_iso8601(a.started_at) + "\r\n"
        "\r\n"
        "This email should be automatically processed and deleted.\r\n";
    return msg;
}

ProbeAttempt RoundTripProbe::run() {
    // INIT
    ProbeAttempt a;
    a.token = new_token();
    a.direction = direction_;
    a.started_at = clock_.wall_now();
    const SteadyTime t0 = clock_.now();
    const std::string tag = std::string("direction=") + to_string(direction_) + " token=" + a.token.str();

    // SENT
    if (log_) log_->info("PROBE_SEND " + tag + " from=" + from_ + " to=" + to_);
    try {
        sender_.send(build_message(a));
        a.sent = true;
    } catch (const ExporterError& e) {
        a.error_kind = e.kind();
        a.detail = e.what();
    } catch (const std::exception& e) {
        a.detail = e.what();
    }
    if (!a.sent) {
        a.outcome = ProbeOutcome::SendFailed;
        a.elapsed_seconds = seconds_between(t0, clock_.now());
        if (log_)
            log_->error("PROBE_SEND_FAILED " + tag +
                        " kind=" + (a.error_kind ? to_string(*a.error_kind) : "unexpected") +
                        " detail=\"" + a.detail + "\"");
        return a;
    }

    // POLLING, MATCHED + CLEANUP happen inside find_and_delete
    std::optional<ErrorKind> last_error;
    std::string last_detail;
    const SteadyTime deadline = t0 + opts_.timeout;
    BoundedPoller poller(clock_, opts_.poll_interval, opts_.timeout);
    const PollResult res = poller.run_until(deadline, [&]() {
        const auto budget = std::max(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_.now()), kFinalAttemptBudget);
        try {
            const bool found = receiver_.find_and_delete(from_, a.token.str(), budget);
            last_error.reset();
            return found;
        } catch (const ExporterError& e) {
            last_error = e.kind();
            last_detail = e.what();
        } catch (const std::exception& e) {
            last_error = ErrorKind::Protocol;
            last_detail = e.what();
        }
        if (log_)
            log_->warn("PROBE_POLL_ERROR " + tag + " kind=" + to_string(*last_error) +
                       " detail=\"" + last_detail + "\"");
        return false;
    });

    a.polls = res.attempts;
    a.elapsed_seconds = seconds_between(t0, clock_.now());

    if (res.status == PollStatus::Found) {
        a.received = true;
        a.outcome = ProbeOutcome::Success;
        if (log_)
            log_->info("PROBE_MATCHED " + tag + " polls=" + std::to_string(a.polls) +
                       " elapsed_s=" + fmt_seconds(a.elapsed_seconds));
        return a;
    }

    // TIMED_OUT, unless the mailbox itself was unreachable until the end
    if (last_error) {
        a.error_kind = last_error;
        a.outcome = outcome_for(*last_error);
        a.detail = last_detail;
    } else {
        a.error_kind = ErrorKind::Timeout;
        a.outcome = ProbeOutcome::Timeout;
        a.detail = "message not observed within " +
                   std::to_string(std::chrono::duration_cast<std::chrono::seconds>(opts_.timeout).count()) + "s";
    }
    if (log_)
        log_->error("PROBE_NOT_RECEIVED " + tag + " outcome=" + to_string(a.outcome) +
                    " polls=" + std::to_string(a.polls) + " elapsed_s=" + fmt_seconds(a.elapsed_seconds) +
                    " detail=\"" + a.detail + "\"");
    return a;
}

RoundTripResult RoundTripResult::failed(const std::string& detail, WallTime at) {
    RoundTripResult r;
    r.checked_at = at;
    r.outbound.direction = ProbeDirection::InternalToExternal;
    r.inbound.direction = ProbeDirection::ExternalToInternal;
    for (ProbeAttempt* a : {&r.outbound, &r.inbound}) {
        a->started_at = at;
        a->outcome = ProbeOutcome::Error;
        a->detail = detail;
    }
    return r;
}

RoundTripCheck::RoundTripCheck(RoundTripProbe& outbound, RoundTripProbe& inbound, Clock& clock,
                               DiagLogger* log)
    : outbound_(outbound), inbound_(inbound), clock_(clock), log_(log) {}

RoundTripResult RoundTripCheck::run() {
    RoundTripResult r;
    if (log_) log_->info("ROUNDTRIP_START");
    r.outbound = outbound_.run();
    r.inbound = inbound_.run();
    r.checked_at = clock_.wall_now();
    if (log_)
        log_->info("ROUNDTRIP_DONE total_s=" + fmt_seconds(r.total_seconds()) +
                   " outbound=" + to_string(r.outbound.outcome) +
                   " inbound=" + to_string(r.inbound.outcome));
    return r;
}

} // namespace mailhealth
