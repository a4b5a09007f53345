#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "capabilities.hpp"
#include "clock.hpp"
#include "correlation_token.hpp"
#include "errors.hpp"

namespace mailhealth {

class DiagLogger;

enum class ProbeDirection { InternalToExternal, ExternalToInternal };

// "internal_to_external" / "external_to_internal", as used in metric names.
const char* to_string(ProbeDirection d);

enum class ProbeOutcome {
    Success,
    SendFailed,
    Timeout,
    ConnectionFailed,
    AuthenticationFailed,
    Error
};

const char* to_string(ProbeOutcome o);

// One directional send -> poll -> delete cycle.
struct ProbeAttempt {
    CorrelationToken token;
    ProbeDirection direction = ProbeDirection::InternalToExternal;
    WallTime started_at{};
    bool sent = false;
    bool received = false;
    ProbeOutcome outcome = ProbeOutcome::Error;
    std::optional<ErrorKind> error_kind;
    std::string detail;
    double elapsed_seconds = 0.0;
    int polls = 0;

    bool succeeded() const { return outcome == ProbeOutcome::Success; }
};

struct RoundTripOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds poll_interval{std::chrono::seconds(10)};
};

class RoundTripProbe {
public:
    RoundTripProbe(ProbeDirection direction, MailSender& sender, MailboxProbe& receiver,
                   std::string from_address, std::string to_address,
                   Clock& clock, RoundTripOptions opts, DiagLogger* log = nullptr);

    // Never throws: every failure is folded into the returned attempt.
    ProbeAttempt run();

    ProbeDirection direction() const { return direction_; }

private:
    ProbeMessage build_message(const ProbeAttempt& a) const;

    ProbeDirection direction_;
    MailSender& sender_;
    MailboxProbe& receiver_;
    std::string from_;
    std::string to_;
    Clock& clock_;
    RoundTripOptions opts_;
    DiagLogger* log_;
};

struct RoundTripResult {
    ProbeAttempt outbound; // internal -> external
    ProbeAttempt inbound;  // external -> internal
    WallTime checked_at{};

    double total_seconds() const { return outbound.elapsed_seconds + inbound.elapsed_seconds; }
    bool sending_works() const { return outbound.sent && inbound.sent; }
    bool receiving_works() const { return outbound.received && inbound.received; }

    // Both directions failed before anything was sent.
    static RoundTripResult failed(const std::string& detail, WallTime at);
};

// Full round trip: both directions, sequentially, always both.
class RoundTripCheck {
public:
    RoundTripCheck(RoundTripProbe& outbound, RoundTripProbe& inbound, Clock& clock,
                   DiagLogger* log = nullptr);

    RoundTripResult run();

private:
    RoundTripProbe& outbound_;
    RoundTripProbe& inbound_;
    Clock& clock_;
    DiagLogger* log_;
};

} // namespace mailhealth
