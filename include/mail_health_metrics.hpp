#pragma once
#include <memory>
#include <optional>
#include <string>

#include "clock.hpp"
#include "metrics_registry.hpp"
#include "round_trip_probe.hpp"
#include "spam_score_probe.hpp"

namespace mailhealth {
namespace metric {

constexpr const char* kSendInternalToExternalSuccess    = "mail_health_exporter__send_internal_to_external_success_total";
constexpr const char* kSendInternalToExternalFailures   = "mail_health_exporter__send_internal_to_external_failures_total";
constexpr const char* kReceiveInternalToExternalSuccess = "mail_health_exporter__receive_internal_to_external_success_total";
constexpr const char* kReceiveInternalToExternalFailures= "mail_health_exporter__receive_internal_to_external_failures_total";
constexpr const char* kSendExternalToInternalSuccess    = "mail_health_exporter__send_external_to_internal_success_total";
constexpr const char* kSendExternalToInternalFailures   = "mail_health_exporter__send_external_to_internal_failures_total";
constexpr const char* kReceiveExternalToInternalSuccess = "mail_health_exporter__receive_external_to_internal_success_total";
constexpr const char* kReceiveExternalToInternalFailures= "mail_health_exporter__receive_external_to_internal_failures_total";
constexpr const char* kSendingWorking       = "mail_health_exporter__sending_mails_working";
constexpr const char* kReceivingWorking     = "mail_health_exporter__receiving_mails_working";
constexpr const char* kRoundTripDuration    = "mail_health_exporter__roundtrip_duration_seconds";
constexpr const char* kLastRoundTripCheck   = "mail_health_exporter__last_send_receive_check_timestamp";
constexpr const char* kSpamScore            = "mail_health_exporter__spam_score";
constexpr const char* kLastSpamScoreCheck   = "mail_health_exporter__last_spam_score_check_timestamp";

} // namespace metric

// Registry preloaded with the fourteen exporter metrics. Working gauges start
// at 1 and both check timestamps at `start`, so a fresh process reads healthy.
std::unique_ptr<MetricsRegistry> make_mail_health_registry(WallTime start);

// Per direction exactly one send and one receive counter moves; a direction
// whose send failed counts as a failed receive as well.
void record_round_trip(MetricsRegistry& reg, const RoundTripResult& result);

// Only a scored result updates the score and its timestamp.
void record_spam_score(MetricsRegistry& reg, const SpamScoreResult& result);

// Read-only view handed to the status page.
struct StatusSnapshot {
    bool sending_works = false;
    bool receiving_works = false;
    double spam_score = 0.0;
    double sending_updated = 0.0;   // unix seconds
    double receiving_updated = 0.0;
    double spam_updated = 0.0;
    std::string spam_test_url;
};

StatusSnapshot status_snapshot(const MetricsRegistry& reg, const std::string& spam_test_url);

} // namespace mailhealth
