#include "mail_health_metrics.hpp"

#include <vector>

namespace mailhealth {

namespace {

MetricDescriptor counter(const char* name, const char* help) {
    MetricDescriptor d;
    d.name = name;
    d.help = help;
    d.type = MetricType::Counter;
    return d;
}

MetricDescriptor gauge(const char* name, const char* help, double initial,
                       const char* timestamp_metric = "") {
    MetricDescriptor d;
    d.name = name;
    d.help = help;
    d.type = MetricType::Gauge;
    d.initial = initial;
    d.timestamp_metric = timestamp_metric;
    return d;
}

struct DirectionCounters {
    const char* send_ok;
    const char* send_fail;
    const char* recv_ok;
    const char* recv_fail;
};

DirectionCounters counters_for(ProbeDirection d) {
    using namespace metric;
    if (d == ProbeDirection::InternalToExternal)
        return {kSendInternalToExternalSuccess, kSendInternalToExternalFailures,
                kReceiveInternalToExternalSuccess, kReceiveInternalToExternalFailures};
    return {kSendExternalToInternalSuccess, kSendExternalToInternalFailures,
            kReceiveExternalToInternalSuccess, kReceiveExternalToInternalFailures};
}

void record_attempt(MetricsRegistry& reg, const ProbeAttempt& a) {
    const DirectionCounters c = counters_for(a.direction);
    reg.increment_counter(a.sent ? c.send_ok : c.send_fail);
    reg.increment_counter(a.received ? c.recv_ok : c.recv_fail);
}

} // namespace

std::unique_ptr<MetricsRegistry> make_mail_health_registry(WallTime start) {
    using namespace metric;
    const double t0 = to_unix_seconds(start);

    std::vector<MetricDescriptor> d;
    d.push_back(counter(kSendInternalToExternalSuccess, "Total successful mail sends from internal to external"));
    d.push_back(counter(kSendInternalToExternalFailures, "Total failed mail sends from internal to external"));
    d.push_back(counter(kReceiveInternalToExternalSuccess, "Total successful mail receives from internal to external"));
    d.push_back(counter(kReceiveInternalToExternalFailures, "Total failed mail receives from internal to external"));
    d.push_back(counter(kSendExternalToInternalSuccess, "Total successful mail sends from external to internal"));
    d.push_back(counter(kSendExternalToInternalFailures, "Total failed mail sends from external to internal"));
    d.push_back(counter(kReceiveExternalToInternalSuccess, "Total successful mail receives from external to internal"));
    d.push_back(counter(kReceiveExternalToInternalFailures, "Total failed mail receives from external to internal"));
    d.push_back(gauge(kSendingWorking, "Status whether the server is able to send mails or not",
                      1.0, kLastRoundTripCheck));
    d.push_back(gauge(kReceivingWorking, "Status whether the server is able to receive mails or not",
                      1.0, kLastRoundTripCheck));
    d.push_back(gauge(kRoundTripDuration, "Duration of last full internal->external->internal mail roundtrip",
                      0.0, kLastRoundTripCheck));
    d.push_back(gauge(kLastRoundTripCheck, "Timestamp of last send-receive check", t0));
    d.push_back(gauge(kSpamScore, "Spam score of send mails", 0.0, kLastSpamScoreCheck));
    d.push_back(gauge(kLastSpamScoreCheck, "Timestamp of last spam-score check", t0));

    return std::make_unique<MetricsRegistry>(std::move(d));
}

void record_round_trip(MetricsRegistry& reg, const RoundTripResult& result) {
    using namespace metric;
    record_attempt(reg, result.outbound);
    record_attempt(reg, result.inbound);

    const double ts = to_unix_seconds(result.checked_at);
    reg.set_gauge(kSendingWorking, result.sending_works() ? 1.0 : 0.0, ts);
    reg.set_gauge(kReceivingWorking, result.receiving_works() ? 1.0 : 0.0, ts);
    reg.set_gauge(kRoundTripDuration, result.total_seconds(), ts);
}

void record_spam_score(MetricsRegistry& reg, const SpamScoreResult& result) {
    reg.set_gauge(metric::kSpamScore, result.score, to_unix_seconds(result.checked_at));
}

StatusSnapshot status_snapshot(const MetricsRegistry& reg, const std::string& spam_test_url) {
    using namespace metric;
    StatusSnapshot s;
    for (const MetricSample& m : reg.snapshot()) {
        if (m.name == kSendingWorking) s.sending_works = m.value >= 1.0;
        else if (m.name == kReceivingWorking) s.receiving_works = m.value >= 1.0;
        else if (m.name == kSpamScore) s.spam_score = m.value;
        else if (m.name == kLastRoundTripCheck) s.sending_updated = s.receiving_updated = m.value;
        else if (m.name == kLastSpamScoreCheck) s.spam_updated = m.value;
    }
    s.spam_test_url = spam_test_url;
    return s;
}

} // namespace mailhealth
