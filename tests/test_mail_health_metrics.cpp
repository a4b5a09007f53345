#include "mail_health_metrics.hpp"

#include <catch2/catch.hpp>

using namespace mailhealth;
using namespace mailhealth::metric;

namespace {

const WallTime kStart = WallTime(std::chrono::seconds(1700000000));

ProbeAttempt attempt(ProbeDirection d, bool sent, bool received, double elapsed) {
    ProbeAttempt a;
    a.direction = d;
    a.sent = sent;
    a.received = received;
    a.outcome = received ? ProbeOutcome::Success : (sent ? ProbeOutcome::Timeout : ProbeOutcome::SendFailed);
    a.elapsed_seconds = elapsed;
    return a;
}

RoundTripResult result(bool out_sent, bool out_recv, double out_s, bool in_sent, bool in_recv, double in_s,
                       WallTime at) {
    RoundTripResult r;
    r.outbound = attempt(ProbeDirection::InternalToExternal, out_sent, out_recv, out_s);
    r.inbound = attempt(ProbeDirection::ExternalToInternal, in_sent, in_recv, in_s);
    r.checked_at = at;
    return r;
}

} // namespace

TEST_CASE("fresh registry carries all fourteen metrics with healthy defaults", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);
    REQUIRE(reg->size() == 14);

    for (const char* name : {kSendInternalToExternalSuccess, kSendInternalToExternalFailures,
                             kReceiveInternalToExternalSuccess, kReceiveInternalToExternalFailures,
                             kSendExternalToInternalSuccess, kSendExternalToInternalFailures,
                             kReceiveExternalToInternalSuccess, kReceiveExternalToInternalFailures}) {
        REQUIRE(reg->value(name) == 0.0);
    }
    REQUIRE(reg->value(kSendingWorking) == 1.0);
    REQUIRE(reg->value(kReceivingWorking) == 1.0);
    REQUIRE(reg->value(kRoundTripDuration) == 0.0);
    REQUIRE(reg->value(kSpamScore) == 0.0);
    REQUIRE(reg->value(kLastRoundTripCheck) == 1700000000.0);
    REQUIRE(reg->value(kLastSpamScoreCheck) == 1700000000.0);
}

TEST_CASE("successful round trip moves the success counters and records the summed duration", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);
    const WallTime at = kStart + std::chrono::seconds(300);

    record_round_trip(*reg, result(true, true, 2.0, true, true, 3.0, at));

    REQUIRE(reg->value(kSendInternalToExternalSuccess) == 1.0);
    REQUIRE(reg->value(kReceiveInternalToExternalSuccess) == 1.0);
    REQUIRE(reg->value(kSendExternalToInternalSuccess) == 1.0);
    REQUIRE(reg->value(kReceiveExternalToInternalSuccess) == 1.0);
    REQUIRE(reg->value(kSendInternalToExternalFailures) == 0.0);
    REQUIRE(reg->value(kReceiveExternalToInternalFailures) == 0.0);
    REQUIRE(reg->value(kRoundTripDuration) == Approx(5.0));
    REQUIRE(reg->value(kSendingWorking) == 1.0);
    REQUIRE(reg->value(kReceivingWorking) == 1.0);
    REQUIRE(reg->value(kLastRoundTripCheck) == 1700000300.0);
}

TEST_CASE("outbound send failure counts as a failed send and a failed receive", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);

    record_round_trip(*reg, result(false, false, 0.0, true, true, 4.0, kStart));

    REQUIRE(reg->value(kSendInternalToExternalFailures) == 1.0);
    REQUIRE(reg->value(kReceiveInternalToExternalFailures) == 1.0);
    REQUIRE(reg->value(kSendInternalToExternalSuccess) == 0.0);
    REQUIRE(reg->value(kReceiveInternalToExternalSuccess) == 0.0);
    REQUIRE(reg->value(kSendExternalToInternalSuccess) == 1.0);
    REQUIRE(reg->value(kReceiveExternalToInternalSuccess) == 1.0);
    REQUIRE(reg->value(kSendingWorking) == 0.0);
    REQUIRE(reg->value(kReceivingWorking) == 0.0);
}

TEST_CASE("delivery timeout keeps sending healthy but marks receiving down", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);

    record_round_trip(*reg, result(true, true, 2.0, true, false, 60.0, kStart));

    REQUIRE(reg->value(kSendExternalToInternalSuccess) == 1.0);
    REQUIRE(reg->value(kReceiveExternalToInternalFailures) == 1.0);
    REQUIRE(reg->value(kSendingWorking) == 1.0);
    REQUIRE(reg->value(kReceivingWorking) == 0.0);
    REQUIRE(reg->value(kRoundTripDuration) == Approx(62.0));
}

TEST_CASE("counters accumulate across checks", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);
    for (int i = 0; i < 3; ++i) record_round_trip(*reg, result(true, true, 1.0, true, true, 1.0, kStart));
    record_round_trip(*reg, result(true, false, 60.0, true, true, 1.0, kStart));

    REQUIRE(reg->value(kSendInternalToExternalSuccess) == 4.0);
    REQUIRE(reg->value(kReceiveInternalToExternalSuccess) == 3.0);
    REQUIRE(reg->value(kReceiveInternalToExternalFailures) == 1.0);
}

TEST_CASE("spam score is recorded with its check time", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);
    SpamScoreResult s;
    s.score = 8.0;
    s.checked_at = kStart + std::chrono::hours(9);

    record_spam_score(*reg, s);

    REQUIRE(reg->value(kSpamScore) == 8.0);
    REQUIRE(reg->value(kLastSpamScoreCheck) == 1700000000.0 + 9 * 3600);
    REQUIRE(reg->value(kLastRoundTripCheck) == 1700000000.0);
}

TEST_CASE("status snapshot reflects the registry", "[metrics]") {
    auto reg = make_mail_health_registry(kStart);
    record_round_trip(*reg, result(true, false, 2.0, true, true, 3.0, kStart + std::chrono::seconds(60)));
    SpamScoreResult s;
    s.score = 7.5;
    s.checked_at = kStart + std::chrono::seconds(120);
    record_spam_score(*reg, s);

    const StatusSnapshot snap = status_snapshot(*reg, "https://www.mail-tester.com/test-x");

    REQUIRE(snap.sending_works);
    REQUIRE_FALSE(snap.receiving_works);
    REQUIRE(snap.spam_score == 7.5);
    REQUIRE(snap.sending_updated == 1700000060.0);
    REQUIRE(snap.receiving_updated == 1700000060.0);
    REQUIRE(snap.spam_updated == 1700000120.0);
    REQUIRE(snap.spam_test_url == "https://www.mail-tester.com/test-x");
}
