#include "prometheus_exposition.hpp"
#include "mail_health_metrics.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <sstream>

using namespace mailhealth;

TEST_CASE("metric values are formatted for the text exposition", "[prometheus]") {
    REQUIRE(format_metric_value(0.0) == "0");
    REQUIRE(format_metric_value(1.0) == "1");
    REQUIRE(format_metric_value(1700000000.0) == "1700000000");
    REQUIRE(format_metric_value(5.25) == "5.250");
    REQUIRE(format_metric_value(-2.5) == "-2.500");
    REQUIRE(format_metric_value(std::numeric_limits<double>::quiet_NaN()) == "NaN");
    REQUIRE(format_metric_value(std::numeric_limits<double>::infinity()) == "+Inf");
    REQUIRE(format_metric_value(-std::numeric_limits<double>::infinity()) == "-Inf");
}

TEST_CASE("each sample renders HELP, TYPE and value lines", "[prometheus]") {
    std::vector<MetricSample> samples;
    samples.push_back(MetricSample{"a_total", "Things done", MetricType::Counter, 3.0});
    samples.push_back(MetricSample{"b", "Line one\nline \\ two", MetricType::Gauge, 0.5});

    const std::string text = render_prometheus(samples);

    REQUIRE(text ==
            "# HELP a_total Things done\n"
            "# TYPE a_total counter\n"
            "a_total 3\n"
            "# HELP b Line one\\nline \\\\ two\n"
            "# TYPE b gauge\n"
            "b 0.500\n");
}

TEST_CASE("every exporter metric is exposed before the first check", "[prometheus]") {
    auto reg = make_mail_health_registry(WallTime(std::chrono::seconds(1700000000)));
    const std::string text = render_prometheus(reg->snapshot());

    using namespace metric;
    for (const char* name : {kSendInternalToExternalSuccess, kSendInternalToExternalFailures,
                             kReceiveInternalToExternalSuccess, kReceiveInternalToExternalFailures,
                             kSendExternalToInternalSuccess, kSendExternalToInternalFailures,
                             kReceiveExternalToInternalSuccess, kReceiveExternalToInternalFailures,
                             kSendingWorking, kReceivingWorking, kRoundTripDuration,
                             kLastRoundTripCheck, kSpamScore, kLastSpamScoreCheck}) {
        REQUIRE(text.find(std::string("# TYPE ") + name) != std::string::npos);
        REQUIRE(text.find(std::string("\n") + name + " ") != std::string::npos);
    }

    REQUIRE(text.find(std::string("# TYPE ") + kSendInternalToExternalSuccess + " counter") != std::string::npos);
    REQUIRE(text.find(std::string("# TYPE ") + kSpamScore + " gauge") != std::string::npos);
    REQUIRE(text.find(std::string(kSendingWorking) + " 1\n") != std::string::npos);
    REQUIRE(text.find(std::string(kLastRoundTripCheck) + " 1700000000\n") != std::string::npos);

    // three lines per metric
    std::istringstream in(text);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) ++lines;
    REQUIRE(lines == 14 * 3);
}
