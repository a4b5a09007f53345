#include "metrics_registry.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

using namespace mailhealth;

namespace {

MetricDescriptor counter(const std::string& name) {
    MetricDescriptor d;
    d.name = name;
    d.help = name + " help";
    d.type = MetricType::Counter;
    return d;
}

MetricDescriptor gauge(const std::string& name, double initial = 0.0, const std::string& ts = "") {
    MetricDescriptor d;
    d.name = name;
    d.help = name + " help";
    d.type = MetricType::Gauge;
    d.initial = initial;
    d.timestamp_metric = ts;
    return d;
}

std::vector<MetricDescriptor> sample_set() {
    return {counter("ok_total"), gauge("working", 1.0, "updated"), gauge("updated", 42.0)};
}

} // namespace

TEST_CASE("registry starts every metric at its initial value", "[registry]") {
    MetricsRegistry reg(sample_set());
    REQUIRE(reg.size() == 3);
    REQUIRE(reg.value("ok_total") == 0.0);
    REQUIRE(reg.value("working") == 1.0);
    REQUIRE(reg.value("updated") == 42.0);
    REQUIRE(reg.contains("working"));
    REQUIRE_FALSE(reg.contains("missing"));
}

TEST_CASE("counters only move up by one", "[registry]") {
    MetricsRegistry reg(sample_set());
    reg.increment_counter("ok_total");
    reg.increment_counter("ok_total");
    REQUIRE(reg.value("ok_total") == 2.0);
    REQUIRE_THROWS_AS(reg.set_gauge("ok_total", 0.0), std::logic_error);
    REQUIRE(reg.value("ok_total") == 2.0);
}

TEST_CASE("gauge and its timestamp are written together", "[registry]") {
    MetricsRegistry reg(sample_set());
    reg.set_gauge("working", 0.0, 1700000123.5);
    REQUIRE(reg.value("working") == 0.0);
    REQUIRE(reg.value("updated") == 1700000123.5);

    reg.set_gauge("working", 1.0);
    REQUIRE(reg.value("working") == 1.0);
    REQUIRE(reg.value("updated") == 1700000123.5);
}

TEST_CASE("misuse of the registry is rejected", "[registry]") {
    MetricsRegistry reg(sample_set());
    REQUIRE_THROWS_AS(reg.increment_counter("working"), std::logic_error);
    REQUIRE_THROWS_AS(reg.increment_counter("nope"), std::out_of_range);
    REQUIRE_THROWS_AS(reg.value("nope"), std::out_of_range);
    REQUIRE_THROWS_AS(reg.set_gauge("updated", 1.0, 2.0), std::logic_error);
}

TEST_CASE("invalid metric sets are refused at construction", "[registry]") {
    SECTION("duplicate name") {
        REQUIRE_THROWS_AS(MetricsRegistry(std::vector<MetricDescriptor>{counter("a"), gauge("a")}), std::invalid_argument);
    }
    SECTION("unknown timestamp metric") {
        REQUIRE_THROWS_AS(MetricsRegistry(std::vector<MetricDescriptor>{gauge("a", 0.0, "b")}), std::invalid_argument);
    }
    SECTION("timestamp metric that is a counter") {
        REQUIRE_THROWS_AS(MetricsRegistry(std::vector<MetricDescriptor>{gauge("a", 0.0, "b"), counter("b")}), std::invalid_argument);
    }
    SECTION("empty name") {
        REQUIRE_THROWS_AS(MetricsRegistry(std::vector<MetricDescriptor>{gauge("")}), std::invalid_argument);
    }
}

TEST_CASE("snapshot keeps registration order", "[registry]") {
    MetricsRegistry reg(sample_set());
    reg.increment_counter("ok_total");
    const std::vector<MetricSample> s = reg.snapshot();
    REQUIRE(s.size() == 3);
    REQUIRE(s[0].name == "ok_total");
    REQUIRE(s[0].type == MetricType::Counter);
    REQUIRE(s[0].value == 1.0);
    REQUIRE(s[0].help == "ok_total help");
    REQUIRE(s[1].name == "working");
    REQUIRE(s[2].name == "updated");
}

TEST_CASE("readers never see a gauge without its timestamp", "[registry][threads]") {
    MetricsRegistry reg(sample_set());
    reg.set_gauge("working", 0.0, 0.0);

    // writer keeps value == timestamp; readers check the pair in one snapshot
    std::thread writer([&] {
        for (int i = 1; i <= 2000; ++i) {
            reg.set_gauge("working", i, i);
            reg.increment_counter("ok_total");
        }
    });

    bool consistent = true;
    for (int i = 0; i < 2000; ++i) {
        const std::vector<MetricSample> s = reg.snapshot();
        if (s[1].value != s[2].value) consistent = false;
    }
    writer.join();

    REQUIRE(consistent);
    REQUIRE(reg.value("ok_total") == 2000.0);
    REQUIRE(reg.value("working") == 2000.0);
}
