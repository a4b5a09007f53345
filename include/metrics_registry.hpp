#pragma once
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mailhealth {

enum class MetricType { Counter, Gauge };

const char* to_string(MetricType t); // "counter" / "gauge"

struct MetricDescriptor {
    std::string name;
    std::string help;
    MetricType type = MetricType::Gauge;
    double initial = 0.0;
    // Gauge holding the time this metric was last set; written together with
    // the value by set_gauge(name, value, timestamp).
    std::string timestamp_metric;
};

struct MetricSample {
    std::string name;
    std::string help;
    MetricType type = MetricType::Gauge;
    double value = 0.0;
};

// Fixed set of counters and gauges shared by the scheduler (writer) and the
// HTTP handlers (readers). Writers take the lock exclusively, readers share it.
class MetricsRegistry {
public:
    // Throws std::invalid_argument on duplicate names, unknown timestamp
    // metrics or a timestamp metric that is not a gauge.
    explicit MetricsRegistry(std::vector<MetricDescriptor> descriptors);

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    // Unknown names throw std::out_of_range, type mismatches std::logic_error.
    void increment_counter(const std::string& name);
    void set_gauge(const std::string& name, double value);
    void set_gauge(const std::string& name, double value, double timestamp);

    double value(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::size_t size() const { return entries_.size(); }

    // Point-in-time copy in registration order.
    std::vector<MetricSample> snapshot() const;

private:
    struct Entry {
        MetricDescriptor desc;
        double value = 0.0;
        std::size_t timestamp_index = npos;
    };
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    std::size_t index_of(const std::string& name) const;
    Entry& gauge_entry(const std::string& name);

    mutable std::shared_mutex mu_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace mailhealth
