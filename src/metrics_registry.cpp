#include "metrics_registry.hpp"

#include <mutex>
#include <stdexcept>

namespace mailhealth {

const char* to_string(MetricType t) {
    return t == MetricType::Counter ? "counter" : "gauge";
}

MetricsRegistry::MetricsRegistry(std::vector<MetricDescriptor> descriptors) {
    entries_.reserve(descriptors.size());
    for (auto& d : descriptors) {
        if (d.name.empty()) throw std::invalid_argument("metric without a name");
        if (index_.count(d.name)) throw std::invalid_argument("duplicate metric: " + d.name);
        index_[d.name] = entries_.size();
        Entry e;
        e.value = d.initial;
        e.desc = std::move(d);
        entries_.push_back(std::move(e));
    }

    for (auto& e : entries_) {
        if (e.desc.timestamp_metric.empty()) continue;
        auto it = index_.find(e.desc.timestamp_metric);
        if (it == index_.end())
            throw std::invalid_argument("unknown timestamp metric " + e.desc.timestamp_metric +
                                        " for " + e.desc.name);
        if (entries_[it->second].desc.type != MetricType::Gauge)
            throw std::invalid_argument("timestamp metric must be a gauge: " + e.desc.timestamp_metric);
        e.timestamp_index = it->second;
    }
}

std::size_t MetricsRegistry::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) throw std::out_of_range("unknown metric: " + name);
    return it->second;
}

MetricsRegistry::Entry& MetricsRegistry::gauge_entry(const std::string& name) {
    Entry& e = entries_[index_of(name)];
    if (e.desc.type != MetricType::Gauge) throw std::logic_error("not a gauge: " + name);
    return e;
}

void MetricsRegistry::increment_counter(const std::string& name) {
    Entry& e = entries_[index_of(name)];
    if (e.desc.type != MetricType::Counter) throw std::logic_error("not a counter: " + name);
    std::unique_lock<std::shared_mutex> lock(mu_);
    e.value += 1.0;
}

void MetricsRegistry::set_gauge(const std::string& name, double value) {
    Entry& e = gauge_entry(name);
    std::unique_lock<std::shared_mutex> lock(mu_);
    e.value = value;
}

void MetricsRegistry::set_gauge(const std::string& name, double value, double timestamp) {
    Entry& e = gauge_entry(name);
    if (e.timestamp_index == npos) throw std::logic_error("no timestamp metric paired with " + name);
    std::unique_lock<std::shared_mutex> lock(mu_);
    e.value = value;
    entries_[e.timestamp_index].value = timestamp;
}

double MetricsRegistry::value(const std::string& name) const {
    const Entry& e = entries_[index_of(name)];
    std::shared_lock<std::shared_mutex> lock(mu_);
    return e.value;
}

bool MetricsRegistry::contains(const std::string& name) const {
    return index_.count(name) != 0;
}

std::vector<MetricSample> MetricsRegistry::snapshot() const {
    std::vector<MetricSample> out;
    out.reserve(entries_.size());
    std::shared_lock<std::shared_mutex> lock(mu_);
    for (const auto& e : entries_)
        out.push_back(MetricSample{e.desc.name, e.desc.help, e.desc.type, e.value});
    return out;
}

} // namespace mailhealth
