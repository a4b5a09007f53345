#pragma once
#include <string>
#include <vector>

#include "metrics_registry.hpp"

namespace mailhealth {

constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

// Integral values print without a fraction; everything else with three decimals.
std::string format_metric_value(double v);

// Text exposition format 0.0.4: "# HELP", "# TYPE" and the sample line per metric.
std::string render_prometheus(const std::vector<MetricSample>& samples);

} // namespace mailhealth
