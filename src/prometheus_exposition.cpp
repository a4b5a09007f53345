#include "prometheus_exposition.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace mailhealth {

namespace {

std::string escape_help(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

} // namespace

std::string format_metric_value(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";

    char buf[64];
    if (std::floor(v) == v && std::fabs(v) < 1e15)
        std::snprintf(buf, sizeof(buf), "%.0f", v);
    else
        std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

std::string render_prometheus(const std::vector<MetricSample>& samples) {
    std::ostringstream out;
    for (const auto& m : samples) {
        out << "# HELP " << m.name << ' ' << escape_help(m.help) << '\n';
        out << "# TYPE " << m.name << ' ' << to_string(m.type) << '\n';
        out << m.name << ' ' << format_metric_value(m.value) << '\n';
    }
    return out.str();
}

} // namespace mailhealth
