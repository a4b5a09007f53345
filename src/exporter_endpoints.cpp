#include "exporter_endpoints.hpp"

#include "mail_health_metrics.hpp"
#include "prometheus_exposition.hpp"

namespace mailhealth {

ExporterHttpHandler::ExporterHttpHandler(const MetricsRegistry& registry, const StatusRenderer& status,
                                         std::string spam_test_url)
    : registry_(registry), status_(status), spam_test_url_(std::move(spam_test_url)) {}

HttpResponse ExporterHttpHandler::handle(const HttpRequest& req) {
    HttpResponse res;
    const bool known = req.path == "/metrics" || req.path == "/status";
    if (!known) {
        res.status = 404;
        res.body = "Not Found\n";
        return res;
    }
    if (req.method != "GET") {
        res.status = 405;
        res.body = "Method Not Allowed\n";
        return res;
    }

    if (req.path == "/metrics") {
        res.content_type = kPrometheusContentType;
        res.body = render_prometheus(registry_.snapshot());
    } else {
        res.content_type = "text/html; charset=utf-8";
        res.body = status_.render(status_snapshot(registry_, spam_test_url_));
    }
    return res;
}

} // namespace mailhealth
