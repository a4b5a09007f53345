#pragma once
#include <string>

#include "http_server.hpp"
#include "metrics_registry.hpp"
#include "status_page.hpp"

namespace mailhealth {

// GET /metrics  -> Prometheus text of the registry
// GET /status   -> status page rendered from the same registry
// anything else -> 404 (unknown path) or 405 (other method)
class ExporterHttpHandler : public HttpHandler {
public:
    ExporterHttpHandler(const MetricsRegistry& registry, const StatusRenderer& status,
                        std::string spam_test_url);

    HttpResponse handle(const HttpRequest& req) override;

private:
    const MetricsRegistry& registry_;
    const StatusRenderer& status_;
    std::string spam_test_url_;
};

} // namespace mailhealth
