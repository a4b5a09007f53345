#pragma once
#include <string>

#include "mail_health_metrics.hpp"

namespace mailhealth {

class StatusRenderer {
public:
    virtual ~StatusRenderer() = default;
    virtual std::string render(const StatusSnapshot& snapshot) const = 0;
};

// "let mailServerData = { ... };" carrying the snapshot.
std::string status_data_script(const StatusSnapshot& snapshot);

// Replaces the first `let mailServerData = {...};` statement in the HTML
// template. A template without it is served as-is.
class TemplateStatusRenderer : public StatusRenderer {
public:
    explicit TemplateStatusRenderer(std::string html_template);

    std::string render(const StatusSnapshot& snapshot) const override;

private:
    std::string template_;
};

} // namespace mailhealth
