#include "status_page.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <regex>
#include <sstream>

namespace mailhealth {

namespace {

std::string js_string(const std::string& s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '<':  out += "\\u003c"; break; // keeps "</script>" out of the page
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    out += '"';
    return out;
}

std::string js_number(double v, int precision) {
    if (!std::isfinite(v)) return "0";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

// Offset one past the `;` closing the object that opens at `open`, or npos.
std::size_t end_of_object(const std::string& s, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < s.size(); ++i) {
        if (s[i] == '{') ++depth;
        else if (s[i] == '}') {
            if (--depth == 0) {
                std::size_t j = i + 1;
                while (j < s.size() && std::isspace(static_cast<unsigned char>(s[j]))) ++j;
                if (j < s.size() && s[j] == ';') return j + 1;
                return std::string::npos;
            }
        }
    }
    return std::string::npos;
}

} // namespace

std::string status_data_script(const StatusSnapshot& s) {
    std::ostringstream js;
    js << "let mailServerData = {\n"
       << "    sendingWorks: " << (s.sending_works ? "true" : "false") << ",\n"
       << "    receivingWorks: " << (s.receiving_works ? "true" : "false") << ",\n"
       << "    spamScore: " << js_number(s.spam_score, 1) << ",\n"
       << "    spamTestUrl: " << js_string(s.spam_test_url) << ",\n"
       << "    lastUpdated: {\n"
       << "        sending: " << js_number(s.sending_updated, 3) << ",\n"
       << "        receiving: " << js_number(s.receiving_updated, 3) << ",\n"
       << "        spam: " << js_number(s.spam_updated, 3) << "\n"
       << "    }\n"
       << "};";
    return js.str();
}

TemplateStatusRenderer::TemplateStatusRenderer(std::string html_template)
    : template_(std::move(html_template)) {}

std::string TemplateStatusRenderer::render(const StatusSnapshot& snapshot) const {
    static const std::regex head_re(R"(let\s+mailServerData\s*=\s*\{)");
    std::smatch m;
    if (!std::regex_search(template_, m, head_re)) return template_;

    const std::size_t start = static_cast<std::size_t>(m.position(0));
    const std::size_t open = start + static_cast<std::size_t>(m.length(0)) - 1;
    const std::size_t end = end_of_object(template_, open);
    if (end == std::string::npos) return template_;

    std::string out;
    out.reserve(template_.size() + 256);
    out.append(template_, 0, start);
    out += status_data_script(snapshot);
    out.append(template_, end, std::string::npos);
    return out;
}

} // namespace mailhealth
