#include "config.hpp"

#include "errors.hpp"
#include "parsed_url.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace mailhealth {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Collects problems so that one failed start reports all of them.
class Reader {
public:
    explicit Reader(const EnvLookup& env) : env_(env) {}

    std::optional<std::string> get(const std::string& name) const {
        std::optional<std::string> v = env_(name);
        if (v && trim(*v).empty()) return std::nullopt;
        return v;
    }

    std::string required(const std::string& name) {
        std::optional<std::string> v = get(name);
        if (!v) {
            problems_.push_back("missing required environment variable " + name);
            return std::string();
        }
        return trim(*v);
    }

    std::string text(const std::string& name, const std::string& def) const {
        std::optional<std::string> v = get(name);
        return v ? trim(*v) : def;
    }

    bool flag(const std::string& name, bool def) const {
        std::optional<std::string> v = get(name);
        return v ? parse_bool_flag(trim(*v)) : def;
    }

    long number(const std::string& name, long def, long min, long max) {
        std::optional<std::string> v = get(name);
        if (!v) return def;
        const std::string s = trim(*v);
        try {
            size_t used = 0;
            long n = std::stol(s, &used, 10);
            if (used != s.size()) throw std::invalid_argument(s);
            if (n < min || n > max) {
                problems_.push_back(name + "=" + s + " is out of range [" + std::to_string(min) + ", " +
                                    std::to_string(max) + "]");
                return def;
            }
            return n;
        } catch (const std::logic_error&) {
            problems_.push_back(name + "=" + s + " is not a number");
            return def;
        }
    }

    std::chrono::seconds seconds(const std::string& name, long def) {
        return std::chrono::seconds(number(name, def, 1, 365L * 24 * 3600));
    }

    void problem(const std::string& p) { problems_.push_back(p); }
    const std::vector<std::string>& problems() const { return problems_; }

private:
    const EnvLookup& env_;
    std::vector<std::string> problems_;
};

MailAccountConfig read_account(Reader& r, const std::string& prefix) {
    MailAccountConfig a;
    a.smtp_server = r.required(prefix + "_SMTP_SERVER");
    a.smtp_port = static_cast<int>(r.number(prefix + "_SMTP_PORT", 465, 1, 65535));
    a.smtp_use_tls = r.flag(prefix + "_SMTP_USE_TLS", true);
    a.imap_server = r.required(prefix + "_IMAP_SERVER");
    a.imap_port = static_cast<int>(r.number(prefix + "_IMAP_PORT", 993, 1, 65535));
    // the compose template spells it _IMAP_USE_TLS
    a.imap_use_ssl = r.get(prefix + "_IMAP_USE_SSL") ? r.flag(prefix + "_IMAP_USE_SSL", true)
                                                      : r.flag(prefix + "_IMAP_USE_TLS", true);
    a.email_address = r.required(prefix + "_EMAIL_ADDRESS");
    return a;
}

} // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

bool parse_bool_flag(const std::string& s) {
    const std::string u = upper(trim(s));
    return u == "TRUE" || u == "1" || u == "YES";
}

std::optional<std::string> read_secret(const EnvLookup& env, const std::string& dir, const std::string& name) {
    std::ifstream in(dir + "/" + name);
    if (in) {
        std::ostringstream ss;
        ss << in.rdbuf();
        std::string v = trim(ss.str());
        if (!v.empty()) return v;
    }
    std::optional<std::string> v = env(upper(name));
    if (v && !v->empty()) return v;
    return std::nullopt;
}

ExporterConfig load_config(const EnvLookup& env) {
    Reader r(env);
    ExporterConfig cfg;

    cfg.secrets_dir = r.text("SECRETS_DIR", cfg.secrets_dir);
    cfg.internal = read_account(r, "INTERNAL");
    cfg.external = read_account(r, "EXTERNAL");

    if (auto p = read_secret(env, cfg.secrets_dir, "internal_email_password")) cfg.internal.password = *p;
    else r.problem("missing required secret internal_email_password");
    if (auto p = read_secret(env, cfg.secrets_dir, "external_email_password")) cfg.external.password = *p;
    else r.problem("missing required secret external_email_password");

    cfg.spam_test_address = r.required("SPAM_SCORE_TEST_EMAIL_ADDRESS");
    cfg.spam_test_url = r.required("SPAM_SCORE_TEST_URL");
    if (!cfg.spam_test_url.empty()) {
        try {
            ParsedURL url(cfg.spam_test_url);
            (void)url;
        } catch (const std::invalid_argument& e) {
            r.problem(std::string("SPAM_SCORE_TEST_URL: ") + e.what());
        }
    }

    cfg.check_interval = r.seconds("CHECK_INTERVAL_SECONDS", 300);
    cfg.timeout = r.seconds("TIMEOUT_SECONDS", 60);
    cfg.poll_interval = r.seconds("POLL_INTERVAL_SECONDS", 10);
    cfg.spam_check_interval = r.seconds("SPAM_SCORE_CHECK_INTERVAL_SECONDS", cfg.check_interval.count());
    cfg.spam_min_interval = r.seconds("SPAM_SCORE_MIN_INTERVAL_SECONDS", 8 * 3600);
    cfg.spam_fetch_timeout = r.seconds("SPAM_SCORE_FETCH_TIMEOUT_SECONDS", 30);
    cfg.network_timeout = r.seconds("NETWORK_TIMEOUT_SECONDS", 30);
    cfg.http_port = static_cast<int>(r.number("HTTP_PORT", 9091, 0, 65535));
    cfg.tls_verify = r.flag("TLS_VERIFY", true);

    const std::string level = r.text("LOG_LEVEL", "INFO");
    if (auto lvl = parse_log_level(level)) cfg.log_level = *lvl;
    else r.problem("LOG_LEVEL=" + level + " is not one of DEBUG, INFO, WARNING, ERROR");

    cfg.status_html_file = r.text("STATUS_HTML_FILE", cfg.status_html_file);
    std::ifstream html(cfg.status_html_file);
    if (!html) {
        r.problem("cannot read STATUS_HTML_FILE " + cfg.status_html_file);
    } else {
        std::ostringstream ss;
        ss << html.rdbuf();
        cfg.status_html_template = ss.str();
    }

    if (!r.problems().empty()) {
        std::string msg = "invalid configuration:";
        for (const auto& p : r.problems()) msg += "\n  - " + p;
        throw ConfigurationError(msg);
    }
    return cfg;
}

std::string describe(const ExporterConfig& cfg) {
    std::ostringstream oss;
    oss << "internal=" << cfg.internal.email_address << " smtp=" << cfg.internal.smtp_server << ':'
        << cfg.internal.smtp_port << " imap=" << cfg.internal.imap_server << ':' << cfg.internal.imap_port
        << " external=" << cfg.external.email_address << " smtp=" << cfg.external.smtp_server << ':'
        << cfg.external.smtp_port << " imap=" << cfg.external.imap_server << ':' << cfg.external.imap_port
        << " spam_to=" << cfg.spam_test_address << " check_interval_s=" << cfg.check_interval.count()
        << " timeout_s=" << cfg.timeout.count() << " spam_min_interval_s=" << cfg.spam_min_interval.count()
        << " http_port=" << cfg.http_port << " tls_verify=" << (cfg.tls_verify ? "true" : "false");
    return oss.str();
}

} // namespace mailhealth
