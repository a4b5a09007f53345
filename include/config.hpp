#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "diag_logger.hpp"

namespace mailhealth {

// Returns the variable's value, or nullopt when it is unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

// "true", "1", "yes" (any case) are true; everything else is false.
bool parse_bool_flag(const std::string& s);

struct MailAccountConfig {
    std::string smtp_server;
    int smtp_port = 465;
    bool smtp_use_tls = true;
    std::string imap_server;
    int imap_port = 993;
    bool imap_use_ssl = true;
    std::string email_address;
    std::string password;
};

struct ExporterConfig {
    MailAccountConfig internal;
    MailAccountConfig external;

    std::string spam_test_address;
    std::string spam_test_url;

    std::chrono::seconds check_interval{300};
    std::chrono::seconds timeout{60};
    std::chrono::seconds poll_interval{10};
    std::chrono::seconds spam_check_interval{300};
    std::chrono::seconds spam_min_interval{std::chrono::hours(8)};
    std::chrono::seconds spam_fetch_timeout{30};
    std::chrono::seconds network_timeout{30};

    int http_port = 9091;
    std::string status_html_file = "status.html";
    std::string status_html_template; // file contents
    LogLevel log_level = LogLevel::Info;
    bool tls_verify = true;
    std::string secrets_dir = "/run/secrets";
};

// Builds the configuration from the environment plus the password secrets.
// Every missing or malformed value is collected into one ConfigurationError.
ExporterConfig load_config(const EnvLookup& env);

// Secret file `<dir>/<name>` (trimmed), else the upper-cased env variable.
std::optional<std::string> read_secret(const EnvLookup& env, const std::string& dir, const std::string& name);

// One-line summary without credentials, for the startup log.
std::string describe(const ExporterConfig& cfg);

} // namespace mailhealth
