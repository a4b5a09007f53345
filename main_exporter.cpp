//// ===================== File: main_exporter.cpp =====================
/**
 * # build
 * cmake -S . -B build && cmake --build build
 * ./build/mail_health_exporter
 *
 * Examples with options:
 *   ./build/mail_health_exporter --log=exporter.log --log-level=DEBUG
 *   ./build/mail_health_exporter --once          # one check, print metrics, exit
 *
 * Configuration comes from the environment (INTERNAL_SMTP_SERVER, ...) and
 * the password secrets under $SECRETS_DIR (default /run/secrets).
 */

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <pthread.h>

#include "config.hpp"
#include "diag_logger.hpp"
#include "errors.hpp"
#include "exporter_endpoints.hpp"
#include "http_server.hpp"
#include "https_fetcher.hpp"
#include "imap_mailbox.hpp"
#include "mail_health_metrics.hpp"
#include "prometheus_exposition.hpp"
#include "round_trip_probe.hpp"
#include "scheduler.hpp"
#include "smtp_sender.hpp"
#include "spam_score_probe.hpp"
#include "status_page.hpp"

using namespace std;
using namespace mailhealth;

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " [--log=PATH] [--log-level=DEBUG|INFO|WARNING|ERROR] [--once] [--help]\n"
         << "Notes:\n"
         << "  - settings are read from environment variables, passwords from $SECRETS_DIR or\n"
         << "    INTERNAL_EMAIL_PASSWORD / EXTERNAL_EMAIL_PASSWORD.\n"
         << "  - --once runs one round trip and one spam check, prints the metrics and exits.\n"
         << "  - exit status 2 means the configuration was rejected.\n";
}

static SmtpEndpoint smtp_endpoint(const MailAccountConfig &a, const ExporterConfig &cfg) {
    SmtpEndpoint ep;
    ep.host = a.smtp_server;
    ep.port = a.smtp_port;
    ep.use_tls = a.smtp_use_tls;
    ep.username = a.email_address;
    ep.password = a.password;
    ep.verify_tls = cfg.tls_verify;
    ep.timeout = cfg.network_timeout;
    return ep;
}

static ImapEndpoint imap_endpoint(const MailAccountConfig &a, const ExporterConfig &cfg) {
    ImapEndpoint ep;
    ep.host = a.imap_server;
    ep.port = a.imap_port;
    ep.use_ssl = a.imap_use_ssl;
    ep.username = a.email_address;
    ep.password = a.password;
    ep.verify_tls = cfg.tls_verify;
    ep.timeout = cfg.network_timeout;
    return ep;
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    // flags: --log=PATH , --log-level=LEVEL , --once , --help
    string log_path;
    optional<LogLevel> cli_level;
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a.rfind("--log=", 0) == 0) {
            log_path = a.substr(6);
        } else if (a.rfind("--log-level=", 0) == 0) {
            cli_level = parse_log_level(a.substr(12));
            if (!cli_level) { cerr << "unknown log level: " << a.substr(12) << "\n"; print_usage(argv[0]); return 1; }
        } else if (a == "--once") {
            once = true;
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            cerr << "unknown argument: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    DiagLogger log(cli_level.value_or(LogLevel::Info), log_path);
    if (!log_path.empty() && !log.file_ok()) {
        cerr << "Warning: couldn't open log file: " << log_path << "\n";
    }

    ExporterConfig cfg;
    try {
        cfg = load_config(process_env());
    } catch (const ConfigurationError &e) {
        log.error(string("CONFIG_REJECTED ") + e.what());
        return 2;
    }
    if (!cli_level) log.set_level(cfg.log_level);
    log.info("CONFIG " + describe(cfg));

    // SIGINT/SIGTERM are collected by sigwait below; worker threads inherit the mask.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        SystemClock clock;
        unique_ptr<MetricsRegistry> registry = make_mail_health_registry(clock.wall_now());

        SmtpSender internal_smtp(smtp_endpoint(cfg.internal, cfg), default_channel_factory(), &log);
        SmtpSender external_smtp(smtp_endpoint(cfg.external, cfg), default_channel_factory(), &log);
        ImapMailbox internal_imap(imap_endpoint(cfg.internal, cfg), default_channel_factory(), &log);
        ImapMailbox external_imap(imap_endpoint(cfg.external, cfg), default_channel_factory(), &log);

        RoundTripOptions rt;
        rt.timeout = cfg.timeout;
        rt.poll_interval = cfg.poll_interval;
        RoundTripProbe outbound(ProbeDirection::InternalToExternal, internal_smtp, external_imap,
                                cfg.internal.email_address, cfg.external.email_address, clock, rt, &log);
        RoundTripProbe inbound(ProbeDirection::ExternalToInternal, external_smtp, internal_imap,
                               cfg.external.email_address, cfg.internal.email_address, clock, rt, &log);
        RoundTripCheck round_trip(outbound, inbound, clock, &log);

        HttpsScoreFetcher fetcher(cfg.spam_fetch_timeout, cfg.tls_verify, &log);
        SpamProbeOptions so;
        so.from_address = cfg.internal.email_address;
        so.target_address = cfg.spam_test_address;
        so.result_url = cfg.spam_test_url;
        so.min_interval = cfg.spam_min_interval;
        SpamScoreProbe spam(internal_smtp, fetcher, so, &log);

        SchedulerOptions sched_opts;
        sched_opts.round_trip_interval = cfg.check_interval;
        sched_opts.spam_interval = cfg.spam_check_interval;
        Scheduler scheduler(round_trip, spam, *registry, clock, sched_opts, &log);

        if (once) {
            scheduler.run_round_trip_tick();
            scheduler.run_spam_score_tick();
            cout << render_prometheus(registry->snapshot());
            cout.flush();
            return 0;
        }

        TemplateStatusRenderer renderer(cfg.status_html_template);
        ExporterHttpHandler handler(*registry, renderer, cfg.spam_test_url);
        HttpServer server(handler, cfg.http_port, &log);
        server.start();
        scheduler.start();
        log.info("EXPORTER_STARTED port=" + to_string(server.port()));

        int sig = 0;
        sigwait(&stop_signals, &sig);
        log.info(string("EXPORTER_STOPPING signal=") + (sig == SIGINT ? "SIGINT" : "SIGTERM"));

        scheduler.stop();
        server.stop();
        log.info("EXPORTER_STOPPED");
        return 0;
    } catch (const exception &e) {
        log.error(string("EXPORTER_FAILED detail=\"") + e.what() + "\"");
        return 1;
    }
}
