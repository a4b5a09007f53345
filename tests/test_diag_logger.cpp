#include "diag_logger.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace mailhealth;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

TEST_CASE("log levels parse case-insensitively", "[logger]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("Warn") == LogLevel::Warning);
    REQUIRE(parse_log_level("ERROR") == LogLevel::Error);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("enabled follows the minimum level", "[logger]") {
    DiagLogger log(LogLevel::Info);
    REQUIRE_FALSE(log.enabled(LogLevel::Debug));
    REQUIRE(log.enabled(LogLevel::Info));
    REQUIRE(log.enabled(LogLevel::Error));

    log.set_level(LogLevel::Debug);
    REQUIRE(log.enabled(LogLevel::Debug));

    log.set_level(LogLevel::Error);
    REQUIRE_FALSE(log.enabled(LogLevel::Warning));
}

TEST_CASE("file copy holds only lines at or above the level", "[logger]") {
    char tmpl[] = "/tmp/mailhealth-log-XXXXXX";
    REQUIRE(::mkdtemp(tmpl) != nullptr);
    const std::string path = std::string(tmpl) + "/exporter.log";
    {
        DiagLogger log(LogLevel::Warning, path);
        REQUIRE(log.file_ok());
        log.debug("SCHEDULER_WAIT loop=round_trip");
        log.info("PROBE_SEND direction=internal_to_external");
        log.warn("PROBE_POLL_ERROR kind=connection");
    }
    const std::string text = read_file(path);
    REQUIRE(text.find("SCHEDULER_WAIT") == std::string::npos);
    REQUIRE(text.find("PROBE_SEND") == std::string::npos);
    REQUIRE(text.find(" | WARNING | PROBE_POLL_ERROR kind=connection\n") != std::string::npos);
    std::remove(path.c_str());
    ::rmdir(tmpl);
}
