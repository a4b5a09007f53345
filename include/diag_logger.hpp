// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace mailhealth {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& s);

// Console logger with an optional append-mode file copy. Info and below go
// to stdout, warnings and errors to stderr. Safe to share between threads.
class DiagLogger {
public:
    explicit DiagLogger(LogLevel min_level = LogLevel::Info, const std::string& path = std::string());
    ~DiagLogger();

    bool file_ok() const { return out_.is_open(); }
    void set_level(LogLevel level);
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& line);
    void debug(const std::string& line) { log(LogLevel::Debug, line); }
    void info(const std::string& line) { log(LogLevel::Info, line); }
    void warn(const std::string& line) { log(LogLevel::Warning, line); }
    void error(const std::string& line) { log(LogLevel::Error, line); }

private:
    mutable std::mutex mu_;
    LogLevel min_level_;
    std::ofstream out_;
};

} // namespace mailhealth
