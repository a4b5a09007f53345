// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mailhealth {

static std::string now_ts() {
    using namespace std::chrono;
    auto t  = system_clock::now();
    auto tt = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (u == "DEBUG")                  return LogLevel::Debug;
    if (u == "INFO")                   return LogLevel::Info;
    if (u == "WARNING" || u == "WARN") return LogLevel::Warning;
    if (u == "ERROR")                  return LogLevel::Error;
    return std::nullopt;
}

DiagLogger::DiagLogger(LogLevel min_level, const std::string& path) : min_level_(min_level) {
    if (!path.empty()) out_.open(path, std::ios::app);
    if (out_.is_open()) out_ << "=== mail_health_exporter log start " << now_ts() << " ===\n";
}

DiagLogger::~DiagLogger() {
    if (out_.is_open()) out_ << "=== mail_health_exporter log end " << now_ts() << " ===\n";
}

void DiagLogger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
}

bool DiagLogger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return level >= min_level_;
}

void DiagLogger::log(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    if (level < min_level_) return;

    const std::string text = now_ts() + " | " + to_string(level) + " | " + line + '\n';
    std::ostream& console = (level >= LogLevel::Warning) ? std::cerr : std::cout;
    console << text;
    console.flush();

    if (out_.is_open()) {
        out_ << text;
        out_.flush();
    }
}

} // namespace mailhealth
