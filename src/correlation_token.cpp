#include "correlation_token.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace mailhealth {

namespace {

std::atomic<uint64_t> g_counter{0};

uint64_t random_bits() {
    static std::mutex mu;
    static std::mt19937_64 rng{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    std::lock_guard<std::mutex> lock(mu);
    return rng();
}

} // namespace

CorrelationToken new_token() {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const uint64_t n = g_counter.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << std::hex << ms << '-' << std::dec << n << '-'
        << std::hex << std::setw(16) << std::setfill('0') << random_bits();
    return CorrelationToken(oss.str());
}

std::string probe_subject(const std::string& token) {
    return "Mail Health Exporter - " + token;
}

std::string probe_subject(const CorrelationToken& token) {
    return probe_subject(token.str());
}

} // namespace mailhealth
