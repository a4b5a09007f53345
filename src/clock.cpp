#include "clock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace mailhealth {

SteadyTime SystemClock::now() const { return std::chrono::steady_clock::now(); }

WallTime SystemClock::wall_now() const { return std::chrono::system_clock::now(); }

void SystemClock::sleep_for(std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

double to_unix_seconds(WallTime t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

std::string to_iso8601(WallTime t) {
    using namespace std::chrono;
    const std::time_t tt = system_clock::to_time_t(t);
    const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);
    char zone[8] = {0};
    std::strftime(zone, sizeof(zone), "%z", &tm); // +0100
    std::string z = zone;
    if (z.size() == 5) z.insert(3, ":");

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms << z;
    return oss.str();
}

} // namespace mailhealth
