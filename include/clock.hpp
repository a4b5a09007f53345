#pragma once
#include <chrono>
#include <string>

namespace mailhealth {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// Time source for the probes. Tests swap in a clock whose sleep_for just
// advances the reading.
class Clock {
public:
    virtual ~Clock() = default;
    virtual SteadyTime now() const = 0;
    virtual WallTime wall_now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

class SystemClock : public Clock {
public:
    SteadyTime now() const override;
    WallTime wall_now() const override;
    void sleep_for(std::chrono::milliseconds d) override;
};

// Seconds since the Unix epoch, with sub-second precision.
double to_unix_seconds(WallTime t);

// Local time, e.g. 2025-03-01T14:05:09.250+01:00
std::string to_iso8601(WallTime t);

} // namespace mailhealth
