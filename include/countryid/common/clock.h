#pragma once

#include <cstdint>

namespace countryid {

/* Wall clock reporting nanoseconds since the Unix epoch. */
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint64_t NowUnixNanos() = 0;
};

/* std::chrono::system_clock. Regressions (NTP steps) are passed through. */
class SystemClock : public Clock {
public:
    SystemClock() = default;
    ~SystemClock() override = default;

    uint64_t NowUnixNanos() override;

    static SystemClock& Instance();
};

}  // namespace countryid
