#include "countryid/common/clock.h"

#include <chrono>

namespace countryid {

uint64_t SystemClock::NowUnixNanos() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

SystemClock& SystemClock::Instance() {
    static SystemClock instance;
    return instance;
}

}  // namespace countryid
