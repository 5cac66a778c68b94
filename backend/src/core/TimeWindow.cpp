#include "TimeWindow.hpp"
#include <chrono>

std::int64_t SystemClock::now() const {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t TimeWindow::epochAt(std::int64_t timestamp, std::uint64_t window_seconds) {
    const auto width = static_cast<std::int64_t>(window_seconds);
    std::int64_t epoch = timestamp / width;
    // integer division truncates toward zero; epochs must floor
    if (timestamp % width != 0 && timestamp < 0) {
        --epoch;
    }
    return epoch;
}

std::int64_t TimeWindow::currentEpoch(const Clock& clock, std::uint64_t window_seconds) {
    return epochAt(clock.now(), window_seconds);
}
