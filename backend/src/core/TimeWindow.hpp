#pragma once
#include <cstdint>
#include <ctime>

// Source of wall-clock time. Injected everywhere so tests can move time.
class Clock {
public:
    virtual ~Clock() = default;

    // Seconds since the Unix epoch.
    virtual std::int64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t now() const override;
};

// Maps time to discrete validity windows ("epochs") of fixed width.
//   epoch = floor(unix_time / window_seconds)
class TimeWindow {
public:
    // window_seconds must be non-zero; validateConfig() rejects zero and
    // FlagMinter refuses a config that fails it.
    static std::int64_t epochAt(std::int64_t timestamp, std::uint64_t window_seconds);

    static std::int64_t currentEpoch(const Clock& clock, std::uint64_t window_seconds);
};
