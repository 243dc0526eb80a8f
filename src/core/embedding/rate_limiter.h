#pragma once

#include <chrono>
#include <mutex>

namespace sv {

struct RateLimiterConfig {
    int callsPerMinute = 3000;
};

// RateLimiter: spaces calls at least 60s / callsPerMinute apart.
//
// One instance is shared by every component that talks to the same provider
// account. The check-then-sleep sequence runs under a mutex so the ceiling
// holds across threads.
class RateLimiter {
public:
    using Config = RateLimiterConfig;
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(const Config& config = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until the next call is allowed and records it.
    // Returns the time spent waiting.
    std::chrono::milliseconds acquire();

    std::chrono::milliseconds minInterval() const { return m_minInterval; }

private:
    std::chrono::milliseconds m_minInterval;
    std::mutex m_mutex;
    Clock::time_point m_lastCall;
    bool m_hasCalled = false;
};

} // namespace sv
