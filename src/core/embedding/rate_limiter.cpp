#include "core/embedding/rate_limiter.h"

#include <thread>

namespace sv {

RateLimiter::RateLimiter(const Config& config)
    : m_minInterval(config.callsPerMinute > 0
                        ? std::chrono::milliseconds(60000 / config.callsPerMinute)
                        : std::chrono::milliseconds(0))
{
}

std::chrono::milliseconds RateLimiter::acquire()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::chrono::milliseconds waited{0};
    if (m_hasCalled) {
        const auto nextAllowed = m_lastCall + m_minInterval;
        const auto now = Clock::now();
        if (now < nextAllowed) {
            waited = std::chrono::duration_cast<std::chrono::milliseconds>(nextAllowed - now);
            std::this_thread::sleep_until(nextAllowed);
        }
    }

    m_lastCall = Clock::now();
    m_hasCalled = true;
    return waited;
}

} // namespace sv
