/**
 * @file RateLimiter.hpp
 * @brief Process-wide token bucket shared by every request to the portal.
 */

#pragma once

#include <chrono>
#include <mutex>
#include "domain/CancellationToken.hpp"

namespace adaharvest::application {

/**
 * @class RateLimiter
 * @brief Token bucket with a global pause for server-requested back-off.
 *
 * A rate of zero or less disables limiting (pauses still apply).
 */
class RateLimiter {
public:
    RateLimiter(double requestsPerSecond, int burst);

    /**
     * @brief Blocks until a request may be sent.
     * @throws domain::CancelledError when @p token fires while waiting.
     */
    void acquire(const domain::CancellationToken& token);

    /** @brief Holds back every caller for at least @p duration (HTTP 429 Retry-After). */
    void pauseFor(std::chrono::milliseconds duration);

private:
    using Clock = std::chrono::steady_clock;

    void refill(Clock::time_point now);

    double m_rate;
    double m_capacity;
    double m_tokens;
    Clock::time_point m_lastRefill;
    Clock::time_point m_pausedUntil;
    std::mutex m_mutex;
};

} // namespace adaharvest::application
