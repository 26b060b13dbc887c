/**
 * @file RateLimiter.cpp
 * @brief Implementation of RateLimiter.
 */

#include "application/RateLimiter.hpp"
#include "domain/PipelineErrors.hpp"

#include <algorithm>

namespace adaharvest::application {

RateLimiter::RateLimiter(double requestsPerSecond, int burst)
    : m_rate(requestsPerSecond),
      m_capacity(std::max(1, burst)),
      m_tokens(std::max(1, burst)),
      m_lastRefill(Clock::now()),
      m_pausedUntil(Clock::now()) {}

void RateLimiter::refill(Clock::time_point now) {
    std::chrono::duration<double> elapsed = now - m_lastRefill;
    m_tokens = std::min(m_capacity, m_tokens + elapsed.count() * m_rate);
    m_lastRefill = now;
}

void RateLimiter::acquire(const domain::CancellationToken& token) {
    for (;;) {
        Clock::duration wait{};
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto now = Clock::now();
            if (now < m_pausedUntil) {
                wait = m_pausedUntil - now;
            } else if (m_rate <= 0.0) {
                return;
            } else {
                refill(now);
                if (m_tokens >= 1.0) {
                    m_tokens -= 1.0;
                    return;
                }
                wait = std::chrono::duration_cast<Clock::duration>(
                    std::chrono::duration<double>((1.0 - m_tokens) / m_rate));
            }
        }
        if (!token.sleepFor(wait)) {
            throw domain::CancelledError();
        }
    }
}

void RateLimiter::pauseFor(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto until = Clock::now() + duration;
    if (until > m_pausedUntil) {
        m_pausedUntil = until;
    }
}

} // namespace adaharvest::application
