/**
 * @file RetryPolicy.cpp
 * @brief Implementation of RetryPolicy.
 */

#include "application/RetryPolicy.hpp"

#include <algorithm>

namespace adaharvest::application {

RetryPolicy::RetryPolicy(Options options, Predicate retryable, std::uint64_t seed)
    : m_options(options), m_retryable(std::move(retryable)), m_rng(seed) {
    if (m_options.maxAttempts < 1) m_options.maxAttempts = 1;
    m_options.jitter = std::clamp(m_options.jitter, 0.0, 1.0);
}

bool RetryPolicy::IsTransientFetch(const std::exception& error) {
    return dynamic_cast<const domain::TransientFetchError*>(&error) != nullptr;
}

bool RetryPolicy::IsStorage(const std::exception& error) {
    return dynamic_cast<const domain::StorageError*>(&error) != nullptr;
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt, std::optional<std::chrono::milliseconds> hint) {
    double base = static_cast<double>(m_options.baseDelay.count());
    double cap = static_cast<double>(m_options.maxDelay.count());
    double exponential = base;
    for (int i = 1; i < attempt && exponential < cap; ++i) {
        exponential *= 2.0;
    }
    exponential = std::min(exponential, cap);

    double factor = 1.0;
    if (m_options.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - m_options.jitter, 1.0 + m_options.jitter);
        std::lock_guard<std::mutex> lock(m_rngMutex);
        factor = dist(m_rng);
    }

    auto delay = std::chrono::milliseconds(static_cast<long long>(exponential * factor));
    if (hint && *hint > delay) {
        delay = *hint;
    }
    return delay;
}

} // namespace adaharvest::application
