/**
 * @file RetryPolicy.hpp
 * @brief Bounded retry with exponential backoff and jitter.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include "domain/CancellationToken.hpp"
#include "domain/PipelineErrors.hpp"

namespace adaharvest::application {

/**
 * @class RetryPolicy
 * @brief Max attempts, backoff schedule and retryable-error predicate in one object.
 *
 * The delay before attempt n+1 is min(maxDelay, baseDelay * 2^(n-1)), scaled by a
 * random factor in [1 - jitter, 1 + jitter], and never shorter than a retry-after
 * hint carried by a TransientFetchError.
 */
class RetryPolicy {
public:
    struct Options {
        int maxAttempts = 5;
        std::chrono::milliseconds baseDelay{500};
        std::chrono::milliseconds maxDelay{30000};
        double jitter = 0.3;
    };

    using Predicate = std::function<bool(const std::exception&)>;
    using RetryObserver = std::function<void(int attempt, int maxAttempts,
                                             std::chrono::milliseconds delay,
                                             const std::exception& error)>;

    explicit RetryPolicy(Options options,
                         Predicate retryable = IsTransientFetch,
                         std::uint64_t seed = std::random_device{}());

    static bool IsTransientFetch(const std::exception& error);
    static bool IsStorage(const std::exception& error);

    const Options& options() const { return m_options; }

    /** @brief Delay to wait after failed attempt @p attempt (1-based). */
    std::chrono::milliseconds delayFor(int attempt, std::optional<std::chrono::milliseconds> hint = std::nullopt);

    /**
     * @brief Runs @p fn until it succeeds, throws a non-retryable error or the attempts run out.
     *
     * The last error is rethrown unchanged. CancelledError always propagates at once,
     * and a backoff sleep interrupted by @p token raises CancelledError.
     */
    template <typename Fn>
    auto execute(Fn&& fn, const domain::CancellationToken& token, const RetryObserver& onRetry = {})
        -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            if (token.isCancelled()) {
                throw domain::CancelledError();
            }
            try {
                return fn();
            } catch (const domain::CancelledError&) {
                throw;
            } catch (const std::exception& error) {
                if (!m_retryable(error) || attempt >= m_options.maxAttempts) {
                    throw;
                }
                std::optional<std::chrono::milliseconds> hint;
                if (auto transient = dynamic_cast<const domain::TransientFetchError*>(&error)) {
                    hint = transient->retryAfter();
                }
                auto delay = delayFor(attempt, hint);
                if (onRetry) {
                    onRetry(attempt, m_options.maxAttempts, delay, error);
                }
                if (!token.sleepFor(delay)) {
                    throw domain::CancelledError();
                }
            }
        }
    }

private:
    Options m_options;
    Predicate m_retryable;
    std::mutex m_rngMutex;
    std::mt19937_64 m_rng;
};

} // namespace adaharvest::application
