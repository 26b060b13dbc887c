#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "application/RateLimiter.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/PipelineErrors.hpp"

using namespace adaharvest;
using application::RetryPolicy;

namespace {

RetryPolicy::Options Fast(int attempts) {
    RetryPolicy::Options options;
    options.maxAttempts = attempts;
    options.baseDelay = std::chrono::milliseconds(1);
    options.maxDelay = std::chrono::milliseconds(4);
    options.jitter = 0.0;
    return options;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RetryPolicy Test..." << std::endl;
    domain::CancellationToken token;

    // Transient errors are retried until success.
    {
        RetryPolicy policy(Fast(5));
        int calls = 0;
        int observed = 0;
        int result = policy.execute([&] {
            if (++calls < 3) throw domain::TransientFetchError("HTTP 503", 503);
            return 42;
        }, token, [&](int, int, std::chrono::milliseconds, const std::exception&) { ++observed; });
        assert(result == 42);
        assert(calls == 3);
        assert(observed == 2);
    }
    std::cout << "[PASS] Transient errors retried." << std::endl;

    // Attempts are bounded and the last error surfaces unchanged.
    {
        RetryPolicy policy(Fast(3));
        int calls = 0;
        bool caught = false;
        try {
            policy.execute([&]() -> int {
                ++calls;
                throw domain::TransientFetchError("HTTP 502 attempt " + std::to_string(calls), 502);
            }, token);
        } catch (const domain::TransientFetchError& e) {
            caught = true;
            assert(e.httpStatus() == 502);
            assert(std::string(e.what()) == "HTTP 502 attempt 3");
        }
        assert(caught);
        assert(calls == 3);
    }
    std::cout << "[PASS] Attempts bounded." << std::endl;

    // Permanent errors are not retried.
    {
        RetryPolicy policy(Fast(5));
        int calls = 0;
        bool caught = false;
        try {
            policy.execute([&]() -> int {
                ++calls;
                throw domain::PermanentFetchError("HTTP 404", 404);
            }, token);
        } catch (const domain::PermanentFetchError&) {
            caught = true;
        }
        assert(caught);
        assert(calls == 1);
    }
    std::cout << "[PASS] Permanent errors not retried." << std::endl;

    // Backoff grows exponentially, is capped, and a longer retry-after hint wins.
    {
        RetryPolicy::Options options;
        options.baseDelay = std::chrono::milliseconds(100);
        options.maxDelay = std::chrono::milliseconds(1000);
        options.jitter = 0.0;
        RetryPolicy policy(options);
        assert(policy.delayFor(1).count() == 100);
        assert(policy.delayFor(2).count() == 200);
        assert(policy.delayFor(3).count() == 400);
        assert(policy.delayFor(10).count() == 1000);
        assert(policy.delayFor(1, std::chrono::milliseconds(5000)).count() == 5000);
        assert(policy.delayFor(3, std::chrono::milliseconds(50)).count() == 400);

        RetryPolicy::Options jittered = options;
        jittered.jitter = 0.3;
        RetryPolicy noisy(jittered, RetryPolicy::IsTransientFetch, 1234);
        for (int i = 0; i < 50; ++i) {
            auto d = noisy.delayFor(2).count();
            assert(d >= 140 && d <= 260);
        }
    }
    std::cout << "[PASS] Backoff schedule." << std::endl;

    // A cancelled token interrupts the backoff sleep.
    {
        RetryPolicy::Options slow = Fast(5);
        slow.baseDelay = std::chrono::milliseconds(10000);
        slow.maxDelay = std::chrono::milliseconds(10000);
        RetryPolicy policy(slow);
        domain::CancellationToken cancel;
        std::thread canceller([&cancel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            cancel.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            policy.execute([]() -> int { throw domain::TransientFetchError("timeout"); }, cancel);
        } catch (const domain::CancelledError&) {
            cancelled = true;
        }
        canceller.join();
        assert(cancelled);
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    }
    std::cout << "[PASS] Backoff sleep cancellable." << std::endl;

    // Storage predicate retries StorageError only.
    {
        RetryPolicy policy(Fast(3), RetryPolicy::IsStorage);
        int calls = 0;
        policy.execute([&] {
            if (++calls < 2) throw domain::StorageError("EIO");
        }, token);
        assert(calls == 2);
    }
    std::cout << "[PASS] Storage retry predicate." << std::endl;

    // Rate limiter: burst passes at once, then requests are paced.
    {
        application::RateLimiter limiter(20.0, 2);
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 4; ++i) limiter.acquire(token);
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed >= std::chrono::milliseconds(80));

        domain::CancellationToken cancelled;
        cancelled.cancel();
        application::RateLimiter paused(100.0, 1);
        paused.pauseFor(std::chrono::milliseconds(60000));
        bool threw = false;
        try {
            paused.acquire(cancelled);
        } catch (const domain::CancelledError&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "[PASS] Rate limiter pacing and pause." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
