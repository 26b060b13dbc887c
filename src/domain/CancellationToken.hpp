/**
 * @file CancellationToken.hpp
 * @brief Run-level cancellation signal shared by the runner, stages and blocking calls.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace adaharvest::domain {

/**
 * @class CancellationToken
 * @brief One-shot flag with an interruptible sleep.
 *
 * cancel() may be called from any thread. It is not async-signal-safe; signal
 * handlers should only set a flag that a regular thread forwards here.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Sleeps for @p duration unless cancelled first.
     * @return false when the sleep was interrupted by cancellation.
     */
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_cv.wait_for(lock, duration, [this] { return m_cancelled.load(); });
    }

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

} // namespace adaharvest::domain
