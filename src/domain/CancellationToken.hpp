/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a run and its waits.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace webforge::domain {

/**
 * @class CancellationToken
 * @brief Set once; every bounded wait in a run polls or sleeps on it.
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
     * @brief Sleeps up to `duration`, waking early on cancellation.
     * @return True if the token was cancelled.
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, duration, [this] { return m_cancelled.load(); });
    }

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

} // namespace webforge::domain
