#pragma once

/**
 * @file types.hpp
 * @brief Clock aliases and blocking-wait helpers shared by every component
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace streamkit {

/**
 * @brief Monotonic clock used for deadlines, timers and rate limiting
 */
using Clock = std::chrono::steady_clock;

/**
 * @brief Point in time on the monotonic clock
 */
using Timestamp = Clock::time_point;

/**
 * @brief Millisecond durations are the unit of every public timeout
 */
using Millis = std::chrono::milliseconds;

/**
 * @brief Deadline meaning "wait as long as it takes"
 */
constexpr Timestamp kNoDeadline = Timestamp::max();

/**
 * @brief Deadline `timeout` from now, saturating instead of overflowing
 */
template<typename Rep, typename Period>
[[nodiscard]] Timestamp deadline_after(std::chrono::duration<Rep, Period> timeout) {
    auto now = Clock::now();
    auto delta = std::chrono::duration_cast<Clock::duration>(timeout);
    if (delta >= kNoDeadline - now) {
        return kNoDeadline;
    }
    return now + delta;
}

namespace detail {

/**
 * @brief condition_variable::wait_until that treats kNoDeadline as "forever"
 *
 * Some standard libraries convert steady deadlines to the system clock,
 * which overflows for time_point::max().
 * @return the predicate's value on return
 */
template<typename Predicate>
bool wait_until(std::condition_variable& cv,
                std::unique_lock<std::mutex>& lock,
                Timestamp deadline,
                Predicate pred) {
    if (deadline == kNoDeadline) {
        cv.wait(lock, pred);
        return true;
    }
    return cv.wait_until(lock, deadline, pred);
}

inline void sleep_until(Timestamp deadline) {
    if (deadline != kNoDeadline) {
        std::this_thread::sleep_until(deadline);
    }
}

} // namespace detail

} // namespace streamkit
