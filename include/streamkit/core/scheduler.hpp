#pragma once

/**
 * @file scheduler.hpp
 * @brief Cooperative scheduler interface and the RunLoop implementation
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "streamkit/core/types.hpp"

namespace streamkit {

/**
 * @brief Identifier of a delayed task; 0 is never issued
 */
using TimerId = std::uint64_t;

/**
 * @brief Unit of work run by a scheduler
 */
using Task = std::function<void()>;

/**
 * @brief Scheduler statistics
 */
struct RunLoopStats {
    std::uint64_t tasks_run{0};
    std::uint64_t timers_fired{0};
    std::uint64_t timers_cancelled{0};
    std::uint64_t task_failures{0};
    std::size_t pending_tasks{0};
    std::size_t pending_timers{0};
};

/**
 * @brief Abstract scheduler interface
 *
 * Push-model streams defer work (deferred completion, debounce timers,
 * interval sources) through this interface instead of running it inline.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /**
     * @brief Run a task on the next scheduling turn
     */
    virtual void post(Task task) = 0;

    /**
     * @brief Run a task once `delay` has elapsed
     * @return Id usable with cancel()
     */
    virtual TimerId post_after(Millis delay, Task task) = 0;

    /**
     * @brief Cancel a delayed task that has not fired yet
     * @return true if the timer was pending
     */
    virtual bool cancel(TimerId id) = 0;

    [[nodiscard]] virtual Timestamp now() const { return Clock::now(); }
};

/**
 * @brief Single cooperative scheduler driven by its owner
 *
 * Posting is thread-safe; tasks only run inside the run_* calls, on the
 * calling thread. Ready tasks run FIFO; timers run in due-time order,
 * ties broken by insertion order.
 */
class RunLoop : public Scheduler {
public:
    explicit RunLoop(std::shared_ptr<spdlog::logger> logger = nullptr);

    RunLoop(const RunLoop&) = delete;
    RunLoop& operator=(const RunLoop&) = delete;

    void post(Task task) override;
    TimerId post_after(Millis delay, Task task) override;
    bool cancel(TimerId id) override;

    /**
     * @brief Run one turn: the tasks ready now and the timers already due
     * @return Number of tasks run
     */
    std::size_t run_once();

    /**
     * @brief Run turns until nothing is ready (pending timers may remain)
     * @return Number of tasks run
     */
    std::size_t run_pending();

    /**
     * @brief Keep running tasks and timers for the given duration
     */
    void run_for(Millis duration);

    /**
     * @brief Run until `pred` holds or the timeout expires
     * @return the final value of `pred`
     */
    bool run_until(const std::function<bool()>& pred, Millis timeout);

    /**
     * @brief Run until no tasks or timers remain
     * @return false if the timeout expired first
     */
    bool run_until_idle(Millis timeout = Millis(5000));

    /**
     * @brief Interrupt a run_for / run_until in progress
     */
    void stop();

    [[nodiscard]] bool empty() const;
    [[nodiscard]] RunLoopStats stats() const;

private:
    using TimerKey = std::pair<Timestamp, TimerId>;

    void run_task(Task& task);
    [[nodiscard]] Timestamp next_due_locked() const;
    void wait_for_work(Timestamp limit);

    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> ready_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, Timestamp> timer_index_;
    TimerId next_timer_id_{1};
    std::uint64_t generation_{0};
    std::atomic<bool> stop_requested_{false};

    RunLoopStats stats_;
};

} // namespace streamkit
