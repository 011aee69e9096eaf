/**
 * @file scheduler.cpp
 * @brief RunLoop implementation
 */

#include "streamkit/core/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"

namespace streamkit {

namespace {

// Upper bound on a single blocking wait inside run_until, so the
// predicate is re-checked even when nothing is posted.
constexpr Millis kPollSlice{10};

} // namespace

RunLoop::RunLoop(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::resolve(std::move(logger), "run_loop")) {}

void RunLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(task));
    }
    wake_.notify_all();
}

TimerId RunLoop::post_after(Millis delay, Task task) {
    if (delay.count() < 0) {
        delay = Millis(0);
    }
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        auto due = now() + delay;
        timers_.emplace(TimerKey{due, id}, std::move(task));
        timer_index_.emplace(id, due);
        generation_++;
    }
    wake_.notify_all();
    return id;
}

bool RunLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_index_.find(id);
    if (it == timer_index_.end()) {
        return false;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_index_.erase(it);
    stats_.timers_cancelled++;
    return true;
}

void RunLoop::run_task(Task& task) {
    try {
        task();
        return;
    } catch (const std::exception& e) {
        logger_->error("scheduled task failed: {}", e.what());
    } catch (...) {
        logger_->error("scheduled task failed: {}", describe(std::current_exception()));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.task_failures++;
}

std::size_t RunLoop::run_once() {
    std::deque<Task> batch;
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(ready_);
        auto current = now();
        while (!timers_.empty() && timers_.begin()->first.first <= current) {
            auto node = timers_.begin();
            timer_index_.erase(node->first.second);
            due.push_back(std::move(node->second));
            timers_.erase(node);
        }
        stats_.tasks_run += batch.size();
        stats_.timers_fired += due.size();
    }

    for (auto& task : batch) {
        run_task(task);
    }
    for (auto& task : due) {
        run_task(task);
    }
    return batch.size() + due.size();
}

std::size_t RunLoop::run_pending() {
    std::size_t total = 0;
    while (true) {
        auto ran = run_once();
        if (ran == 0) {
            break;
        }
        total += ran;
    }
    return total;
}

Timestamp RunLoop::next_due_locked() const {
    if (!ready_.empty()) {
        return now();
    }
    if (timers_.empty()) {
        return kNoDeadline;
    }
    return timers_.begin()->first.first;
}

void RunLoop::wait_for_work(Timestamp limit) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto until = std::min(limit, next_due_locked());
    if (until <= now()) {
        return;
    }
    auto seen = generation_;
    detail::wait_until(wake_, lock, until, [this, seen] {
        return !ready_.empty() || generation_ != seen || stop_requested_.load();
    });
}

void RunLoop::run_for(Millis duration) {
    stop_requested_.store(false);
    auto end = deadline_after(duration);
    while (!stop_requested_.load() && now() < end) {
        if (run_once() == 0) {
            wait_for_work(end);
        }
    }
}

bool RunLoop::run_until(const std::function<bool()>& pred, Millis timeout) {
    stop_requested_.store(false);
    auto end = deadline_after(timeout);
    while (!pred()) {
        if (stop_requested_.load() || now() >= end) {
            return pred();
        }
        if (run_once() == 0) {
            wait_for_work(std::min(end, now() + kPollSlice));
        }
    }
    return true;
}

bool RunLoop::run_until_idle(Millis timeout) {
    return run_until([this] { return empty(); }, timeout);
}

void RunLoop::stop() {
    stop_requested_.store(true);
    wake_.notify_all();
}

bool RunLoop::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.empty() && timers_.empty();
}

RunLoopStats RunLoop::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto s = stats_;
    s.pending_tasks = ready_.size();
    s.pending_timers = timers_.size();
    return s;
}

} // namespace streamkit
