#pragma once

/**
 * @file worker_pool.hpp
 * @brief Dynamically sized pool of worker threads
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"
#include "streamkit/core/metrics.hpp"
#include "streamkit/core/types.hpp"

namespace streamkit {

/**
 * @brief Lifecycle of one worker
 *
 * Idle -> Busy -> Idle on each task; Idle -> Terminating -> Terminated on
 * reap or shutdown; any state -> Terminated on a fatal worker exit.
 */
enum class WorkerState {
    Idle,
    Busy,
    Terminating,
    Terminated
};

[[nodiscard]] const char* to_string(WorkerState state) noexcept;

/**
 * @brief Thrown by a handler to end its worker with an exit code
 *
 * The current task is rejected and the worker is replaced unless the pool
 * is terminating.
 */
struct WorkerExit {
    int code{0};
};

/**
 * @brief Per-worker options
 */
struct WorkerOptions {
    std::string name_prefix{"worker"};     // worker ids are "<prefix>-<n>"
};

/**
 * @brief Configuration for WorkerPool
 */
struct WorkerPoolConfig {
    std::uint32_t min_workers{1};
    std::uint32_t max_workers{0};           // 0 = auto-detect (cores - 1, at least 1)
    Millis idle_timeout{30000};
    std::size_t max_queue_size{1000};
    Millis reap_interval{1000};             // idle sweep period
    std::size_t drain_batch_size{10};       // queued tasks assigned per drain pass
    WorkerOptions worker_options;

    // called with the pool lock held; must not call back into the pool
    std::function<void(const std::string& worker_id)> on_worker_created;
    std::function<void(const std::string& worker_id, std::optional<int> exit_code)> on_worker_terminated;

    std::shared_ptr<spdlog::logger> logger; // defaults to "streamkit.worker_pool"

    /**
     * @throws ValidationError on min > max, zero intervals or batch size
     */
    void validate() const;

    /**
     * @brief max_workers with 0 resolved against the hardware
     */
    [[nodiscard]] std::uint32_t resolved_max_workers() const noexcept;
};

/**
 * @brief Pool of OS threads executing Request -> Response handlers
 *
 * Every worker owns one handler made by the factory. All pool bookkeeping
 * is guarded by a single mutex; handlers run outside it. Results are
 * delivered through std::future, in completion order; tasks leave the
 * queue in submission order.
 *
 * Handlers must not call back into their own pool's terminate().
 */
template<typename Request, typename Response>
class WorkerPool {
public:
    using Handler = std::function<Response(Request)>;
    using WorkerFactory = std::function<Handler()>;

    /**
     * @brief Start min_workers workers and the idle reaper
     * @throws ValidationError on an invalid config
     */
    explicit WorkerPool(WorkerFactory factory, WorkerPoolConfig config = {})
        : factory_(std::move(factory))
        , config_(std::move(config))
        , max_workers_(config_.resolved_max_workers())
        , logger_(logging::resolve(config_.logger, "worker_pool")) {
        config_.validate();
        if (!factory_) {
            throw ValidationError("WorkerPool requires a worker factory");
        }
        if (config_.min_workers > max_workers_) {
            throw ValidationError("minWorkers cannot exceed maxWorkers");
        }

        try {
            std::lock_guard<std::mutex> lock(mutex_);
            for (std::uint32_t i = 0; i < config_.min_workers; i++) {
                create_worker_locked();
            }
        } catch (...) {
            shutdown(true);
            throw;
        }
        reaper_ = std::thread(&WorkerPool::reap_loop, this);

        logger_->debug("worker pool started (min={}, max={}, queue={})",
                       config_.min_workers, max_workers_, config_.max_queue_size);
    }

    ~WorkerPool() {
        terminate(false);
    }

    // Non-copyable, non-movable (due to synchronization primitives)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Run a request on an idle worker, a new worker, or after queueing
     * @throws PoolTerminatingError once terminate() has been called
     * @throws QueueFullError when every worker is busy and the queue is full
     */
    std::future<Response> execute(Request request) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminating_) {
            metrics_.rejected().increment();
            throw PoolTerminatingError();
        }

        Task task{std::move(request), std::promise<Response>(), Clock::now(), false};
        auto future = task.promise.get_future();

        if (auto* worker = find_idle_locked()) {
            assign_locked(*worker, std::move(task));
        } else if (workers_.size() < max_workers_) {
            assign_locked(create_worker_locked(), std::move(task));
        } else if (queue_.size() < config_.max_queue_size) {
            queue_.push_back(std::move(task));
        } else {
            metrics_.rejected().increment();
            throw QueueFullError();
        }
        metrics_.submitted().increment();
        return future;
    }

    /**
     * @brief Stop accepting work, reject queued tasks and stop every worker
     *
     * Graceful termination lets in-flight tasks finish; force rejects them
     * at once with PoolTerminatingError. Either way worker threads are
     * joined before returning. Idempotent.
     */
    void terminate(bool force = false) {
        std::call_once(shutdown_once_, [this, force] { shutdown(force); });
    }

    [[nodiscard]] bool is_terminating() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminating_;
    }

    [[nodiscard]] PoolStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        PoolStats stats;
        stats.total_workers = workers_.size();
        for (const auto& [key, worker] : workers_) {
            switch (worker->state) {
                case WorkerState::Idle:        stats.idle_workers++; break;
                case WorkerState::Busy:        stats.busy_workers++; break;
                case WorkerState::Terminating: stats.terminating_workers++; break;
                case WorkerState::Terminated:  stats.terminated_workers++; break;
            }
        }
        stats.terminated_workers += graveyard_.size();
        stats.queued_tasks = queue_.size();
        return stats;
    }

    [[nodiscard]] const PoolMetrics& metrics() const noexcept { return metrics_; }

    [[nodiscard]] std::uint32_t max_workers() const noexcept { return max_workers_; }

private:
    struct Task {
        Request request;
        std::promise<Response> promise;
        Timestamp enqueued_at;
        bool settled;
    };

    struct Worker {
        std::uint64_t key{0};
        std::string id;
        WorkerState state{WorkerState::Idle};
        Timestamp last_used{};
        std::optional<Task> current;
        bool dispatched{false};     // current task handed to the thread
        bool stop{false};
        std::condition_variable cv;
        std::thread thread;
    };

    Worker& create_worker_locked() {
        Handler handler = factory_();
        if (!handler) {
            throw ValidationError("Worker factory returned an empty handler");
        }

        auto key = next_worker_key_++;
        auto worker = std::make_unique<Worker>();
        worker->key = key;
        worker->id = config_.worker_options.name_prefix + "-" + std::to_string(key);
        worker->last_used = Clock::now();

        auto& ref = *worker;
        workers_.emplace(key, std::move(worker));
        ref.thread = std::thread(&WorkerPool::run, this, &ref, std::move(handler));

        metrics_.workers_created().increment();
        metrics_.live_workers().set(static_cast<std::int64_t>(workers_.size()));
        logger_->debug("created {} ({} workers)", ref.id, workers_.size());
        if (config_.on_worker_created) {
            config_.on_worker_created(ref.id);
        }
        return ref;
    }

    Worker* find_idle_locked() {
        for (auto& [key, worker] : workers_) {
            if (worker->state == WorkerState::Idle && !worker->stop) {
                return worker.get();
            }
        }
        return nullptr;
    }

    void assign_locked(Worker& worker, Task task) {
        auto waited = std::chrono::duration<double, std::milli>(Clock::now() - task.enqueued_at);
        metrics_.queue_wait_ms().observe(waited.count());

        worker.state = WorkerState::Busy;
        metrics_.busy_workers().increment();
        worker.last_used = Clock::now();
        worker.current.emplace(std::move(task));
        worker.dispatched = false;
        worker.cv.notify_one();
    }

    /**
     * @brief Hand queued tasks to idle workers, at most drain_batch_size per pass
     */
    void drain_locked() {
        std::size_t assigned = 0;
        while (!queue_.empty() && assigned < config_.drain_batch_size) {
            auto* worker = find_idle_locked();
            if (!worker) {
                break;
            }
            Task task = std::move(queue_.front());
            queue_.pop_front();
            assign_locked(*worker, std::move(task));
            assigned++;
        }
    }

    void settle_value_locked(Task& task, Response* response) {
        if (task.settled) {
            return;
        }
        task.settled = true;
        if constexpr (std::is_void_v<Response>) {
            task.promise.set_value();
        } else {
            task.promise.set_value(std::move(*response));
        }
    }

    static void settle_error_locked(Task& task, std::exception_ptr error) {
        if (task.settled) {
            return;
        }
        task.settled = true;
        task.promise.set_exception(std::move(error));
    }

    void run(Worker* worker, Handler handler) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<int> exit_code;
        bool fatal = false;

        while (true) {
            worker->cv.wait(lock, [worker] {
                return (worker->current && !worker->dispatched) || worker->stop;
            });
            if (!worker->current || worker->dispatched) {
                break;
            }
            worker->dispatched = true;
            Request request = std::move(worker->current->request);
            lock.unlock();

            std::exception_ptr failure;
            std::optional<std::conditional_t<std::is_void_v<Response>, bool, Response>> response;
            try {
                if constexpr (std::is_void_v<Response>) {
                    handler(std::move(request));
                    response.emplace(true);
                } else {
                    response.emplace(handler(std::move(request)));
                }
            } catch (const WorkerExit& exit) {
                exit_code = exit.code;
                fatal = true;
            } catch (...) {
                failure = std::current_exception();
            }

            lock.lock();
            Task& task = *worker->current;
            if (fatal) {
                metrics_.failed().increment();
                settle_error_locked(task, std::make_exception_ptr(WorkerFailureError(
                    worker->id, "Worker stopped with exit code " + std::to_string(*exit_code), exit_code)));
            } else if (failure) {
                metrics_.failed().increment();
                settle_error_locked(task, std::make_exception_ptr(WorkerFailureError(
                    worker->id, "Task failed on " + worker->id + ": " + describe(failure),
                    std::nullopt, failure)));
            } else {
                metrics_.completed().increment();
                if constexpr (std::is_void_v<Response>) {
                    settle_value_locked(task, nullptr);
                } else {
                    settle_value_locked(task, &*response);
                }
            }
            worker->current.reset();
            worker->dispatched = false;
            metrics_.busy_workers().decrement();

            if (fatal) {
                break;
            }
            worker->last_used = Clock::now();
            if (worker->stop) {
                break;
            }
            worker->state = WorkerState::Idle;
            drain_locked();
        }

        // the record is erased here; copy what is needed afterwards
        std::string id = worker->id;
        worker->state = WorkerState::Terminated;
        graveyard_.push_back(std::move(worker->thread));
        workers_.erase(worker->key);
        worker = nullptr;
        metrics_.live_workers().set(static_cast<std::int64_t>(workers_.size()));

        bool replace = fatal && !terminating_ &&
                       (workers_.size() < config_.min_workers || !queue_.empty());
        if (fatal) {
            if (exit_code && *exit_code != 0) {
                logger_->error("{} exited with code {}", id, *exit_code);
            } else {
                logger_->info("{} exited", id);
            }
        } else {
            logger_->debug("{} terminated ({} workers)", id, workers_.size());
        }
        if (replace) {
            try {
                create_worker_locked();
                metrics_.workers_replaced().increment();
                logger_->warn("replaced {} ({} workers)", id, workers_.size());
                drain_locked();
            } catch (const std::exception& e) {
                logger_->error("failed to replace {}: {}", id, e.what());
            } catch (...) {
                logger_->error("failed to replace {}: {}", id, describe(std::current_exception()));
            }
        }
        workers_changed_.notify_all();
        lock.unlock();

        if (config_.on_worker_terminated) {
            config_.on_worker_terminated(id, exit_code);
        }
    }

    void reap_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!terminating_) {
            reaper_cv_.wait_for(lock, config_.reap_interval, [this] { return terminating_; });
            if (terminating_) {
                break;
            }
            reap_idle_locked();

            std::vector<std::thread> exited;
            exited.swap(graveyard_);
            lock.unlock();
            for (auto& thread : exited) {
                thread.join();
            }
            lock.lock();
        }
    }

    /**
     * @brief Stop idle workers past idle_timeout, never going below min_workers
     */
    void reap_idle_locked() {
        auto now = Clock::now();
        std::size_t live = 0;
        for (const auto& [key, worker] : workers_) {
            if (!worker->stop) {
                live++;
            }
        }
        for (auto& [key, worker] : workers_) {
            if (live <= config_.min_workers) {
                break;
            }
            if (worker->state != WorkerState::Idle || worker->stop) {
                continue;
            }
            if (now - worker->last_used < config_.idle_timeout) {
                continue;
            }
            worker->state = WorkerState::Terminating;
            worker->stop = true;
            worker->cv.notify_one();
            live--;
            metrics_.workers_reaped().increment();
            logger_->debug("reaping idle {}", worker->id);
        }
    }

    void shutdown(bool force) {
        std::deque<Task> rejected;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            terminating_ = true;
            rejected.swap(queue_);
            for (auto& task : rejected) {
                metrics_.rejected().increment();
                settle_error_locked(task, std::make_exception_ptr(PoolTerminatingError()));
            }
            for (auto& [key, worker] : workers_) {
                if (worker->state == WorkerState::Idle) {
                    worker->state = WorkerState::Terminating;
                }
                if (force && worker->current) {
                    settle_error_locked(*worker->current, std::make_exception_ptr(
                        PoolTerminatingError("Worker pool terminated while the task was running")));
                }
                worker->stop = true;
                worker->cv.notify_one();
            }
            reaper_cv_.notify_all();
            logger_->info("terminating worker pool ({} workers, {} queued tasks rejected, force={})",
                          workers_.size(), rejected.size(), force);

            workers_changed_.wait(lock, [this] { return workers_.empty(); });
        }

        if (reaper_.joinable()) {
            reaper_.join();
        }
        std::vector<std::thread> exited;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            exited.swap(graveyard_);
        }
        for (auto& thread : exited) {
            thread.join();
        }
        logger_->info("worker pool terminated ({})", metrics_.format());
    }

    WorkerFactory factory_;
    WorkerPoolConfig config_;
    std::uint32_t max_workers_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::map<std::uint64_t, std::unique_ptr<Worker>> workers_;
    std::deque<Task> queue_;
    std::vector<std::thread> graveyard_;    // exited worker threads awaiting join
    std::uint64_t next_worker_key_{1};
    bool terminating_{false};

    std::condition_variable workers_changed_;
    std::condition_variable reaper_cv_;
    std::thread reaper_;
    std::once_flag shutdown_once_;
    PoolMetrics metrics_;
};

} // namespace streamkit
