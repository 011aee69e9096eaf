#pragma once

/**
 * @file queue.hpp
 * @brief Bounded, thread-safe queue with overflow policies
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"
#include "streamkit/core/metrics.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {

/**
 * @brief What enqueue does when a bounded queue is full
 */
enum class OverflowPolicy {
    DropOld,    // evict the oldest buffered item
    DropNew,    // discard the incoming item
    Throw       // fail with QueueOverflowError and close the queue
};

[[nodiscard]] inline const char* to_string(OverflowPolicy policy) noexcept {
    switch (policy) {
        case OverflowPolicy::DropOld: return "drop-old";
        case OverflowPolicy::DropNew: return "drop-new";
        case OverflowPolicy::Throw:   return "throw";
    }
    return "unknown";
}

/**
 * @brief Configuration for BackpressureQueue
 */
struct QueueOptions {
    std::size_t limit{0};                          // 0 = unbounded
    OverflowPolicy overflow{OverflowPolicy::Throw};
    CancellationToken token;                       // cancellation closes the queue
    std::shared_ptr<spdlog::logger> logger;        // defaults to "streamkit.queue"

    void validate() const {
        switch (overflow) {
            case OverflowPolicy::DropOld:
            case OverflowPolicy::DropNew:
            case OverflowPolicy::Throw:
                return;
        }
        throw ValidationError("Unknown overflow policy " + std::to_string(static_cast<int>(overflow)));
    }
};

/**
 * @brief FIFO buffer between a producer that must not block and consumers
 *        that wait
 *
 * Producers never block: a full queue applies the overflow policy instead.
 * Blocked consumers are served in arrival order, and an enqueue with a
 * consumer waiting hands the item over directly, so waiting consumers and
 * buffered items never coexist.
 *
 * Closing is terminal and idempotent. After end(error) consumers drain the
 * buffer before they see the error; cancellation discards the buffer and
 * fails consumers at once. Release hooks (upstream unregistration) run
 * before any consumer is woken.
 *
 * @tparam T Item type
 */
template<typename T>
class BackpressureQueue {
public:
    explicit BackpressureQueue(QueueOptions options = {})
        : limit_(options.limit)
        , overflow_(options.overflow)
        , logger_(logging::resolve(std::move(options.logger), "queue")) {
        options.validate();
        stats_.limit = limit_;
        // may close the queue immediately if the token is already cancelled
        registration_ = options.token.register_callback([this] {
            close(std::make_exception_ptr(OperationAbortedError()), true);
        });
    }

    ~BackpressureQueue() {
        registration_.reset();
    }

    // Non-copyable, non-movable (due to synchronization primitives)
    BackpressureQueue(const BackpressureQueue&) = delete;
    BackpressureQueue& operator=(const BackpressureQueue&) = delete;
    BackpressureQueue(BackpressureQueue&&) = delete;
    BackpressureQueue& operator=(BackpressureQueue&&) = delete;

    /**
     * @brief Offer an item
     * @return false if the item was discarded (DropNew, or queue closed)
     * @throws QueueOverflowError under the Throw policy; the queue is then closed
     */
    bool enqueue(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        stats_.enqueued++;

        if (!waiters_.empty()) {
            Waiter* waiter = waiters_.front();
            waiters_.pop_front();
            waiter->value.emplace(std::move(item));
            waiter->finished = true;
            stats_.handed_off++;
            stats_.dequeued++;
            // the waiter lives on its consumer's stack, notify before unlocking
            waiter->cv.notify_one();
            return true;
        }

        if (limit_ == 0 || buffer_.size() < limit_) {
            push_locked(std::move(item));
            return true;
        }

        switch (overflow_) {
            case OverflowPolicy::DropOld:
                buffer_.pop_front();
                stats_.dropped++;
                push_locked(std::move(item));
                logger_->debug("queue full (limit {}), dropped oldest item", limit_);
                return true;

            case OverflowPolicy::DropNew:
                stats_.dropped++;
                logger_->debug("queue full (limit {}), dropped incoming item", limit_);
                return false;

            case OverflowPolicy::Throw:
                break;
        }

        stats_.dropped++;
        QueueOverflowError overflow("Queue overflow: limit of " + std::to_string(limit_) + " reached");
        lock.unlock();
        close(std::make_exception_ptr(overflow), false);
        throw overflow;
    }

    /**
     * @brief Wait for the next item
     * @return nullopt once the queue is closed and drained
     * @throws the closing error once drained, if the queue was failed
     */
    std::optional<T> next() {
        while (true) {
            auto step = next_until(kNoDeadline);
            if (step.has_value()) {
                return std::move(step.value);
            }
            if (step.is_done()) {
                return std::nullopt;
            }
        }
    }

    /**
     * @brief Take the head item without waiting
     * @return nullopt if nothing is buffered
     */
    std::optional<T> try_next() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.empty()) {
            return pop_locked();
        }
        if (closed_ && error_) {
            std::rethrow_exception(error_);
        }
        return std::nullopt;
    }

    /**
     * @brief Wait for the next item until `deadline`
     */
    Step<T> next_until(Timestamp deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!buffer_.empty()) {
            return Step<T>::of(pop_locked());
        }
        if (closed_) {
            return closed_step_locked();
        }

        Waiter waiter;
        waiters_.push_back(&waiter);
        bool finished = detail::wait_until(waiter.cv, lock, deadline, [&waiter] {
            return waiter.finished;
        });
        if (!finished) {
            waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), &waiter), waiters_.end());
            return Step<T>::timeout();
        }
        if (waiter.value) {
            return Step<T>::of(std::move(*waiter.value));
        }
        return closed_step_locked();
    }

    template<typename Rep, typename Period>
    Step<T> next_for(std::chrono::duration<Rep, Period> timeout) {
        return next_until(deadline_after(timeout));
    }

    /**
     * @brief Close the queue; consumers drain the buffer, then see the end
     *        (or `error`, if given)
     */
    void end(std::exception_ptr error = nullptr) {
        close(std::move(error), false);
    }

    /**
     * @brief Close the queue with a failure delivered after the buffer drains
     */
    void fail(std::exception_ptr error) {
        close(std::move(error), false);
    }

    /**
     * @brief Run `hook` when the queue closes, before consumers are woken
     *
     * Runs immediately if the queue is already closed.
     */
    void on_release(std::function<void()> hook) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                release_hooks_.push_back(std::move(hook));
                return;
            }
        }
        run_hook(hook);
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    /**
     * @brief Number of consumers currently blocked
     */
    [[nodiscard]] std::size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiters_.size();
    }

    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
    [[nodiscard]] OverflowPolicy overflow_policy() const noexcept { return overflow_; }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.current_size = buffer_.size();
        return s;
    }

private:
    struct Waiter {
        std::condition_variable cv;
        std::optional<T> value;
        bool finished{false};
    };

    void push_locked(T item) {
        buffer_.push_back(std::move(item));
        if (buffer_.size() > stats_.high_watermark) {
            stats_.high_watermark = buffer_.size();
        }
    }

    T pop_locked() {
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        stats_.dequeued++;
        return item;
    }

    Step<T> closed_step_locked() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
        return Step<T>::done();
    }

    void close(std::exception_ptr error, bool discard) {
        std::vector<std::function<void()>> hooks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            error_ = std::move(error);
            if (discard) {
                stats_.dropped += buffer_.size();
                buffer_.clear();
            }
            hooks.swap(release_hooks_);
        }

        for (auto& hook : hooks) {
            run_hook(hook);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (Waiter* waiter : waiters_) {
            waiter->finished = true;
            waiter->cv.notify_one();
        }
        waiters_.clear();
    }

    void run_hook(const std::function<void()>& hook) {
        try {
            hook();
        } catch (const std::exception& e) {
            logger_->error("queue release hook failed: {}", e.what());
        } catch (...) {
            logger_->error("queue release hook failed: {}", describe(std::current_exception()));
        }
    }

    const std::size_t limit_;
    const OverflowPolicy overflow_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::deque<T> buffer_;
    std::deque<Waiter*> waiters_;
    bool closed_{false};
    std::exception_ptr error_;
    std::vector<std::function<void()>> release_hooks_;
    QueueStats stats_;

    // last member: unregistered first on destruction
    CancellationRegistration registration_;
};

} // namespace streamkit
