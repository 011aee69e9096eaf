#pragma once

/**
 * @file pump.hpp
 * @brief Threads that drain sequences into a BackpressureQueue
 *
 * Used where a consumer must wait on several sources at once (merge, race)
 * or where a producer must run ahead of its consumer (with_queue).
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "streamkit/core/queue.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace detail {

/**
 * @brief Slice length of each pump pull, bounding how long stop() waits
 */
constexpr Millis kPumpSlice{50};

enum class PumpEvent { Value, Done, Error };

/**
 * @brief Item forwarded by a pump, tagged with its source index
 */
template<typename T>
struct Tagged {
    std::size_t source{0};
    PumpEvent event{PumpEvent::Done};
    std::optional<T> value;
    std::exception_ptr error;
};

/**
 * @brief One pump thread per source, all feeding one queue
 *
 * Each source is owned and pulled only by its pump thread. A pump does not
 * pull again until the consumer has taken its previous value, so the queue
 * holds at most one undelivered value per source. The destructor stops
 * every pump and joins it.
 */
template<typename T>
class PumpGroup {
public:
    explicit PumpGroup(std::vector<SequencePtr<T>> sources)
        : sources_(std::move(sources)) {
        for (std::size_t i = 0; i < sources_.size(); i++) {
            stops_.push_back(std::make_unique<std::atomic<bool>>(false));
        }
        undelivered_.assign(sources_.size(), false);
    }

    ~PumpGroup() {
        stop_all();
        queue_.end();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    PumpGroup(const PumpGroup&) = delete;
    PumpGroup& operator=(const PumpGroup&) = delete;

    void start() {
        if (started_) {
            return;
        }
        started_ = true;
        threads_.reserve(sources_.size());
        for (std::size_t i = 0; i < sources_.size(); i++) {
            threads_.emplace_back(&PumpGroup::run, this, i);
        }
    }

    void stop(std::size_t index) {
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            stops_[index]->store(true, std::memory_order_release);
        }
        gate_cv_.notify_all();
    }

    void stop_all() {
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            for (auto& flag : stops_) {
                flag->store(true, std::memory_order_release);
            }
        }
        gate_cv_.notify_all();
    }

    Step<Tagged<T>> next_until(Timestamp deadline) {
        auto step = queue_.next_until(deadline);
        if (step.has_value() && step.value->event == PumpEvent::Value) {
            {
                std::lock_guard<std::mutex> lock(gate_mutex_);
                undelivered_[step.value->source] = false;
            }
            gate_cv_.notify_all();
        }
        return step;
    }

    [[nodiscard]] std::size_t size() const noexcept { return sources_.size(); }

private:
    void run(std::size_t index) {
        auto& source = sources_[index];
        auto& stopped = *stops_[index];
        try {
            while (!stopped.load(std::memory_order_acquire)) {
                auto step = source->pull(deadline_after(kPumpSlice));
                if (step.is_timeout()) {
                    continue;
                }
                if (step.is_done()) {
                    queue_.enqueue(Tagged<T>{index, PumpEvent::Done, std::nullopt, nullptr});
                    break;
                }
                {
                    std::lock_guard<std::mutex> lock(gate_mutex_);
                    undelivered_[index] = true;
                }
                if (!queue_.enqueue(Tagged<T>{index, PumpEvent::Value, std::move(step.value), nullptr})) {
                    break;
                }
                std::unique_lock<std::mutex> lock(gate_mutex_);
                gate_cv_.wait(lock, [this, index, &stopped] {
                    return !undelivered_[index] || stopped.load(std::memory_order_acquire);
                });
            }
        } catch (...) {
            queue_.enqueue(Tagged<T>{index, PumpEvent::Error, std::nullopt, std::current_exception()});
        }
        // the source is released on its own thread
        source.reset();
    }

    std::vector<SequencePtr<T>> sources_;
    std::vector<std::unique_ptr<std::atomic<bool>>> stops_;
    std::vector<std::thread> threads_;
    BackpressureQueue<Tagged<T>> queue_;
    bool started_{false};

    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    std::vector<bool> undelivered_;     // guarded by gate_mutex_
};

} // namespace detail

namespace seq {

/**
 * @brief with_queue implementation: a pump thread runs the source ahead of
 *        the consumer into a bounded queue
 */
template<typename T>
class QueuedSequence : public Sequence<T> {
public:
    QueuedSequence(SequencePtr<T> source, QueueOptions options)
        : source_(std::move(source))
        , queue_(std::make_shared<BackpressureQueue<T>>(std::move(options))) {}

    ~QueuedSequence() override {
        stop_.store(true, std::memory_order_release);
        queue_->end();
        if (pump_.joinable()) {
            pump_.join();
        }
    }

    Step<T> pull(Timestamp deadline) override {
        if (!pump_.joinable()) {
            pump_ = std::thread(&QueuedSequence::run, this);
        }
        return queue_->next_until(deadline);
    }

    [[nodiscard]] QueueStats stats() const { return queue_->stats(); }

private:
    void run() {
        try {
            while (!stop_.load(std::memory_order_acquire) && !queue_->is_closed()) {
                auto step = source_->pull(deadline_after(detail::kPumpSlice));
                if (step.is_timeout()) {
                    continue;
                }
                if (step.is_done()) {
                    queue_->end();
                    break;
                }
                queue_->enqueue(std::move(*step.value));
            }
        } catch (const QueueOverflowError&) {
            // the queue closed itself with the overflow error
        } catch (...) {
            queue_->fail(std::current_exception());
        }
        source_.reset();
    }

    SequencePtr<T> source_;
    std::shared_ptr<BackpressureQueue<T>> queue_;
    std::atomic<bool> stop_{false};
    std::thread pump_;
};

/**
 * @brief Decouple producer and consumer through a BackpressureQueue
 *
 * The overflow policy decides what happens when the consumer falls behind.
 */
inline auto with_queue(QueueOptions options = {}) {
    return [options](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<QueuedSequence<T>>(std::move(source), options));
    };
}

} // namespace seq
} // namespace streamkit
