#pragma once

/**
 * @file source.hpp
 * @brief Pull sequence sources, including the push-to-pull bridge
 */

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/event_stream.hpp"
#include "streamkit/core/queue.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace seq {

/**
 * @brief Sequence over a fixed list of values
 */
template<typename T>
class ValuesSequence : public Sequence<T> {
public:
    explicit ValuesSequence(std::vector<T> values)
        : values_(std::move(values)) {}

    Step<T> pull(Timestamp /*deadline*/) override {
        if (index_ >= values_.size()) {
            return Step<T>::done();
        }
        return Step<T>::of(values_[index_++]);
    }

private:
    std::vector<T> values_;
    std::size_t index_{0};
};

template<typename T>
SequencePtr<T> from_values(std::vector<T> values) {
    return std::make_unique<ValuesSequence<T>>(std::move(values));
}

/**
 * @brief Generator returning nullopt once exhausted
 */
template<typename T>
using Generator = std::function<std::optional<T>()>;

/**
 * @brief Sequence driven by a generator function
 */
template<typename T>
class GeneratorSequence : public Sequence<T> {
public:
    explicit GeneratorSequence(Generator<T> generator)
        : generator_(std::move(generator)) {}

    Step<T> pull(Timestamp /*deadline*/) override {
        if (done_) {
            return Step<T>::done();
        }
        auto value = generator_();
        if (!value) {
            done_ = true;
            return Step<T>::done();
        }
        return Step<T>::of(std::move(*value));
    }

private:
    Generator<T> generator_;
    bool done_{false};
};

template<typename T>
SequencePtr<T> from_generator(Generator<T> generator) {
    if (!generator) {
        throw ValidationError("from_generator requires a generator");
    }
    return std::make_unique<GeneratorSequence<T>>(std::move(generator));
}

/**
 * @brief 0, 1, 2, ... one value per period
 */
class IntervalSequence : public Sequence<std::uint64_t> {
public:
    IntervalSequence(Millis period, std::optional<std::uint64_t> count, CancellationToken token)
        : period_(period)
        , count_(count)
        , token_(std::move(token)) {}

    Step<std::uint64_t> pull(Timestamp deadline) override {
        if (count_ && emitted_ >= *count_) {
            return Step<std::uint64_t>::done();
        }
        if (!started_) {
            started_ = true;
            next_at_ = Clock::now() + period_;
        }
        auto limit = std::min(deadline, next_at_);
        if (token_.wait_until(limit)) {
            throw OperationAbortedError("Interval aborted");
        }
        if (Clock::now() < next_at_) {
            return Step<std::uint64_t>::timeout();
        }
        next_at_ += period_;
        return Step<std::uint64_t>::of(emitted_++);
    }

private:
    Millis period_;
    std::optional<std::uint64_t> count_;
    CancellationToken token_;
    Timestamp next_at_{};
    std::uint64_t emitted_{0};
    bool started_{false};
};

/**
 * @throws ValidationError on a non-positive period
 */
inline SequencePtr<std::uint64_t> from_interval(Millis period,
                                                std::optional<std::uint64_t> count = std::nullopt,
                                                CancellationToken token = {}) {
    if (period.count() <= 0) {
        throw ValidationError("Interval period must be positive");
    }
    return std::make_unique<IntervalSequence>(period, count, std::move(token));
}

/**
 * @brief Consumer side of a BackpressureQueue as a sequence
 */
template<typename T>
class QueueSequence : public Sequence<T> {
public:
    explicit QueueSequence(std::shared_ptr<BackpressureQueue<T>> queue)
        : queue_(std::move(queue)) {}

    Step<T> pull(Timestamp deadline) override {
        return queue_->next_until(deadline);
    }

private:
    std::shared_ptr<BackpressureQueue<T>> queue_;
};

template<typename T>
SequencePtr<T> from_queue(std::shared_ptr<BackpressureQueue<T>> queue) {
    if (!queue) {
        throw ValidationError("from_queue requires a queue");
    }
    return std::make_unique<QueueSequence<T>>(std::move(queue));
}

/**
 * @brief Pull view of an EventStream, buffered by a BackpressureQueue
 *
 * Values emitted before the first pull are buffered too: the subscription
 * is made on construction. Stream completion ends the queue. Closing the
 * queue (cancellation, overflow) unsubscribes from the stream before any
 * waiting consumer is released.
 */
template<typename T>
class StreamSequence : public Sequence<T> {
public:
    StreamSequence(StreamPtr<T> stream, QueueOptions options)
        : stream_(std::move(stream))
        , queue_(std::make_shared<BackpressureQueue<T>>(std::move(options)))
        , subscription_(std::make_shared<Subscription>()) {
        std::weak_ptr<BackpressureQueue<T>> weak_queue = queue_;

        Observer<T> observer(
            [weak_queue](const T& value) {
                auto queue = weak_queue.lock();
                if (!queue) {
                    return;
                }
                try {
                    queue->enqueue(value);
                } catch (const QueueOverflowError&) {
                    // the queue is closed and its consumer sees the overflow
                }
            },
            nullptr,
            [weak_queue] {
                if (auto queue = weak_queue.lock()) {
                    queue->end();
                }
            });

        auto unsubscribe = stream_->subscribe(std::move(observer));
        subscription_->set(std::move(unsubscribe));

        auto subscription = subscription_;
        queue_->on_release([subscription] { subscription->release(); });
    }

    ~StreamSequence() override {
        subscription_->release();
        queue_->end();
    }

    Step<T> pull(Timestamp deadline) override {
        return queue_->next_until(deadline);
    }

    [[nodiscard]] QueueStats stats() const { return queue_->stats(); }

private:
    /**
     * @brief Unsubscribe exactly once, from whichever side gets there first
     */
    class Subscription {
    public:
        void set(Unsubscribe unsubscribe) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!released_) {
                    unsubscribe_ = std::move(unsubscribe);
                    return;
                }
            }
            if (unsubscribe) {
                unsubscribe();
            }
        }

        void release() {
            Unsubscribe unsubscribe;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (released_) {
                    return;
                }
                released_ = true;
                unsubscribe.swap(unsubscribe_);
            }
            if (unsubscribe) {
                unsubscribe();
            }
        }

    private:
        std::mutex mutex_;
        Unsubscribe unsubscribe_;
        bool released_{false};
    };

    StreamPtr<T> stream_;
    std::shared_ptr<BackpressureQueue<T>> queue_;
    std::shared_ptr<Subscription> subscription_;
};

/**
 * @brief Bridge a push stream into a pull sequence
 */
template<typename T>
SequencePtr<T> from_stream(StreamPtr<T> stream, QueueOptions options = {}) {
    if (!stream) {
        throw ValidationError("from_stream requires a stream");
    }
    return std::make_unique<StreamSequence<T>>(std::move(stream), std::move(options));
}

} // namespace seq
} // namespace streamkit
