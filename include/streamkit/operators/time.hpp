#pragma once

/**
 * @file time.hpp
 * @brief Time-based pull operators: debounce_time, throttle_time, timeout
 *
 * Timers are deadlines kept inside the operator; nothing runs in the
 * background, so dropping the sequence releases everything at once.
 */

#include <optional>
#include <string>
#include <utility>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace seq {

/**
 * @brief debounce_time implementation
 */
template<typename T>
class DebounceSequence : public Sequence<T> {
public:
    DebounceSequence(SequencePtr<T> source, Millis wait, CancellationToken token)
        : source_(std::move(source))
        , wait_(wait)
        , token_(std::move(token)) {}

    Step<T> pull(Timestamp deadline) override {
        while (true) {
            token_.throw_if_cancelled();
            if (source_done_) {
                return take_pending_or_done();
            }

            auto limit = pending_ ? std::min(deadline, fire_at_) : deadline;
            auto step = source_->pull(detail::poll_limit(limit, token_));

            if (step.has_value()) {
                // a newer value replaces the pending one and restarts the timer
                pending_ = std::move(step.value);
                fire_at_ = Clock::now() + wait_;
                continue;
            }
            if (step.is_done()) {
                source_done_ = true;
                continue;
            }

            auto now = Clock::now();
            if (pending_ && now >= fire_at_) {
                return take_pending_or_done();
            }
            if (now >= deadline) {
                return Step<T>::timeout();
            }
        }
    }

private:
    Step<T> take_pending_or_done() {
        if (!pending_) {
            return Step<T>::done();
        }
        T value = std::move(*pending_);
        pending_.reset();
        return Step<T>::of(std::move(value));
    }

    SequencePtr<T> source_;
    Millis wait_;
    CancellationToken token_;
    std::optional<T> pending_;
    Timestamp fire_at_{};
    bool source_done_{false};
};

/**
 * @brief Emit a value once `wait` passes without a newer one; the pending
 *        value is flushed when the source ends
 * @throws ValidationError on a negative wait
 */
inline auto debounce_time(Millis wait, CancellationToken token = {}) {
    if (wait.count() < 0) {
        throw ValidationError("Debounce time must be non-negative");
    }
    return [wait, token](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<DebounceSequence<T>>(std::move(source), wait, token));
    };
}

/**
 * @brief Options for throttle_time
 */
struct ThrottleOptions {
    bool leading{true};     // emit the value that opens a window
    bool trailing{true};    // emit the latest suppressed value when the window closes
    CancellationToken token;

    void validate() const {
        if (!leading && !trailing) {
            throw ValidationError("Throttle needs leading or trailing emission enabled");
        }
    }
};

/**
 * @brief throttle_time implementation
 *
 * A window of `interval` opens with each emission (or with the first value
 * when leading is off). Values inside the window replace the pending value;
 * when the window closes the pending value is emitted once, which opens the
 * next window.
 */
template<typename T>
class ThrottleSequence : public Sequence<T> {
public:
    ThrottleSequence(SequencePtr<T> source, Millis interval, ThrottleOptions options)
        : source_(std::move(source))
        , interval_(interval)
        , options_(std::move(options)) {}

    Step<T> pull(Timestamp deadline) override {
        while (true) {
            options_.token.throw_if_cancelled();
            auto now = Clock::now();
            bool in_window = now < window_end_;

            if (!in_window && pending_) {
                window_end_ = now + interval_;
                return take_pending();
            }
            if (source_done_) {
                if (pending_) {
                    return take_pending();
                }
                return Step<T>::done();
            }

            auto limit = (in_window && pending_) ? std::min(deadline, window_end_) : deadline;
            auto step = source_->pull(detail::poll_limit(limit, options_.token));

            if (step.has_value()) {
                now = Clock::now();
                if (now >= window_end_) {
                    window_end_ = now + interval_;
                    if (options_.leading) {
                        return step;
                    }
                }
                if (options_.trailing) {
                    pending_ = std::move(step.value);
                }
                continue;
            }
            if (step.is_done()) {
                source_done_ = true;
                continue;
            }
            now = Clock::now();
            if (pending_ && now >= window_end_) {
                continue;
            }
            if (now >= deadline) {
                return Step<T>::timeout();
            }
        }
    }

private:
    Step<T> take_pending() {
        T value = std::move(*pending_);
        pending_.reset();
        return Step<T>::of(std::move(value));
    }

    SequencePtr<T> source_;
    Millis interval_;
    ThrottleOptions options_;
    std::optional<T> pending_;
    Timestamp window_end_{};
    bool source_done_{false};
};

/**
 * @brief Rate-limit emissions to at most one per `interval` (plus the
 *        trailing value of each window)
 * @throws ValidationError on a negative interval, or with both leading and
 *         trailing emission disabled
 */
inline auto throttle_time(Millis interval, ThrottleOptions options = {}) {
    if (interval.count() < 0) {
        throw ValidationError("Throttle time must be non-negative");
    }
    options.validate();
    return [interval, options](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<ThrottleSequence<T>>(std::move(source), interval, options));
    };
}

/**
 * @brief Options for timeout
 */
struct TimeoutOptions {
    std::optional<std::string> message;     // replaces the default error message
};

/**
 * @brief timeout implementation
 */
template<typename T>
class TimeoutSequence : public Sequence<T> {
public:
    TimeoutSequence(SequencePtr<T> source, Millis limit, TimeoutOptions options)
        : source_(std::move(source))
        , limit_(limit)
        , options_(std::move(options)) {}

    Step<T> pull(Timestamp deadline) override {
        if (!started_) {
            started_ = true;
            last_ = Clock::now();
        }
        auto expires = last_ + limit_;
        auto step = source_->pull(std::min(deadline, expires));
        if (step.has_value()) {
            last_ = Clock::now();
            return step;
        }
        if (step.is_timeout() && Clock::now() >= expires) {
            throw OperatorTimeoutError(options_.message.value_or(
                "Operation timed out after " + std::to_string(limit_.count()) + "ms"));
        }
        return step;
    }

private:
    SequencePtr<T> source_;
    Millis limit_;
    TimeoutOptions options_;
    Timestamp last_{};
    bool started_{false};
};

/**
 * @brief Fail with OperatorTimeoutError when the next value takes longer
 *        than `limit` (measured from the previous value, or the first pull)
 * @throws ValidationError on a negative limit
 */
inline auto timeout(Millis limit, TimeoutOptions options = {}) {
    if (limit.count() < 0) {
        throw ValidationError("Timeout must be non-negative");
    }
    return [limit, options](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<TimeoutSequence<T>>(std::move(source), limit, options));
    };
}

} // namespace seq
} // namespace streamkit
