#pragma once

/**
 * @file sequence.hpp
 * @brief Pull-model lazy sequences
 */

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/pipe.hpp"
#include "streamkit/core/types.hpp"

namespace streamkit {

/**
 * @brief Outcome kind of a single pull
 */
enum class StepKind {
    Value,      // a value was produced
    Timeout,    // the caller's deadline passed first; pulling again resumes
    Done        // the sequence is exhausted
};

/**
 * @brief Result of Sequence::pull
 */
template<typename T>
struct Step {
    StepKind kind{StepKind::Done};
    std::optional<T> value;

    static Step of(T item) { return Step{StepKind::Value, std::optional<T>(std::move(item))}; }
    static Step timeout() { return Step{StepKind::Timeout, std::nullopt}; }
    static Step done() { return Step{StepKind::Done, std::nullopt}; }

    [[nodiscard]] bool has_value() const noexcept { return kind == StepKind::Value; }
    [[nodiscard]] bool is_timeout() const noexcept { return kind == StepKind::Timeout; }
    [[nodiscard]] bool is_done() const noexcept { return kind == StepKind::Done; }
};

/**
 * @brief Lazy, non-restartable source of values consumed by pulling
 *
 * Failures are thrown from pull() and end the iteration. A Timeout step
 * leaves the sequence's state intact, so callers can poll with short
 * deadlines.
 */
template<typename T>
class Sequence {
public:
    using value_type = T;

    virtual ~Sequence() = default;

    /**
     * @brief Produce the next step, waiting no later than `deadline`
     */
    virtual Step<T> pull(Timestamp deadline) = 0;

    /**
     * @brief Block until the next value; nullopt when exhausted
     */
    std::optional<T> next() {
        while (true) {
            auto step = pull(kNoDeadline);
            if (step.has_value()) {
                return std::move(step.value);
            }
            if (step.is_done()) {
                return std::nullopt;
            }
        }
    }

    template<typename Rep, typename Period>
    Step<T> next_for(std::chrono::duration<Rep, Period> timeout) {
        return pull(deadline_after(timeout));
    }
};

template<typename T>
using SequencePtr = std::unique_ptr<Sequence<T>>;

/**
 * @brief Produces a fresh sequence each call; what retry re-drives
 */
template<typename T>
using SequenceFactory = std::function<SequencePtr<T>()>;

template<typename S>
using sequence_value_t = typename std::decay_t<S>::element_type::value_type;

namespace detail {

/**
 * @brief Longest single wait before an operator re-checks its token
 */
constexpr Millis kCancellationPoll{50};

/**
 * @brief Deadline for one upstream pull, shortened when a token can cancel
 */
inline Timestamp poll_limit(Timestamp deadline, const CancellationToken& token) {
    if (!token.can_be_cancelled()) {
        return deadline;
    }
    return std::min(deadline, deadline_after(kCancellationPoll));
}

/**
 * @brief Re-type a Timeout or Done step
 */
template<typename R, typename T>
Step<R> pass_through(const Step<T>& step) {
    return step.is_done() ? Step<R>::done() : Step<R>::timeout();
}

} // namespace detail

} // namespace streamkit
