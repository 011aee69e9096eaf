#pragma once

/**
 * @file sink.hpp
 * @brief Terminal consumers of pull sequences
 */

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace seq {

/**
 * @brief Drain a sequence into a vector
 *
 * Source failures propagate to the caller. Cancellation stops the drain
 * with OperationAbortedError.
 */
template<typename T>
std::vector<T> to_vector(SequencePtr<T> source, const CancellationToken& token = {}) {
    std::vector<T> values;
    while (true) {
        token.throw_if_cancelled();
        auto step = source->pull(detail::poll_limit(kNoDeadline, token));
        if (step.is_done()) {
            break;
        }
        if (step.has_value()) {
            values.push_back(std::move(*step.value));
        }
    }
    return values;
}

/**
 * @brief First value of a sequence, or nullopt if it ends empty
 */
template<typename T>
std::optional<T> first(SequencePtr<T> source) {
    return source->next();
}

/**
 * @brief Invoke `fn` on each value; returns the number consumed
 */
template<typename T, typename F>
std::uint64_t for_each(SequencePtr<T> source, F&& fn, const CancellationToken& token = {}) {
    std::uint64_t consumed = 0;
    while (true) {
        token.throw_if_cancelled();
        auto step = source->pull(detail::poll_limit(kNoDeadline, token));
        if (step.is_done()) {
            break;
        }
        if (step.has_value()) {
            fn(*step.value);
            consumed++;
        }
    }
    return consumed;
}

} // namespace seq
} // namespace streamkit
