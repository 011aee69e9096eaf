#pragma once

/**
 * @file pipe.hpp
 * @brief Left-to-right operator composition for streams and sequences
 */

#include <functional>
#include <type_traits>
#include <utility>

namespace streamkit {

/**
 * @brief pipe(source) is the source itself
 */
template<typename Source>
std::decay_t<Source> pipe(Source&& source) {
    return std::forward<Source>(source);
}

/**
 * @brief pipe(source, op1, op2, ...) == op2(op1(source)) ...
 *
 * An operator is any callable taking the previous stage by value.
 */
template<typename Source, typename Op, typename... Rest>
auto pipe(Source&& source, Op&& op, Rest&&... rest) {
    return pipe(std::invoke(std::forward<Op>(op), std::forward<Source>(source)),
                std::forward<Rest>(rest)...);
}

} // namespace streamkit
