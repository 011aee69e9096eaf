#pragma once

/**
 * @file admission.hpp
 * @brief Rate limiter placed in front of worker pool submission
 */

#include <cstdint>
#include <future>
#include <optional>
#include <utility>

#include "streamkit/core/rate_limiter.hpp"
#include "streamkit/core/worker_pool.hpp"

namespace streamkit {

/**
 * @brief Outcome of submit_limited
 *
 * `result` is set only when the limiter allowed the request; a denial
 * carries the limiter's retry_after instead.
 */
template<typename Response>
struct Admitted {
    RateLimitResult limit;
    std::optional<std::future<Response>> result;

    [[nodiscard]] bool accepted() const noexcept { return result.has_value(); }
};

/**
 * @brief Consume `cost` tokens, then execute on the pool if allowed
 *
 * A denied request never reaches the pool. Pool failures (PoolTerminating,
 * QueueFull) propagate after the tokens were spent.
 */
template<typename Request, typename Response>
Admitted<Response> submit_limited(WorkerPool<Request, Response>& pool,
                                  TokenBucket& limiter,
                                  Request request,
                                  std::uint32_t cost = 1) {
    Admitted<Response> admitted;
    admitted.limit = limiter.consume(cost);
    if (admitted.limit.allowed) {
        admitted.result.emplace(pool.execute(std::move(request)));
    }
    return admitted;
}

} // namespace streamkit
