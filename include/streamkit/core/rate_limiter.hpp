#pragma once

/**
 * @file rate_limiter.hpp
 * @brief Token-bucket admission control
 */

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "streamkit/core/types.hpp"

namespace streamkit {

/**
 * @brief Time source of a limiter; injectable for tests
 */
using ClockFn = std::function<Timestamp()>;

/**
 * @brief Configuration for TokenBucket
 */
struct RateLimiterConfig {
    double capacity{10.0};                  // burst size
    double refill_rate{1.0};                // tokens per second
    std::optional<double> initial_tokens;   // defaults to capacity
    bool sliding_window{false};             // count requests in a trailing window instead
    Millis window_size{60000};
    std::shared_ptr<spdlog::logger> logger;

    /**
     * @throws ValidationError on non-positive capacity, rate or window,
     *         or initial tokens outside [0, capacity]
     */
    void validate() const;

    [[nodiscard]] double starting_tokens() const noexcept {
        return initial_tokens.value_or(capacity);
    }
};

/**
 * @brief Outcome of one consume() call; denial is not an error
 */
struct RateLimitResult {
    bool allowed{false};
    double remaining{0.0};              // whole tokens (or window slots) left
    Timestamp reset_time{};             // when the bucket / window is full again
    std::optional<Millis> retry_after;  // set on denial
};

/**
 * @brief TokenBucket snapshot
 */
struct BucketStatus {
    double tokens{0.0};
    double capacity{0.0};
    double refill_rate{0.0};
    std::size_t window_requests{0};
    std::uint64_t allowed{0};
    std::uint64_t denied{0};
};

/**
 * @brief Token bucket with lazy, time-proportional refill
 *
 * Tokens only grow through refill (capped at capacity) and only shrink
 * through an allowed consume(). Thread-safe.
 */
class TokenBucket {
public:
    explicit TokenBucket(RateLimiterConfig config, ClockFn clock = nullptr);

    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    /**
     * @brief Try to take `tokens` tokens
     */
    RateLimitResult consume(std::uint32_t tokens = 1);

    [[nodiscard]] BucketStatus status();

    /**
     * @brief Restore the initial tokens and clear the request log
     */
    void reset();

    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }

private:
    void refill(Timestamp now);
    RateLimitResult consume_bucket(std::uint32_t tokens, Timestamp now);
    RateLimitResult consume_window(std::uint32_t tokens, Timestamp now);

    RateLimiterConfig config_;
    ClockFn clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;
    double tokens_;
    Timestamp last_refill_;
    std::deque<Timestamp> requests_;
    std::uint64_t allowed_{0};
    std::uint64_t denied_{0};
};

/**
 * @brief Keyed collection of limiters, owned by whoever needs one
 */
class RateLimiterRegistry {
public:
    RateLimiterRegistry() = default;

    explicit RateLimiterRegistry(ClockFn clock)
        : clock_(std::move(clock)) {}

    /**
     * @brief Limiter for `key`, created with `config` on first use
     */
    std::shared_ptr<TokenBucket> get(const std::string& key, const RateLimiterConfig& config);

    bool remove(const std::string& key);
    void clear();

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const;

private:
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TokenBucket>> limiters_;
};

} // namespace streamkit
