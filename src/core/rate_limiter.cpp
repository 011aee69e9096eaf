/**
 * @file rate_limiter.cpp
 * @brief TokenBucket and RateLimiterRegistry
 */

#include "streamkit/core/rate_limiter.hpp"

#include <algorithm>
#include <cmath>

#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"

namespace streamkit {

namespace {

Clock::duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace

void RateLimiterConfig::validate() const {
    if (!(capacity > 0.0)) {
        throw ValidationError("Rate limiter capacity must be positive");
    }
    if (!(refill_rate > 0.0)) {
        throw ValidationError("Rate limiter refill rate must be positive");
    }
    if (initial_tokens && (*initial_tokens < 0.0 || *initial_tokens > capacity)) {
        throw ValidationError("Rate limiter initial tokens must be within [0, capacity]");
    }
    if (window_size.count() <= 0) {
        throw ValidationError("Rate limiter window size must be positive");
    }
}

TokenBucket::TokenBucket(RateLimiterConfig config, ClockFn clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {
    config_.validate();
    logger_ = logging::resolve(config_.logger, "rate_limiter");
    tokens_ = config_.starting_tokens();
    last_refill_ = clock_();
}

void TokenBucket::refill(Timestamp now) {
    if (now > last_refill_) {
        double elapsed = std::chrono::duration<double>(now - last_refill_).count();
        tokens_ = std::min(config_.capacity, tokens_ + elapsed * config_.refill_rate);
    }
    last_refill_ = now;
}

RateLimitResult TokenBucket::consume(std::uint32_t tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    refill(now);

    auto result = config_.sliding_window ? consume_window(tokens, now) : consume_bucket(tokens, now);
    if (result.allowed) {
        allowed_++;
    } else {
        denied_++;
        logger_->debug("rate limited: {} token(s) requested, retry after {}ms",
                       tokens, result.retry_after ? result.retry_after->count() : 0);
    }
    return result;
}

RateLimitResult TokenBucket::consume_bucket(std::uint32_t tokens, Timestamp now) {
    RateLimitResult result;
    double requested = static_cast<double>(tokens);

    if (tokens_ >= requested) {
        tokens_ -= requested;
        result.allowed = true;
        result.remaining = std::floor(tokens_);
        result.reset_time = now + seconds_to_duration((config_.capacity - tokens_) / config_.refill_rate);
        return result;
    }

    auto retry_ms = static_cast<Millis::rep>(
        std::ceil((requested - tokens_) / config_.refill_rate * 1000.0));
    result.allowed = false;
    result.remaining = std::floor(tokens_);
    result.retry_after = Millis(retry_ms);
    result.reset_time = now + *result.retry_after;
    return result;
}

RateLimitResult TokenBucket::consume_window(std::uint32_t tokens, Timestamp now) {
    auto window = std::chrono::duration_cast<Clock::duration>(config_.window_size);
    while (!requests_.empty() && requests_.front() + window < now) {
        requests_.pop_front();
    }

    RateLimitResult result;
    if (static_cast<double>(requests_.size() + tokens) <= config_.capacity) {
        requests_.insert(requests_.end(), tokens, now);
        result.allowed = true;
        result.remaining = config_.capacity - static_cast<double>(requests_.size());
        result.reset_time = requests_.empty() ? now : requests_.front() + window;
        return result;
    }

    result.allowed = false;
    result.remaining = std::max(0.0, config_.capacity - static_cast<double>(requests_.size()));
    result.reset_time = requests_.empty() ? now + window : requests_.front() + window;
    result.retry_after = std::chrono::ceil<Millis>(result.reset_time - now);
    return result;
}

BucketStatus TokenBucket::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(clock_());
    BucketStatus s;
    s.tokens = std::floor(tokens_);
    s.capacity = config_.capacity;
    s.refill_rate = config_.refill_rate;
    s.window_requests = requests_.size();
    s.allowed = allowed_;
    s.denied = denied_;
    return s;
}

void TokenBucket::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = config_.starting_tokens();
    last_refill_ = clock_();
    requests_.clear();
}

std::shared_ptr<TokenBucket> RateLimiterRegistry::get(const std::string& key, const RateLimiterConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limiters_.find(key);
    if (it != limiters_.end()) {
        return it->second;
    }
    auto limiter = std::make_shared<TokenBucket>(config, clock_);
    limiters_.emplace(key, limiter);
    return limiter;
}

bool RateLimiterRegistry::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiters_.erase(key) > 0;
}

void RateLimiterRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    limiters_.clear();
}

std::vector<std::string> RateLimiterRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(limiters_.size());
    for (const auto& [key, limiter] : limiters_) {
        result.push_back(key);
    }
    return result;
}

std::size_t RateLimiterRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limiters_.size();
}

} // namespace streamkit
