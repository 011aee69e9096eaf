#pragma once

/**
 * @file retry.hpp
 * @brief Re-drive a failing sequence from the start, with backoff
 */

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <utility>

#include <spdlog/spdlog.h>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace seq {

/**
 * @brief Delay before the attempt after `attempt` (1-based) failed
 */
using BackoffFn = std::function<Millis(std::uint32_t attempt)>;

/**
 * @brief Whether a failure is worth another attempt
 */
using RetryPredicate = std::function<bool(const std::exception_ptr&)>;

/**
 * @brief min(1000 * 2^(attempt-1), 30000) ms
 */
[[nodiscard]] inline Millis default_backoff(std::uint32_t attempt) {
    constexpr std::int64_t kBaseMs = 1000;
    constexpr std::int64_t kCapMs = 30000;
    if (attempt < 1) {
        attempt = 1;
    }
    // 2^5 * 1000 already exceeds the cap
    if (attempt > 6) {
        return Millis(kCapMs);
    }
    return Millis(std::min(kBaseMs << (attempt - 1), kCapMs));
}

/**
 * @brief Options for retry
 */
struct RetryOptions {
    std::uint32_t max_attempts{3};
    BackoffFn backoff{default_backoff};
    RetryPredicate retry_if;                    // empty = retry every failure
    CancellationToken token;
    std::shared_ptr<spdlog::logger> logger;     // defaults to "streamkit.retry"

    void validate() const {
        if (max_attempts < 1) {
            throw ValidationError("maxAttempts must be at least 1");
        }
        if (!backoff) {
            throw ValidationError("retry requires a backoff function");
        }
    }
};

/**
 * @brief retry implementation
 *
 * Values are forwarded as they arrive, including those of attempts that
 * later fail. Backoff is a deadline, not a sleep: a pull during backoff
 * waits at most until the caller's deadline.
 */
template<typename T>
class RetrySequence : public Sequence<T> {
public:
    RetrySequence(SequenceFactory<T> factory, RetryOptions options)
        : factory_(std::move(factory))
        , options_(std::move(options))
        , logger_(logging::resolve(options_.logger, "retry")) {}

    Step<T> pull(Timestamp deadline) override {
        while (true) {
            if (resume_at_) {
                auto limit = std::min(deadline, *resume_at_);
                if (options_.token.wait_until(limit)) {
                    throw RetryExhaustedError(attempt_, last_error_);
                }
                if (Clock::now() < *resume_at_) {
                    return Step<T>::timeout();
                }
                resume_at_.reset();
                attempt_++;
            }

            try {
                if (!current_) {
                    current_ = factory_();
                }
                return current_->pull(deadline);
            } catch (...) {
                on_failure(std::current_exception());
            }
        }
    }

    [[nodiscard]] std::uint32_t attempt() const noexcept { return attempt_; }

private:
    void on_failure(std::exception_ptr error) {
        current_.reset();
        last_error_ = error;

        bool retryable = !options_.retry_if || options_.retry_if(error);
        if (attempt_ >= options_.max_attempts || !retryable || options_.token.is_cancelled()) {
            throw RetryExhaustedError(attempt_, error);
        }

        auto delay = options_.backoff(attempt_);
        logger_->warn("attempt {}/{} failed ({}), retrying in {}ms",
                      attempt_, options_.max_attempts, describe(error), delay.count());
        resume_at_ = deadline_after(delay);
    }

    SequenceFactory<T> factory_;
    RetryOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    SequencePtr<T> current_;
    std::uint32_t attempt_{1};
    std::exception_ptr last_error_;
    std::optional<Timestamp> resume_at_;
};

/**
 * @brief Retry operator: SequenceFactory<T> -> SequencePtr<T>
 *
 * Raises RetryExhaustedError after the last failed attempt, on a failure
 * retry_if rejects, or on cancellation.
 * @throws ValidationError if options are invalid
 */
inline auto retry(RetryOptions options = {}) {
    options.validate();
    return [options](auto factory) {
        using T = sequence_value_t<std::invoke_result_t<decltype(factory)&>>;
        return SequencePtr<T>(std::make_unique<RetrySequence<T>>(SequenceFactory<T>(std::move(factory)), options));
    };
}

/**
 * @brief Exponential backoff parameters for retry_with_backoff
 */
struct BackoffOptions {
    Millis initial_delay{1000};
    Millis max_delay{30000};
    double jitter{0.1};                         // +/- fraction of the delay
    CancellationToken token;
    std::shared_ptr<spdlog::logger> logger;
};

/**
 * @brief min(initial * 2^(attempt-1), max) scaled by a random factor in
 *        [1 - jitter, 1 + jitter]
 */
inline BackoffFn exponential_backoff(Millis initial, Millis max_delay, double jitter) {
    struct Random {
        std::mutex mutex;
        std::mt19937 engine{std::random_device{}()};
    };
    auto random = std::make_shared<Random>();

    return [initial, max_delay, jitter, random](std::uint32_t attempt) {
        double exponent = static_cast<double>(attempt < 1 ? 0 : attempt - 1);
        double delay = std::min(static_cast<double>(initial.count()) * std::pow(2.0, exponent),
                                static_cast<double>(max_delay.count()));
        if (jitter > 0.0) {
            std::uniform_real_distribution<double> dist(-1.0, 1.0);
            std::lock_guard<std::mutex> lock(random->mutex);
            delay *= 1.0 + dist(random->engine) * jitter;
        }
        return Millis(static_cast<Millis::rep>(std::llround(std::max(0.0, delay))));
    };
}

/**
 * @brief retry with exponential backoff and jitter
 * @throws ValidationError on max_attempts < 1, negative delays or a jitter
 *         outside [0, 1]
 */
inline auto retry_with_backoff(std::uint32_t max_attempts = 3, BackoffOptions options = {}) {
    if (options.initial_delay.count() < 0 || options.max_delay.count() < 0) {
        throw ValidationError("Backoff delays must be non-negative");
    }
    if (options.jitter < 0.0 || options.jitter > 1.0) {
        throw ValidationError("Backoff jitter must be within [0, 1]");
    }
    RetryOptions retry_options;
    retry_options.max_attempts = max_attempts;
    retry_options.backoff = exponential_backoff(options.initial_delay, options.max_delay, options.jitter);
    retry_options.token = options.token;
    retry_options.logger = options.logger;
    return retry(std::move(retry_options));
}

} // namespace seq
} // namespace streamkit
