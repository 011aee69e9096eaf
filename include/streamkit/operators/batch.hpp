#pragma once

/**
 * @file batch.hpp
 * @brief Grouping pull operators: buffer, batch, window
 */

#include <cstddef>
#include <deque>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace seq {

/**
 * @brief Fixed-size chunks; the remainder is emitted at the end
 */
template<typename T>
class BufferSequence : public Sequence<std::vector<T>> {
public:
    BufferSequence(SequencePtr<T> source, std::size_t size)
        : source_(std::move(source))
        , size_(size) {}

    Step<std::vector<T>> pull(Timestamp deadline) override {
        while (!source_done_) {
            auto step = source_->pull(deadline);
            if (step.is_timeout()) {
                return Step<std::vector<T>>::timeout();
            }
            if (step.is_done()) {
                source_done_ = true;
                break;
            }
            buffer_.push_back(std::move(*step.value));
            if (buffer_.size() >= size_) {
                return flush();
            }
        }
        if (!buffer_.empty()) {
            return flush();
        }
        return Step<std::vector<T>>::done();
    }

private:
    Step<std::vector<T>> flush() {
        std::vector<T> chunk;
        chunk.swap(buffer_);
        return Step<std::vector<T>>::of(std::move(chunk));
    }

    SequencePtr<T> source_;
    std::size_t size_;
    std::vector<T> buffer_;
    bool source_done_{false};
};

/**
 * @brief Chunks of `size` values
 * @throws ValidationError if size is 0
 */
inline auto buffer(std::size_t size) {
    if (size == 0) {
        throw ValidationError("buffer size must be a positive integer");
    }
    return [size](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<std::vector<T>>(std::make_unique<BufferSequence<T>>(std::move(source), size));
    };
}

/**
 * @brief Options for batch
 */
struct BatchOptions {
    std::optional<Millis> timeout;      // flush this long after the first buffered item
    CancellationToken token;

    void validate() const {
        if (timeout && timeout->count() < 0) {
            throw ValidationError("Batch timeout must not be negative");
        }
    }
};

/**
 * @brief batch operator implementation
 *
 * A source failure with items buffered is raised as BatchFailure<T>
 * carrying those items.
 */
template<typename T>
class BatchSequence : public Sequence<std::vector<T>> {
public:
    BatchSequence(SequencePtr<T> source, std::size_t size, BatchOptions options)
        : source_(std::move(source))
        , size_(size)
        , options_(std::move(options)) {}

    Step<std::vector<T>> pull(Timestamp deadline) override {
        while (true) {
            if (options_.token.is_cancelled()) {
                throw OperationAbortedError("Batch operation aborted");
            }
            if (source_done_) {
                if (!buffer_.empty()) {
                    return flush();
                }
                return Step<std::vector<T>>::done();
            }

            Timestamp flush_at = kNoDeadline;
            if (options_.timeout && !buffer_.empty()) {
                flush_at = first_at_ + *options_.timeout;
            }
            auto limit = detail::poll_limit(std::min(deadline, flush_at), options_.token);

            Step<T> step;
            try {
                step = source_->pull(limit);
            } catch (const OperationAbortedError&) {
                throw;
            } catch (...) {
                if (buffer_.empty()) {
                    throw;
                }
                std::vector<T> pending;
                pending.swap(buffer_);
                throw BatchFailure<T>(std::move(pending), std::current_exception());
            }

            if (step.has_value()) {
                if (buffer_.empty()) {
                    first_at_ = Clock::now();
                }
                buffer_.push_back(std::move(*step.value));
                if (buffer_.size() >= size_) {
                    return flush();
                }
                continue;
            }
            if (step.is_done()) {
                source_done_ = true;
                continue;
            }

            auto now = Clock::now();
            if (!buffer_.empty() && now >= flush_at) {
                return flush();
            }
            if (now >= deadline) {
                return Step<std::vector<T>>::timeout();
            }
        }
    }

private:
    Step<std::vector<T>> flush() {
        std::vector<T> chunk;
        chunk.swap(buffer_);
        return Step<std::vector<T>>::of(std::move(chunk));
    }

    SequencePtr<T> source_;
    std::size_t size_;
    BatchOptions options_;
    std::vector<T> buffer_;
    Timestamp first_at_{};
    bool source_done_{false};
};

/**
 * @brief Flush when `size` values are buffered or `options.timeout` has
 *        passed since the first of them, whichever comes first
 * @throws ValidationError on a zero size or negative timeout
 */
inline auto batch(std::size_t size, BatchOptions options = {}) {
    if (size == 0) {
        throw ValidationError("Batch size must be positive");
    }
    options.validate();
    return [size, options](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<std::vector<T>>(
            std::make_unique<BatchSequence<T>>(std::move(source), size, options));
    };
}

/**
 * @brief window operator implementation
 */
template<typename T>
class WindowSequence : public Sequence<std::vector<T>> {
public:
    WindowSequence(SequencePtr<T> source, std::size_t size, std::size_t slide)
        : source_(std::move(source))
        , size_(size)
        , slide_(slide) {}

    Step<std::vector<T>> pull(Timestamp deadline) override {
        while (window_.size() < size_) {
            if (source_done_) {
                // a trailing partial window is never emitted
                return Step<std::vector<T>>::done();
            }
            auto step = source_->pull(deadline);
            if (step.is_timeout()) {
                return Step<std::vector<T>>::timeout();
            }
            if (step.is_done()) {
                source_done_ = true;
                continue;
            }
            if (to_skip_ > 0) {
                to_skip_--;
                continue;
            }
            window_.push_back(std::move(*step.value));
        }

        std::vector<T> out(window_.begin(), window_.end());
        advance();
        return Step<std::vector<T>>::of(std::move(out));
    }

private:
    void advance() {
        if (slide_ >= window_.size()) {
            to_skip_ = slide_ - window_.size();
            window_.clear();
            return;
        }
        window_.erase(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(slide_));
    }

    SequencePtr<T> source_;
    std::size_t size_;
    std::size_t slide_;
    std::deque<T> window_;
    std::size_t to_skip_{0};
    bool source_done_{false};
};

/**
 * @brief Complete windows of `size` values, the start advancing by `slide`
 * @throws ValidationError if size or slide is 0
 */
inline auto window(std::size_t size, std::size_t slide = 1) {
    if (size == 0) {
        throw ValidationError("Window size must be positive");
    }
    if (slide == 0) {
        throw ValidationError("Slide amount must be positive");
    }
    return [size, slide](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<std::vector<T>>(
            std::make_unique<WindowSequence<T>>(std::move(source), size, slide));
    };
}

} // namespace seq
} // namespace streamkit
