#pragma once

/**
 * @file transform.hpp
 * @brief Element-wise pull operators: map, filter, take, skip, scan,
 *        distinct_until_changed
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "streamkit/core/sequence.hpp"

namespace streamkit {
namespace seq {

/**
 * @brief Map operator implementation
 */
template<typename T, typename R, typename F>
class MapSequence : public Sequence<R> {
public:
    MapSequence(SequencePtr<T> source, F fn)
        : source_(std::move(source))
        , fn_(std::move(fn)) {}

    Step<R> pull(Timestamp deadline) override {
        auto step = source_->pull(deadline);
        if (!step.has_value()) {
            return detail::pass_through<R>(step);
        }
        return Step<R>::of(fn_(*step.value));
    }

private:
    SequencePtr<T> source_;
    F fn_;
};

/**
 * @brief Transform each value
 */
template<typename F>
auto map(F fn) {
    return [fn](auto source) {
        using T = sequence_value_t<decltype(source)>;
        using R = std::decay_t<std::invoke_result_t<F&, const T&>>;
        return SequencePtr<R>(std::make_unique<MapSequence<T, R, F>>(std::move(source), fn));
    };
}

/**
 * @brief Filter operator implementation
 */
template<typename T, typename Predicate>
class FilterSequence : public Sequence<T> {
public:
    FilterSequence(SequencePtr<T> source, Predicate pred)
        : source_(std::move(source))
        , pred_(std::move(pred)) {}

    Step<T> pull(Timestamp deadline) override {
        while (true) {
            auto step = source_->pull(deadline);
            if (!step.has_value() || pred_(*step.value)) {
                return step;
            }
        }
    }

private:
    SequencePtr<T> source_;
    Predicate pred_;
};

/**
 * @brief Keep values satisfying the predicate
 */
template<typename Predicate>
auto filter(Predicate pred) {
    return [pred](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<FilterSequence<T, Predicate>>(std::move(source), pred));
    };
}

/**
 * @brief Take operator implementation; stops pulling once satisfied
 */
template<typename T>
class TakeSequence : public Sequence<T> {
public:
    TakeSequence(SequencePtr<T> source, std::size_t count)
        : source_(std::move(source))
        , remaining_(count) {}

    Step<T> pull(Timestamp deadline) override {
        if (remaining_ == 0) {
            source_.reset();
            return Step<T>::done();
        }
        auto step = source_->pull(deadline);
        if (step.has_value()) {
            remaining_--;
        }
        return step;
    }

private:
    SequencePtr<T> source_;
    std::size_t remaining_;
};

/**
 * @brief First `count` values
 */
inline auto take(std::size_t count) {
    return [count](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<TakeSequence<T>>(std::move(source), count));
    };
}

/**
 * @brief Skip operator implementation
 */
template<typename T>
class SkipSequence : public Sequence<T> {
public:
    SkipSequence(SequencePtr<T> source, std::size_t count)
        : source_(std::move(source))
        , to_skip_(count) {}

    Step<T> pull(Timestamp deadline) override {
        while (true) {
            auto step = source_->pull(deadline);
            if (!step.has_value() || to_skip_ == 0) {
                return step;
            }
            to_skip_--;
        }
    }

private:
    SequencePtr<T> source_;
    std::size_t to_skip_;
};

/**
 * @brief Drop the first `count` values
 */
inline auto skip(std::size_t count) {
    return [count](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<SkipSequence<T>>(std::move(source), count));
    };
}

/**
 * @brief Scan operator implementation
 */
template<typename T, typename Acc, typename F>
class ScanSequence : public Sequence<Acc> {
public:
    ScanSequence(SequencePtr<T> source, F fn, Acc seed)
        : source_(std::move(source))
        , fn_(std::move(fn))
        , acc_(std::move(seed)) {}

    Step<Acc> pull(Timestamp deadline) override {
        auto step = source_->pull(deadline);
        if (!step.has_value()) {
            return detail::pass_through<Acc>(step);
        }
        acc_ = fn_(acc_, *step.value);
        return Step<Acc>::of(acc_);
    }

private:
    SequencePtr<T> source_;
    F fn_;
    Acc acc_;
};

/**
 * @brief Running accumulation: emits fn(acc, value) for every value
 */
template<typename F, typename Acc>
auto scan(F fn, Acc seed) {
    return [fn, seed](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<Acc>(std::make_unique<ScanSequence<T, Acc, F>>(std::move(source), fn, seed));
    };
}

/**
 * @brief distinct_until_changed implementation
 */
template<typename T, typename Equal>
class DistinctSequence : public Sequence<T> {
public:
    DistinctSequence(SequencePtr<T> source, Equal equal)
        : source_(std::move(source))
        , equal_(std::move(equal)) {}

    Step<T> pull(Timestamp deadline) override {
        while (true) {
            auto step = source_->pull(deadline);
            if (!step.has_value()) {
                return step;
            }
            if (last_ && equal_(*last_, *step.value)) {
                continue;
            }
            last_ = *step.value;
            return step;
        }
    }

private:
    SequencePtr<T> source_;
    Equal equal_;
    std::optional<T> last_;
};

/**
 * @brief Suppress values equal to the one emitted just before
 */
template<typename Equal = std::equal_to<>>
auto distinct_until_changed(Equal equal = Equal{}) {
    return [equal](auto source) {
        using T = sequence_value_t<decltype(source)>;
        return SequencePtr<T>(std::make_unique<DistinctSequence<T, Equal>>(std::move(source), equal));
    };
}

} // namespace seq
} // namespace streamkit
