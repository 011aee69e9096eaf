#pragma once

/**
 * @file combine.hpp
 * @brief Multi-source pull operators: merge, race, zip, concat
 */

#include <cstddef>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "streamkit/core/error.hpp"
#include "streamkit/core/sequence.hpp"
#include "streamkit/operators/pump.hpp"

namespace streamkit {
namespace detail {

template<typename T, typename... Rest>
std::vector<SequencePtr<T>> collect(SequencePtr<T> first, Rest... rest) {
    std::vector<SequencePtr<T>> sources;
    sources.reserve(1 + sizeof...(rest));
    sources.push_back(std::move(first));
    (sources.push_back(std::move(rest)), ...);
    return sources;
}

} // namespace detail

namespace seq {

/**
 * @brief merge implementation
 *
 * Values are forwarded in arrival order. The first source failure stops
 * the remaining sources and is raised to the consumer.
 */
template<typename T>
class MergeSequence : public Sequence<T> {
public:
    explicit MergeSequence(std::vector<SequencePtr<T>> sources)
        : remaining_(sources.size())
        , pumps_(std::move(sources)) {}

    Step<T> pull(Timestamp deadline) override {
        pumps_.start();
        while (remaining_ > 0) {
            auto step = pumps_.next_until(deadline);
            if (step.is_timeout()) {
                return Step<T>::timeout();
            }
            if (step.is_done()) {
                break;
            }
            auto& tagged = *step.value;
            switch (tagged.event) {
                case detail::PumpEvent::Value:
                    return Step<T>::of(std::move(*tagged.value));
                case detail::PumpEvent::Done:
                    remaining_--;
                    break;
                case detail::PumpEvent::Error:
                    remaining_ = 0;
                    pumps_.stop_all();
                    std::rethrow_exception(tagged.error);
            }
        }
        return Step<T>::done();
    }

private:
    std::size_t remaining_;
    detail::PumpGroup<T> pumps_;
};

/**
 * @brief Interleave sources by arrival; ends when all of them have ended
 */
template<typename T>
SequencePtr<T> merge(std::vector<SequencePtr<T>> sources) {
    return std::make_unique<MergeSequence<T>>(std::move(sources));
}

template<typename T, typename... Rest>
SequencePtr<T> merge(SequencePtr<T> first, Rest... rest) {
    return merge<T>(detail::collect<T>(std::move(first), std::move(rest)...));
}

/**
 * @brief race implementation
 *
 * The first source to produce a value wins; the others are stopped and
 * anything they already produced is ignored. Sources that end without a
 * value never win. A failure before a winner is chosen is raised.
 */
template<typename T>
class RaceSequence : public Sequence<T> {
public:
    explicit RaceSequence(std::vector<SequencePtr<T>> sources)
        : remaining_(sources.size())
        , pumps_(std::move(sources)) {}

    Step<T> pull(Timestamp deadline) override {
        pumps_.start();
        while (!finished_) {
            auto step = pumps_.next_until(deadline);
            if (step.is_timeout()) {
                return Step<T>::timeout();
            }
            if (step.is_done()) {
                break;
            }
            auto& tagged = *step.value;

            if (winner_ == kNoWinner) {
                switch (tagged.event) {
                    case detail::PumpEvent::Value:
                        declare_winner(tagged.source);
                        return Step<T>::of(std::move(*tagged.value));
                    case detail::PumpEvent::Done:
                        if (--remaining_ == 0) {
                            finished_ = true;
                        }
                        continue;
                    case detail::PumpEvent::Error:
                        finished_ = true;
                        pumps_.stop_all();
                        std::rethrow_exception(tagged.error);
                }
            }

            if (tagged.source != winner_) {
                continue;
            }
            switch (tagged.event) {
                case detail::PumpEvent::Value:
                    return Step<T>::of(std::move(*tagged.value));
                case detail::PumpEvent::Done:
                    finished_ = true;
                    break;
                case detail::PumpEvent::Error:
                    finished_ = true;
                    std::rethrow_exception(tagged.error);
            }
        }
        return Step<T>::done();
    }

private:
    static constexpr std::size_t kNoWinner = std::numeric_limits<std::size_t>::max();

    void declare_winner(std::size_t index) {
        winner_ = index;
        for (std::size_t i = 0; i < pumps_.size(); i++) {
            if (i != index) {
                pumps_.stop(i);
            }
        }
    }

    std::size_t remaining_;
    detail::PumpGroup<T> pumps_;
    std::size_t winner_{kNoWinner};
    bool finished_{false};
};

/**
 * @brief Forward only the source that produces a value first
 */
template<typename T>
SequencePtr<T> race(std::vector<SequencePtr<T>> sources) {
    return std::make_unique<RaceSequence<T>>(std::move(sources));
}

template<typename T, typename... Rest>
SequencePtr<T> race(SequencePtr<T> first, Rest... rest) {
    return race<T>(detail::collect<T>(std::move(first), std::move(rest)...));
}

/**
 * @brief zip implementation
 *
 * Sources are pulled in order for each index; values already received for
 * an unfinished tuple survive a Timeout step.
 */
template<typename T>
class ZipSequence : public Sequence<std::vector<T>> {
public:
    explicit ZipSequence(std::vector<SequencePtr<T>> sources)
        : sources_(std::move(sources))
        , slots_(sources_.size()) {}

    Step<std::vector<T>> pull(Timestamp deadline) override {
        if (done_ || sources_.empty()) {
            return Step<std::vector<T>>::done();
        }
        for (std::size_t i = 0; i < sources_.size(); i++) {
            if (slots_[i]) {
                continue;
            }
            auto step = sources_[i]->pull(deadline);
            if (step.is_timeout()) {
                return Step<std::vector<T>>::timeout();
            }
            if (step.is_done()) {
                done_ = true;
                sources_.clear();
                return Step<std::vector<T>>::done();
            }
            slots_[i] = std::move(step.value);
        }

        std::vector<T> tuple;
        tuple.reserve(slots_.size());
        for (auto& slot : slots_) {
            tuple.push_back(std::move(*slot));
            slot.reset();
        }
        return Step<std::vector<T>>::of(std::move(tuple));
    }

private:
    std::vector<SequencePtr<T>> sources_;
    std::vector<std::optional<T>> slots_;
    bool done_{false};
};

/**
 * @brief Tuples of the i-th value of every source; ends when any source ends
 */
template<typename T>
SequencePtr<std::vector<T>> zip(std::vector<SequencePtr<T>> sources) {
    return std::make_unique<ZipSequence<T>>(std::move(sources));
}

template<typename T, typename... Rest>
SequencePtr<std::vector<T>> zip(SequencePtr<T> first, Rest... rest) {
    return zip<T>(detail::collect<T>(std::move(first), std::move(rest)...));
}

/**
 * @brief concat implementation
 */
template<typename T>
class ConcatSequence : public Sequence<T> {
public:
    explicit ConcatSequence(std::vector<SequencePtr<T>> sources)
        : sources_(std::move(sources)) {}

    Step<T> pull(Timestamp deadline) override {
        while (index_ < sources_.size()) {
            auto step = sources_[index_]->pull(deadline);
            if (!step.is_done()) {
                return step;
            }
            sources_[index_].reset();
            index_++;
        }
        return Step<T>::done();
    }

private:
    std::vector<SequencePtr<T>> sources_;
    std::size_t index_{0};
};

/**
 * @brief Drain each source fully before starting the next, in order
 */
template<typename T>
SequencePtr<T> concat(std::vector<SequencePtr<T>> sources) {
    return std::make_unique<ConcatSequence<T>>(std::move(sources));
}

template<typename T, typename... Rest>
SequencePtr<T> concat(SequencePtr<T> first, Rest... rest) {
    return concat<T>(detail::collect<T>(std::move(first), std::move(rest)...));
}

} // namespace seq
} // namespace streamkit
