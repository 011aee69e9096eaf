#pragma once

/**
 * @file operators.hpp
 * @brief Push-model operators: StreamPtr<T> -> StreamPtr<R>
 *
 * Each operator returns a callable usable with pipe(). The derived stream
 * subscribes upstream when it gains its first listener and unsubscribes
 * when it loses its last one or completes. Operator state lives for one
 * application and assumes the single cooperative scheduler model.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "streamkit/core/error.hpp"
#include "streamkit/core/event_stream.hpp"
#include "streamkit/core/rate_limiter.hpp"

namespace streamkit {
namespace stream {

template<typename Stream>
using stream_value_t = typename std::decay_t<Stream>::element_type::value_type;

/**
 * @brief Type-erased push operator, for storing a composed chain
 */
template<typename T, typename R>
using StreamOperator = std::function<StreamPtr<R>(StreamPtr<T>)>;

namespace detail {

/**
 * @brief Per-application behaviour of a derived stream
 */
template<typename T, typename R>
struct Stage {
    std::function<void(const T&, EventStream<R>&)> on_value;
    std::function<void(EventStream<R>&)> on_complete;   // all sources done; default completes out
    std::function<void()> on_teardown;
};

/**
 * @brief Stream fed by `sources` through `stage`
 */
template<typename R, typename T>
StreamPtr<R> derive(std::vector<StreamPtr<T>> sources, Stage<T, R> stage) {
    if (sources.empty()) {
        throw ValidationError("A derived stream needs at least one source");
    }
    auto out = make_event_stream<R>(sources.front()->derived_config());
    std::weak_ptr<EventStream<R>> weak_out = out;
    auto shared_stage = std::make_shared<Stage<T, R>>(std::move(stage));
    auto upstream = std::make_shared<std::vector<Unsubscribe>>();
    auto logger = out->logger();

    StreamLifecycle lifecycle;
    lifecycle.activate = [sources, weak_out, shared_stage, upstream, logger] {
        auto remaining = std::make_shared<std::size_t>(sources.size());
        for (const auto& source : sources) {
            Observer<T> observer(
                [weak_out, shared_stage, logger](const T& value) {
                    auto target = weak_out.lock();
                    if (!target) {
                        return;
                    }
                    try {
                        shared_stage->on_value(value, *target);
                    } catch (const std::exception& e) {
                        logger->warn("stream operator dropped a value: {}", e.what());
                    } catch (...) {
                        logger->warn("stream operator dropped a value: {}", describe(std::current_exception()));
                    }
                },
                nullptr,
                [weak_out, shared_stage, remaining] {
                    auto target = weak_out.lock();
                    if (!target || *remaining == 0 || --*remaining > 0) {
                        return;
                    }
                    if (shared_stage->on_complete) {
                        shared_stage->on_complete(*target);
                    } else {
                        target->complete();
                    }
                });
            upstream->push_back(source->subscribe(std::move(observer)));
        }
    };
    lifecycle.teardown = [upstream, shared_stage] {
        auto subscriptions = std::move(*upstream);
        upstream->clear();
        for (auto& unsubscribe : subscriptions) {
            unsubscribe();
        }
        if (shared_stage->on_teardown) {
            shared_stage->on_teardown();
        }
    };
    out->set_lifecycle(std::move(lifecycle));
    return out;
}

template<typename R, typename T>
StreamPtr<R> derive(StreamPtr<T> source, Stage<T, R> stage) {
    return derive<R, T>(std::vector<StreamPtr<T>>{std::move(source)}, std::move(stage));
}

} // namespace detail

/**
 * @brief Transform each value
 */
template<typename F>
auto map(F fn) {
    return [fn](auto source) {
        using T = stream_value_t<decltype(source)>;
        using R = std::decay_t<std::invoke_result_t<F&, const T&>>;
        detail::Stage<T, R> stage;
        stage.on_value = [fn](const T& value, EventStream<R>& out) mutable {
            out.emit(fn(value));
        };
        return detail::derive<R, T>(std::move(source), std::move(stage));
    };
}

/**
 * @brief Forward values satisfying the predicate
 */
template<typename Predicate>
auto filter(Predicate pred) {
    return [pred](auto source) {
        using T = stream_value_t<decltype(source)>;
        detail::Stage<T, T> stage;
        stage.on_value = [pred](const T& value, EventStream<T>& out) mutable {
            if (pred(value)) {
                out.emit(value);
            }
        };
        return detail::derive<T, T>(std::move(source), std::move(stage));
    };
}

/**
 * @brief Forward the first `count` values, then complete
 *
 * take(0) completes on the turn after the first subscription.
 */
inline auto take(std::size_t count) {
    return [count](auto source) {
        using T = stream_value_t<decltype(source)>;
        if (count == 0) {
            auto out = make_event_stream<T>(source->derived_config());
            std::weak_ptr<EventStream<T>> weak_out = out;
            auto scheduler = out->scheduler();
            out->set_lifecycle(StreamLifecycle{
                [weak_out, scheduler] {
                    scheduler->post([weak_out] {
                        if (auto target = weak_out.lock()) {
                            target->complete();
                        }
                    });
                },
                nullptr});
            return out;
        }

        auto taken = std::make_shared<std::size_t>(0);
        detail::Stage<T, T> stage;
        stage.on_value = [count, taken](const T& value, EventStream<T>& out) {
            if (*taken >= count) {
                return;
            }
            ++*taken;
            out.emit(value);
            if (*taken == count) {
                out.complete();
            }
        };
        return detail::derive<T, T>(std::move(source), std::move(stage));
    };
}

/**
 * @brief Drop the first `count` values
 */
inline auto skip(std::size_t count) {
    return [count](auto source) {
        using T = stream_value_t<decltype(source)>;
        auto seen = std::make_shared<std::size_t>(0);
        detail::Stage<T, T> stage;
        stage.on_value = [count, seen](const T& value, EventStream<T>& out) {
            if (*seen < count) {
                ++*seen;
                return;
            }
            out.emit(value);
        };
        return detail::derive<T, T>(std::move(source), std::move(stage));
    };
}

/**
 * @brief Emit a value only after `wait` passes with no newer value
 *
 * The pending value is flushed when the source completes and dropped on
 * teardown.
 */
inline auto debounce(Millis wait) {
    if (wait.count() < 0) {
        throw ValidationError("debounce wait must not be negative");
    }
    return [wait](auto source) {
        using T = stream_value_t<decltype(source)>;
        struct State {
            std::optional<T> pending;
            TimerId timer{0};
            std::shared_ptr<Scheduler> scheduler;
        };
        auto state = std::make_shared<State>();
        state->scheduler = source->scheduler();

        auto cancel_timer = [state] {
            if (state->timer != 0) {
                state->scheduler->cancel(state->timer);
                state->timer = 0;
            }
        };

        detail::Stage<T, T> stage;
        stage.on_value = [state, wait, cancel_timer](const T& value, EventStream<T>& out) {
            cancel_timer();
            state->pending = value;
            std::weak_ptr<EventStream<T>> weak_out = out.shared_from_this();
            state->timer = state->scheduler->post_after(wait, [state, weak_out] {
                state->timer = 0;
                auto target = weak_out.lock();
                if (!target || !state->pending) {
                    return;
                }
                T value = std::move(*state->pending);
                state->pending.reset();
                target->emit(value);
            });
        };
        stage.on_complete = [state, cancel_timer](EventStream<T>& out) {
            cancel_timer();
            if (state->pending) {
                T value = std::move(*state->pending);
                state->pending.reset();
                out.emit(value);
            }
            out.complete();
        };
        stage.on_teardown = [state, cancel_timer] {
            cancel_timer();
            state->pending.reset();
        };
        return detail::derive<T, T>(std::move(source), std::move(stage));
    };
}

/**
 * @brief Group values into vectors of `size`; the remainder is flushed on completion
 */
inline auto batch(std::size_t size) {
    if (size == 0) {
        throw ValidationError("batch size must be positive");
    }
    return [size](auto source) {
        using T = stream_value_t<decltype(source)>;
        auto buffer = std::make_shared<std::vector<T>>();
        detail::Stage<T, std::vector<T>> stage;
        stage.on_value = [size, buffer](const T& value, EventStream<std::vector<T>>& out) {
            buffer->push_back(value);
            if (buffer->size() >= size) {
                std::vector<T> full;
                full.swap(*buffer);
                out.emit(full);
            }
        };
        stage.on_complete = [buffer](EventStream<std::vector<T>>& out) {
            if (!buffer->empty()) {
                std::vector<T> rest;
                rest.swap(*buffer);
                out.emit(rest);
            }
            out.complete();
        };
        return detail::derive<std::vector<T>, T>(std::move(source), std::move(stage));
    };
}

/**
 * @brief Interleave several streams; completes when all of them have
 */
template<typename T>
StreamPtr<T> merge(std::vector<StreamPtr<T>> sources) {
    detail::Stage<T, T> stage;
    stage.on_value = [](const T& value, EventStream<T>& out) { out.emit(value); };
    return detail::derive<T, T>(std::move(sources), std::move(stage));
}

/**
 * @brief Operator form of merge: the piped stream first, then `others`
 */
template<typename T>
auto merge_with(std::vector<StreamPtr<T>> others) {
    return [others](StreamPtr<T> source) {
        std::vector<StreamPtr<T>> sources;
        sources.reserve(others.size() + 1);
        sources.push_back(std::move(source));
        sources.insert(sources.end(), others.begin(), others.end());
        return merge<T>(std::move(sources));
    };
}

/**
 * @brief Forward a value only when `limiter` admits it; denied values are dropped
 */
inline auto rate_limit(std::shared_ptr<TokenBucket> limiter, std::uint32_t cost = 1) {
    if (!limiter) {
        throw ValidationError("rate_limit requires a limiter");
    }
    return [limiter, cost](auto source) {
        using T = stream_value_t<decltype(source)>;
        auto logger = source->logger();
        detail::Stage<T, T> stage;
        stage.on_value = [limiter, cost, logger](const T& value, EventStream<T>& out) {
            auto decision = limiter->consume(cost);
            if (decision.allowed) {
                out.emit(value);
                return;
            }
            logger->debug("value dropped by rate limiter, retry after {}ms",
                          decision.retry_after ? decision.retry_after->count() : 0);
        };
        return detail::derive<T, T>(std::move(source), std::move(stage));
    };
}

} // namespace stream
} // namespace streamkit
