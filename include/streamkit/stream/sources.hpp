#pragma once

/**
 * @file sources.hpp
 * @brief Push-model stream sources
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "streamkit/core/error.hpp"
#include "streamkit/core/event_stream.hpp"

namespace streamkit {
namespace stream {

/**
 * @brief Stream that emits `values` on the turn after its first
 *        subscription, then completes
 *
 * Values are emitted once per stream, however many times it is activated.
 */
template<typename T>
StreamPtr<T> from_values(EventStreamConfig config, std::vector<T> values) {
    auto out = make_event_stream<T>(std::move(config));
    std::weak_ptr<EventStream<T>> weak_out = out;
    auto scheduler = out->scheduler();
    auto started = std::make_shared<bool>(false);
    auto shared_values = std::make_shared<std::vector<T>>(std::move(values));

    StreamLifecycle lifecycle;
    lifecycle.activate = [weak_out, scheduler, started, shared_values] {
        if (*started) {
            return;
        }
        *started = true;
        scheduler->post([weak_out, shared_values] {
            auto target = weak_out.lock();
            if (!target) {
                return;
            }
            for (const auto& value : *shared_values) {
                target->emit(value);
            }
            target->complete();
        });
    };
    out->set_lifecycle(std::move(lifecycle));
    return out;
}

/**
 * @brief Stream of 0, 1, 2, ... emitted every `period` while subscribed
 *
 * Completes after `count` values when a count is given. The timer is
 * cancelled on teardown.
 */
inline StreamPtr<std::uint64_t> from_interval(EventStreamConfig config,
                                              Millis period,
                                              std::optional<std::uint64_t> count = std::nullopt) {
    if (period.count() <= 0) {
        throw ValidationError("interval period must be positive");
    }
    auto out = make_event_stream<std::uint64_t>(std::move(config));
    std::weak_ptr<EventStream<std::uint64_t>> weak_out = out;

    struct State {
        std::shared_ptr<Scheduler> scheduler;
        TimerId timer{0};
        std::uint64_t emitted{0};
        std::function<void()> tick;
    };
    auto state = std::make_shared<State>();
    state->scheduler = out->scheduler();
    std::weak_ptr<State> weak_state = state;

    // the tick only holds the state weakly; the lifecycle hooks own it
    state->tick = [weak_state, weak_out, period, count] {
        auto s = weak_state.lock();
        auto target = weak_out.lock();
        if (!s || !target) {
            return;
        }
        s->timer = 0;
        if (count && s->emitted >= *count) {
            target->complete();
            return;
        }
        target->emit(s->emitted++);
        if (count && s->emitted >= *count) {
            target->complete();
            return;
        }
        auto next = s->tick;
        s->timer = s->scheduler->post_after(period, next);
    };

    StreamLifecycle lifecycle;
    lifecycle.activate = [state, period] {
        if (state->timer == 0) {
            state->timer = state->scheduler->post_after(period, state->tick);
        }
    };
    lifecycle.teardown = [state] {
        if (state->timer != 0) {
            state->scheduler->cancel(state->timer);
            state->timer = 0;
        }
    };
    out->set_lifecycle(std::move(lifecycle));
    return out;
}

/**
 * @brief Callback an external source invokes for each event
 */
template<typename T>
using EmitFn = std::function<void(const T&)>;

/**
 * @brief Registers an EmitFn with an external source; returns the deregistration
 */
template<typename T>
using AddListener = std::function<Unsubscribe(EmitFn<T>)>;

/**
 * @brief Bridge an external event emitter into a stream
 *
 * Registers with the emitter when the stream gains its first listener and
 * deregisters when it loses the last one or completes.
 */
template<typename T>
StreamPtr<T> from_event_source(EventStreamConfig config, AddListener<T> add_listener) {
    if (!add_listener) {
        throw ValidationError("from_event_source requires an add_listener function");
    }
    auto out = make_event_stream<T>(std::move(config));
    std::weak_ptr<EventStream<T>> weak_out = out;
    auto registration = std::make_shared<Unsubscribe>();

    StreamLifecycle lifecycle;
    lifecycle.activate = [weak_out, add_listener, registration] {
        *registration = add_listener([weak_out](const T& value) {
            if (auto target = weak_out.lock()) {
                target->emit(value);
            }
        });
    };
    lifecycle.teardown = [registration] {
        auto remove = std::move(*registration);
        *registration = nullptr;
        if (remove) {
            remove();
        }
    };
    out->set_lifecycle(std::move(lifecycle));
    return out;
}

} // namespace stream
} // namespace streamkit
