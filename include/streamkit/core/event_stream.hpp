#pragma once

/**
 * @file event_stream.hpp
 * @brief Push-model pub/sub stream with completion
 */

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "streamkit/core/async_result.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"
#include "streamkit/core/pipe.hpp"
#include "streamkit/core/scheduler.hpp"

namespace streamkit {

using ErrorHandler = std::function<void(std::exception_ptr)>;
using CompleteHandler = std::function<void()>;

template<typename T>
using NextHandler = std::function<AsyncResult(const T&)>;

/**
 * @brief Removes one listener; idempotent, safe after the stream is gone
 */
using Unsubscribe = std::function<void()>;

namespace detail {

/**
 * @brief Adapt a listener returning void or AsyncResult to NextHandler<T>
 */
template<typename T, typename F>
NextHandler<T> wrap_listener(F&& fn) {
    using Fn = std::decay_t<F>;
    using Result = std::invoke_result_t<Fn&, const T&>;
    if constexpr (std::is_same_v<Result, AsyncResult>) {
        return NextHandler<T>(std::forward<F>(fn));
    } else {
        static_assert(std::is_void_v<Result>, "listeners return void or AsyncResult");
        return [f = Fn(std::forward<F>(fn))](const T& value) mutable {
            f(value);
            return AsyncResult::ready();
        };
    }
}

} // namespace detail

/**
 * @brief Plain value listener; never told about completion
 */
template<typename T>
struct Callback {
    NextHandler<T> fn;
};

/**
 * @brief Listener with optional error and completion paths
 */
template<typename T>
struct Observer {
    NextHandler<T> next;
    ErrorHandler error;
    CompleteHandler complete;

    Observer() = default;

    template<typename Next,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Next>, Observer>>>
    explicit Observer(Next&& on_next, ErrorHandler on_error = nullptr, CompleteHandler on_complete = nullptr)
        : next(detail::wrap_listener<T>(std::forward<Next>(on_next)))
        , error(std::move(on_error))
        , complete(std::move(on_complete)) {}

    /**
     * @brief Observer interested only in completion
     */
    static Observer on_complete(CompleteHandler fn) {
        Observer observer;
        observer.complete = std::move(fn);
        return observer;
    }
};

template<typename T>
using Listener = std::variant<Callback<T>, Observer<T>>;

/**
 * @brief Hooks run when a stream gains its first listener / loses its last
 *
 * teardown also runs on completion if the stream was active.
 */
struct StreamLifecycle {
    std::function<void()> activate;
    std::function<void()> teardown;
};

/**
 * @brief Construction parameters of an EventStream
 */
struct EventStreamConfig {
    std::shared_ptr<Scheduler> scheduler;      // required: deferred completion runs here
    std::shared_ptr<spdlog::logger> logger;    // defaults to "streamkit.stream"
    StreamLifecycle lifecycle;

    void validate() const {
        if (!scheduler) {
            throw ValidationError("EventStreamConfig requires a scheduler");
        }
    }
};

template<typename T>
class EventStream;

template<typename T>
using StreamPtr = std::shared_ptr<EventStream<T>>;

/**
 * @brief In-process fan-out of values to listeners, until completed
 *
 * emit / subscribe / complete run synchronously in the caller's turn.
 * Listener dispatch happens outside the internal lock on a snapshot, so
 * listeners may subscribe, unsubscribe, emit or complete re-entrantly.
 */
template<typename T>
class EventStream : public std::enable_shared_from_this<EventStream<T>> {
public:
    using value_type = T;

    /**
     * @throws ValidationError if the config has no scheduler
     */
    explicit EventStream(EventStreamConfig config)
        : state_(std::make_shared<State>()) {
        config.validate();
        scheduler_ = std::move(config.scheduler);
        logger_ = logging::resolve(std::move(config.logger), "stream");
        state_->lifecycle = std::move(config.lifecycle);
    }

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    ~EventStream() = default;

    /**
     * @brief Replace the lifecycle hooks; call before the first subscribe
     */
    void set_lifecycle(StreamLifecycle lifecycle) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->lifecycle = std::move(lifecycle);
    }

    /**
     * @brief Subscribe an observer
     *
     * On a completed stream, `complete` is posted to the scheduler and the
     * returned unsubscribe does nothing.
     */
    Unsubscribe subscribe(Observer<T> observer) {
        return add_listener(Listener<T>(std::move(observer)));
    }

    /**
     * @brief Subscribe a plain callback returning void or AsyncResult
     */
    template<typename F,
             typename = std::enable_if_t<std::is_invocable_v<std::decay_t<F>&, const T&>>>
    Unsubscribe subscribe(F&& fn) {
        return add_listener(Listener<T>(Callback<T>{detail::wrap_listener<T>(std::forward<F>(fn))}));
    }

    /**
     * @brief Deliver a value to a snapshot of the current listeners
     */
    void emit(const T& value) {
        std::vector<Listener<T>> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->completed) {
                return;
            }
            snapshot.reserve(state_->listeners.size());
            for (const auto& [id, listener] : state_->listeners) {
                snapshot.push_back(listener);
            }
        }
        for (const auto& listener : snapshot) {
            dispatch(listener, value);
        }
    }

    /**
     * @brief Complete the stream; later calls are no-ops
     */
    void complete() {
        std::map<std::uint64_t, Listener<T>> listeners;
        std::function<void()> teardown;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->completed) {
                return;
            }
            state_->completed = true;
            listeners.swap(state_->listeners);
            if (state_->active) {
                state_->active = false;
                teardown = state_->lifecycle.teardown;
            }
        }

        if (teardown) {
            run_hook(teardown, "teardown");
        }
        for (auto& [id, listener] : listeners) {
            if (auto* observer = std::get_if<Observer<T>>(&listener)) {
                notify_complete(*observer);
            }
        }
    }

    [[nodiscard]] std::size_t listener_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->listeners.size();
    }

    [[nodiscard]] bool is_completed() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->completed;
    }

    [[nodiscard]] const std::shared_ptr<Scheduler>& scheduler() const noexcept { return scheduler_; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

    /**
     * @brief Config for a stream derived from this one (same scheduler/logger)
     */
    [[nodiscard]] EventStreamConfig derived_config() const {
        EventStreamConfig config;
        config.scheduler = scheduler_;
        config.logger = logger_;
        return config;
    }

    /**
     * @brief Apply stream operators left to right
     */
    template<typename... Ops>
    auto pipe(Ops&&... ops) {
        return streamkit::pipe(this->shared_from_this(), std::forward<Ops>(ops)...);
    }

private:
    struct State {
        std::mutex mutex;
        std::map<std::uint64_t, Listener<T>> listeners;
        std::uint64_t next_id{1};
        bool completed{false};
        bool active{false};
        StreamLifecycle lifecycle;
    };

    Unsubscribe add_listener(Listener<T> listener) {
        std::function<void()> activate;
        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->completed) {
                if (auto* observer = std::get_if<Observer<T>>(&listener)) {
                    if (observer->complete) {
                        post_complete(*observer);
                    }
                }
                return [] {};
            }
            id = state_->next_id++;
            state_->listeners.emplace(id, std::move(listener));
            if (!state_->active) {
                state_->active = true;
                activate = state_->lifecycle.activate;
            }
        }

        if (activate) {
            run_hook(activate, "activate");
        }

        std::weak_ptr<State> weak = state_;
        auto logger = logger_;
        return [weak, id, logger] {
            auto state = weak.lock();
            if (!state) {
                return;
            }
            std::function<void()> teardown;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->listeners.erase(id) == 0) {
                    return;
                }
                if (state->listeners.empty() && state->active) {
                    state->active = false;
                    teardown = state->lifecycle.teardown;
                }
            }
            if (teardown) {
                try {
                    teardown();
                } catch (const std::exception& e) {
                    logger->error("stream teardown failed: {}", e.what());
                } catch (...) {
                    logger->error("stream teardown failed: {}", describe(std::current_exception()));
                }
            }
        };
    }

    void post_complete(const Observer<T>& observer) {
        auto complete = observer.complete;
        auto logger = logger_;
        scheduler_->post([complete, logger] {
            try {
                complete();
            } catch (const std::exception& e) {
                logger->warn("listener completion failed: {}", e.what());
            } catch (...) {
                logger->warn("listener completion failed: {}", describe(std::current_exception()));
            }
        });
    }

    void notify_complete(const Observer<T>& observer) {
        if (!observer.complete) {
            return;
        }
        try {
            observer.complete();
        } catch (const std::exception& e) {
            logger_->warn("listener completion failed: {}", e.what());
        } catch (...) {
            logger_->warn("listener completion failed: {}", describe(std::current_exception()));
        }
    }

    void run_hook(const std::function<void()>& hook, const char* name) {
        try {
            hook();
        } catch (const std::exception& e) {
            logger_->error("stream {} failed: {}", name, e.what());
        } catch (...) {
            logger_->error("stream {} failed: {}", name, describe(std::current_exception()));
        }
    }

    static void report(const ErrorHandler& on_error,
                       const std::shared_ptr<spdlog::logger>& logger,
                       std::exception_ptr error) {
        if (on_error) {
            try {
                on_error(error);
            } catch (const std::exception& e) {
                logger->error("listener error handler failed: {}", e.what());
            } catch (...) {
                logger->error("listener error handler failed: {}", describe(std::current_exception()));
            }
            return;
        }
        logger->warn("listener failed: {}", describe(error));
    }

    void dispatch(const Listener<T>& listener, const T& value) {
        ErrorHandler on_error;
        NextHandler<T> next;
        if (const auto* observer = std::get_if<Observer<T>>(&listener)) {
            on_error = observer->error;
            next = observer->next;
        } else {
            next = std::get<Callback<T>>(listener).fn;
        }
        if (!next) {
            return;
        }

        try {
            AsyncResult result = next(value);
            if (result.is_pending() || result.has_failed()) {
                auto logger = logger_;
                result.on_failure([on_error, logger](std::exception_ptr error) {
                    report(on_error, logger, error);
                });
            }
        } catch (...) {
            // isolate the failure to this listener; delivery continues
            report(on_error, logger_, std::current_exception());
        }
    }

    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<State> state_;
};

/**
 * @brief Create a stream
 * @throws ValidationError if the config has no scheduler
 */
template<typename T>
StreamPtr<T> make_event_stream(EventStreamConfig config) {
    return std::make_shared<EventStream<T>>(std::move(config));
}

} // namespace streamkit
