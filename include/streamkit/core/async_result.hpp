#pragma once

/**
 * @file async_result.hpp
 * @brief Settle-once completion returned by asynchronous stream listeners
 */

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace streamkit {

/**
 * @brief Outcome of work a listener started but did not finish inline
 *
 * A stream never waits for it; it only attaches a failure handler.
 */
class AsyncResult {
public:
    using FailureHandler = std::function<void(std::exception_ptr)>;

    /**
     * @brief Already succeeded
     */
    [[nodiscard]] static AsyncResult ready() {
        auto state = std::make_shared<State>();
        state->settled = true;
        return AsyncResult(std::move(state));
    }

    /**
     * @brief Already failed with `error`
     */
    [[nodiscard]] static AsyncResult failed(std::exception_ptr error) {
        auto state = std::make_shared<State>();
        state->settled = true;
        state->error = std::move(error);
        return AsyncResult(std::move(state));
    }

    [[nodiscard]] bool is_pending() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return !state_->settled;
    }

    [[nodiscard]] bool has_failed() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->settled && state_->error != nullptr;
    }

    /**
     * @brief Run `handler` if the result fails; immediately if it already has
     */
    void on_failure(FailureHandler handler) const {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->settled) {
                state_->handlers.push_back(std::move(handler));
                return;
            }
            error = state_->error;
        }
        if (error) {
            handler(error);
        }
    }

private:
    friend class AsyncPromise;

    struct State {
        std::mutex mutex;
        bool settled{false};
        std::exception_ptr error;
        std::vector<FailureHandler> handlers;
    };

    explicit AsyncResult(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * @brief Producer side of a pending AsyncResult
 */
class AsyncPromise {
public:
    AsyncPromise()
        : state_(std::make_shared<AsyncResult::State>()) {}

    [[nodiscard]] AsyncResult result() const { return AsyncResult(state_); }

    /**
     * @return false if already settled
     */
    bool resolve() { return settle(nullptr); }

    /**
     * @return false if already settled
     */
    bool reject(std::exception_ptr error) { return settle(std::move(error)); }

private:
    bool settle(std::exception_ptr error) {
        std::vector<AsyncResult::FailureHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->settled) {
                return false;
            }
            state_->settled = true;
            state_->error = error;
            handlers.swap(state_->handlers);
        }
        if (error) {
            for (auto& handler : handlers) {
                handler(error);
            }
        }
        return true;
    }

    std::shared_ptr<AsyncResult::State> state_;
};

} // namespace streamkit
