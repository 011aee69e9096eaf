/**
 * @file cancellation.cpp
 * @brief Cancellation source, token and registration
 */

#include "streamkit/core/cancellation.hpp"

#include <exception>
#include <thread>
#include <utility>

#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"

namespace streamkit {

void CancellationRegistration::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        std::unique_lock<std::mutex> lock(state->mutex);
        if (state->callbacks.erase(id_) == 0 && state->running_id == id_ &&
            state->running_thread != std::this_thread::get_id()) {
            auto id = id_;
            state->cv.wait(lock, [&state, id] { return state->running_id != id; });
        }
    }
    state_.reset();
    id_ = 0;
}

bool CancellationToken::is_cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationToken::register_callback(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return {};
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }
    callback();
    return {};
}

bool CancellationToken::wait_until(Timestamp deadline) const {
    if (!state_) {
        detail::sleep_until(deadline);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return detail::wait_until(state_->cv, lock, deadline, [this] { return state_->cancelled; });
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationAbortedError();
    }
}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
    }
    state_->cv.notify_all();

    // One callback at a time stays in flight so reset() can wait for it
    while (true) {
        std::uint64_t id = 0;
        std::function<void()> callback;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->callbacks.empty()) {
                break;
            }
            auto it = state_->callbacks.begin();
            id = it->first;
            callback = std::move(it->second);
            state_->callbacks.erase(it);
            state_->running_id = id;
            state_->running_thread = std::this_thread::get_id();
        }

        try {
            callback();
        } catch (const std::exception& e) {
            logging::get("cancellation")->error("cancellation callback {} failed: {}", id, e.what());
        } catch (...) {
            logging::get("cancellation")->error("cancellation callback {} failed: {}", id,
                                                describe(std::current_exception()));
        }
        callback = nullptr;

        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->running_id = 0;
        }
        state_->cv.notify_all();
    }
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace streamkit
