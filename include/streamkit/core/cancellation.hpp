#pragma once

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation tokens shared by operators, queues and sources
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "streamkit/core/types.hpp"

namespace streamkit {

namespace detail {

/**
 * @brief State shared between a CancellationSource and its tokens
 */
struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    std::uint64_t next_id{1};
    // ordered by id, i.e. by registration order
    std::map<std::uint64_t, std::function<void()>> callbacks;
    // callback currently being invoked by cancel(), 0 if none
    std::uint64_t running_id{0};
    std::thread::id running_thread;
};

} // namespace detail

/**
 * @brief Handle for one registered cancellation callback
 *
 * Destroying or resetting the registration unregisters the callback.
 * Move-only.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state))
        , id_(id) {}

    ~CancellationRegistration() { reset(); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_))
        , id_(other.id_) {
        other.id_ = 0;
    }

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    /**
     * @brief Unregister the callback if it has not run yet
     *
     * If the callback is running on another thread, blocks until it
     * returns. Safe to call from inside the callback itself.
     */
    void reset();

    [[nodiscard]] bool is_registered() const noexcept { return id_ != 0; }

private:
    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

/**
 * @brief Observer side of a cancellation signal
 *
 * Cheap to copy. A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const;

    /**
     * @brief Whether this token is attached to a source at all
     */
    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

    /**
     * @brief Register a callback run once on cancellation
     *
     * Runs synchronously on the cancelling thread, or immediately on the
     * calling thread if the token is already cancelled.
     */
    [[nodiscard]] CancellationRegistration register_callback(std::function<void()> callback) const;

    /**
     * @brief Block until cancelled or the deadline passes
     * @return true if cancelled
     */
    bool wait_until(Timestamp deadline) const;

    /**
     * @brief Cancellable sleep
     * @return true if cancelled
     */
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        return wait_until(deadline_after(timeout));
    }

    /**
     * @throws OperationAbortedError if cancelled
     */
    void throw_if_cancelled() const;

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner of a cancellation signal
 */
class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    /**
     * @brief Signal cancellation; later calls are no-ops
     */
    void cancel();

    [[nodiscard]] bool is_cancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace streamkit
