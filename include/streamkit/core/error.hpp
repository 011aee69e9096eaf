#pragma once

/**
 * @file error.hpp
 * @brief Failure kinds raised by streams, sequences, queues and the worker pool
 */

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace streamkit {

/**
 * @brief Machine-readable failure kind
 */
enum class ErrorCode {
    Validation,
    QueueOverflow,
    OperationAborted,
    RetryExhausted,
    BatchOperation,
    OperatorTimeout,
    PoolTerminating,
    QueueFull,
    WorkerFailure
};

/**
 * @brief Stable name of an error code (e.g. "QUEUE_OVERFLOW")
 */
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Human-readable description of a captured exception
 *
 * Used when a failure can only be reported, not rethrown.
 */
[[nodiscard]] std::string describe(const std::exception_ptr& error);

/**
 * @brief Base class of every streamkit failure
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Bad operator or configuration argument
 */
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message = "Invalid argument")
        : Error(ErrorCode::Validation, message) {}
};

/**
 * @brief A bounded queue with the Throw policy was full
 */
class QueueOverflowError : public Error {
public:
    explicit QueueOverflowError(const std::string& message = "Queue overflow")
        : Error(ErrorCode::QueueOverflow, message) {}
};

/**
 * @brief The operation observed a cancelled token
 */
class OperationAbortedError : public Error {
public:
    explicit OperationAbortedError(const std::string& message = "Operation was aborted")
        : Error(ErrorCode::OperationAborted, message) {}
};

/**
 * @brief retry gave up; carries the attempt count and the last cause
 */
class RetryExhaustedError : public Error {
public:
    RetryExhaustedError(std::uint32_t attempts, std::exception_ptr last_error)
        : Error(ErrorCode::RetryExhausted,
                "Failed after " + std::to_string(attempts) + " attempts: " + describe(last_error))
        , attempts_(attempts)
        , last_error_(std::move(last_error)) {}

    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] const std::exception_ptr& last_error() const noexcept { return last_error_; }

private:
    std::uint32_t attempts_;
    std::exception_ptr last_error_;
};

/**
 * @brief A batching operator failed while items were still buffered
 */
class BatchOperationError : public Error {
public:
    BatchOperationError(const std::string& message, std::size_t pending, std::exception_ptr cause)
        : Error(ErrorCode::BatchOperation, message)
        , pending_(pending)
        , cause_(std::move(cause)) {}

    /// Number of items that were buffered but never flushed
    [[nodiscard]] std::size_t pending() const noexcept { return pending_; }
    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::size_t pending_;
    std::exception_ptr cause_;
};

/**
 * @brief BatchOperationError that hands the unflushed items back to the caller
 */
template<typename T>
class BatchFailure : public BatchOperationError {
public:
    BatchFailure(std::vector<T> batch, std::exception_ptr cause)
        : BatchOperationError("Batch operation failed: " + describe(cause), batch.size(), cause)
        , batch_(std::move(batch)) {}

    [[nodiscard]] const std::vector<T>& batch() const noexcept { return batch_; }

private:
    std::vector<T> batch_;
};

/**
 * @brief The next value did not arrive within the operator's time limit
 */
class OperatorTimeoutError : public Error {
public:
    explicit OperatorTimeoutError(const std::string& message = "Operation timed out")
        : Error(ErrorCode::OperatorTimeout, message) {}
};

/**
 * @brief The worker pool is shutting down and accepts no more work
 */
class PoolTerminatingError : public Error {
public:
    explicit PoolTerminatingError(const std::string& message = "Worker pool is terminating")
        : Error(ErrorCode::PoolTerminating, message) {}
};

/**
 * @brief Every worker is busy and the task queue is at capacity
 */
class QueueFullError : public Error {
public:
    explicit QueueFullError(const std::string& message = "Worker pool queue is full")
        : Error(ErrorCode::QueueFull, message) {}
};

/**
 * @brief A task failed inside a worker, or the worker itself died
 */
class WorkerFailureError : public Error {
public:
    WorkerFailureError(std::string worker_id,
                       const std::string& message,
                       std::optional<int> exit_code = std::nullopt,
                       std::exception_ptr cause = nullptr)
        : Error(ErrorCode::WorkerFailure, message)
        , worker_id_(std::move(worker_id))
        , exit_code_(exit_code)
        , cause_(std::move(cause)) {}

    [[nodiscard]] const std::string& worker_id() const noexcept { return worker_id_; }
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::string worker_id_;
    std::optional<int> exit_code_;
    std::exception_ptr cause_;
};

} // namespace streamkit
