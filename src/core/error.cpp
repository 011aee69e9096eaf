/**
 * @file error.cpp
 * @brief Error code names and exception descriptions
 */

#include "streamkit/core/error.hpp"

namespace streamkit {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation:       return "VALIDATION_ERROR";
        case ErrorCode::QueueOverflow:    return "QUEUE_OVERFLOW";
        case ErrorCode::OperationAborted: return "ABORT_ERR";
        case ErrorCode::RetryExhausted:   return "RETRY_EXHAUSTED";
        case ErrorCode::BatchOperation:   return "BATCH_OPERATION_FAILED";
        case ErrorCode::OperatorTimeout:  return "OPERATOR_TIMEOUT";
        case ErrorCode::PoolTerminating:  return "POOL_TERMINATING";
        case ErrorCode::QueueFull:        return "QUEUE_FULL";
        case ErrorCode::WorkerFailure:    return "WORKER_FAILURE";
    }
    return "UNKNOWN";
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const Error& e) {
        return std::string(to_string(e.code())) + ": " + e.what();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace streamkit
