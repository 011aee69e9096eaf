/**
 * @file worker_pool.cpp
 * @brief Non-template parts of the worker pool
 */

#include "streamkit/core/worker_pool.hpp"

#include <algorithm>
#include <thread>

namespace streamkit {

const char* to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Idle:        return "idle";
        case WorkerState::Busy:        return "busy";
        case WorkerState::Terminating: return "terminating";
        case WorkerState::Terminated:  return "terminated";
    }
    return "unknown";
}

void WorkerPoolConfig::validate() const {
    if (max_workers != 0 && min_workers > max_workers) {
        throw ValidationError("minWorkers cannot exceed maxWorkers");
    }
    if (idle_timeout.count() <= 0) {
        throw ValidationError("idleTimeout must be positive");
    }
    if (reap_interval.count() <= 0) {
        throw ValidationError("Reap interval must be positive");
    }
    if (drain_batch_size == 0) {
        throw ValidationError("Drain batch size must be positive");
    }
    if (worker_options.name_prefix.empty()) {
        throw ValidationError("Worker name prefix must not be empty");
    }
}

std::uint32_t WorkerPoolConfig::resolved_max_workers() const noexcept {
    if (max_workers != 0) {
        return max_workers;
    }
    auto cores = std::thread::hardware_concurrency();
    if (cores == 0) {
        cores = 4;  // Fallback
    }
    // leave one core to the coordinating thread
    return std::max<std::uint32_t>(1, cores - 1);
}

} // namespace streamkit
