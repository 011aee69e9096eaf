#pragma once

/**
 * @file streamkit.hpp
 * @brief Main header for streamkit - event streams, lazy sequence operators,
 *        backpressure queues, worker pools and rate limiting
 *
 * Include this single header to access the full streamkit API.
 */

#include "streamkit/core/types.hpp"
#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"
#include "streamkit/core/cancellation.hpp"
#include "streamkit/core/scheduler.hpp"
#include "streamkit/core/async_result.hpp"
#include "streamkit/core/metrics.hpp"
#include "streamkit/core/pipe.hpp"
#include "streamkit/core/event_stream.hpp"
#include "streamkit/core/sequence.hpp"
#include "streamkit/core/queue.hpp"
#include "streamkit/core/worker_pool.hpp"
#include "streamkit/core/rate_limiter.hpp"
#include "streamkit/core/admission.hpp"
#include "streamkit/core/settings.hpp"

#include "streamkit/stream/operators.hpp"
#include "streamkit/stream/sources.hpp"

#include "streamkit/operators/source.hpp"
#include "streamkit/operators/sink.hpp"
#include "streamkit/operators/transform.hpp"
#include "streamkit/operators/batch.hpp"
#include "streamkit/operators/time.hpp"
#include "streamkit/operators/retry.hpp"
#include "streamkit/operators/pump.hpp"
#include "streamkit/operators/combine.hpp"

namespace streamkit {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace streamkit
