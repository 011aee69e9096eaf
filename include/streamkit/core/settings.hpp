#pragma once

/**
 * @file settings.hpp
 * @brief Environment overrides for pool, queue and logging defaults
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "streamkit/core/queue.hpp"
#include "streamkit/core/types.hpp"
#include "streamkit/core/worker_pool.hpp"

namespace streamkit {

/**
 * @brief Looks a variable up by name; nullopt when unset
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Process-level defaults
 *
 * Recognised variables: STREAMKIT_LOG_LEVEL, STREAMKIT_MIN_WORKERS,
 * STREAMKIT_MAX_WORKERS, STREAMKIT_IDLE_TIMEOUT_MS, STREAMKIT_MAX_QUEUE_SIZE,
 * STREAMKIT_QUEUE_LIMIT, STREAMKIT_OVERFLOW_POLICY. Unset or empty
 * variables keep the defaults below.
 */
struct Settings {
    spdlog::level::level_enum log_level{spdlog::level::info};
    std::uint32_t min_workers{1};
    std::uint32_t max_workers{0};
    Millis idle_timeout{30000};
    std::size_t max_queue_size{1000};
    std::size_t queue_limit{0};
    OverflowPolicy overflow{OverflowPolicy::Throw};

    /**
     * @throws ValidationError on a malformed value
     */
    static Settings from_environment();
    static Settings from_lookup(const EnvLookup& lookup);

    /**
     * @brief Apply log_level to every streamkit logger
     */
    void apply_logging() const;

    [[nodiscard]] WorkerPoolConfig pool_config() const;
    [[nodiscard]] QueueOptions queue_options() const;
};

/**
 * @brief Parse drop-old|drop-new|throw
 * @throws ValidationError for anything else
 */
[[nodiscard]] OverflowPolicy parse_overflow_policy(std::string_view text);

} // namespace streamkit
