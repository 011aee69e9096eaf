#pragma once

/**
 * @file logging.hpp
 * @brief Named spdlog loggers for streamkit components
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace streamkit {
namespace logging {

/**
 * @brief Logger registered as "streamkit.<component>"
 *
 * Returns the already registered logger of that name, or creates a
 * stderr colour logger at the current streamkit level.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& component);

/**
 * @brief Injected logger if set, otherwise the component's named logger
 */
[[nodiscard]] inline std::shared_ptr<spdlog::logger> resolve(
    std::shared_ptr<spdlog::logger> injected, const std::string& component) {
    if (injected) {
        return injected;
    }
    return get(component);
}

/**
 * @brief Set the level of every streamkit logger, existing and future
 */
void set_level(spdlog::level::level_enum level);

/**
 * @brief Current level applied to new streamkit loggers
 */
[[nodiscard]] spdlog::level::level_enum level() noexcept;

/**
 * @brief Parse trace|debug|info|warn|error|critical|off
 * @throws ValidationError for anything else
 */
[[nodiscard]] spdlog::level::level_enum level_from_string(std::string_view name);

} // namespace logging
} // namespace streamkit
