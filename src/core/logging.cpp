/**
 * @file logging.cpp
 * @brief Logger registry glue
 */

#include "streamkit/core/logging.hpp"

#include <atomic>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "streamkit/core/error.hpp"

namespace streamkit {
namespace logging {

namespace {

constexpr std::string_view kPrefix = "streamkit.";

std::atomic<spdlog::level::level_enum> g_level{spdlog::level::info};
std::mutex g_create_mutex;

bool is_streamkit_logger(const std::shared_ptr<spdlog::logger>& logger) {
    return logger->name().compare(0, kPrefix.size(), kPrefix) == 0;
}

} // namespace

std::shared_ptr<spdlog::logger> get(const std::string& component) {
    std::string name = std::string(kPrefix) + component;
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    // spdlog refuses duplicate registration, so creation is serialized
    std::lock_guard<std::mutex> lock(g_create_mutex);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_level(g_level.load());
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    g_level.store(level);
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
        if (is_streamkit_logger(logger)) {
            logger->set_level(level);
        }
    });
}

spdlog::level::level_enum level() noexcept {
    return g_level.load();
}

spdlog::level::level_enum level_from_string(std::string_view name) {
    std::string text(name);
    auto parsed = spdlog::level::from_str(text);
    if (parsed == spdlog::level::off && text != "off") {
        throw ValidationError("Unknown log level '" + text + "'");
    }
    return parsed;
}

} // namespace logging
} // namespace streamkit
