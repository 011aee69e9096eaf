/**
 * @file settings.cpp
 * @brief Settings parsing
 */

#include "streamkit/core/settings.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>

#include "streamkit/core/error.hpp"
#include "streamkit/core/logging.hpp"

namespace streamkit {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<std::string> non_empty(const EnvLookup& lookup, const std::string& name) {
    auto value = lookup(name);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return value;
}

template<typename Int>
Int parse_unsigned(const std::string& name, const std::string& text) {
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        throw ValidationError(name + " must be a non-negative integer, got '" + text + "'");
    }
    if (value > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
        throw ValidationError(name + " is out of range: " + text);
    }
    return static_cast<Int>(value);
}

} // namespace

OverflowPolicy parse_overflow_policy(std::string_view text) {
    auto name = lowercase(text);
    if (name == "drop-old" || name == "dropold") {
        return OverflowPolicy::DropOld;
    }
    if (name == "drop-new" || name == "dropnew") {
        return OverflowPolicy::DropNew;
    }
    if (name == "throw") {
        return OverflowPolicy::Throw;
    }
    throw ValidationError("Unknown overflow policy '" + std::string(text) + "'");
}

Settings Settings::from_environment() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

Settings Settings::from_lookup(const EnvLookup& lookup) {
    Settings settings;

    if (auto value = non_empty(lookup, "STREAMKIT_LOG_LEVEL")) {
        settings.log_level = logging::level_from_string(lowercase(*value));
    }
    if (auto value = non_empty(lookup, "STREAMKIT_MIN_WORKERS")) {
        settings.min_workers = parse_unsigned<std::uint32_t>("STREAMKIT_MIN_WORKERS", *value);
    }
    if (auto value = non_empty(lookup, "STREAMKIT_MAX_WORKERS")) {
        settings.max_workers = parse_unsigned<std::uint32_t>("STREAMKIT_MAX_WORKERS", *value);
    }
    if (auto value = non_empty(lookup, "STREAMKIT_IDLE_TIMEOUT_MS")) {
        settings.idle_timeout = Millis(parse_unsigned<std::int64_t>("STREAMKIT_IDLE_TIMEOUT_MS", *value));
    }
    if (auto value = non_empty(lookup, "STREAMKIT_MAX_QUEUE_SIZE")) {
        settings.max_queue_size = parse_unsigned<std::size_t>("STREAMKIT_MAX_QUEUE_SIZE", *value);
    }
    if (auto value = non_empty(lookup, "STREAMKIT_QUEUE_LIMIT")) {
        settings.queue_limit = parse_unsigned<std::size_t>("STREAMKIT_QUEUE_LIMIT", *value);
    }
    if (auto value = non_empty(lookup, "STREAMKIT_OVERFLOW_POLICY")) {
        settings.overflow = parse_overflow_policy(*value);
    }

    settings.pool_config().validate();
    return settings;
}

void Settings::apply_logging() const {
    logging::set_level(log_level);
}

WorkerPoolConfig Settings::pool_config() const {
    WorkerPoolConfig config;
    config.min_workers = min_workers;
    config.max_workers = max_workers;
    config.idle_timeout = idle_timeout;
    config.max_queue_size = max_queue_size;
    return config;
}

QueueOptions Settings::queue_options() const {
    QueueOptions options;
    options.limit = queue_limit;
    options.overflow = overflow;
    return options;
}

} // namespace streamkit
