/**
 * @file simple_pipeline.cpp
 * @brief Example: interval stream -> map -> queue -> filter -> batch -> worker pool
 *
 * Pool, queue and log settings are read from STREAMKIT_* environment
 * variables. Ctrl+C stops the pipeline early.
 */

#include <iostream>
#include <chrono>
#include <csignal>
#include <atomic>
#include <exception>
#include <future>
#include <thread>
#include <vector>

#include "streamkit/streamkit.hpp"

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

} // namespace

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "=== streamkit Example Pipeline ===" << std::endl;
    std::cout << "Version: " << streamkit::VERSION << std::endl;
    std::cout << std::endl;

    streamkit::Settings settings;
    try {
        settings = streamkit::Settings::from_environment();
    } catch (const streamkit::ValidationError& e) {
        std::cerr << "Invalid environment: " << e.what() << std::endl;
        return 1;
    }
    settings.apply_logging();

    // Push side: a tick every millisecond, driven by a run loop thread
    auto loop = std::make_shared<streamkit::RunLoop>();
    streamkit::EventStreamConfig stream_config;
    stream_config.scheduler = loop;

    auto ticks = streamkit::pipe(
        streamkit::stream::from_interval(stream_config, streamkit::Millis(1), std::uint64_t{2000}),
        streamkit::stream::map([](const std::uint64_t& n) { return static_cast<std::int64_t>(n + 1); }));

    // Pull side: square, keep the even ones, batch by size or time
    streamkit::CancellationSource cancel;

    auto queue_options = settings.queue_options();
    queue_options.token = cancel.token();
    streamkit::seq::BatchOptions batch_options;
    batch_options.timeout = streamkit::Millis(50);
    batch_options.token = cancel.token();

    auto batches = streamkit::pipe(
        streamkit::seq::from_stream(ticks, queue_options),
        streamkit::seq::map([](const std::int64_t& x) { return x * x; }),
        streamkit::seq::filter([](const std::int64_t& x) { return x % 2 == 0; }),
        streamkit::seq::batch(100, batch_options));

    std::thread driver([&] {
        while (!g_shutdown.load()) {
            if (loop->run_until([&] { return ticks->is_completed() || g_shutdown.load(); },
                                streamkit::Millis(100))) {
                break;
            }
        }
        if (g_shutdown.load()) {
            std::cout << "\nShutdown requested..." << std::endl;
            cancel.cancel();
        }
    });

    // Aggregate each batch on the worker pool, admitted through a token bucket
    auto pool_config = settings.pool_config();
    streamkit::WorkerPool<std::vector<std::int64_t>, std::int64_t> pool([] {
        return [](std::vector<std::int64_t> chunk) {
            std::int64_t sum = 0;
            for (auto v : chunk) {
                sum += v;
            }
            return sum;
        };
    }, pool_config);

    streamkit::RateLimiterConfig limiter_config;
    limiter_config.capacity = 20;
    limiter_config.refill_rate = 50;
    streamkit::TokenBucket limiter(limiter_config);

    std::vector<std::future<std::int64_t>> results;
    std::uint64_t denied = 0;
    try {
        streamkit::seq::for_each(std::move(batches), [&](const std::vector<std::int64_t>& chunk) {
            auto admitted = streamkit::submit_limited(pool, limiter, chunk);
            if (admitted.accepted()) {
                results.push_back(std::move(*admitted.result));
            } else {
                denied++;
            }
        });
    } catch (const streamkit::OperationAbortedError&) {
        std::cout << "Pipeline aborted" << std::endl;
    }
    driver.join();

    std::int64_t total = 0;
    for (auto& f : results) {
        try {
            total += f.get();
        } catch (const std::exception& e) {
            std::cerr << "Batch failed: " << e.what() << std::endl;
        }
    }
    pool.terminate();

    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << "Batches aggregated: " << results.size() << std::endl;
    std::cout << "Batches rate limited: " << denied << std::endl;
    std::cout << "Sum of even squares: " << total << std::endl;
    std::cout << "Pool: " << pool.metrics().format() << std::endl;

    return 0;
}
