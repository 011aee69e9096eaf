/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for streamkit
 */

#include <benchmark/benchmark.h>
#include <future>
#include <optional>
#include <vector>

#include "streamkit/streamkit.hpp"

using namespace streamkit;

namespace {

void quiet_logs() {
    logging::set_level(spdlog::level::warn);
}

} // namespace

static void BM_QueueEnqueueNext(benchmark::State& state) {
    BackpressureQueue<std::int64_t> queue;

    for (auto _ : state) {
        queue.enqueue(42);
        auto result = queue.next();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueueEnqueueNext);

static void BM_QueueDropOldOverflow(benchmark::State& state) {
    QueueOptions options;
    options.limit = 1024;
    options.overflow = OverflowPolicy::DropOld;
    BackpressureQueue<std::int64_t> queue(options);

    std::int64_t i = 0;
    for (auto _ : state) {
        queue.enqueue(i++);
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["dropped"] = static_cast<double>(queue.stats().dropped);
}
BENCHMARK(BM_QueueDropOldOverflow);

static void BM_StreamEmit(benchmark::State& state) {
    const auto listeners = state.range(0);
    EventStreamConfig config;
    config.scheduler = std::make_shared<RunLoop>();
    auto source = make_event_stream<std::int64_t>(config);

    std::int64_t sink = 0;
    for (std::int64_t l = 0; l < listeners; l++) {
        source->subscribe([&sink](const std::int64_t& v) { sink += v; });
    }

    for (auto _ : state) {
        source->emit(1);
    }
    benchmark::DoNotOptimize(sink);

    state.SetItemsProcessed(state.iterations() * listeners);
}
BENCHMARK(BM_StreamEmit)->Arg(1)->Arg(4)->Arg(16);

static void BM_SequenceMapFilter(benchmark::State& state) {
    const auto count = state.range(0);

    for (auto _ : state) {
        auto values = pipe(seq::from_generator<std::int64_t>([n = std::int64_t{0}, count]() mutable
                                                              -> std::optional<std::int64_t> {
                               if (n >= count) {
                                   return std::nullopt;
                               }
                               return n++;
                           }),
                           seq::map([](const std::int64_t& x) { return x * x; }),
                           seq::filter([](const std::int64_t& x) { return x % 2 == 0; }));
        auto consumed = seq::for_each(std::move(values), [](const std::int64_t& v) {
            benchmark::DoNotOptimize(v);
        });
        benchmark::DoNotOptimize(consumed);
    }

    state.SetItemsProcessed(state.iterations() * count);
}
BENCHMARK(BM_SequenceMapFilter)->Arg(1000)->Arg(100000);

static void BM_TokenBucketConsume(benchmark::State& state) {
    quiet_logs();
    RateLimiterConfig config;
    config.capacity = 1e12;
    config.refill_rate = 1e12;
    TokenBucket bucket(config);

    for (auto _ : state) {
        auto result = bucket.consume();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TokenBucketConsume);

static void BM_WorkerPoolExecute(benchmark::State& state) {
    quiet_logs();
    WorkerPoolConfig config;
    config.min_workers = static_cast<std::uint32_t>(state.range(0));
    config.max_workers = static_cast<std::uint32_t>(state.range(0));
    config.max_queue_size = 1u << 20;

    WorkerPool<std::int64_t, std::int64_t> pool([] {
        return [](std::int64_t x) { return x * x; };
    }, config);

    std::vector<std::future<std::int64_t>> futures;
    futures.reserve(256);
    for (auto _ : state) {
        futures.clear();
        for (std::int64_t i = 0; i < 256; i++) {
            futures.push_back(pool.execute(i));
        }
        for (auto& f : futures) {
            benchmark::DoNotOptimize(f.get());
        }
    }

    state.SetItemsProcessed(state.iterations() * 256);
}
BENCHMARK(BM_WorkerPoolExecute)->Arg(1)->Arg(2)->Arg(4);

BENCHMARK_MAIN();
